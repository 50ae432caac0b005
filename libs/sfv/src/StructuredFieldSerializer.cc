// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "sfv/StructuredFieldSerializer.hh"

#include <cstdlib>
#include <type_traits>

#include <fmt/format.h>

#include "sfv/StructuredFieldParser.hh"
#include "utils/Base64.hh"

#include "Grammar.hh"

using namespace gatekeeper::sfv;
using namespace gatekeeper::sfv::grammar;

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_item(const Item &item) const
{
  if (const auto *items = item.get_if<InnerList>(); items != nullptr)
    {
      return serialize_inner_list(*items, item.parameters);
    }

  auto value = serialize_value(item.value);
  if (!value)
    {
      return value.error();
    }
  auto parameters = serialize_parameters(item.parameters);
  if (!parameters)
    {
      return parameters.error();
    }
  return value.value() + parameters.value();
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_list(const List &list) const
{
  std::string out;
  for (const auto &member: list)
    {
      auto serialized = serialize_item(member);
      if (!serialized)
        {
          return serialized.error();
        }
      if (!out.empty())
        {
          out += ", ";
        }
      out += serialized.value();
    }
  return out;
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_dictionary(const Dictionary &dictionary) const
{
  std::string out;
  bool first = true;
  for (const auto &[key, member]: dictionary)
    {
      auto serialized_key = serialize_key(key);
      if (!serialized_key)
        {
          return serialized_key.error();
        }
      if (!first)
        {
          out += ", ";
        }
      first = false;
      out += serialized_key.value();

      const auto *flag = member.get_if<bool>();
      if (flag != nullptr && *flag)
        {
          auto parameters = serialize_parameters(member.parameters);
          if (!parameters)
            {
              return parameters.error();
            }
          out += parameters.value();
        }
      else
        {
          auto serialized = serialize_item(member);
          if (!serialized)
            {
              return serialized.error();
            }
          out += "=" + serialized.value();
        }
    }
  return out;
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_inner_list(const InnerList &items, const Parameters &parameters) const
{
  std::string out = "(";
  for (const auto &item: items)
    {
      if (item.is_inner_list())
        {
          return fail(StructuredFieldErrc::InvalidInnerList, "inner lists cannot be nested");
        }
      auto serialized = serialize_item(item);
      if (!serialized)
        {
          return serialized.error();
        }
      if (out.size() > 1)
        {
          out += " ";
        }
      out += serialized.value();
    }
  out += ")";

  auto serialized_parameters = serialize_parameters(parameters);
  if (!serialized_parameters)
    {
      return serialized_parameters.error();
    }
  return out + serialized_parameters.value();
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_bare_item(const BareItem &value) const
{
  return serialize_value(to_value(value));
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_parameters(const Parameters &parameters) const
{
  std::string out;
  for (const auto &[key, value]: parameters)
    {
      auto serialized_key = serialize_key(key);
      if (!serialized_key)
        {
          return serialized_key.error();
        }
      out += ";" + serialized_key.value();

      const auto *flag = std::get_if<bool>(&value);
      if (flag != nullptr && *flag)
        {
          continue;
        }

      auto serialized = serialize_bare_item(value);
      if (!serialized)
        {
          return serialized.error();
        }
      out += "=" + serialized.value();
    }
  return out;
}

outcome::std_result<bool>
StructuredFieldSerializer::round_trip(FieldType type, std::string_view text) const
{
  StructuredFieldParser parser;
  outcome::std_result<std::string> serialized{std::string{}};

  switch (type)
    {
    case FieldType::Item:
      {
        auto item = parser.parse_item(text);
        if (!item)
          {
            return item.error();
          }
        serialized = serialize_item(item.value());
        break;
      }
    case FieldType::List:
      {
        auto list = parser.parse_list(text);
        if (!list)
          {
            return list.error();
          }
        serialized = serialize_list(list.value());
        break;
      }
    case FieldType::Dictionary:
      {
        auto dictionary = parser.parse_dictionary(text);
        if (!dictionary)
          {
            return dictionary.error();
          }
        serialized = serialize_dictionary(dictionary.value());
        break;
      }
    }

  if (!serialized)
    {
      return serialized.error();
    }

  bool identical = serialized.value() == text;
  if (!identical)
    {
      logger_->debug("round trip mismatch: '{}' serialized as '{}'", text, serialized.value());
    }
  return identical;
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_value(const Value &value) const
{
  return std::visit(
    [this](const auto &v) -> outcome::std_result<std::string> {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, bool>)
        {
          return std::string(v ? "?1" : "?0");
        }
      else if constexpr (std::is_same_v<T, std::int64_t>)
        {
          return serialize_integer(v);
        }
      else if constexpr (std::is_same_v<T, Decimal>)
        {
          return serialize_decimal(v);
        }
      else if constexpr (std::is_same_v<T, std::string>)
        {
          return serialize_string(v);
        }
      else if constexpr (std::is_same_v<T, Token>)
        {
          return serialize_token(v);
        }
      else if constexpr (std::is_same_v<T, ByteSequence>)
        {
          return ":" + gatekeeper::utils::Base64::encode(v.bytes) + ":";
        }
      else if constexpr (std::is_same_v<T, Date>)
        {
          auto seconds = serialize_integer(v.seconds);
          if (!seconds)
            {
              return fail(StructuredFieldErrc::InvalidDate, "date out of range");
            }
          return "@" + seconds.value();
        }
      else if constexpr (std::is_same_v<T, DisplayString>)
        {
          return serialize_display_string(v);
        }
      else
        {
          return fail(StructuredFieldErrc::InvalidInnerList, "inner list where a bare item is expected");
        }
    },
    value);
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_integer(std::int64_t value) const
{
  if (value > max_integer || value < -max_integer)
    {
      return fail(StructuredFieldErrc::ValueOutOfRange, "integer out of range");
    }
  return std::to_string(value);
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_decimal(const Decimal &value) const
{
  std::int64_t magnitude = std::llabs(value.thousandths);
  std::int64_t integer_part = magnitude / Decimal::scale;
  std::int64_t fraction_part = magnitude % Decimal::scale;

  if (integer_part > max_decimal_integer_part)
    {
      return fail(StructuredFieldErrc::ValueOutOfRange, "decimal out of range");
    }

  std::string fraction = fmt::format("{:03d}", fraction_part);
  while (fraction.size() > 1 && fraction.back() == '0')
    {
      fraction.pop_back();
    }

  std::string sign = value.thousandths < 0 ? "-" : "";
  return fmt::format("{}{}.{}", sign, integer_part, fraction);
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_string(const std::string &value) const
{
  std::string out = "\"";
  for (char c: value)
    {
      if (!is_visible_ascii(c))
        {
          return fail(StructuredFieldErrc::InvalidString, "string contains a non printable character");
        }
      if (c == '"' || c == '\\')
        {
          out.push_back('\\');
        }
      out.push_back(c);
    }
  out.push_back('"');
  return out;
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_token(const Token &value) const
{
  if (!is_valid_token(value.value))
    {
      return fail(StructuredFieldErrc::InvalidToken, "invalid token");
    }
  return value.value;
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_display_string(const DisplayString &value) const
{
  if (!is_valid_utf8(value.value))
    {
      return fail(StructuredFieldErrc::InvalidDisplayString, "display string is not valid UTF-8");
    }

  std::string out = "%\"";
  for (char c: value.value)
    {
      if (c == '%' || c == '"' || !is_visible_ascii(c))
        {
          out += fmt::format("%{:02x}", static_cast<unsigned char>(c));
        }
      else
        {
          out.push_back(c);
        }
    }
  out.push_back('"');
  return out;
}

outcome::std_result<std::string>
StructuredFieldSerializer::serialize_key(const std::string &key) const
{
  if (!is_valid_key(key))
    {
      return fail(StructuredFieldErrc::InvalidKey, "invalid key");
    }
  return key;
}

std::error_code
StructuredFieldSerializer::fail(StructuredFieldErrc ec, std::string_view what) const
{
  logger_->debug("failed to serialize structured field: {}", what);
  return make_error_code(ec);
}
