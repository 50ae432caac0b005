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

#include "sfv/StructuredFieldParser.hh"

#include <charconv>
#include <utility>

#include "utils/Base64.hh"

#include "Grammar.hh"

using namespace gatekeeper::sfv;
using namespace gatekeeper::sfv::grammar;

class StructuredFieldParser::Input
{
public:
  explicit Input(std::string_view text)
    : text(text)
  {
  }

  bool eof() const
  {
    return pos >= text.size();
  }

  char peek() const
  {
    return text[pos];
  }

  bool next_is(char c) const
  {
    return !eof() && text[pos] == c;
  }

  char consume()
  {
    return text[pos++];
  }

  void skip_sp()
  {
    while (next_is(' '))
      {
        pos++;
      }
  }

  void skip_ows()
  {
    while (next_is(' ') || next_is('\t'))
      {
        pos++;
      }
  }

  std::size_t position() const
  {
    return pos;
  }

private:
  std::string_view text;
  std::size_t pos{0};
};

namespace
{
  template<typename T>
  outcome::std_result<BareItem> as_bare_item(outcome::std_result<T> &&result)
  {
    if (!result)
      {
        return result.error();
      }
    return BareItem{std::move(result.value())};
  }

  std::int64_t to_integer(std::string_view digits)
  {
    std::int64_t value = 0;
    std::from_chars(digits.data(), digits.data() + digits.size(), value);
    return value;
  }

  int hex_value(char c)
  {
    return is_digit(c) ? c - '0' : c - 'a' + 10;
  }
} // namespace

outcome::std_result<Item>
StructuredFieldParser::parse_item(std::string_view text) const
{
  Input input(text);
  input.skip_sp();

  auto item = parse_item_or_inner_list(input);
  if (!item)
    {
      return item.error();
    }

  input.skip_sp();
  if (!input.eof())
    {
      return fail(input, StructuredFieldErrc::TrailingCharacters);
    }
  return item;
}

outcome::std_result<List>
StructuredFieldParser::parse_list(std::string_view text) const
{
  Input input(text);
  input.skip_sp();

  List members;
  while (!input.eof())
    {
      auto member = parse_item_or_inner_list(input);
      if (!member)
        {
          return member.error();
        }
      members.push_back(std::move(member.value()));

      input.skip_ows();
      if (input.eof())
        {
          break;
        }
      if (input.consume() != ',')
        {
          return fail(input, StructuredFieldErrc::InvalidList);
        }
      input.skip_ows();
      if (input.eof())
        {
          return fail(input, StructuredFieldErrc::InvalidList);
        }
    }
  return members;
}

outcome::std_result<Dictionary>
StructuredFieldParser::parse_dictionary(std::string_view text) const
{
  Input input(text);
  input.skip_sp();

  Dictionary dictionary;
  while (!input.eof())
    {
      auto key = parse_key(input);
      if (!key)
        {
          return key.error();
        }

      if (input.next_is('='))
        {
          input.consume();
          auto member = parse_item_or_inner_list(input);
          if (!member)
            {
              return member.error();
            }
          dictionary.insert_or_assign(std::move(key.value()), std::move(member.value()));
        }
      else
        {
          auto parameters = parse_parameters(input);
          if (!parameters)
            {
              return parameters.error();
            }
          dictionary.insert_or_assign(std::move(key.value()), Item{Value{true}, std::move(parameters.value())});
        }

      input.skip_ows();
      if (input.eof())
        {
          break;
        }
      if (input.consume() != ',')
        {
          return fail(input, StructuredFieldErrc::InvalidDictionary);
        }
      input.skip_ows();
      if (input.eof())
        {
          return fail(input, StructuredFieldErrc::InvalidDictionary);
        }
    }
  return dictionary;
}

outcome::std_result<Item>
StructuredFieldParser::parse_item_or_inner_list(Input &input) const
{
  if (input.next_is('('))
    {
      return parse_inner_list(input);
    }

  auto bare_item = parse_bare_item(input);
  if (!bare_item)
    {
      return bare_item.error();
    }
  auto parameters = parse_parameters(input);
  if (!parameters)
    {
      return parameters.error();
    }
  return Item{to_value(bare_item.value()), std::move(parameters.value())};
}

outcome::std_result<Item>
StructuredFieldParser::parse_inner_list(Input &input) const
{
  input.consume();

  InnerList items;
  while (true)
    {
      input.skip_sp();
      if (input.eof())
        {
          break;
        }

      if (input.next_is(')'))
        {
          input.consume();
          auto parameters = parse_parameters(input);
          if (!parameters)
            {
              return parameters.error();
            }
          return Item{Value{std::move(items)}, std::move(parameters.value())};
        }

      auto bare_item = parse_bare_item(input);
      if (!bare_item)
        {
          return bare_item.error();
        }
      auto parameters = parse_parameters(input);
      if (!parameters)
        {
          return parameters.error();
        }
      items.emplace_back(to_value(bare_item.value()), std::move(parameters.value()));

      if (input.eof() || (input.peek() != ' ' && input.peek() != ')'))
        {
          return fail(input, StructuredFieldErrc::InvalidInnerList);
        }
    }
  return fail(input, StructuredFieldErrc::InvalidInnerList);
}

outcome::std_result<BareItem>
StructuredFieldParser::parse_bare_item(Input &input) const
{
  if (input.eof())
    {
      return fail(input, StructuredFieldErrc::UnexpectedEndOfInput);
    }

  char c = input.peek();
  if (c == '-' || is_digit(c))
    {
      return parse_number(input);
    }
  if (c == '"')
    {
      return as_bare_item(parse_string(input));
    }
  if (c == '*' || is_alpha(c))
    {
      return as_bare_item(parse_token(input));
    }
  if (c == ':')
    {
      return as_bare_item(parse_byte_sequence(input));
    }
  if (c == '?')
    {
      return as_bare_item(parse_boolean(input));
    }
  if (c == '@')
    {
      return as_bare_item(parse_date(input));
    }
  if (c == '%')
    {
      return as_bare_item(parse_display_string(input));
    }
  return fail(input, StructuredFieldErrc::UnrecognisedItem);
}

outcome::std_result<Parameters>
StructuredFieldParser::parse_parameters(Input &input) const
{
  Parameters parameters;
  while (input.next_is(';'))
    {
      input.consume();
      input.skip_sp();

      auto key = parse_key(input);
      if (!key)
        {
          return key.error();
        }

      BareItem value{true};
      if (input.next_is('='))
        {
          input.consume();
          auto bare_item = parse_bare_item(input);
          if (!bare_item)
            {
              return bare_item.error();
            }
          value = std::move(bare_item.value());
        }
      parameters.insert_or_assign(std::move(key.value()), std::move(value));
    }
  return parameters;
}

outcome::std_result<std::string>
StructuredFieldParser::parse_key(Input &input) const
{
  if (input.eof() || !(is_lcalpha(input.peek()) || input.peek() == '*'))
    {
      return fail(input, StructuredFieldErrc::InvalidKey);
    }

  std::string key;
  while (!input.eof() && is_key_char(input.peek()))
    {
      key.push_back(input.consume());
    }
  return key;
}

outcome::std_result<BareItem>
StructuredFieldParser::parse_number(Input &input) const
{
  bool negative = false;
  if (input.next_is('-'))
    {
      input.consume();
      negative = true;
    }

  if (input.eof() || !is_digit(input.peek()))
    {
      return fail(input, StructuredFieldErrc::InvalidInteger);
    }

  std::string number;
  std::size_t dot = std::string::npos;
  while (!input.eof())
    {
      char c = input.peek();
      if (is_digit(c))
        {
          number.push_back(c);
        }
      else if (dot == std::string::npos && c == '.')
        {
          if (number.size() > 12)
            {
              return fail(input, StructuredFieldErrc::InvalidDecimal);
            }
          dot = number.size();
          number.push_back(c);
        }
      else
        {
          break;
        }
      input.consume();

      if (dot == std::string::npos && number.size() > 15)
        {
          return fail(input, StructuredFieldErrc::InvalidInteger);
        }
      if (dot != std::string::npos && number.size() > 16)
        {
          return fail(input, StructuredFieldErrc::InvalidDecimal);
        }
    }

  if (dot == std::string::npos)
    {
      std::int64_t value = to_integer(number);
      return BareItem{negative ? -value : value};
    }

  std::string fraction = number.substr(dot + 1);
  if (fraction.empty() || fraction.size() > 3)
    {
      return fail(input, StructuredFieldErrc::InvalidDecimal);
    }
  fraction.append(3 - fraction.size(), '0');

  std::int64_t thousandths = to_integer(std::string_view(number).substr(0, dot)) * Decimal::scale + to_integer(fraction);
  return BareItem{Decimal{negative ? -thousandths : thousandths}};
}

outcome::std_result<std::string>
StructuredFieldParser::parse_string(Input &input) const
{
  input.consume();

  std::string value;
  while (!input.eof())
    {
      char c = input.consume();
      if (c == '\\')
        {
          if (input.eof())
            {
              return fail(input, StructuredFieldErrc::InvalidString);
            }
          char escaped = input.consume();
          if (escaped != '"' && escaped != '\\')
            {
              return fail(input, StructuredFieldErrc::InvalidString);
            }
          value.push_back(escaped);
        }
      else if (c == '"')
        {
          return value;
        }
      else if (!is_visible_ascii(c))
        {
          return fail(input, StructuredFieldErrc::InvalidString);
        }
      else
        {
          value.push_back(c);
        }
    }
  return fail(input, StructuredFieldErrc::InvalidString);
}

outcome::std_result<Token>
StructuredFieldParser::parse_token(Input &input) const
{
  if (input.eof() || !(is_alpha(input.peek()) || input.peek() == '*'))
    {
      return fail(input, StructuredFieldErrc::InvalidToken);
    }

  Token token;
  while (!input.eof() && is_token_char(input.peek()))
    {
      token.value.push_back(input.consume());
    }
  return token;
}

outcome::std_result<ByteSequence>
StructuredFieldParser::parse_byte_sequence(Input &input) const
{
  input.consume();

  std::string encoded;
  while (true)
    {
      if (input.eof())
        {
          return fail(input, StructuredFieldErrc::InvalidByteSequence);
        }
      char c = input.consume();
      if (c == ':')
        {
          break;
        }
      if (!gatekeeper::utils::Base64::is_base64_char(c) && c != '=')
        {
          return fail(input, StructuredFieldErrc::InvalidByteSequence);
        }
      encoded.push_back(c);
    }

  auto decoded = gatekeeper::utils::Base64::try_decode(encoded);
  if (!decoded)
    {
      return fail(input, StructuredFieldErrc::InvalidByteSequence);
    }
  return ByteSequence{std::move(*decoded)};
}

outcome::std_result<bool>
StructuredFieldParser::parse_boolean(Input &input) const
{
  input.consume();
  if (input.eof())
    {
      return fail(input, StructuredFieldErrc::InvalidBoolean);
    }

  char c = input.consume();
  if (c == '1')
    {
      return true;
    }
  if (c == '0')
    {
      return false;
    }
  return fail(input, StructuredFieldErrc::InvalidBoolean);
}

outcome::std_result<Date>
StructuredFieldParser::parse_date(Input &input) const
{
  input.consume();

  auto number = parse_number(input);
  if (!number)
    {
      return fail(input, StructuredFieldErrc::InvalidDate);
    }

  const auto *seconds = std::get_if<std::int64_t>(&number.value());
  if (seconds == nullptr)
    {
      return fail(input, StructuredFieldErrc::InvalidDate);
    }
  return Date{*seconds};
}

outcome::std_result<DisplayString>
StructuredFieldParser::parse_display_string(Input &input) const
{
  input.consume();
  if (!input.next_is('"'))
    {
      return fail(input, StructuredFieldErrc::InvalidDisplayString);
    }
  input.consume();

  std::string bytes;
  while (!input.eof())
    {
      char c = input.consume();
      if (!is_visible_ascii(c))
        {
          return fail(input, StructuredFieldErrc::InvalidDisplayString);
        }

      if (c == '%')
        {
          if (input.eof() || !is_lchex(input.peek()))
            {
              return fail(input, StructuredFieldErrc::InvalidDisplayString);
            }
          int high = hex_value(input.consume());
          if (input.eof() || !is_lchex(input.peek()))
            {
              return fail(input, StructuredFieldErrc::InvalidDisplayString);
            }
          int low = hex_value(input.consume());
          bytes.push_back(static_cast<char>(high * 16 + low));
        }
      else if (c == '"')
        {
          if (!is_valid_utf8(bytes))
            {
              return fail(input, StructuredFieldErrc::InvalidDisplayString);
            }
          return DisplayString{std::move(bytes)};
        }
      else
        {
          bytes.push_back(c);
        }
    }
  return fail(input, StructuredFieldErrc::InvalidDisplayString);
}

std::error_code
StructuredFieldParser::fail(const Input &input, StructuredFieldErrc ec) const
{
  std::error_code error = make_error_code(ec);
  logger_->debug("failed to parse structured field at offset {}: {}", input.position(), error.message());
  return error;
}
