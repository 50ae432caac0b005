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

#include "CanonicalMessageBuilder.hh"

#include <optional>
#include <set>
#include <variant>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

using namespace gatekeeper;

namespace
{
  constexpr std::string_view signature_params_component = "@signature-params";

  std::optional<std::string> string_parameter(const sfv::Parameters &parameters, const std::string &key)
  {
    const auto *value = parameters.find(key);
    if (value == nullptr)
      {
        return {};
      }
    const auto *str = std::get_if<std::string>(value);
    if (str == nullptr)
      {
        return {};
      }
    return *str;
  }

  VerificationFailure unresolvable(std::string reason)
  {
    return make_failure(VerificationErrc::UnresolvableComponent, std::move(reason));
  }
} // namespace

verification_result<std::string>
CanonicalMessageBuilder::build(const Request &request, const sfv::InnerList &components, const sfv::Parameters &parameters) const
{
  std::string canonical;
  std::set<std::string> seen;

  for (const auto &component: components)
    {
      const auto *name = component.get_if<std::string>();
      if (name == nullptr)
        {
          return unresolvable("covered component is not a string");
        }
      if (*name == signature_params_component)
        {
          return unresolvable("@signature-params cannot be a covered component");
        }

      auto label = serializer.serialize_item(component);
      if (!label)
        {
          return unresolvable(fmt::format("cannot serialize component '{}': {}", *name, label.error().message()));
        }
      if (!seen.insert(label.value()).second)
        {
          return unresolvable(fmt::format("component {} is covered twice", label.value()));
        }

      auto value = resolve(request, *name, component.parameters);
      if (!value)
        {
          return value.error();
        }

      canonical += label.value() + ": " + value.value() + "\n";
    }

  auto signature_params = serializer.serialize_inner_list(components, parameters);
  if (!signature_params)
    {
      return unresolvable(fmt::format("cannot serialize signature parameters: {}", signature_params.error().message()));
    }
  canonical += fmt::format("\"{}\": {}", signature_params_component, signature_params.value());

  logger->debug("canonical message has {} covered components", components.size());
  return canonical;
}

verification_result<std::string>
CanonicalMessageBuilder::resolve(const Request &request, const std::string &name, const sfv::Parameters &parameters) const
{
  if (boost::algorithm::starts_with(name, "@"))
    {
      return resolve_derived(request, name, parameters);
    }
  return resolve_header(request, name, parameters);
}

verification_result<std::string>
CanonicalMessageBuilder::resolve_derived(const Request &request, const std::string &name, const sfv::Parameters &parameters) const
{
  std::optional<std::string> value;

  if (name == "@method")
    {
      value = request.method();
    }
  else if (name == "@target-uri")
    {
      value = request.target_uri();
    }
  else if (name == "@authority")
    {
      value = request.authority();
    }
  else if (name == "@scheme")
    {
      value = request.scheme();
    }
  else if (name == "@path")
    {
      value = request.path();
    }
  else if (name == "@query")
    {
      value = request.query();
    }
  else if (name == "@request-target")
    {
      value = request.request_target();
    }
  else if (name == "@query-param")
    {
      return resolve_query_param(request, parameters);
    }
  else
    {
      return unresolvable(fmt::format("unknown derived component '{}'", name));
    }

  if (!value)
    {
      return unresolvable(fmt::format("derived component '{}' is not available", name));
    }
  return *value;
}

verification_result<std::string>
CanonicalMessageBuilder::resolve_query_param(const Request &request, const sfv::Parameters &parameters) const
{
  auto param_name = string_parameter(parameters, "name");
  if (!param_name)
    {
      return unresolvable("@query-param requires a string 'name' parameter");
    }

  auto values = request.query_param(*param_name);
  if (values.empty())
    {
      return unresolvable(fmt::format("query parameter '{}' is not present", *param_name));
    }
  return boost::algorithm::join(values, ",");
}

verification_result<std::string>
CanonicalMessageBuilder::resolve_header(const Request &request, const std::string &name, const sfv::Parameters &parameters) const
{
  auto values = request.header_values(name);
  if (values.empty())
    {
      return unresolvable(fmt::format("header '{}' is not present", name));
    }

  std::string combined = combine_header_values(values);

  if (const auto *sf = parameters.find("sf"); sf != nullptr)
    {
      const auto *structured = std::get_if<bool>(sf);
      if (structured != nullptr && *structured)
        {
          return reserialize_structured(name, combined);
        }
    }
  if (const auto *key = parameters.find("key"); key != nullptr)
    {
      return resolve_dictionary_member(name, combined, *key);
    }
  return combined;
}

verification_result<std::string>
CanonicalMessageBuilder::reserialize_structured(const std::string &name, const std::string &value) const
{
  if (auto dictionary = parser.parse_dictionary(value); dictionary)
    {
      if (auto serialized = serializer.serialize_dictionary(dictionary.value()); serialized)
        {
          return serialized.value();
        }
    }
  if (auto list = parser.parse_list(value); list)
    {
      if (auto serialized = serializer.serialize_list(list.value()); serialized)
        {
          return serialized.value();
        }
    }
  if (auto item = parser.parse_item(value); item)
    {
      if (auto serialized = serializer.serialize_item(item.value()); serialized)
        {
          return serialized.value();
        }
    }
  return unresolvable(fmt::format("header '{}' is not a structured field", name));
}

verification_result<std::string>
CanonicalMessageBuilder::resolve_dictionary_member(const std::string &name, const std::string &value, const sfv::BareItem &key) const
{
  const auto *member_key = std::get_if<std::string>(&key);
  if (member_key == nullptr)
    {
      return unresolvable(fmt::format("'key' parameter of header '{}' is not a string", name));
    }

  auto dictionary = parser.parse_dictionary(value);
  if (!dictionary)
    {
      return unresolvable(fmt::format("header '{}' is not a dictionary: {}", name, dictionary.error().message()));
    }

  const auto *member = dictionary.value().find(*member_key);
  if (member == nullptr)
    {
      return unresolvable(fmt::format("header '{}' has no member '{}'", name, *member_key));
    }

  auto serialized = serializer.serialize_item(*member);
  if (!serialized)
    {
      return unresolvable(fmt::format("cannot serialize member '{}' of header '{}'", *member_key, name));
    }
  return serialized.value();
}

std::string
CanonicalMessageBuilder::combine_header_values(const std::vector<std::string> &values)
{
  std::vector<std::string> trimmed;
  trimmed.reserve(values.size());
  for (const auto &value: values)
    {
      trimmed.push_back(boost::algorithm::trim_copy(value));
    }
  return boost::algorithm::join(trimmed, ", ");
}
