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

#include "gatekeeper/Request.hh"

#include <utility>

#include <boost/algorithm/string.hpp>
#include <boost/url/parse.hpp>

using namespace gatekeeper;

namespace
{
  template<typename S>
  std::string to_string(const S &s)
  {
    return std::string(s.data(), s.size());
  }
} // namespace

Request::Request(message_type message, std::string scheme)
  : msg(std::move(message))
  , request_scheme(std::move(scheme))
{
  auto raw_target = msg.target();
  auto parsed = boost::urls::parse_uri_reference(std::string_view(raw_target.data(), raw_target.size()));
  if (parsed)
    {
      target = boost::urls::url(*parsed);
    }
}

const Request::message_type &
Request::message() const
{
  return msg;
}

std::string
Request::method() const
{
  std::string method = to_string(msg.method_string());
  boost::algorithm::to_upper(method);
  return method;
}

std::string
Request::scheme() const
{
  return boost::algorithm::to_lower_copy(request_scheme);
}

std::optional<std::string>
Request::authority() const
{
  if (target && target->has_authority())
    {
      return boost::algorithm::to_lower_copy(to_string(target->encoded_host_and_port()));
    }

  auto host = msg.find(boost::beast::http::field::host);
  if (host == msg.end())
    {
      return {};
    }
  std::string authority = boost::algorithm::trim_copy(to_string(host->value()));
  if (authority.empty())
    {
      return {};
    }
  return boost::algorithm::to_lower_copy(authority);
}

std::optional<std::string>
Request::path() const
{
  if (!target)
    {
      return {};
    }
  std::string path = to_string(target->encoded_path());
  if (path.empty())
    {
      path = "/";
    }
  return path;
}

std::optional<std::string>
Request::query() const
{
  if (!target)
    {
      return {};
    }
  if (!target->has_query())
    {
      return std::string{};
    }
  return to_string(target->encoded_query());
}

std::optional<std::string>
Request::target_uri() const
{
  auto authority = this->authority();
  auto request_target = this->request_target();
  if (!authority || !request_target)
    {
      return {};
    }
  return scheme() + "://" + *authority + *request_target;
}

std::optional<std::string>
Request::request_target() const
{
  auto path = this->path();
  if (!path)
    {
      return {};
    }
  if (target->has_query())
    {
      return *path + "?" + to_string(target->encoded_query());
    }
  return path;
}

std::vector<std::string>
Request::query_param(std::string_view name) const
{
  std::vector<std::string> values;
  if (!target)
    {
      return values;
    }

  for (const auto &param: target->params())
    {
      if (param.key == name)
        {
          values.push_back(param.has_value ? param.value : std::string{});
        }
    }
  return values;
}

std::vector<std::string>
Request::header_values(std::string_view name) const
{
  std::vector<std::string> values;
  auto range = msg.equal_range(boost::beast::string_view(name.data(), name.size()));
  for (auto it = range.first; it != range.second; ++it)
    {
      values.push_back(to_string(it->value()));
    }
  return values;
}

const std::string &
Request::body() const
{
  return msg.body();
}
