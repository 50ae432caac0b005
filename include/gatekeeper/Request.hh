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

#ifndef GATEKEEPER_REQUEST_HH
#define GATEKEEPER_REQUEST_HH

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http.hpp>
#include <boost/url/url.hpp>

namespace gatekeeper
{
  // An HTTP request with a fully buffered body, as seen by the verifier.
  class Request
  {
  public:
    using message_type = boost::beast::http::request<boost::beast::http::string_body>;

    explicit Request(message_type message, std::string scheme = "https");

    const message_type &message() const;

    // Uppercase request method.
    std::string method() const;
    std::string scheme() const;
    // Lowercase host and optional port, from an absolute-form target or the Host header.
    std::optional<std::string> authority() const;
    // Path and query as sent on the wire; empty optional when the target cannot be parsed.
    std::optional<std::string> path() const;
    std::optional<std::string> query() const;
    std::optional<std::string> target_uri() const;
    std::optional<std::string> request_target() const;
    // Decoded values of a query parameter, in order of appearance.
    std::vector<std::string> query_param(std::string_view name) const;

    // All instances of a header; empty when absent.
    std::vector<std::string> header_values(std::string_view name) const;

    const std::string &body() const;

  private:
    message_type msg;
    std::string request_scheme;
    std::optional<boost::urls::url> target;
  };
} // namespace gatekeeper

#endif // GATEKEEPER_REQUEST_HH
