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

#ifndef UTILS_BASE64_HH
#define UTILS_BASE64_HH

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace gatekeeper::utils
{
  class Base64Exception : public std::exception
  {
  public:
    explicit Base64Exception(std::string detail)
      : detail(std::move(detail))
    {
    }

    const char *what() const noexcept override
    {
      return detail.c_str();
    }

  private:
    std::string detail;
  };

  class Base64
  {
  public:
    static std::string encode(std::string_view val);
    static std::string decode(std::string_view val);

    // Same as decode, but reports malformed input as std::nullopt.
    static std::optional<std::string> try_decode(std::string_view val);

    static bool is_base64_char(char c);
  };
} // namespace gatekeeper::utils

#endif // UTILS_BASE64_HH
