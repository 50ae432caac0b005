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

#ifndef SFV_GRAMMAR_HH
#define SFV_GRAMMAR_HH

#include <cstdint>
#include <string_view>

namespace gatekeeper::sfv::grammar
{
  constexpr std::int64_t max_integer = 999'999'999'999'999;
  constexpr std::int64_t max_decimal_integer_part = 999'999'999'999;

  inline bool is_digit(char c)
  {
    return c >= '0' && c <= '9';
  }

  inline bool is_lcalpha(char c)
  {
    return c >= 'a' && c <= 'z';
  }

  inline bool is_alpha(char c)
  {
    return is_lcalpha(c) || (c >= 'A' && c <= 'Z');
  }

  inline bool is_lchex(char c)
  {
    return is_digit(c) || (c >= 'a' && c <= 'f');
  }

  inline bool is_visible_ascii(char c)
  {
    auto uc = static_cast<unsigned char>(c);
    return uc >= 0x20 && uc <= 0x7e;
  }

  // RFC 9110 tchar
  inline bool is_tchar(char c)
  {
    switch (c)
      {
      case '!':
      case '#':
      case '$':
      case '%':
      case '&':
      case '\'':
      case '*':
      case '+':
      case '-':
      case '.':
      case '^':
      case '_':
      case '`':
      case '|':
      case '~':
        return true;
      default:
        return is_alpha(c) || is_digit(c);
      }
  }

  inline bool is_token_char(char c)
  {
    return is_tchar(c) || c == ':' || c == '/';
  }

  inline bool is_key_char(char c)
  {
    return is_lcalpha(c) || is_digit(c) || c == '_' || c == '-' || c == '.' || c == '*';
  }

  inline bool is_valid_key(std::string_view key)
  {
    if (key.empty() || !(is_lcalpha(key.front()) || key.front() == '*'))
      {
        return false;
      }
    for (char c: key)
      {
        if (!is_key_char(c))
          {
            return false;
          }
      }
    return true;
  }

  inline bool is_valid_token(std::string_view token)
  {
    if (token.empty() || !(is_alpha(token.front()) || token.front() == '*'))
      {
        return false;
      }
    for (char c: token)
      {
        if (!is_token_char(c))
          {
            return false;
          }
      }
    return true;
  }

  bool is_valid_utf8(std::string_view text);
} // namespace gatekeeper::sfv::grammar

#endif // SFV_GRAMMAR_HH
