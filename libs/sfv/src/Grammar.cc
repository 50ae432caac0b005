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

#include "Grammar.hh"

namespace gatekeeper::sfv::grammar
{
  bool is_valid_utf8(std::string_view text)
  {
    std::size_t i = 0;
    while (i < text.size())
      {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80)
          {
            i++;
            continue;
          }

        std::size_t length = 0;
        std::uint32_t code_point = 0;
        if ((c & 0xe0U) == 0xc0U)
          {
            length = 2;
            code_point = c & 0x1fU;
          }
        else if ((c & 0xf0U) == 0xe0U)
          {
            length = 3;
            code_point = c & 0x0fU;
          }
        else if ((c & 0xf8U) == 0xf0U)
          {
            length = 4;
            code_point = c & 0x07U;
          }
        else
          {
            return false;
          }

        if (i + length > text.size())
          {
            return false;
          }

        for (std::size_t k = 1; k < length; k++)
          {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xc0U) != 0x80U)
              {
                return false;
              }
            code_point = (code_point << 6U) | (cc & 0x3fU);
          }

        // Overlong encodings, surrogates and out of range code points
        if ((length == 2 && code_point < 0x80) || (length == 3 && code_point < 0x800) || (length == 4 && code_point < 0x10000)
            || code_point > 0x10ffff || (code_point >= 0xd800 && code_point <= 0xdfff))
          {
            return false;
          }
        i += length;
      }
    return true;
  }
} // namespace gatekeeper::sfv::grammar
