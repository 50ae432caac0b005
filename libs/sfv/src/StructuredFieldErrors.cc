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

#include "sfv/StructuredFieldErrors.hh"

using namespace gatekeeper::sfv;

namespace
{
  struct StructuredFieldErrorCategory : std::error_category
  {
    const char *name() const noexcept override
    {
      return "sfv";
    }
    std::string message(int ev) const override;
  };

  std::string StructuredFieldErrorCategory::message(int ev) const
  {
    switch (static_cast<StructuredFieldErrc>(ev))
      {
      case StructuredFieldErrc::Success:
        return "success";
      case StructuredFieldErrc::UnexpectedEndOfInput:
        return "unexpected end of input";
      case StructuredFieldErrc::TrailingCharacters:
        return "unexpected characters after value";
      case StructuredFieldErrc::UnrecognisedItem:
        return "unrecognised item";
      case StructuredFieldErrc::InvalidBoolean:
        return "invalid boolean";
      case StructuredFieldErrc::InvalidInteger:
        return "invalid integer";
      case StructuredFieldErrc::InvalidDecimal:
        return "invalid decimal";
      case StructuredFieldErrc::InvalidString:
        return "invalid string";
      case StructuredFieldErrc::InvalidToken:
        return "invalid token";
      case StructuredFieldErrc::InvalidByteSequence:
        return "invalid byte sequence";
      case StructuredFieldErrc::InvalidDate:
        return "invalid date";
      case StructuredFieldErrc::InvalidDisplayString:
        return "invalid display string";
      case StructuredFieldErrc::InvalidKey:
        return "invalid key";
      case StructuredFieldErrc::InvalidInnerList:
        return "invalid inner list";
      case StructuredFieldErrc::InvalidList:
        return "invalid list";
      case StructuredFieldErrc::InvalidDictionary:
        return "invalid dictionary";
      case StructuredFieldErrc::ValueOutOfRange:
        return "value out of range";
      }
    return "(unknown)";
  }

  const StructuredFieldErrorCategory globalStructuredFieldErrorCategory{};
} // namespace

std::error_code
gatekeeper::sfv::make_error_code(StructuredFieldErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalStructuredFieldErrorCategory};
}
