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

#ifndef SFV_STRUCTURED_FIELD_SERIALIZER_HH
#define SFV_STRUCTURED_FIELD_SERIALIZER_HH

#include <memory>
#include <string>
#include <string_view>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "sfv/StructuredField.hh"
#include "sfv/StructuredFieldErrors.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace gatekeeper::sfv
{
  class StructuredFieldSerializer
  {
  public:
    StructuredFieldSerializer() = default;

    outcome::std_result<std::string> serialize_item(const Item &item) const;
    outcome::std_result<std::string> serialize_list(const List &list) const;
    outcome::std_result<std::string> serialize_dictionary(const Dictionary &dictionary) const;
    outcome::std_result<std::string> serialize_inner_list(const InnerList &items, const Parameters &parameters) const;
    outcome::std_result<std::string> serialize_bare_item(const BareItem &value) const;
    outcome::std_result<std::string> serialize_parameters(const Parameters &parameters) const;

    // Parses text as the given field type and reports whether serializing the
    // result reproduces it exactly. Parse errors are returned as errors.
    outcome::std_result<bool> round_trip(FieldType type, std::string_view text) const;

  private:
    outcome::std_result<std::string> serialize_value(const Value &value) const;
    outcome::std_result<std::string> serialize_integer(std::int64_t value) const;
    outcome::std_result<std::string> serialize_decimal(const Decimal &value) const;
    outcome::std_result<std::string> serialize_string(const std::string &value) const;
    outcome::std_result<std::string> serialize_token(const Token &value) const;
    outcome::std_result<std::string> serialize_display_string(const DisplayString &value) const;
    outcome::std_result<std::string> serialize_key(const std::string &key) const;

    std::error_code fail(StructuredFieldErrc ec, std::string_view what) const;

  private:
    std::shared_ptr<spdlog::logger> logger_{gatekeeper::utils::Logging::create("gatekeeper:sfv:serializer")};
  };
} // namespace gatekeeper::sfv

#endif // SFV_STRUCTURED_FIELD_SERIALIZER_HH
