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

#ifndef SFV_STRUCTURED_FIELD_PARSER_HH
#define SFV_STRUCTURED_FIELD_PARSER_HH

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
  class StructuredFieldParser
  {
  public:
    StructuredFieldParser() = default;

    outcome::std_result<Item> parse_item(std::string_view text) const;
    outcome::std_result<List> parse_list(std::string_view text) const;
    outcome::std_result<Dictionary> parse_dictionary(std::string_view text) const;

  private:
    class Input;

    outcome::std_result<Item> parse_item_or_inner_list(Input &input) const;
    outcome::std_result<Item> parse_inner_list(Input &input) const;
    outcome::std_result<BareItem> parse_bare_item(Input &input) const;
    outcome::std_result<Parameters> parse_parameters(Input &input) const;
    outcome::std_result<std::string> parse_key(Input &input) const;
    outcome::std_result<BareItem> parse_number(Input &input) const;
    outcome::std_result<std::string> parse_string(Input &input) const;
    outcome::std_result<Token> parse_token(Input &input) const;
    outcome::std_result<ByteSequence> parse_byte_sequence(Input &input) const;
    outcome::std_result<bool> parse_boolean(Input &input) const;
    outcome::std_result<Date> parse_date(Input &input) const;
    outcome::std_result<DisplayString> parse_display_string(Input &input) const;

    std::error_code fail(const Input &input, StructuredFieldErrc ec) const;

  private:
    std::shared_ptr<spdlog::logger> logger_{gatekeeper::utils::Logging::create("gatekeeper:sfv:parser")};
  };
} // namespace gatekeeper::sfv

#endif // SFV_STRUCTURED_FIELD_PARSER_HH
