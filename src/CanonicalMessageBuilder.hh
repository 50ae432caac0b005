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

#ifndef CANONICAL_MESSAGE_BUILDER_HH
#define CANONICAL_MESSAGE_BUILDER_HH

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "gatekeeper/Request.hh"
#include "sfv/StructuredField.hh"
#include "sfv/StructuredFieldParser.hh"
#include "sfv/StructuredFieldSerializer.hh"
#include "utils/Logging.hh"

#include "VerificationFailure.hh"

namespace gatekeeper
{
  // Builds the signature base: one line per covered component followed by
  // the "@signature-params" line.
  class CanonicalMessageBuilder
  {
  public:
    CanonicalMessageBuilder() = default;

    verification_result<std::string> build(const Request &request,
                                           const sfv::InnerList &components,
                                           const sfv::Parameters &parameters) const;

  private:
    verification_result<std::string> resolve(const Request &request, const std::string &name, const sfv::Parameters &parameters) const;
    verification_result<std::string> resolve_derived(const Request &request, const std::string &name, const sfv::Parameters &parameters) const;
    verification_result<std::string> resolve_query_param(const Request &request, const sfv::Parameters &parameters) const;
    verification_result<std::string> resolve_header(const Request &request, const std::string &name, const sfv::Parameters &parameters) const;
    verification_result<std::string> reserialize_structured(const std::string &name, const std::string &value) const;
    verification_result<std::string> resolve_dictionary_member(const std::string &name,
                                                                const std::string &value,
                                                                const sfv::BareItem &key) const;

    static std::string combine_header_values(const std::vector<std::string> &values);

  private:
    sfv::StructuredFieldParser parser;
    sfv::StructuredFieldSerializer serializer;
    std::shared_ptr<spdlog::logger> logger{gatekeeper::utils::Logging::create("gatekeeper:canonical")};
  };
} // namespace gatekeeper

#endif // CANONICAL_MESSAGE_BUILDER_HH
