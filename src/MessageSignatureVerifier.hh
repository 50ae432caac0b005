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

#ifndef MESSAGE_SIGNATURE_VERIFIER_HH
#define MESSAGE_SIGNATURE_VERIFIER_HH

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "gatekeeper/MessageVerifier.hh"
#include "sfv/StructuredField.hh"
#include "sfv/StructuredFieldParser.hh"
#include "utils/Logging.hh"
#include "utils/TimeSource.hh"

#include "CanonicalMessageBuilder.hh"
#include "ContentDigestVerifier.hh"
#include "SignatureMetadataValidator.hh"
#include "VerificationFailure.hh"

namespace gatekeeper
{
  class MessageSignatureVerifier : public MessageVerifier
  {
  public:
    MessageSignatureVerifier(VerificationPolicy policy, std::shared_ptr<utils::TimeSource> time_source);

    void set_trace_callback(trace_callback_t callback) override;
    VerificationResult verify(const Request &request, const KeyMaterial &key) const override;
    bool verify_signature(std::string_view payload, std::string_view signature, const KeyMaterial &key) const override;

  private:
    struct SignatureEntry
    {
      std::string label;
      std::string signature;
      sfv::InnerList components;
      sfv::Parameters parameters;
    };

    verification_result<sfv::Dictionary> parse_header(const Request &request, std::string_view name) const;
    verification_result<SignatureEntry> select_entry(const Request &request, const std::string &label) const;
    verification_result<void> check_signature(std::string_view payload, std::string_view signature, const KeyMaterial &key) const;
    VerificationResult reject(const VerificationFailure &failure, std::string canonical_message = {}) const;

  private:
    VerificationPolicy policy;
    std::shared_ptr<utils::TimeSource> time_source;
    trace_callback_t trace_callback;
    sfv::StructuredFieldParser parser;
    SignatureMetadataValidator metadata_validator;
    CanonicalMessageBuilder canonical_builder;
    ContentDigestVerifier digest_verifier;
    std::shared_ptr<spdlog::logger> logger{gatekeeper::utils::Logging::create("gatekeeper:verifier")};
  };
} // namespace gatekeeper

#endif // MESSAGE_SIGNATURE_VERIFIER_HH
