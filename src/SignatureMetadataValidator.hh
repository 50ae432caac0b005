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

#ifndef SIGNATURE_METADATA_VALIDATOR_HH
#define SIGNATURE_METADATA_VALIDATOR_HH

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "gatekeeper/VerificationPolicy.hh"
#include "sfv/StructuredField.hh"
#include "utils/Logging.hh"

#include "VerificationFailure.hh"

namespace gatekeeper
{
  struct SignatureMetadata
  {
    std::string algorithm;
    std::optional<std::int64_t> created;
    std::optional<std::int64_t> expires;
    std::optional<std::string> nonce;
    std::optional<std::string> keyid;
    std::optional<std::string> tag;
  };

  class SignatureMetadataValidator
  {
  public:
    SignatureMetadataValidator() = default;

    verification_result<SignatureMetadata> validate(const sfv::Parameters &parameters,
                                                    std::string_view expected_algorithm,
                                                    const VerificationPolicy &policy,
                                                    std::chrono::system_clock::time_point now) const;

  private:
    verification_result<SignatureMetadata> extract(const sfv::Parameters &parameters, const VerificationPolicy &policy) const;
    verification_result<void> check_required(const SignatureMetadata &metadata, const VerificationPolicy &policy) const;
    verification_result<void> check_timestamps(const SignatureMetadata &metadata,
                                               const VerificationPolicy &policy,
                                               std::chrono::system_clock::time_point now) const;

  private:
    std::shared_ptr<spdlog::logger> logger{gatekeeper::utils::Logging::create("gatekeeper:metadata")};
  };
} // namespace gatekeeper

#endif // SIGNATURE_METADATA_VALIDATOR_HH
