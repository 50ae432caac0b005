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

#ifndef CONTENT_DIGEST_VERIFIER_HH
#define CONTENT_DIGEST_VERIFIER_HH

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "gatekeeper/Request.hh"
#include "sfv/StructuredField.hh"
#include "sfv/StructuredFieldParser.hh"
#include "utils/Logging.hh"

#include "VerificationFailure.hh"

namespace gatekeeper
{
  // Checks the Content-Digest header (sha-256, sha-512) against the buffered body.
  class ContentDigestVerifier
  {
  public:
    ContentDigestVerifier() = default;

    verification_result<void> verify(const Request &request) const;

  private:
    verification_result<std::string> expected_digest(const std::string &algorithm, const sfv::Item &member) const;

  private:
    sfv::StructuredFieldParser parser;
    std::shared_ptr<spdlog::logger> logger{gatekeeper::utils::Logging::create("gatekeeper:content-digest")};
  };
} // namespace gatekeeper

#endif // CONTENT_DIGEST_VERIFIER_HH
