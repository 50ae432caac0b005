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

#ifndef CRYPTO_SIGNATURE_VERIFIER_HH
#define CRYPTO_SIGNATURE_VERIFIER_HH

#include <string>
#include <string_view>
#include <memory>

#include <boost/outcome/std_result.hpp>

#include "crypto/SignatureAlgorithmType.hh"
#include "crypto/SignatureVerifierErrors.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace gatekeeper::crypto
{
  class SignatureAlgorithm;

  class SignatureVerifier
  {
  public:
    SignatureVerifier() = default;

    // For ECDSA the key is a SubjectPublicKeyInfo (base64 DER, PEM or DER),
    // for HMAC it is the raw shared secret.
    outcome::std_result<void> set_key(SignatureAlgorithmType type, std::string_view key);

    // The signature is raw bytes. ECDSA signatures use the fixed size r||s encoding.
    outcome::std_result<void> verify(std::string_view data, std::string_view signature);

  private:
    std::shared_ptr<SignatureAlgorithm> algo;
    std::shared_ptr<spdlog::logger> logger{gatekeeper::utils::Logging::create("gatekeeper:crypto:signatures")};
  };
} // namespace gatekeeper::crypto

#endif // CRYPTO_SIGNATURE_VERIFIER_HH
