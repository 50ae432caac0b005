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

#include "HMACSignatureAlgorithm.hh"

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include "crypto/ConstantTime.hh"
#include "crypto/Hmac.hh"
#include "crypto/SignatureVerifierErrors.hh"

using namespace gatekeeper::crypto;

HMACSignatureAlgorithm::~HMACSignatureAlgorithm()
{
  OPENSSL_cleanse(secret.data(), secret.size());
}

outcome::std_result<void>
HMACSignatureAlgorithm::set_key(std::string_view key)
{
  if (key.empty())
    {
      logger->info("empty HMAC secret");
      return SignatureVerifierErrc::InvalidKey;
    }
  OPENSSL_cleanse(secret.data(), secret.size());
  secret.assign(key);
  return outcome::success();
}

outcome::std_result<void>
HMACSignatureAlgorithm::verify(std::string_view data, std::string_view signature)
{
  if (secret.empty())
    {
      logger->error("no secret loaded");
      return SignatureVerifierErrc::InvalidKey;
    }

  if (signature.size() != SHA256_DIGEST_LENGTH)
    {
      logger->info("signature has invalid size = {}", signature.size());
      return SignatureVerifierErrc::InvalidSignature;
    }

  Hmac hmac;
  auto expected = hmac.sha256(secret, data);
  if (!expected)
    {
      return expected.error();
    }

  bool match = constant_time_equals(expected.value(), signature);
  OPENSSL_cleanse(expected.value().data(), expected.value().size());
  if (!match)
    {
      return SignatureVerifierErrc::Mismatch;
    }
  return outcome::success();
}
