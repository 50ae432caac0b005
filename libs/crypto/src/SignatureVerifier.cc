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

#include "crypto/SignatureVerifier.hh"

#include <memory>

#include <spdlog/spdlog.h>

#include "crypto/SignatureVerifierErrors.hh"
#include "ECDSASignatureAlgorithm.hh"
#include "HMACSignatureAlgorithm.hh"
#include "SignatureAlgorithm.hh"

using namespace gatekeeper::crypto;

std::shared_ptr<SignatureAlgorithm>
SignatureAlgorithmFactory::create(SignatureAlgorithmType type)
{
  switch (type)
    {
    case SignatureAlgorithmType::ECDSA_P256_SHA256:
      return std::make_shared<ECDSASignatureAlgorithm>();
    case SignatureAlgorithmType::HMAC_SHA256:
      return std::make_shared<HMACSignatureAlgorithm>();
    }
  return {};
}

outcome::std_result<void>
SignatureVerifier::set_key(SignatureAlgorithmType type, std::string_view key)
{
  algo = SignatureAlgorithmFactory::create(type);
  if (!algo)
    {
      logger->error("unsupported signature algorithm");
      return SignatureVerifierErrc::InternalFailure;
    }
  return algo->set_key(key);
}

outcome::std_result<void>
SignatureVerifier::verify(std::string_view data, std::string_view signature)
{
  if (!algo)
    {
      logger->error("no algorithm configured");
      return SignatureVerifierErrc::InvalidKey;
    }

  if (signature.empty())
    {
      logger->info("signature empty");
      return SignatureVerifierErrc::InvalidSignature;
    }

  return algo->verify(data, signature);
}
