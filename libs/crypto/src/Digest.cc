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

#include "crypto/Digest.hh"

#include <array>
#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "OpenSSLError.hh"
#include "crypto/SignatureVerifierErrors.hh"

namespace gatekeeper::crypto
{
  outcome::std_result<std::string> Digest::compute(DigestAlgorithm algorithm, std::string_view data)
  {
    const EVP_MD *md = algorithm == DigestAlgorithm::SHA512 ? EVP_sha512() : EVP_sha256();

    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hash_len = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx)
      {
        logger_->error("failed to create digest context");
        return SignatureVerifierErrc::InternalFailure;
      }

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
      {
        logger_->error("failed to initialize {} digest ({})", EVP_MD_get0_name(md), last_openssl_error());
        ERR_clear_error();
        return SignatureVerifierErrc::InternalFailure;
      }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
      {
        logger_->error("failed to update {} digest ({})", EVP_MD_get0_name(md), last_openssl_error());
        ERR_clear_error();
        return SignatureVerifierErrc::InternalFailure;
      }

    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1)
      {
        logger_->error("failed to finalize {} digest ({})", EVP_MD_get0_name(md), last_openssl_error());
        ERR_clear_error();
        return SignatureVerifierErrc::InternalFailure;
      }

    return std::string{hash.begin(), hash.begin() + hash_len};
  }
} // namespace gatekeeper::crypto
