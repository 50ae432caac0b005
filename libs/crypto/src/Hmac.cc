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

#include "crypto/Hmac.hh"

#include <array>
#include <climits>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "OpenSSLError.hh"
#include "crypto/SignatureVerifierErrors.hh"

namespace gatekeeper::crypto
{
  outcome::std_result<std::string> Hmac::sha256(std::string_view key, std::string_view data)
  {
    if (key.size() > INT_MAX)
      {
        logger_->error("HMAC key exceeds maximum size = {}", key.size());
        return SignatureVerifierErrc::InvalidKey;
      }

    static constexpr unsigned char empty_key = 0;
    const auto *key_data = key.empty() ? &empty_key : reinterpret_cast<const unsigned char *>(key.data()); // NOLINT:cppcoreguidelines-pro-type-reinterpret-cast

    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
    unsigned int mac_len = 0;

    if (HMAC(EVP_sha256(),
             key_data,
             static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char *>(data.data()), // NOLINT:cppcoreguidelines-pro-type-reinterpret-cast
             data.size(),
             mac.data(),
             &mac_len)
        == nullptr)
      {
        logger_->error("failed to compute HMAC-SHA256 ({})", last_openssl_error());
        ERR_clear_error();
        return SignatureVerifierErrc::InternalFailure;
      }

    return std::string{mac.begin(), mac.begin() + mac_len};
  }
} // namespace gatekeeper::crypto
