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

#ifndef CRYPTO_TEST_SIGNER_HH
#define CRYPTO_TEST_SIGNER_HH

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include "utils/Base64.hh"

namespace gatekeeper::test
{
  // Fixed P-256 key pair. The private key is a SEC1 ECPrivateKey, the public
  // key a SubjectPublicKeyInfo, both base64 DER.
  constexpr const char *test_private_key =
    "MHcCAQEEIHWZ2Ueq6odQNG+aaYmEbp7C6nujYNGr7nYKK2jqQ2asoAoGCCqGSM49AwEHoUQDQgAEJSm4DMcivAwvhM+KNce2C/X26cj3oGyUwWVUPuNuZHtd2qyVsM+0g7qX73Qh0Of6fn10AApLnl8vRQsvx94fZQ==";
  constexpr const char *test_public_key =
    "MFkwEwYHKoZIzj0CAQYIKoZIzj0DAQcDQgAEJSm4DMcivAwvhM+KNce2C/X26cj3oGyUwWVUPuNuZHtd2qyVsM+0g7qX73Qh0Of6fn10AApLnl8vRQsvx94fZQ==";

  class TestSigner
  {
  public:
    TestSigner()
      : TestSigner(load(test_private_key))
    {
    }

    static TestSigner generate(const char *curve = "P-256")
    {
      EVP_PKEY *pkey = EVP_EC_gen(curve);
      if (pkey == nullptr)
        {
          throw std::runtime_error("failed to generate EC key");
        }
      return TestSigner(pkey);
    }

    // Signs with ECDSA P-256/SHA-256 and returns the fixed size r||s encoding.
    std::string sign(std::string_view data) const
    {
      std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
      if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1)
        {
          throw std::runtime_error("failed to initialize signing");
        }

      const auto *in = reinterpret_cast<const unsigned char *>(data.data());
      size_t der_len = 0;
      if (EVP_DigestSign(ctx.get(), nullptr, &der_len, in, data.size()) != 1)
        {
          throw std::runtime_error("failed to size signature");
        }
      std::string der(der_len, '\0');
      if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char *>(der.data()), &der_len, in, data.size()) != 1)
        {
          throw std::runtime_error("failed to sign");
        }

      const auto *p = reinterpret_cast<const unsigned char *>(der.data());
      std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_len)),
                                                                ECDSA_SIG_free);
      if (!sig)
        {
          throw std::runtime_error("failed to decode signature");
        }

      const BIGNUM *r = nullptr;
      const BIGNUM *s = nullptr;
      ECDSA_SIG_get0(sig.get(), &r, &s);

      std::string p1363(64, '\0');
      BN_bn2binpad(r, reinterpret_cast<unsigned char *>(p1363.data()), 32);
      BN_bn2binpad(s, reinterpret_cast<unsigned char *>(p1363.data()) + 32, 32);
      return p1363;
    }

    // Base64 SubjectPublicKeyInfo DER of the signing key.
    std::string public_key() const
    {
      int len = i2d_PUBKEY(pkey.get(), nullptr);
      if (len <= 0)
        {
          throw std::runtime_error("failed to encode public key");
        }
      std::string der(static_cast<size_t>(len), '\0');
      auto *out = reinterpret_cast<unsigned char *>(der.data());
      i2d_PUBKEY(pkey.get(), &out);
      return gatekeeper::utils::Base64::encode(der);
    }

  private:
    explicit TestSigner(EVP_PKEY *key)
      : pkey(key, EVP_PKEY_free)
    {
    }

    static EVP_PKEY *load(std::string_view private_key)
    {
      std::string der = gatekeeper::utils::Base64::decode(private_key);
      const auto *p = reinterpret_cast<const unsigned char *>(der.data());
      EVP_PKEY *key = d2i_AutoPrivateKey(nullptr, &p, static_cast<long>(der.size()));
      if (key == nullptr)
        {
          throw std::runtime_error("failed to load private key");
        }
      return key;
    }

  private:
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey;
  };
} // namespace gatekeeper::test

#endif // CRYPTO_TEST_SIGNER_HH
