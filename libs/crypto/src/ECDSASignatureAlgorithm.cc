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

#include "ECDSASignatureAlgorithm.hh"
#include "PublicKey.hh"
#include "OpenSSLError.hh"
#include "crypto/SignatureVerifierErrors.hh"

#include <array>
#include <climits>
#include <cstddef>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

using namespace gatekeeper::crypto;

namespace
{
  constexpr size_t P256_COORDINATE_SIZE = 32;
  constexpr size_t P256_SIGNATURE_SIZE = 2 * P256_COORDINATE_SIZE;
  constexpr int P256_KEY_BITS = 256;
} // namespace

outcome::std_result<void>
ECDSASignatureAlgorithm::set_key(std::string_view key)
{
  public_key = std::make_unique<PublicKey>(key);

  EVP_PKEY *pkey = public_key->get();
  if (pkey == nullptr)
    {
      logger->info("failed to load public key");
      return SignatureVerifierErrc::InvalidKey;
    }

  if (EVP_PKEY_base_id(pkey) != EVP_PKEY_EC)
    {
      logger->info("invalid public key type: expected EC, got {}", EVP_PKEY_base_id(pkey));
      return SignatureVerifierErrc::InvalidKey;
    }

  std::array<char, 64> group_name{};
  size_t group_name_len = 0;
  if (EVP_PKEY_get_group_name(pkey, group_name.data(), group_name.size(), &group_name_len) != 1
      || std::string_view(group_name.data(), group_name_len) != SN_X9_62_prime256v1 || EVP_PKEY_bits(pkey) != P256_KEY_BITS)
    {
      logger->info("invalid public key curve: expected P-256");
      ERR_clear_error();
      return SignatureVerifierErrc::InvalidKey;
    }

  return outcome::success();
}

outcome::std_result<std::string>
ECDSASignatureAlgorithm::to_der(std::string_view signature)
{
  const auto *bytes = reinterpret_cast<const unsigned char *>(signature.data()); // NOLINT:cppcoreguidelines-pro-type-reinterpret-cast

  std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(ECDSA_SIG_new(), ECDSA_SIG_free);
  if (!sig)
    {
      logger->error("failed to allocate signature ({})", last_openssl_error());
      ERR_clear_error();
      return SignatureVerifierErrc::InternalFailure;
    }

  BIGNUM *r = BN_bin2bn(bytes, P256_COORDINATE_SIZE, nullptr);
  BIGNUM *s = BN_bin2bn(bytes + P256_COORDINATE_SIZE, P256_COORDINATE_SIZE, nullptr);
  if (r == nullptr || s == nullptr || ECDSA_SIG_set0(sig.get(), r, s) != 1)
    {
      logger->error("failed to convert signature ({})", last_openssl_error());
      BN_free(r);
      BN_free(s);
      ERR_clear_error();
      return SignatureVerifierErrc::InternalFailure;
    }

  int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (der_len <= 0)
    {
      logger->error("failed to encode signature ({})", last_openssl_error());
      ERR_clear_error();
      return SignatureVerifierErrc::InternalFailure;
    }

  std::string der(static_cast<size_t>(der_len), '\0');
  auto *out = reinterpret_cast<unsigned char *>(der.data()); // NOLINT:cppcoreguidelines-pro-type-reinterpret-cast
  i2d_ECDSA_SIG(sig.get(), &out);
  return der;
}

outcome::std_result<void>
ECDSASignatureAlgorithm::verify(std::string_view data, std::string_view signature)
{
  if (!public_key || public_key->get() == nullptr)
    {
      logger->error("no public key loaded");
      return SignatureVerifierErrc::InvalidKey;
    }
  EVP_PKEY *pkey = public_key->get();

  if (data.size() > INT_MAX)
    {
      logger->error("data exceeds maximum data size = {}", data.size());
      return SignatureVerifierErrc::InternalFailure;
    }

  if (signature.size() != P256_SIGNATURE_SIZE)
    {
      logger->info("signature has invalid size = {}", signature.size());
      return SignatureVerifierErrc::InvalidSignature;
    }

  auto der = to_der(signature);
  if (!der)
    {
      return der.error();
    }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> md_ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!md_ctx)
    {
      logger->error("failed to check signature ({})", last_openssl_error());
      ERR_clear_error();
      return SignatureVerifierErrc::InternalFailure;
    }

  auto ret = EVP_DigestVerifyInit(md_ctx.get(), nullptr, EVP_sha256(), nullptr, pkey);
  if (ret != 1)
    {
      logger->error("failed to check signature ({})", last_openssl_error());
      ERR_clear_error();
      return SignatureVerifierErrc::InternalFailure;
    }

  ret = EVP_DigestVerify(md_ctx.get(),
                         reinterpret_cast<const unsigned char *>(der.value().data()), // NOLINT:cppcoreguidelines-pro-type-reinterpret-cast
                         der.value().size(),
                         reinterpret_cast<const unsigned char *>(data.data()), // NOLINT:cppcoreguidelines-pro-type-reinterpret-cast
                         data.size());

  if (ret == 1)
    {
      return outcome::success();
    }

  // Signatures that decode but do not verify leave errors on the queue
  ERR_clear_error();
  if (ret == 0)
    {
      return SignatureVerifierErrc::Mismatch;
    }
  logger->error("failed to check signature, result = {}", ret);
  return SignatureVerifierErrc::InternalFailure;
}
