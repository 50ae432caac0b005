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

#include "PublicKey.hh"

#include <climits>

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include "OpenSSLError.hh"
#include "utils/Base64.hh"

using namespace gatekeeper::crypto;

PublicKey::PublicKey(std::string_view public_key)
{
  load(public_key);
}

PublicKey::~PublicKey()
{
  if (pkey != nullptr)
    {
      EVP_PKEY_free(pkey);
    }
}

void
PublicKey::load_pem(std::string_view public_key)
{
  BIO *bio = BIO_new_mem_buf(public_key.data(), static_cast<int>(public_key.size()));
  if (bio != nullptr)
    {
      PEM_read_bio_PUBKEY(bio, &pkey, nullptr, nullptr);
      BIO_free_all(bio);
    }
}

void
PublicKey::load_der(std::string_view der)
{
  const auto *p = reinterpret_cast<const unsigned char *>(der.data()); // NOLINT:cppcoreguidelines-pro-type-reinterpret-cast
  const auto *end = p + der.size();
  pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
  if (pkey != nullptr && p != end)
    {
      logger->info("trailing data after public key");
      EVP_PKEY_free(pkey);
      pkey = nullptr;
    }
}

void
PublicKey::load_base64_der(std::string_view public_key)
{
  auto der = gatekeeper::utils::Base64::try_decode(public_key);
  if (!der)
    {
      logger->debug("public key is not base64 encoded");
      return;
    }
  load_der(*der);
}

void
PublicKey::load(std::string_view public_key)
{
  if (public_key.empty() || public_key.size() > INT_MAX)
    {
      logger->info("public key has invalid size = {}", public_key.size());
      return;
    }

  if (public_key.starts_with("-----BEGIN"))
    {
      load_pem(public_key);
    }
  if (pkey == nullptr)
    {
      load_base64_der(public_key);
    }
  if (pkey == nullptr)
    {
      load_der(public_key);
    }
  if (pkey == nullptr)
    {
      logger->info("failed to load public key ({})", last_openssl_error());
    }
  ERR_clear_error();
}

EVP_PKEY *
PublicKey::get() const
{
  return pkey;
}
