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

#ifndef GATEKEEPER_TOKEN_CLAIMS_HH
#define GATEKEEPER_TOKEN_CLAIMS_HH

#include <chrono>
#include <optional>
#include <string>

namespace gatekeeper
{
  // Claims extracted from an attestation token that was already validated upstream.
  struct TokenClaims
  {
    // Base64 SubjectPublicKeyInfo DER of the installation key.
    std::optional<std::string> installation_public_key;
    std::optional<std::string> device_id;
    std::optional<std::chrono::sys_seconds> token_expiry;
    // Base64 SHA-256 of the bound header values.
    std::optional<std::string> binding_hash;
  };
} // namespace gatekeeper

#endif // GATEKEEPER_TOKEN_CLAIMS_HH
