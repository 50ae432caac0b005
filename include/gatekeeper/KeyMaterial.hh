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

#ifndef GATEKEEPER_KEY_MATERIAL_HH
#define GATEKEEPER_KEY_MATERIAL_HH

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace gatekeeper
{
  constexpr std::string_view installation_algorithm = "ecdsa-p256-sha256";
  constexpr std::string_view account_algorithm = "hmac-sha256";

  struct InstallationKey
  {
    // Base64 SubjectPublicKeyInfo DER; PEM and raw DER are accepted as well.
    std::string public_key;
  };

  struct AccountKey
  {
    // Raw bytes of the account base secret.
    std::string base_secret;
    // Standard base64 encoded device identifier.
    std::string device_id;
    std::chrono::sys_seconds token_expiry;
  };

  using KeyMaterial = std::variant<InstallationKey, AccountKey>;
} // namespace gatekeeper

#endif // GATEKEEPER_KEY_MATERIAL_HH
