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

#ifndef GATEKEEPER_VERIFICATION_POLICY_HH
#define GATEKEEPER_VERIFICATION_POLICY_HH

#include <chrono>
#include <optional>
#include <string>

namespace gatekeeper
{
  class VerificationPolicy
  {
  public:
    VerificationPolicy() = default;

    void set_require_created(bool require_created);
    void set_require_expires(bool require_expires);
    void set_require_nonce(bool require_nonce);
    void set_maximum_signature_age(std::optional<std::chrono::seconds> maximum_signature_age);
    void set_allowed_clock_skew(std::chrono::seconds allowed_clock_skew);
    void set_allow_unknown_parameters(bool allow_unknown_parameters);
    void set_installation_label(std::string label);
    void set_account_label(std::string label);

    bool get_require_created() const;
    bool get_require_expires() const;
    bool get_require_nonce() const;
    std::optional<std::chrono::seconds> get_maximum_signature_age() const;
    std::chrono::seconds get_allowed_clock_skew() const;
    bool get_allow_unknown_parameters() const;
    std::string get_installation_label() const;
    std::string get_account_label() const;

  private:
    bool require_created = true;
    bool require_expires = false;
    bool require_nonce = false;
    std::optional<std::chrono::seconds> maximum_signature_age = std::chrono::seconds(300);
    std::chrono::seconds allowed_clock_skew = std::chrono::seconds(0);
    bool allow_unknown_parameters = false;
    std::string installation_label = "install";
    std::string account_label = "account";
  };
} // namespace gatekeeper

#endif // GATEKEEPER_VERIFICATION_POLICY_HH
