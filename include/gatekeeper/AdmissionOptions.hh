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

#ifndef GATEKEEPER_ADMISSION_OPTIONS_HH
#define GATEKEEPER_ADMISSION_OPTIONS_HH

#include <ostream>
#include <string>
#include <vector>

#include <fmt/ostream.h>

#include "gatekeeper/VerificationPolicy.hh"

namespace gatekeeper
{
  enum class SigningMode
  {
    None,
    Installation,
    Account
  };

  class AdmissionOptions
  {
  public:
    AdmissionOptions() = default;

    void set_signing_mode(SigningMode mode);
    void set_account_base_secret(std::string secret);
    void set_binding_headers(std::vector<std::string> headers);
    void set_require_signature(bool require_signature);
    void set_verification_policy(VerificationPolicy policy);

    SigningMode get_signing_mode() const;
    const std::string &get_account_base_secret() const;
    const std::vector<std::string> &get_binding_headers() const;
    bool get_require_signature() const;
    const VerificationPolicy &get_verification_policy() const;

  private:
    SigningMode signing_mode = SigningMode::None;
    std::string account_base_secret;
    std::vector<std::string> binding_headers;
    bool require_signature = false;
    VerificationPolicy verification_policy;
  };

  inline std::ostream &operator<<(std::ostream &os, SigningMode mode)
  {
    switch (mode)
      {
      case SigningMode::None:
        os << "none";
        break;
      case SigningMode::Installation:
        os << "installation";
        break;
      case SigningMode::Account:
        os << "account";
        break;
      }
    return os;
  }
} // namespace gatekeeper

#if FMT_VERSION >= 90000
template<>
struct fmt::formatter<gatekeeper::SigningMode> : fmt::ostream_formatter
{
};
#endif

#endif // GATEKEEPER_ADMISSION_OPTIONS_HH
