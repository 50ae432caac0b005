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

#ifndef TOKEN_BINDING_VERIFIER_HH
#define TOKEN_BINDING_VERIFIER_HH

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "gatekeeper/Request.hh"
#include "utils/Logging.hh"

#include "VerificationFailure.hh"

namespace gatekeeper
{
  // Checks that the token's binding hash equals base64(SHA-256) of the
  // concatenated values of the configured headers.
  class TokenBindingVerifier
  {
  public:
    explicit TokenBindingVerifier(std::vector<std::string> header_names);

    verification_result<void> verify(const Request &request, const std::optional<std::string> &binding_hash) const;

    static outcome::std_result<std::string> compute_binding_hash(std::string_view binding_value);

  private:
    std::vector<std::string> header_names;
    std::shared_ptr<spdlog::logger> logger{gatekeeper::utils::Logging::create("gatekeeper:token-binding")};
  };
} // namespace gatekeeper

#endif // TOKEN_BINDING_VERIFIER_HH
