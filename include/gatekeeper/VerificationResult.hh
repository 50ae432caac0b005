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

#ifndef GATEKEEPER_VERIFICATION_RESULT_HH
#define GATEKEEPER_VERIFICATION_RESULT_HH

#include <string>
#include <system_error>

namespace gatekeeper
{
  class VerificationResult
  {
  public:
    static VerificationResult success(std::string canonical_message);
    static VerificationResult failure(std::error_code error, std::string reason, std::string canonical_message = {});

    bool is_success() const;
    explicit operator bool() const;

    std::error_code error() const;
    // Diagnostic text for logs. Never send it to the client.
    const std::string &reason() const;
    // Canonical message that was verified, empty when verification stopped before it was built.
    const std::string &canonical_message() const;

  private:
    VerificationResult(std::error_code error, std::string reason, std::string canonical_message);

  private:
    std::error_code error_;
    std::string reason_;
    std::string canonical_message_;
  };
} // namespace gatekeeper

#endif // GATEKEEPER_VERIFICATION_RESULT_HH
