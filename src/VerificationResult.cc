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

#include "gatekeeper/VerificationResult.hh"

#include <utility>

using namespace gatekeeper;

VerificationResult::VerificationResult(std::error_code error, std::string reason, std::string canonical_message)
  : error_(error)
  , reason_(std::move(reason))
  , canonical_message_(std::move(canonical_message))
{
}

VerificationResult
VerificationResult::success(std::string canonical_message)
{
  return VerificationResult{std::error_code{}, std::string{}, std::move(canonical_message)};
}

VerificationResult
VerificationResult::failure(std::error_code error, std::string reason, std::string canonical_message)
{
  return VerificationResult{error, std::move(reason), std::move(canonical_message)};
}

bool
VerificationResult::is_success() const
{
  return !error_;
}

VerificationResult::operator bool() const
{
  return is_success();
}

std::error_code
VerificationResult::error() const
{
  return error_;
}

const std::string &
VerificationResult::reason() const
{
  return reason_;
}

const std::string &
VerificationResult::canonical_message() const
{
  return canonical_message_;
}
