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

#include "gatekeeper/AdmissionOptions.hh"

#include <utility>

using namespace gatekeeper;

void
AdmissionOptions::set_signing_mode(SigningMode mode)
{
  signing_mode = mode;
}

void
AdmissionOptions::set_account_base_secret(std::string secret)
{
  account_base_secret = std::move(secret);
}

void
AdmissionOptions::set_binding_headers(std::vector<std::string> headers)
{
  binding_headers = std::move(headers);
}

void
AdmissionOptions::set_require_signature(bool require_signature)
{
  this->require_signature = require_signature;
}

void
AdmissionOptions::set_verification_policy(VerificationPolicy policy)
{
  verification_policy = std::move(policy);
}

SigningMode
AdmissionOptions::get_signing_mode() const
{
  return signing_mode;
}

const std::string &
AdmissionOptions::get_account_base_secret() const
{
  return account_base_secret;
}

const std::vector<std::string> &
AdmissionOptions::get_binding_headers() const
{
  return binding_headers;
}

bool
AdmissionOptions::get_require_signature() const
{
  return require_signature;
}

const VerificationPolicy &
AdmissionOptions::get_verification_policy() const
{
  return verification_policy;
}
