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

#include "gatekeeper/VerificationPolicy.hh"

#include <utility>

using namespace gatekeeper;

void
VerificationPolicy::set_require_created(bool require_created)
{
  this->require_created = require_created;
}

void
VerificationPolicy::set_require_expires(bool require_expires)
{
  this->require_expires = require_expires;
}

void
VerificationPolicy::set_require_nonce(bool require_nonce)
{
  this->require_nonce = require_nonce;
}

void
VerificationPolicy::set_maximum_signature_age(std::optional<std::chrono::seconds> maximum_signature_age)
{
  this->maximum_signature_age = maximum_signature_age;
}

void
VerificationPolicy::set_allowed_clock_skew(std::chrono::seconds allowed_clock_skew)
{
  this->allowed_clock_skew = allowed_clock_skew;
}

void
VerificationPolicy::set_allow_unknown_parameters(bool allow_unknown_parameters)
{
  this->allow_unknown_parameters = allow_unknown_parameters;
}

void
VerificationPolicy::set_installation_label(std::string label)
{
  installation_label = std::move(label);
}

void
VerificationPolicy::set_account_label(std::string label)
{
  account_label = std::move(label);
}

bool
VerificationPolicy::get_require_created() const
{
  return require_created;
}

bool
VerificationPolicy::get_require_expires() const
{
  return require_expires;
}

bool
VerificationPolicy::get_require_nonce() const
{
  return require_nonce;
}

std::optional<std::chrono::seconds>
VerificationPolicy::get_maximum_signature_age() const
{
  return maximum_signature_age;
}

std::chrono::seconds
VerificationPolicy::get_allowed_clock_skew() const
{
  return allowed_clock_skew;
}

bool
VerificationPolicy::get_allow_unknown_parameters() const
{
  return allow_unknown_parameters;
}

std::string
VerificationPolicy::get_installation_label() const
{
  return installation_label;
}

std::string
VerificationPolicy::get_account_label() const
{
  return account_label;
}
