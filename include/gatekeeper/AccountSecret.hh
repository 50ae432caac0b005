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

#ifndef GATEKEEPER_ACCOUNT_SECRET_HH
#define GATEKEEPER_ACCOUNT_SECRET_HH

#include <chrono>
#include <string>
#include <string_view>

#include <boost/outcome/std_result.hpp>

namespace gatekeeper
{
  namespace outcome = boost::outcome_v2;

  class AccountSecret
  {
  public:
    // Per token secret: HMAC-SHA256(base_secret, device_id_bytes || int64_be(token_expiry)).
    // The device id must be standard base64, padding optional.
    static outcome::std_result<std::string> derive(std::string_view base_secret,
                                                   std::string_view device_id,
                                                   std::chrono::sys_seconds token_expiry);
  };
} // namespace gatekeeper

#endif // GATEKEEPER_ACCOUNT_SECRET_HH
