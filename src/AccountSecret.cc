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

#include "gatekeeper/AccountSecret.hh"

#include <cstdint>
#include <system_error>

#include "crypto/Hmac.hh"
#include "utils/Base64.hh"

using namespace gatekeeper;

outcome::std_result<std::string>
AccountSecret::derive(std::string_view base_secret, std::string_view device_id, std::chrono::sys_seconds token_expiry)
{
  if (base_secret.empty())
    {
      return std::make_error_code(std::errc::invalid_argument);
    }

  auto device_id_bytes = utils::Base64::try_decode(device_id);
  if (!device_id_bytes)
    {
      return std::make_error_code(std::errc::invalid_argument);
    }

  std::string message = *device_id_bytes;
  auto expiry = static_cast<std::uint64_t>(token_expiry.time_since_epoch().count());
  for (int shift = 56; shift >= 0; shift -= 8)
    {
      message.push_back(static_cast<char>((expiry >> shift) & 0xff));
    }

  crypto::Hmac hmac;
  return hmac.sha256(base_secret, message);
}
