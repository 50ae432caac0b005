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

#include "TokenBindingVerifier.hh"

#include <utility>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include "crypto/ConstantTime.hh"
#include "crypto/Digest.hh"
#include "utils/Base64.hh"

using namespace gatekeeper;

TokenBindingVerifier::TokenBindingVerifier(std::vector<std::string> header_names)
  : header_names(std::move(header_names))
{
}

verification_result<void>
TokenBindingVerifier::verify(const Request &request, const std::optional<std::string> &binding_hash) const
{
  if (!binding_hash || boost::algorithm::trim_copy(*binding_hash).empty())
    {
      logger->debug("skipping token binding, no binding claim");
      return outcome::success();
    }
  if (header_names.empty())
    {
      logger->debug("skipping token binding, no binding headers configured");
      return outcome::success();
    }

  std::string binding_value;
  std::vector<std::string> missing;
  for (const auto &name: header_names)
    {
      std::string value = boost::algorithm::trim_copy(boost::algorithm::join(request.header_values(name), ","));
      if (value.empty())
        {
          missing.push_back(name);
          continue;
        }
      binding_value += value;
    }

  if (!missing.empty())
    {
      return make_failure(VerificationErrc::MissingBindingHeader,
                          fmt::format("binding header(s) '{}' missing or empty", boost::algorithm::join(missing, ", ")));
    }

  auto expected = compute_binding_hash(binding_value);
  if (!expected)
    {
      logger->error("failed to compute token binding hash ({})", expected.error().message());
      return make_failure(VerificationErrc::BindingMismatch, "cannot compute token binding hash");
    }

  if (!crypto::constant_time_equals(expected.value(), *binding_hash))
    {
      return make_failure(VerificationErrc::BindingMismatch, "token binding hash does not match the bound headers");
    }

  logger->debug("token binding verified for {}", boost::algorithm::join(header_names, ","));
  return outcome::success();
}

outcome::std_result<std::string>
TokenBindingVerifier::compute_binding_hash(std::string_view binding_value)
{
  crypto::Digest digest;
  auto hash = digest.compute(crypto::DigestAlgorithm::SHA256, binding_value);
  if (!hash)
    {
      return hash.error();
    }
  return utils::Base64::encode(hash.value());
}
