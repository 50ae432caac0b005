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

#include "ContentDigestVerifier.hh"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include "crypto/ConstantTime.hh"
#include "crypto/Digest.hh"
#include "utils/Base64.hh"

using namespace gatekeeper;

namespace
{
  constexpr std::string_view content_digest_header = "content-digest";
} // namespace

verification_result<void>
ContentDigestVerifier::verify(const Request &request) const
{
  auto header = boost::algorithm::trim_copy(boost::algorithm::join(request.header_values(content_digest_header), ", "));
  if (header.empty())
    {
      return outcome::success();
    }

  auto dictionary = parser.parse_dictionary(header);
  if (!dictionary)
    {
      return make_failure(VerificationErrc::MalformedHeader,
                          fmt::format("cannot parse Content-Digest: {}", dictionary.error().message()));
    }
  if (dictionary.value().empty())
    {
      return make_failure(VerificationErrc::MalformedHeader, "Content-Digest has no members");
    }

  crypto::Digest digest;
  for (const auto &[algorithm, member]: dictionary.value())
    {
      crypto::DigestAlgorithm digest_algorithm{};
      if (algorithm == "sha-256")
        {
          digest_algorithm = crypto::DigestAlgorithm::SHA256;
        }
      else if (algorithm == "sha-512")
        {
          digest_algorithm = crypto::DigestAlgorithm::SHA512;
        }
      else
        {
          return make_failure(VerificationErrc::DigestMismatch, fmt::format("unsupported digest algorithm '{}'", algorithm));
        }

      auto expected = expected_digest(algorithm, member);
      if (!expected)
        {
          return expected.error();
        }

      auto actual = digest.compute(digest_algorithm, request.body());
      if (!actual)
        {
          logger->error("failed to compute {} digest ({})", algorithm, actual.error().message());
          return make_failure(VerificationErrc::DigestMismatch, fmt::format("cannot compute {} digest", algorithm));
        }

      if (!crypto::constant_time_equals(actual.value(), expected.value()))
        {
          return make_failure(VerificationErrc::DigestMismatch, fmt::format("{} digest does not match the body", algorithm));
        }
    }

  return outcome::success();
}

verification_result<std::string>
ContentDigestVerifier::expected_digest(const std::string &algorithm, const sfv::Item &member) const
{
  if (const auto *bytes = member.get_if<sfv::ByteSequence>(); bytes != nullptr)
    {
      return bytes->bytes;
    }

  // Some clients send the digest as a string holding ":base64:".
  if (const auto *str = member.get_if<std::string>(); str != nullptr)
    {
      if (str->size() >= 2 && str->front() == ':' && str->back() == ':')
        {
          auto decoded = utils::Base64::try_decode(std::string_view(*str).substr(1, str->size() - 2));
          if (decoded)
            {
              return *decoded;
            }
        }
    }

  return make_failure(VerificationErrc::MalformedHeader, fmt::format("Content-Digest member '{}' is not a byte sequence", algorithm));
}
