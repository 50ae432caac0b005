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

#include "SignatureMetadataValidator.hh"

#include <variant>

#include <fmt/format.h>

using namespace gatekeeper;

namespace
{
  template<typename T>
  verification_result<std::optional<T>> typed_parameter(const sfv::Parameters &parameters, const std::string &key, std::string_view type)
  {
    const auto *value = parameters.find(key);
    if (value == nullptr)
      {
        return std::optional<T>{};
      }
    const auto *typed = std::get_if<T>(value);
    if (typed == nullptr)
      {
        return make_failure(VerificationErrc::MalformedHeader, fmt::format("signature parameter '{}' must be {}", key, type));
      }
    return std::optional<T>{*typed};
  }

  VerificationFailure missing(std::string_view name)
  {
    return make_failure(VerificationErrc::MissingMetadata, fmt::format("signature parameter '{}' is required", name));
  }

  VerificationFailure stale(std::string reason)
  {
    return make_failure(VerificationErrc::StaleOrFutureSignature, std::move(reason));
  }
} // namespace

verification_result<SignatureMetadata>
SignatureMetadataValidator::validate(const sfv::Parameters &parameters,
                                     std::string_view expected_algorithm,
                                     const VerificationPolicy &policy,
                                     std::chrono::system_clock::time_point now) const
{
  auto metadata = extract(parameters, policy);
  if (!metadata)
    {
      return metadata.error();
    }

  if (metadata.value().algorithm.empty())
    {
      return make_failure(VerificationErrc::UnsupportedAlgorithm, "signature parameter 'alg' is required");
    }
  if (metadata.value().algorithm != expected_algorithm)
    {
      return make_failure(VerificationErrc::UnsupportedAlgorithm,
                          fmt::format("algorithm '{}' is not supported, expected '{}'", metadata.value().algorithm, expected_algorithm));
    }

  if (auto rc = check_required(metadata.value(), policy); !rc)
    {
      return rc.error();
    }
  if (auto rc = check_timestamps(metadata.value(), policy, now); !rc)
    {
      return rc.error();
    }
  return metadata;
}

verification_result<SignatureMetadata>
SignatureMetadataValidator::extract(const sfv::Parameters &parameters, const VerificationPolicy &policy) const
{
  SignatureMetadata metadata;

  for (const auto &[key, value]: parameters)
    {
      if (key != "alg" && key != "created" && key != "expires" && key != "nonce" && key != "keyid" && key != "tag")
        {
          if (!policy.get_allow_unknown_parameters())
            {
              return make_failure(VerificationErrc::MalformedHeader, fmt::format("unknown signature parameter '{}'", key));
            }
          logger->debug("ignoring unknown signature parameter '{}'", key);
        }
    }

  auto alg = typed_parameter<std::string>(parameters, "alg", "a string");
  if (!alg)
    {
      return alg.error();
    }
  auto created = typed_parameter<std::int64_t>(parameters, "created", "an integer");
  if (!created)
    {
      return created.error();
    }
  auto expires = typed_parameter<std::int64_t>(parameters, "expires", "an integer");
  if (!expires)
    {
      return expires.error();
    }
  auto nonce = typed_parameter<std::string>(parameters, "nonce", "a string");
  if (!nonce)
    {
      return nonce.error();
    }
  auto keyid = typed_parameter<std::string>(parameters, "keyid", "a string");
  if (!keyid)
    {
      return keyid.error();
    }
  auto tag = typed_parameter<std::string>(parameters, "tag", "a string");
  if (!tag)
    {
      return tag.error();
    }

  metadata.algorithm = alg.value().value_or("");
  metadata.created = created.value();
  metadata.expires = expires.value();
  metadata.nonce = nonce.value();
  metadata.keyid = keyid.value();
  metadata.tag = tag.value();
  return metadata;
}

verification_result<void>
SignatureMetadataValidator::check_required(const SignatureMetadata &metadata, const VerificationPolicy &policy) const
{
  if (policy.get_require_created() && !metadata.created)
    {
      return missing("created");
    }
  if (policy.get_require_expires() && !metadata.expires)
    {
      return missing("expires");
    }
  if (policy.get_require_nonce() && !metadata.nonce)
    {
      return missing("nonce");
    }
  return outcome::success();
}

verification_result<void>
SignatureMetadataValidator::check_timestamps(const SignatureMetadata &metadata,
                                             const VerificationPolicy &policy,
                                             std::chrono::system_clock::time_point now) const
{
  const std::int64_t current = std::chrono::floor<std::chrono::seconds>(now).time_since_epoch().count();
  const std::int64_t skew = policy.get_allowed_clock_skew().count();

  if (metadata.created)
    {
      const std::int64_t created = *metadata.created;
      if (created > current + skew)
        {
          return stale(fmt::format("signature created in the future ({} > {})", created, current));
        }

      auto maximum_age = policy.get_maximum_signature_age();
      if (maximum_age && created < current - maximum_age->count() - skew)
        {
          return stale(fmt::format("signature is older than {} seconds", maximum_age->count()));
        }
    }

  if (metadata.expires)
    {
      const std::int64_t expires = *metadata.expires;
      if (expires + skew < current)
        {
          return stale(fmt::format("signature expired at {}", expires));
        }
      if (metadata.created && expires < *metadata.created)
        {
          return stale("signature expires before it was created");
        }
    }

  return outcome::success();
}
