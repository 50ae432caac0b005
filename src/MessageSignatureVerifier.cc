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

#include "MessageSignatureVerifier.hh"

#include <algorithm>
#include <utility>
#include <variant>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <openssl/crypto.h>

#include "crypto/SignatureVerifier.hh"
#include "gatekeeper/AccountSecret.hh"

using namespace gatekeeper;

namespace
{
  constexpr std::string_view signature_header = "signature";
  constexpr std::string_view signature_input_header = "signature-input";

  bool same_labels(const sfv::Dictionary &lhs, const sfv::Dictionary &rhs)
  {
    return std::all_of(lhs.begin(), lhs.end(), [&rhs](const auto &entry) { return rhs.contains(entry.first); })
           && std::all_of(rhs.begin(), rhs.end(), [&lhs](const auto &entry) { return lhs.contains(entry.first); });
  }
} // namespace

std::shared_ptr<MessageVerifier>
MessageVerifier::create(VerificationPolicy policy, std::shared_ptr<utils::TimeSource> time_source)
{
  return std::make_shared<MessageSignatureVerifier>(std::move(policy), std::move(time_source));
}

MessageSignatureVerifier::MessageSignatureVerifier(VerificationPolicy policy, std::shared_ptr<utils::TimeSource> time_source)
  : policy(std::move(policy))
  , time_source(std::move(time_source))
{
}

void
MessageSignatureVerifier::set_trace_callback(trace_callback_t callback)
{
  trace_callback = std::move(callback);
}

VerificationResult
MessageSignatureVerifier::verify(const Request &request, const KeyMaterial &key) const
{
  const bool installation = std::holds_alternative<InstallationKey>(key);
  const std::string label = installation ? policy.get_installation_label() : policy.get_account_label();
  const std::string_view algorithm = installation ? installation_algorithm : account_algorithm;

  auto entry = select_entry(request, label);
  if (!entry)
    {
      return reject(entry.error());
    }

  auto metadata = metadata_validator.validate(entry.value().parameters, algorithm, policy, time_source->now());
  if (!metadata)
    {
      return reject(metadata.error());
    }

  auto canonical = canonical_builder.build(request, entry.value().components, entry.value().parameters);
  if (!canonical)
    {
      return reject(canonical.error());
    }

  if (trace_callback)
    {
      trace_callback(label, canonical.value());
    }

  if (auto rc = digest_verifier.verify(request); !rc)
    {
      return reject(rc.error(), canonical.value());
    }

  if (auto rc = check_signature(canonical.value(), entry.value().signature, key); !rc)
    {
      return reject(rc.error(), canonical.value());
    }

  logger->debug("signature '{}' verified", label);
  return VerificationResult::success(std::move(canonical.value()));
}

bool
MessageSignatureVerifier::verify_signature(std::string_view payload, std::string_view signature, const KeyMaterial &key) const
{
  return check_signature(payload, signature, key).has_value();
}

verification_result<sfv::Dictionary>
MessageSignatureVerifier::parse_header(const Request &request, std::string_view name) const
{
  auto values = request.header_values(name);
  std::string combined = boost::algorithm::trim_copy(boost::algorithm::join(values, ", "));
  if (combined.empty())
    {
      return make_failure(VerificationErrc::MalformedHeader, fmt::format("missing {} header", name));
    }

  auto dictionary = parser.parse_dictionary(combined);
  if (!dictionary)
    {
      return make_failure(VerificationErrc::MalformedHeader, fmt::format("failed to parse {} header: {}", name, dictionary.error().message()));
    }
  return std::move(dictionary.value());
}

verification_result<MessageSignatureVerifier::SignatureEntry>
MessageSignatureVerifier::select_entry(const Request &request, const std::string &label) const
{
  auto signatures = parse_header(request, signature_header);
  if (!signatures)
    {
      return signatures.error();
    }
  auto inputs = parse_header(request, signature_input_header);
  if (!inputs)
    {
      return inputs.error();
    }

  if (!same_labels(signatures.value(), inputs.value()))
    {
      return make_failure(VerificationErrc::MalformedHeader, "Signature and Signature-Input labels do not match");
    }

  const auto *signature_item = signatures.value().find(label);
  const auto *input_item = inputs.value().find(label);
  if (signature_item == nullptr || input_item == nullptr)
    {
      return make_failure(VerificationErrc::MalformedHeader, fmt::format("no signature with label '{}'", label));
    }

  const auto *signature = signature_item->get_if<sfv::ByteSequence>();
  if (signature == nullptr)
    {
      return make_failure(VerificationErrc::MalformedHeader, fmt::format("signature '{}' is not a byte sequence", label));
    }
  const auto *components = input_item->get_if<sfv::InnerList>();
  if (components == nullptr)
    {
      return make_failure(VerificationErrc::MalformedHeader, fmt::format("signature input '{}' is not an inner list", label));
    }

  return SignatureEntry{label, signature->bytes, *components, input_item->parameters};
}

verification_result<void>
MessageSignatureVerifier::check_signature(std::string_view payload, std::string_view signature, const KeyMaterial &key) const
{
  crypto::SignatureVerifier verifier;

  if (const auto *installation_key = std::get_if<InstallationKey>(&key); installation_key != nullptr)
    {
      auto rc = verifier.set_key(crypto::SignatureAlgorithmType::ECDSA_P256_SHA256, installation_key->public_key);
      if (!rc)
        {
          return make_failure(VerificationErrc::SignatureMismatch, fmt::format("invalid installation key: {}", rc.error().message()));
        }
    }
  else
    {
      const auto &account_key = std::get<AccountKey>(key);
      auto secret = AccountSecret::derive(account_key.base_secret, account_key.device_id, account_key.token_expiry);
      if (!secret)
        {
          return make_failure(VerificationErrc::SignatureMismatch, fmt::format("cannot derive account secret: {}", secret.error().message()));
        }
      auto rc = verifier.set_key(crypto::SignatureAlgorithmType::HMAC_SHA256, secret.value());
      OPENSSL_cleanse(secret.value().data(), secret.value().size());
      if (!rc)
        {
          return make_failure(VerificationErrc::SignatureMismatch, fmt::format("invalid account secret: {}", rc.error().message()));
        }
    }

  if (auto rc = verifier.verify(payload, signature); !rc)
    {
      return make_failure(VerificationErrc::SignatureMismatch, fmt::format("signature verification failed: {}", rc.error().message()));
    }
  return outcome::success();
}

VerificationResult
MessageSignatureVerifier::reject(const VerificationFailure &failure, std::string canonical_message) const
{
  logger->info("request signature rejected ({}: {})", make_error_code(failure.code).message(), failure.reason);
  return VerificationResult::failure(make_error_code(failure.code), failure.reason, std::move(canonical_message));
}
