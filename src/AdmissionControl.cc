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

#include "AdmissionControl.hh"

#include <utility>

#include <spdlog/fmt/ostr.h>

#include "gatekeeper/GatekeeperErrors.hh"
#include "gatekeeper/KeyMaterial.hh"

using namespace gatekeeper;

std::shared_ptr<Gatekeeper>
Gatekeeper::create(AdmissionOptions options, std::shared_ptr<utils::TimeSource> time_source)
{
  return std::make_shared<AdmissionControl>(std::move(options), std::move(time_source));
}

boost::beast::http::response<boost::beast::http::string_body>
Gatekeeper::make_rejection(const AdmissionDecision &decision, const Request &request)
{
  boost::beast::http::response<boost::beast::http::string_body> res{decision.status, request.message().version()};
  res.set(boost::beast::http::field::content_type, "text/plain");
  res.keep_alive(request.message().keep_alive());
  res.body() = std::string(AdmissionDecision::rejection_body);
  res.prepare_payload();
  return res;
}

AdmissionControl::AdmissionControl(AdmissionOptions options, std::shared_ptr<utils::TimeSource> time_source)
  : AdmissionControl(options, MessageVerifier::create(options.get_verification_policy(), std::move(time_source)))
{
}

AdmissionControl::AdmissionControl(AdmissionOptions options, std::shared_ptr<MessageVerifier> verifier)
  : options(std::move(options))
  , verifier(std::move(verifier))
  , binding_verifier(this->options.get_binding_headers())
{
}

AdmissionDecision
AdmissionControl::admit(const Request &request, const TokenClaims &claims)
{
  logger->debug("admitting {} {} ({})", request.message().method_string(), request.message().target(), options.get_signing_mode());

  if (auto rc = binding_verifier.verify(request, claims.binding_hash); !rc)
    {
      logger->info("token binding rejected ({})", rc.error().reason);
      return decide(VerificationResult::failure(make_error_code(rc.error().code), rc.error().reason));
    }

  switch (options.get_signing_mode())
    {
    case SigningMode::None:
      return admitted();
    case SigningMode::Installation:
      return verify_installation(request, claims);
    case SigningMode::Account:
      return verify_account(request, claims);
    }
  return admitted();
}

AdmissionDecision
AdmissionControl::verify_installation(const Request &request, const TokenClaims &claims)
{
  if (!claims.installation_public_key || claims.installation_public_key->empty())
    {
      if (options.get_require_signature())
        {
          logger->info("installation signature required, but token has no installation key");
          return decide(VerificationResult::failure(make_error_code(VerificationErrc::SignatureMismatch), "token has no installation key"));
        }
      logger->debug("token has no installation key, skipping message signature");
      return admitted();
    }

  return decide(verifier->verify(request, InstallationKey{*claims.installation_public_key}));
}

AdmissionDecision
AdmissionControl::verify_account(const Request &request, const TokenClaims &claims)
{
  if (!claims.device_id || !claims.token_expiry || options.get_account_base_secret().empty())
    {
      logger->info("account signature cannot be verified, device id, expiry or base secret missing");
      return decide(VerificationResult::failure(make_error_code(VerificationErrc::SignatureMismatch), "account key material missing"));
    }

  return decide(verifier->verify(request, AccountKey{options.get_account_base_secret(), *claims.device_id, *claims.token_expiry}));
}

AdmissionDecision
AdmissionControl::decide(VerificationResult result)
{
  auto status = http_status_for(result.error());
  return AdmissionDecision{status, std::move(result)};
}

AdmissionDecision
AdmissionControl::admitted()
{
  return AdmissionDecision{boost::beast::http::status::ok, VerificationResult::success({})};
}
