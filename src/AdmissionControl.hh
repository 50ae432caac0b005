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

#ifndef ADMISSION_CONTROL_HH
#define ADMISSION_CONTROL_HH

#include <memory>

#include <spdlog/spdlog.h>

#include "gatekeeper/Gatekeeper.hh"
#include "gatekeeper/MessageVerifier.hh"
#include "utils/Logging.hh"
#include "utils/TimeSource.hh"

#include "TokenBindingVerifier.hh"

class AdmissionControl : public gatekeeper::Gatekeeper
{
public:
  AdmissionControl(gatekeeper::AdmissionOptions options, std::shared_ptr<gatekeeper::utils::TimeSource> time_source);
  AdmissionControl(gatekeeper::AdmissionOptions options, std::shared_ptr<gatekeeper::MessageVerifier> verifier);

  gatekeeper::AdmissionDecision admit(const gatekeeper::Request &request, const gatekeeper::TokenClaims &claims) override;

private:
  gatekeeper::AdmissionDecision verify_installation(const gatekeeper::Request &request, const gatekeeper::TokenClaims &claims);
  gatekeeper::AdmissionDecision verify_account(const gatekeeper::Request &request, const gatekeeper::TokenClaims &claims);
  gatekeeper::AdmissionDecision decide(gatekeeper::VerificationResult result);
  gatekeeper::AdmissionDecision admitted();

private:
  gatekeeper::AdmissionOptions options;
  std::shared_ptr<gatekeeper::MessageVerifier> verifier;
  gatekeeper::TokenBindingVerifier binding_verifier;
  std::shared_ptr<spdlog::logger> logger{gatekeeper::utils::Logging::create("gatekeeper:admission")};
};

#endif // ADMISSION_CONTROL_HH
