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

#ifndef GATEKEEPER_GATEKEEPER_HH
#define GATEKEEPER_GATEKEEPER_HH

#include <memory>
#include <string_view>

#include <boost/beast/http.hpp>

#include "gatekeeper/AdmissionOptions.hh"
#include "gatekeeper/GatekeeperErrors.hh"
#include "gatekeeper/Request.hh"
#include "gatekeeper/TokenClaims.hh"
#include "gatekeeper/VerificationResult.hh"
#include "utils/TimeSource.hh"

namespace gatekeeper
{
  struct AdmissionDecision
  {
    static constexpr std::string_view rejection_body = "Invalid Token";

    boost::beast::http::status status;
    VerificationResult result;

    bool admitted() const
    {
      return status == boost::beast::http::status::ok;
    }
  };

  class Gatekeeper
  {
  public:
    Gatekeeper() = default;
    virtual ~Gatekeeper() = default;

    static std::shared_ptr<Gatekeeper> create(AdmissionOptions options,
                                              std::shared_ptr<utils::TimeSource> time_source = std::make_shared<utils::RealTimeSource>());

    // Applies token binding and message signing checks to a request whose
    // token was already validated.
    virtual AdmissionDecision admit(const Request &request, const TokenClaims &claims) = 0;

    // Response to send for a rejected request. The body never contains the reason.
    static boost::beast::http::response<boost::beast::http::string_body> make_rejection(const AdmissionDecision &decision,
                                                                                         const Request &request);
  };
} // namespace gatekeeper

#endif // GATEKEEPER_GATEKEEPER_HH
