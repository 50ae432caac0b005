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

#include "gatekeeper/GatekeeperErrors.hh"

using namespace gatekeeper;

namespace
{
  class VerificationErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept final
    {
      return "gatekeeper";
    }

    std::string message(int ev) const final
    {
      switch (static_cast<VerificationErrc>(ev))
        {
        case VerificationErrc::Success:
          return "success";
        case VerificationErrc::MalformedHeader:
          return "malformed signature header";
        case VerificationErrc::UnsupportedAlgorithm:
          return "unsupported signature algorithm";
        case VerificationErrc::MissingMetadata:
          return "missing signature metadata";
        case VerificationErrc::StaleOrFutureSignature:
          return "signature is stale or from the future";
        case VerificationErrc::UnresolvableComponent:
          return "covered component cannot be resolved";
        case VerificationErrc::DigestMismatch:
          return "content digest mismatch";
        case VerificationErrc::SignatureMismatch:
          return "signature mismatch";
        case VerificationErrc::MissingBindingHeader:
          return "missing token binding header";
        case VerificationErrc::BindingMismatch:
          return "token binding mismatch";
        }
      return "(unknown)";
    }
  };

  const VerificationErrorCategory globalVerificationErrorCategory{};
} // namespace

std::error_code
gatekeeper::make_error_code(VerificationErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalVerificationErrorCategory};
}

boost::beast::http::status
gatekeeper::http_status_for(const std::error_code &ec)
{
  if (!ec)
    {
      return boost::beast::http::status::ok;
    }

  if (ec == VerificationErrc::MalformedHeader || ec == VerificationErrc::UnresolvableComponent
      || ec == VerificationErrc::MissingBindingHeader)
    {
      return boost::beast::http::status::bad_request;
    }
  return boost::beast::http::status::unauthorized;
}
