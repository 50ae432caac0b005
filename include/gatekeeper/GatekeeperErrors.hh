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

#ifndef GATEKEEPER_GATEKEEPER_ERRORS_HH
#define GATEKEEPER_GATEKEEPER_ERRORS_HH

#include <ostream>
#include <system_error>

#include <boost/beast/http/status.hpp>

namespace gatekeeper
{
  enum class VerificationErrc
  {
    Success = 0,
    MalformedHeader,
    UnsupportedAlgorithm,
    MissingMetadata,
    StaleOrFutureSignature,
    UnresolvableComponent,
    DigestMismatch,
    SignatureMismatch,
    MissingBindingHeader,
    BindingMismatch,
  };

  std::error_code make_error_code(VerificationErrc ec);

  // Status a server should answer with when a request is rejected for the
  // given reason. Requests that cannot be verified get 400, requests that fail
  // verification get 401.
  boost::beast::http::status http_status_for(const std::error_code &ec);
} // namespace gatekeeper

namespace std
{
  template<>
  struct is_error_code_enum<gatekeeper::VerificationErrc> : true_type
  {
  };
} // namespace std

#endif // GATEKEEPER_GATEKEEPER_ERRORS_HH
