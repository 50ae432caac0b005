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

#ifndef GATEKEEPER_MESSAGE_VERIFIER_HH
#define GATEKEEPER_MESSAGE_VERIFIER_HH

#include <functional>
#include <memory>
#include <string_view>

#include "gatekeeper/KeyMaterial.hh"
#include "gatekeeper/Request.hh"
#include "gatekeeper/VerificationPolicy.hh"
#include "gatekeeper/VerificationResult.hh"
#include "utils/TimeSource.hh"

namespace gatekeeper
{
  class MessageVerifier
  {
  public:
    MessageVerifier() = default;
    virtual ~MessageVerifier() = default;

    using trace_callback_t = std::function<void(std::string_view label, std::string_view canonical_message)>;

    static std::shared_ptr<MessageVerifier> create(VerificationPolicy policy,
                                                   std::shared_ptr<utils::TimeSource> time_source = std::make_shared<utils::RealTimeSource>());

    // Called with every canonical message the verifier builds. Set before use.
    virtual void set_trace_callback(trace_callback_t callback) = 0;

    virtual VerificationResult verify(const Request &request, const KeyMaterial &key) const = 0;

    // Checks raw signature bytes over an already built canonical message.
    virtual bool verify_signature(std::string_view payload, std::string_view signature, const KeyMaterial &key) const = 0;
  };
} // namespace gatekeeper

#endif // GATEKEEPER_MESSAGE_VERIFIER_HH
