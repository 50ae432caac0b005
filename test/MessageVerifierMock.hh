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

#ifndef MESSAGE_VERIFIER_MOCK_HH
#define MESSAGE_VERIFIER_MOCK_HH

#include "gmock/gmock.h"

#include "gatekeeper/MessageVerifier.hh"

class MessageVerifierMock : public gatekeeper::MessageVerifier
{
public:
  MOCK_METHOD(void, set_trace_callback, (trace_callback_t callback), (override));
  MOCK_METHOD(gatekeeper::VerificationResult, verify, (const gatekeeper::Request &request, const gatekeeper::KeyMaterial &key), (const, override));
  MOCK_METHOD(bool,
              verify_signature,
              (std::string_view payload, std::string_view signature, const gatekeeper::KeyMaterial &key),
              (const, override));
};

#endif // MESSAGE_VERIFIER_MOCK_HH
