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

#include <gtest/gtest.h>

#include <string>

#include "gatekeeper/KeyMaterial.hh"
#include "gatekeeper/VerificationPolicy.hh"
#include "sfv/StructuredFieldParser.hh"

#include "SignatureMetadataValidator.hh"
#include "TestBase.hh"

using namespace gatekeeper;
using namespace gatekeeper::test;

class SignatureMetadataValidatorTest : public ::testing::Test
{
protected:
  verification_result<SignatureMetadata> validate(std::string_view params, std::int64_t now_offset = 0)
  {
    auto item = parser.parse_item("()" + std::string(params));
    EXPECT_TRUE(item) << params;
    return validator.validate(item.value().parameters, installation_algorithm, policy, test_time(now_offset));
  }

  void expect_failure(std::string_view params, VerificationErrc code, std::int64_t now_offset = 0)
  {
    auto result = validate(params, now_offset);
    ASSERT_FALSE(result) << params;
    EXPECT_EQ(result.error().code, code) << params << ": " << result.error().reason;
  }

  sfv::StructuredFieldParser parser;
  SignatureMetadataValidator validator;
  VerificationPolicy policy;
};

TEST_F(SignatureMetadataValidatorTest, valid)
{
  auto result = validate(R"(;alg="ecdsa-p256-sha256";created=1700000000;expires=1700000060;nonce="abc";keyid="k1";tag="app")");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value().algorithm, "ecdsa-p256-sha256");
  EXPECT_EQ(result.value().created, 1700000000);
  EXPECT_EQ(result.value().expires, 1700000060);
  EXPECT_EQ(result.value().nonce, "abc");
  EXPECT_EQ(result.value().keyid, "k1");
  EXPECT_EQ(result.value().tag, "app");
}

TEST_F(SignatureMetadataValidatorTest, algorithm)
{
  expect_failure(R"(;created=1700000000)", VerificationErrc::UnsupportedAlgorithm);
  expect_failure(R"(;alg="hmac-sha256";created=1700000000)", VerificationErrc::UnsupportedAlgorithm);
  expect_failure(R"(;alg="rsa-pss-sha512";created=1700000000)", VerificationErrc::UnsupportedAlgorithm);
  expect_failure(R"(;alg="ECDSA-P256-SHA256";created=1700000000)", VerificationErrc::UnsupportedAlgorithm);

  auto item = parser.parse_item(R"(();alg="hmac-sha256";created=1700000000)");
  ASSERT_TRUE(item);
  auto result = validator.validate(item.value().parameters, account_algorithm, policy, test_time());
  EXPECT_TRUE(result);
}

TEST_F(SignatureMetadataValidatorTest, parameter_types)
{
  expect_failure(R"(;alg=ecdsa;created=1700000000)", VerificationErrc::MalformedHeader);
  expect_failure(R"(;alg="ecdsa-p256-sha256";created="1700000000")", VerificationErrc::MalformedHeader);
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000000.5)", VerificationErrc::MalformedHeader);
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000000;expires=?1)", VerificationErrc::MalformedHeader);
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000000;nonce=12)", VerificationErrc::MalformedHeader);
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000000;keyid=:AQID:)", VerificationErrc::MalformedHeader);
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000000;tag=app)", VerificationErrc::MalformedHeader);
}

TEST_F(SignatureMetadataValidatorTest, unknown_parameters)
{
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000000;extra=1)", VerificationErrc::MalformedHeader);

  policy.set_allow_unknown_parameters(true);
  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";created=1700000000;extra=1)"));
}

TEST_F(SignatureMetadataValidatorTest, required_metadata)
{
  expect_failure(R"(;alg="ecdsa-p256-sha256")", VerificationErrc::MissingMetadata);

  policy.set_require_created(false);
  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256")"));

  policy.set_require_expires(true);
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000000)", VerificationErrc::MissingMetadata);
  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";expires=1700000010)"));

  policy.set_require_nonce(true);
  expect_failure(R"(;alg="ecdsa-p256-sha256";expires=1700000010)", VerificationErrc::MissingMetadata);
  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";expires=1700000010;nonce="n")"));
}

TEST_F(SignatureMetadataValidatorTest, created_boundaries)
{
  // Exactly the maximum age old.
  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";created=1699999700)"));
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1699999699)", VerificationErrc::StaleOrFutureSignature);

  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";created=1700000000)"));
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000001)", VerificationErrc::StaleOrFutureSignature);
}

TEST_F(SignatureMetadataValidatorTest, created_with_clock_skew)
{
  policy.set_allowed_clock_skew(std::chrono::seconds(5));

  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";created=1700000005)"));
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000006)", VerificationErrc::StaleOrFutureSignature);

  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";created=1699999695)"));
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1699999694)", VerificationErrc::StaleOrFutureSignature);
}

TEST_F(SignatureMetadataValidatorTest, created_without_maximum_age)
{
  policy.set_maximum_signature_age(std::nullopt);

  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";created=1)"));
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000001)", VerificationErrc::StaleOrFutureSignature);
}

TEST_F(SignatureMetadataValidatorTest, sub_second_clock)
{
  auto item = parser.parse_item(R"(();alg="ecdsa-p256-sha256";created=1700000000)");
  ASSERT_TRUE(item);
  auto now = test_time() + std::chrono::milliseconds(999);
  EXPECT_TRUE(validator.validate(item.value().parameters, installation_algorithm, policy, now));
}

TEST_F(SignatureMetadataValidatorTest, expires_boundaries)
{
  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";created=1699999990;expires=1700000000)"));
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1699999990;expires=1699999999)", VerificationErrc::StaleOrFutureSignature);

  policy.set_allowed_clock_skew(std::chrono::seconds(10));
  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";created=1699999980;expires=1699999990)"));
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1699999980;expires=1699999989)", VerificationErrc::StaleOrFutureSignature);
}

TEST_F(SignatureMetadataValidatorTest, expires_before_created)
{
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000000;expires=1699999999)", VerificationErrc::StaleOrFutureSignature);

  policy.set_allowed_clock_skew(std::chrono::seconds(60));
  expect_failure(R"(;alg="ecdsa-p256-sha256";created=1700000000;expires=1699999999)", VerificationErrc::StaleOrFutureSignature);
  EXPECT_TRUE(validate(R"(;alg="ecdsa-p256-sha256";created=1700000000;expires=1700000000)"));
}
