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

#include "sfv/StructuredFieldParser.hh"

#include "CanonicalMessageBuilder.hh"
#include "TestBase.hh"

using namespace gatekeeper;
using namespace gatekeeper::test;
using boost::beast::http::verb;

class CanonicalMessageBuilderTest : public ::testing::Test
{
protected:
  verification_result<std::string> build(const Request::message_type &msg, std::string_view member)
  {
    auto dictionary = parser.parse_dictionary("sig=" + std::string(member));
    EXPECT_TRUE(dictionary);
    const auto *input = dictionary.value().find("sig");
    return builder.build(Request{msg}, *input->get_if<sfv::InnerList>(), input->parameters);
  }

  void expect_unresolvable(const Request::message_type &msg, std::string_view member)
  {
    auto result = build(msg, member);
    ASSERT_FALSE(result) << member;
    EXPECT_EQ(result.error().code, VerificationErrc::UnresolvableComponent) << member;
    EXPECT_FALSE(result.error().reason.empty());
  }

  sfv::StructuredFieldParser parser;
  CanonicalMessageBuilder builder;
};

TEST_F(CanonicalMessageBuilderTest, method_and_header)
{
  auto msg = make_message(verb::get, "/token", {{"Approov-Token", "eyJhbGciOi.payload.sig"}});

  auto result = build(msg, R"(("@method" "approov-token");alg="ecdsa-p256-sha256";created=1700000000)");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(),
            "\"@method\": GET\n"
            "\"approov-token\": eyJhbGciOi.payload.sig\n"
            "\"@signature-params\": (\"@method\" \"approov-token\");alg=\"ecdsa-p256-sha256\";created=1700000000");
}

TEST_F(CanonicalMessageBuilderTest, derived_components)
{
  auto msg = make_message(verb::post, "/path/to?x=1&y=two", {{"Host", "Example.COM:8443"}});

  auto result = build(msg, R"(("@method" "@scheme" "@authority" "@target-uri" "@path" "@query" "@request-target"))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(),
            "\"@method\": POST\n"
            "\"@scheme\": https\n"
            "\"@authority\": example.com:8443\n"
            "\"@target-uri\": https://example.com:8443/path/to?x=1&y=two\n"
            "\"@path\": /path/to\n"
            "\"@query\": x=1&y=two\n"
            "\"@request-target\": /path/to?x=1&y=two\n"
            "\"@signature-params\": (\"@method\" \"@scheme\" \"@authority\" \"@target-uri\" \"@path\" \"@query\" \"@request-target\")");
}

TEST_F(CanonicalMessageBuilderTest, method_is_uppercased)
{
  auto msg = make_message(verb::get, "/");
  msg.method_string("patch");

  auto result = build(msg, R"(("@method"))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(), "\"@method\": PATCH\n\"@signature-params\": (\"@method\")");
}

TEST_F(CanonicalMessageBuilderTest, absolute_form_target)
{
  auto msg = make_message(verb::get, "http://API.example.org/v1/items", {{"Host", "ignored.example.org"}});

  auto result = build(msg, R"(("@authority" "@path" "@query"))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(),
            "\"@authority\": api.example.org\n"
            "\"@path\": /v1/items\n"
            "\"@query\": \n"
            "\"@signature-params\": (\"@authority\" \"@path\" \"@query\")");
}

TEST_F(CanonicalMessageBuilderTest, query_param)
{
  auto msg = make_message(verb::get, "/search?name=a%20b&other=1&name=c");

  auto result = build(msg, R"(("@query-param";name="name" "@query-param";name="other"))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(),
            "\"@query-param\";name=\"name\": a b,c\n"
            "\"@query-param\";name=\"other\": 1\n"
            "\"@signature-params\": (\"@query-param\";name=\"name\" \"@query-param\";name=\"other\")");
}

TEST_F(CanonicalMessageBuilderTest, query_param_unresolvable)
{
  auto msg = make_message(verb::get, "/search?name=a");

  expect_unresolvable(msg, R"(("@query-param"))");
  expect_unresolvable(msg, R"(("@query-param";name=name))");
  expect_unresolvable(msg, R"(("@query-param";name="missing"))");
}

TEST_F(CanonicalMessageBuilderTest, header_instances_are_trimmed_and_joined)
{
  auto msg = make_message(verb::get, "/", {{"Cache-Control", "  max-age=60 "}, {"Cache-Control", "must-revalidate  "}});

  auto result = build(msg, R"(("cache-control"))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(), "\"cache-control\": max-age=60, must-revalidate\n\"@signature-params\": (\"cache-control\")");
}

TEST_F(CanonicalMessageBuilderTest, header_lookup_ignores_case)
{
  auto msg = make_message(verb::get, "/", {{"X-Device-Id", "abc"}});

  auto result = build(msg, R"(("x-device-id"))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(), "\"x-device-id\": abc\n\"@signature-params\": (\"x-device-id\")");
}

TEST_F(CanonicalMessageBuilderTest, structured_header_is_reserialized)
{
  auto msg = make_message(verb::get, "/", {{"Example-Dict", " a=1,    b=2;x=1;y=2,   c=(a   b   c)"}, {"Example-List", "\"x\",   ?1 ,1.50"}});

  auto result = build(msg, R"(("example-dict";sf "example-list";sf))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(),
            "\"example-dict\";sf: a=1, b=2;x=1;y=2, c=(a b c)\n"
            "\"example-list\";sf: \"x\", ?1, 1.5\n"
            "\"@signature-params\": (\"example-dict\";sf \"example-list\";sf)");
}

TEST_F(CanonicalMessageBuilderTest, structured_flag_false_keeps_raw_value)
{
  auto msg = make_message(verb::get, "/", {{"Example-Dict", " a=1,    b=2"}});

  auto result = build(msg, R"(("example-dict";sf=?0))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(),
            "\"example-dict\";sf=?0: a=1,    b=2\n"
            "\"@signature-params\": (\"example-dict\";sf=?0)");
}

TEST_F(CanonicalMessageBuilderTest, structured_flag_not_boolean_keeps_raw_value)
{
  auto msg = make_message(verb::get, "/", {{"Example-Dict", "a=1,  b=2"}});

  auto result = build(msg, R"(("example-dict";sf=1))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(),
            "\"example-dict\";sf=1: a=1,  b=2\n"
            "\"@signature-params\": (\"example-dict\";sf=1)");
}

TEST_F(CanonicalMessageBuilderTest, dictionary_member)
{
  auto msg = make_message(verb::get, "/", {{"Example-Dict", " a=1, b=2;x=1;y=2, c=(a   b    c), d"}});

  auto result = build(msg, R"(("example-dict";key="a" "example-dict";key="b" "example-dict";key="c" "example-dict";key="d"))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(),
            "\"example-dict\";key=\"a\": 1\n"
            "\"example-dict\";key=\"b\": 2;x=1;y=2\n"
            "\"example-dict\";key=\"c\": (a b c)\n"
            "\"example-dict\";key=\"d\": ?1\n"
            "\"@signature-params\": (\"example-dict\";key=\"a\" \"example-dict\";key=\"b\" \"example-dict\";key=\"c\" "
            "\"example-dict\";key=\"d\")");
}

TEST_F(CanonicalMessageBuilderTest, dictionary_member_unresolvable)
{
  auto msg = make_message(verb::get, "/", {{"Example-Dict", "a=1"}, {"Example-List", "(1 2"}});

  expect_unresolvable(msg, R"(("example-dict";key="z"))");
  expect_unresolvable(msg, R"(("example-list";key="a"))");
  expect_unresolvable(msg, R"(("example-list";sf))");
}

TEST_F(CanonicalMessageBuilderTest, missing_header)
{
  auto msg = make_message(verb::get, "/");
  expect_unresolvable(msg, R"(("@method" "x-missing"))");
}

TEST_F(CanonicalMessageBuilderTest, invalid_components)
{
  auto msg = make_message(verb::get, "/", {{"Date", "Tue, 20 Apr 2021 02:07:55 GMT"}});

  expect_unresolvable(msg, R"(("date" "date"))");
  expect_unresolvable(msg, R"(("@method" "@method"))");
  expect_unresolvable(msg, R"((date))");
  expect_unresolvable(msg, R"((1))");
  expect_unresolvable(msg, R"(("@signature-params"))");
  expect_unresolvable(msg, R"(("@status"))");
}

TEST_F(CanonicalMessageBuilderTest, same_header_with_different_parameters)
{
  auto msg = make_message(verb::get, "/", {{"Example-Dict", "a=1, b=2"}});

  auto result = build(msg, R"(("example-dict" "example-dict";key="a"))");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(),
            "\"example-dict\": a=1, b=2\n"
            "\"example-dict\";key=\"a\": 1\n"
            "\"@signature-params\": (\"example-dict\" \"example-dict\";key=\"a\")");
}

TEST_F(CanonicalMessageBuilderTest, unparsable_target)
{
  auto msg = make_message(verb::get, "/a b", {{"Host", "example.com"}});

  expect_unresolvable(msg, R"(("@path"))");
  expect_unresolvable(msg, R"(("@query"))");
  expect_unresolvable(msg, R"(("@target-uri"))");

  auto result = build(msg, R"(("@method" "@authority"))");
  ASSERT_TRUE(result);
}

TEST_F(CanonicalMessageBuilderTest, missing_authority)
{
  auto msg = make_message(verb::get, "/");
  expect_unresolvable(msg, R"(("@authority"))");
  expect_unresolvable(msg, R"(("@target-uri"))");
}

TEST_F(CanonicalMessageBuilderTest, empty_component_list)
{
  auto msg = make_message(verb::get, "/");

  auto result = build(msg, R"(();created=1700000000)");
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(), "\"@signature-params\": ();created=1700000000");
}

TEST_F(CanonicalMessageBuilderTest, deterministic)
{
  auto msg = make_message(verb::post,
                          "/api/v1/orders?id=7",
                          {{"Host", "shop.example.com"}, {"Content-Type", "application/json"}, {"Approov-Token", "token"}},
                          R"({"order":7})");
  std::string member = R"(("@method" "@authority" "@path" "content-type" "approov-token");alg="ecdsa-p256-sha256";created=1700000000;nonce="n-1")";

  auto first = build(msg, member);
  auto second = build(msg, member);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first.value(), second.value());
}
