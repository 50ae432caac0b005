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
#include <vector>

#include "sfv/StructuredField.hh"
#include "sfv/StructuredFieldErrors.hh"
#include "sfv/StructuredFieldParser.hh"
#include "sfv/StructuredFieldSerializer.hh"

using namespace gatekeeper::sfv;

class StructuredFieldSerializerTest : public ::testing::Test
{
protected:
  StructuredFieldSerializer serializer;
  StructuredFieldParser parser;

  void expect_round_trip(FieldType type, const std::vector<std::string> &fields)
  {
    for (const auto &field: fields)
      {
        auto result = serializer.round_trip(type, field);
        ASSERT_TRUE(result) << field << ": " << result.error().message();
        EXPECT_TRUE(result.value()) << field;
      }
  }
};

TEST_F(StructuredFieldSerializerTest, SerializeBareItems)
{
  EXPECT_EQ(serializer.serialize_bare_item(true).value(), "?1");
  EXPECT_EQ(serializer.serialize_bare_item(false).value(), "?0");
  EXPECT_EQ(serializer.serialize_bare_item(std::int64_t{-42}).value(), "-42");
  EXPECT_EQ(serializer.serialize_bare_item(std::string("a \"quoted\" \\ string")).value(), R"sf("a \"quoted\" \\ string")sf");
  EXPECT_EQ(serializer.serialize_bare_item(Token{"foo/bar:baz"}).value(), "foo/bar:baz");
  EXPECT_EQ(serializer.serialize_bare_item(ByteSequence{"hello"}).value(), ":aGVsbG8=:");
  EXPECT_EQ(serializer.serialize_bare_item(ByteSequence{""}).value(), "::");
  EXPECT_EQ(serializer.serialize_bare_item(Date{1744045540}).value(), "@1744045540");
  EXPECT_EQ(serializer.serialize_bare_item(DisplayString{"100% \"\xc3\x96\""}).value(), R"sf(%"100%25 %22%c3%96%22")sf");
}

TEST_F(StructuredFieldSerializerTest, SerializeDecimal)
{
  EXPECT_EQ(serializer.serialize_bare_item(Decimal{4500}).value(), "4.5");
  EXPECT_EQ(serializer.serialize_bare_item(Decimal{123456}).value(), "123.456");
  EXPECT_EQ(serializer.serialize_bare_item(Decimal{5000}).value(), "5.0");
  EXPECT_EQ(serializer.serialize_bare_item(Decimal{-1}).value(), "-0.001");
  EXPECT_EQ(serializer.serialize_bare_item(Decimal{0}).value(), "0.0");
}

TEST_F(StructuredFieldSerializerTest, SerializeOutOfRange)
{
  auto result = serializer.serialize_bare_item(std::int64_t{1000000000000000});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), StructuredFieldErrc::ValueOutOfRange);

  result = serializer.serialize_bare_item(Decimal{1000000000000000});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), StructuredFieldErrc::ValueOutOfRange);
}

TEST_F(StructuredFieldSerializerTest, SerializeInvalidValues)
{
  auto result = serializer.serialize_bare_item(std::string("line\nbreak"));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), StructuredFieldErrc::InvalidString);

  result = serializer.serialize_bare_item(std::string("caf\xc3\xa9"));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), StructuredFieldErrc::InvalidString);

  result = serializer.serialize_bare_item(Token{"1abc"});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), StructuredFieldErrc::InvalidToken);

  result = serializer.serialize_bare_item(DisplayString{"\xff"});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), StructuredFieldErrc::InvalidDisplayString);

  Parameters parameters;
  parameters.insert_or_assign("Upper", BareItem{true});
  result = serializer.serialize_parameters(parameters);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), StructuredFieldErrc::InvalidKey);
}

TEST_F(StructuredFieldSerializerTest, SerializeNestedInnerList)
{
  InnerList inner{Item{std::int64_t{1}}};
  InnerList outer{Item{inner}};

  auto result = serializer.serialize_inner_list(outer, {});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), StructuredFieldErrc::InvalidInnerList);
}

TEST_F(StructuredFieldSerializerTest, SerializeParameters)
{
  Parameters parameters{{"alg", std::string("hmac-sha256")}, {"created", std::int64_t{1700000000}}, {"flag", true}};
  Item item{InnerList{Item{std::string("@method")}, Item{std::string("@path")}}, parameters};

  auto result = serializer.serialize_item(item);
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value(), R"sf(("@method" "@path");alg="hmac-sha256";created=1700000000;flag)sf");
}

TEST_F(StructuredFieldSerializerTest, SerializeFalseParameter)
{
  Item item{std::int64_t{1}, Parameters{{"a", false}}};
  EXPECT_EQ(serializer.serialize_item(item).value(), "1;a=?0");
}

TEST_F(StructuredFieldSerializerTest, SerializeList)
{
  List list{Item{Token{"a"}}, Item{std::int64_t{2}, Parameters{{"x", true}}}, Item{InnerList{}}};
  EXPECT_EQ(serializer.serialize_list(list).value(), "a, 2;x, ()");
  EXPECT_EQ(serializer.serialize_list(List{}).value(), "");
}

TEST_F(StructuredFieldSerializerTest, SerializeDictionary)
{
  Dictionary dictionary;
  dictionary.insert_or_assign("sha-256", Item{ByteSequence{"a"}});
  dictionary.insert_or_assign("flag", Item{true, Parameters{{"p", std::int64_t{1}}}});
  dictionary.insert_or_assign("off", Item{false});

  EXPECT_EQ(serializer.serialize_dictionary(dictionary).value(), "sha-256=:YQ==:, flag;p=1, off=?0");
}

TEST_F(StructuredFieldSerializerTest, RoundTripItems)
{
  expect_round_trip(FieldType::Item,
                    {
                      "?1;param=123",
                      "?1",
                      R"sf(45;param1;param2="my string")sf",
                      R"sf(45.1;param1=%"my %c3%96 string")sf",
                      "@1744045540",
                      R"sf("a string like no other";param1;param2;param3)sf",
                      "*big/$good_token#!;param1=@1744045540",
                      "Big/%good_token&'*-;param1=5540",
                      "big+/good.token^`|~:;param1=5540.113",
                      R"sf(%"my %c3%96 string";param1=token/string)sf",
                      ":DeviceIDDeviceIDDevicQ==:;param1=:DeviceIODeviceIODevicQ==:",
                      "(:DeviceIDDeviceIDDevicQ==: @1744045540 Big/%good_token&'*-)",
                      "(:YQ==: @1744045540 Big/%good_token&'*-);param1=5540.113;param2=:DeviceIODeviceIODevicQ==:",
                      R"sf((?0 ?1 123 134.321 @1744045540 "something" Big/%good_token&'*- %"my %c3%96 string" :YQ==:))sf",
                      R"sf((?0;p2=?0;p3=123;p4=123.456 ?1;date=@1000 123;str="attention");p45=Big/%good_token&'*-)sf",
                      R"sf((134.321;str=%"my %c3%96 string" @1744045540;boolt;boolf=?0 "something";n=0.1 Big/%good_token&'*-;mybytes=:JQ==:))sf",
                      R"sf((%"my %c3%96 string";p4=123.4;p3=123 :YQ==:;t1=token ?0 ?1 123 134.321 @1744045540;bool1);bool2=?0)sf",
                      "-0.5",
                      "()",
                    });
}

TEST_F(StructuredFieldSerializerTest, RoundTripLists)
{
  expect_round_trip(FieldType::List,
                    {
                      "?0",
                      "()",
                      R"sf(?0, ?1, 123, 134.321, @1744045540, "something", Big/%good_token&'*-, %"my %c3%96 string", :YQ==:, ())sf",
                      R"sf((tok1);p1, ?0;p2=?0;p3=123;p4=123.456, ?1;date=@1000, 123;str="attention";p45=Big/%good_token&'*-)sf",
                      R"sf(134.321;str=%"my %c3%96 string", @1744045540;boolt;boolf=?0, "something";n=0.1, Big/%good_token&'*-;mybytes=:JQ==:)sf",
                      R"sf(%"my %c3%96 string";p4=123.4;p3=123, :YQ==:;t1=token, (?0 ?1 123 134.321 @1744045540);bool1;bool2=?0)sf",
                    });
}

TEST_F(StructuredFieldSerializerTest, RoundTripDictionaries)
{
  expect_round_trip(FieldType::Dictionary,
                    {
                      R"sf(k1=(@1744045540 12 tok);param1, k2="my string";bool1, k3=?0, k4;tok2)sf",
                      R"sf(k1=?0, k2, k3=123, k4=134.321, k5=@1744045540, k6="something", k7=Big/%good_token&'*-, k8=%"my %c3%96 string", k9=:YQ==:, k10=())sf",
                      R"sf(k1=(tok1);p1, k2=?0;p2=?0;p3=123;p4=123.456, k3;date=@1000, k4=123;str="attention";p45=Big/%good_token&'*-)sf",
                      R"sf(k1=134.321;str=%"my %c3%96 string", k2=@1744045540;boolt;boolf=?0, k3="something";n=0.1, k4=Big/%good_token&'*-;mybytes=:JQ==:)sf",
                      R"sf(k1=%"my %c3%96 string";p4=123.4;p3=123, k2=:YQ==:;t1=token, k3=(?0 ?1 123 134.321 @1744045540);bool1;bool2=?0)sf",
                      R"sf(install=("@method" "@path" "content-digest");alg="ecdsa-p256-sha256";created=1700000000;nonce="abc")sf",
                    });
}

TEST_F(StructuredFieldSerializerTest, RoundTripNonCanonicalInput)
{
  auto result = serializer.round_trip(FieldType::Item, "4.50");
  ASSERT_TRUE(result);
  EXPECT_FALSE(result.value());

  result = serializer.round_trip(FieldType::List, "a,b");
  ASSERT_TRUE(result);
  EXPECT_FALSE(result.value());

  result = serializer.round_trip(FieldType::Dictionary, "a=?1");
  ASSERT_TRUE(result);
  EXPECT_FALSE(result.value());
}

TEST_F(StructuredFieldSerializerTest, RoundTripParseError)
{
  auto result = serializer.round_trip(FieldType::Item, "\"unterminated");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), StructuredFieldErrc::InvalidString);
}

TEST_F(StructuredFieldSerializerTest, ParsedValueSerializesIdentically)
{
  auto parsed = parser.parse_item(R"sf(("@method" "approov-token");alg="ecdsa-p256-sha256";created=1700000000)sf");
  ASSERT_TRUE(parsed);

  auto first = serializer.serialize_item(parsed.value());
  auto second = serializer.serialize_item(parsed.value());
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first.value(), second.value());
}
