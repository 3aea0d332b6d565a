#include <gtest/gtest.h>
#include <warden/crypto/pin.hpp>
#include <warden/crypto/random.hpp>
#include <warden/testing/common.hpp>

using namespace warden::crypto;
using warden::testing::kTestPinIterations;

TEST(pin, derived_record_verifies_only_matching_pin) {
  auto record = make_pin_record("1234", kTestPinIterations);
  EXPECT_EQ(record.iterations, kTestPinIterations);
  EXPECT_EQ(record.salt.size(), kPinSaltSize);
  EXPECT_EQ(record.digest.size(), kPinDigestSize);
  EXPECT_TRUE(verify_pin("1234", record));
  EXPECT_FALSE(verify_pin("1235", record));
  EXPECT_FALSE(verify_pin("", record));
}

TEST(pin, salts_differ_between_records) {
  auto first = make_pin_record("1234", kTestPinIterations);
  auto second = make_pin_record("1234", kTestPinIterations);
  EXPECT_NE(first.salt, second.salt);
  EXPECT_NE(first.digest, second.digest);
}

TEST(pin, text_form_round_trips) {
  auto record = make_pin_record("987654", kTestPinIterations);
  auto text = format_pin_record(record);
  EXPECT_TRUE(text.starts_with("pbkdf2-sha256$1000$"));

  auto parsed = parse_pin_record(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->iterations, record.iterations);
  EXPECT_EQ(parsed->salt, record.salt);
  EXPECT_EQ(parsed->digest, record.digest);
  EXPECT_TRUE(verify_pin("987654", *parsed));
}

TEST(pin, malformed_text_is_rejected) {
  auto valid = format_pin_record(make_pin_record("1234", kTestPinIterations));
  EXPECT_FALSE(parse_pin_record("").has_value());
  EXPECT_FALSE(parse_pin_record("sha1$1000$00$00").has_value());
  EXPECT_FALSE(parse_pin_record("pbkdf2-sha256$0$00$" + std::string(64, '0'))
                   .has_value());
  EXPECT_FALSE(parse_pin_record("pbkdf2-sha256$12x$00$" + std::string(64, '0'))
                   .has_value());
  EXPECT_FALSE(parse_pin_record("pbkdf2-sha256$1000$zz$" + std::string(64, '0'))
                   .has_value());
  EXPECT_FALSE(parse_pin_record("pbkdf2-sha256$1000$00$0000").has_value());
  EXPECT_FALSE(parse_pin_record(valid + "$extra").has_value());
}

TEST(pin, corrupt_record_never_verifies) {
  auto record = make_pin_record("1234", kTestPinIterations);
  auto truncated = record;
  truncated.digest.pop_back();
  EXPECT_FALSE(verify_pin("1234", truncated));

  auto zero_iterations = record;
  zero_iterations.iterations = 0;
  EXPECT_FALSE(verify_pin("1234", zero_iterations));
}

TEST(random, tokens_are_hex_and_unique) {
  auto first = make_token();
  auto second = make_token();
  EXPECT_EQ(first.size(), kTokenSize * 2);
  EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);
  EXPECT_NE(first, second);
  EXPECT_EQ(random_bytes(7).size(), 7u);
}
