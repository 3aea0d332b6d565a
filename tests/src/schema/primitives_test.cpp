#include <gtest/gtest.h>
#include <warden/schema/action.hpp>
#include <warden/schema/call_phase.hpp>
#include <warden/schema/decision.hpp>
#include <warden/schema/permission_level.hpp>
#include <warden/schema/primitives.hpp>

#include <string>

using namespace warden::schema;

TEST(primitives, to_hex_is_lowercase_without_prefix) {
  auto bytes = bytes_t{0x00, 0x0A, 0xAB, 0xFF};
  EXPECT_EQ(to_hex(bytes), "000aabff");
}

TEST(primitives, try_from_hex_accepts_prefix_and_either_case) {
  auto plain = try_from_hex("0aabff");
  auto prefixed = try_from_hex("0x0AABFF");
  ASSERT_TRUE(plain.has_value());
  ASSERT_TRUE(prefixed.has_value());
  EXPECT_EQ(*plain, (bytes_t{0x0A, 0xAB, 0xFF}));
  EXPECT_EQ(*prefixed, *plain);
}

TEST(primitives, try_from_hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(try_from_hex("abc").has_value());
  EXPECT_FALSE(try_from_hex("zz").has_value());
  EXPECT_FALSE(try_from_hex("0x1g").has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, string_and_bytes_conversions_preserve_content) {
  auto text = std::string{"hello"};
  auto bytes = make_bytes(text);
  ASSERT_EQ(bytes.size(), 5u);
  EXPECT_EQ(bytes[0], static_cast<uint8_t>('h'));
  EXPECT_EQ(make_string(bytes), text);
  EXPECT_EQ(make_string_view(bytes), std::string_view{text});
  EXPECT_EQ(make_string(make_bytes_view(bytes)), text);
}

TEST(primitives, to_lower_only_touches_ascii_letters) {
  EXPECT_EQ(to_lower("Open_App:COM.Example-1"), "open_app:com.example-1");
}

TEST(primitives, seconds_to_milliseconds_scales) {
  static_assert(seconds_to_milliseconds(120) == 120000);
  EXPECT_EQ(seconds_to_milliseconds(0), 0u);
}

TEST(primitives, permission_level_strings_round_trip) {
  EXPECT_EQ(to_string(permission_level_t::l1), "L1");
  EXPECT_EQ(to_string(permission_level_t::l5), "L5");
  EXPECT_EQ(try_from_string<permission_level_t>("L3"), permission_level_t::l3);
  EXPECT_FALSE(try_from_string<permission_level_t>("l3").has_value());
  EXPECT_FALSE(try_from_string<permission_level_t>("L6").has_value());
  EXPECT_LT(permission_level_t::l2, permission_level_t::l4);
}

TEST(primitives, enum_names_fall_back_to_unknown) {
  static_assert(name_of(call_phase_t::ringing, kCallPhaseMappings) == "ringing");
  EXPECT_EQ(to_string(static_cast<call_phase_t>(200)), kUnknownEnumName);
  EXPECT_EQ(to_string(static_cast<permission_level_t>(9)), "unknown");
  EXPECT_FALSE(try_from_string<call_phase_t>("ringing").has_value());

  constexpr auto duplicated = enum_mappings_t<call_phase_t, 2>{{
      {"idle", call_phase_t::idle},
      {"idle", call_phase_t::ringing},
  }};
  static_assert(!has_unique_names(duplicated));
  static_assert(has_unique_names(kPermissionLevelMappings));
}

TEST(primitives, action_kind_splits_base_and_target) {
  EXPECT_EQ(base_kind("open_app:com.phonepe.app"), "open_app");
  EXPECT_EQ(action_target("open_app:com.phonepe.app"), "com.phonepe.app");
  EXPECT_EQ(base_kind("get_time"), "get_time");
  EXPECT_TRUE(action_target("get_time").empty());
}

TEST(primitives, describe_renders_every_decision) {
  EXPECT_EQ(describe(granted_t{}), "granted");
  EXPECT_EQ(describe(denied_needs_auth_t{permission_level_t::l2}),
            "authentication required (L2)");
  EXPECT_EQ(describe(denied_blocked_t{}), "blocked by policy");
  EXPECT_EQ(describe(denied_pending_confirmation_t{"abc"}),
            "awaiting confirmation");
  EXPECT_EQ(describe(denied_pending_delay_t{2500}),
            "cooling down, 2500 ms remaining");
  EXPECT_EQ(describe(system_error_t{error_code_t::confirmation_expired,
                                    "token expired"}),
            "error: confirmation_expired (token expired)");
  EXPECT_TRUE(is_granted(granted_t{}));
  EXPECT_FALSE(is_granted(denied_blocked_t{}));
}
