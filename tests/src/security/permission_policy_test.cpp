#include <gtest/gtest.h>
#include <warden/config/options.hpp>
#include <warden/security/permission_policy.hpp>

using namespace warden::schema;
using warden::security::permission_policy;

namespace {

permission_policy make_policy() {
  return permission_policy::make_default(
      {.banking_blocklist = warden::config::default_banking_blocklist()});
}

}  // namespace

TEST(permission_policy, resolves_default_levels) {
  auto policy = make_policy();
  EXPECT_EQ(policy.resolve("get_time"), permission_level_t::l1);
  EXPECT_EQ(policy.resolve("read_whatsapp"), permission_level_t::l2);
  EXPECT_EQ(policy.resolve("edit_file"), permission_level_t::l3);
  EXPECT_EQ(policy.resolve("make_call"), permission_level_t::l4);
  EXPECT_EQ(policy.resolve("call_pickup"), permission_level_t::l4);
  EXPECT_EQ(policy.resolve("bank_transfer"), permission_level_t::l5);
}

TEST(permission_policy, unknown_kind_never_defaults_to_l1) {
  auto policy = make_policy();
  EXPECT_FALSE(policy.resolve("launch_rockets").has_value());
  EXPECT_FALSE(
      policy.bind(action_request_t{.kind = "launch_rockets"}).has_value());
  EXPECT_FALSE(policy.is_blocked("launch_rockets"));
}

TEST(permission_policy, target_resolves_by_base_kind) {
  auto policy = make_policy();
  EXPECT_EQ(policy.resolve("open_app:com.example.notes"),
            permission_level_t::l3);
}

TEST(permission_policy, blocks_l5_actions) {
  auto policy = make_policy();
  EXPECT_TRUE(policy.is_blocked("bank_transfer"));
  EXPECT_TRUE(policy.is_blocked("upi_payment"));
  EXPECT_TRUE(policy.is_blocked("open_banking_app"));
  EXPECT_FALSE(policy.is_blocked("read_whatsapp"));
}

TEST(permission_policy, blocks_banking_app_targets_case_insensitively) {
  auto policy = make_policy();
  EXPECT_TRUE(policy.is_blocked("open_app:com.phonepe.app"));
  EXPECT_TRUE(policy.is_blocked("open_app:COM.PHONEPE.APP"));
  EXPECT_TRUE(policy.is_blocked("open_app:net.one97.paytm"));
  EXPECT_FALSE(policy.is_blocked("open_app:com.example.notes"));
}

TEST(permission_policy, short_targets_are_not_blocked_by_longer_entries) {
  auto policy = make_policy();
  EXPECT_FALSE(policy.is_blocked("open_app:com"));
  EXPECT_FALSE(policy.is_blocked("open_app:pay"));
  EXPECT_FALSE(policy.is_blocked("open_app:app"));
  EXPECT_TRUE(policy.is_blocked("open_app:com.phonepe.app"));
}

TEST(permission_policy, blocks_kind_named_on_blocklist) {
  auto policy = permission_policy::make_default(
      {.banking_blocklist = {"Crypto_Wallet"}});
  EXPECT_TRUE(policy.is_blocked("crypto_wallet"));
  EXPECT_FALSE(policy.is_blocked("open_app:com.phonepe.app"));
}

TEST(permission_policy, bind_fills_required_level_from_policy) {
  auto policy = make_policy();
  auto action = policy.bind(action_request_t{
      .kind = "edit_file", .payload = "notes.txt", .requested_at = 42});
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->kind, "edit_file");
  EXPECT_EQ(action->required_level, permission_level_t::l3);
  EXPECT_EQ(action->payload, "notes.txt");
  EXPECT_EQ(action->requested_at, 42u);
}

TEST(permission_policy, entries_carry_delays_and_capabilities) {
  auto policy = make_policy();
  auto make_call = policy.find("make_call");
  ASSERT_TRUE(make_call.has_value());
  EXPECT_EQ(make_call->get().delay, seconds_to_milliseconds(10));
  EXPECT_TRUE(std::holds_alternative<warden::security::executor_capability_t>(
      make_call->get().capability));

  auto sms = policy.find("read_sms");
  ASSERT_TRUE(sms.has_value());
  auto* reader =
      std::get_if<warden::security::reader_capability_t>(&sms->get().capability);
  ASSERT_NE(reader, nullptr);
  EXPECT_EQ(reader->source, "sms");
}

TEST(permission_policy, auto_pickup_standing_approval_follows_settings) {
  auto enabled = permission_policy::make_default(
      {.auto_pickup_enabled = true, .auto_pickup_delay = 20000});
  EXPECT_TRUE(enabled.find("call_pickup")->get().standing_approval);
  EXPECT_EQ(enabled.find("call_pickup")->get().delay, 20000u);

  auto disabled =
      permission_policy::make_default({.auto_pickup_enabled = false});
  EXPECT_FALSE(disabled.find("call_pickup")->get().standing_approval);
}
