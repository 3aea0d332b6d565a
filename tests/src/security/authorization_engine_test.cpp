#include <gtest/gtest.h>
#include <warden/testing/assistant_fixture.hpp>

#include <array>
#include <atomic>
#include <thread>

using namespace warden::schema;
using namespace warden::testing;

namespace {

template <typename T>
const T* as(const decision_t& decision) {
  return std::get_if<T>(&decision);
}

action_request_t system_request(std::string kind,
                                std::optional<timestamp_milliseconds_t> trigger) {
  return action_request_t{.kind = std::move(kind),
                          .origin = action_origin_t::system,
                          .triggered_at = trigger};
}

}  // namespace

TEST(authorization_engine, l1_actions_need_no_session) {
  auto fixture = assistant_fixture{"warden_engine_l1"};
  auto decision = fixture.engine().authorize(kOwner, fixture.request("get_time"));
  EXPECT_TRUE(is_granted(decision));
}

TEST(authorization_engine, blocked_actions_are_denied_even_with_l4_session) {
  auto fixture = assistant_fixture{"warden_engine_blocked"};
  fixture.login_owner();
  ASSERT_EQ(fixture.sessions().effective_level(kOwner), permission_level_t::l4);

  for (auto kind : {"bank_transfer", "upi_payment", "open_banking_app",
                    "open_app:com.phonepe.app"}) {
    auto decision = fixture.engine().authorize(kOwner, fixture.request(kind));
    EXPECT_NE(as<denied_blocked_t>(decision), nullptr) << kind;
  }

  auto blocked = fixture.audit().query(
      audit_filter_t{.outcome = audit_outcome_t::blocked});
  EXPECT_EQ(blocked.size(), 4u);
  EXPECT_TRUE(fixture.transport().prompts().empty());
}

TEST(authorization_engine, unknown_action_is_an_audited_error) {
  auto fixture = assistant_fixture{"warden_engine_unknown"};
  fixture.login_owner();
  auto decision =
      fixture.engine().authorize(kOwner, fixture.request("launch_rockets"));
  auto* error = as<system_error_t>(decision);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, error_code_t::unknown_action);

  auto records = fixture.audit().query(
      audit_filter_t{.action_kind = std::string{"launch_rockets"}});
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].outcome, audit_outcome_t::error);
  EXPECT_FALSE(records[0].required_level.has_value());
}

TEST(authorization_engine, read_whatsapp_requires_pin_then_succeeds) {
  auto fixture = assistant_fixture{"warden_engine_whatsapp"};
  fixture.enroll_owner();

  auto first =
      fixture.engine().authorize(kOwner, fixture.request("read_whatsapp"));
  auto* needs_auth = as<denied_needs_auth_t>(first);
  ASSERT_NE(needs_auth, nullptr);
  EXPECT_EQ(needs_auth->required_level, permission_level_t::l2);

  auto verified = fixture.engine().verify_pin(kOwner, kOwnerPin);
  ASSERT_TRUE(std::holds_alternative<permission_level_t>(verified));

  auto second =
      fixture.engine().authorize(kOwner, fixture.request("read_whatsapp"));
  EXPECT_TRUE(is_granted(second));
}

TEST(authorization_engine, expired_session_requires_pin_again) {
  auto fixture = assistant_fixture{"warden_engine_expired"};
  fixture.login_owner();
  fixture.clock().advance_seconds(301);
  auto decision =
      fixture.engine().authorize(kOwner, fixture.request("read_sms"));
  EXPECT_NE(as<denied_needs_auth_t>(decision), nullptr);
}

TEST(authorization_engine, grant_slides_session_without_raising_level) {
  auto fixture = assistant_fixture{"warden_engine_touch"};
  fixture.login_owner();
  fixture.clock().advance_seconds(200);

  ASSERT_TRUE(is_granted(
      fixture.engine().authorize(kOwner, fixture.request("read_sms"))));
  auto session = fixture.sessions().get_or_create(kOwner);
  EXPECT_EQ(session.verified_level, permission_level_t::l4);
  EXPECT_EQ(session.expires_at, fixture.clock().now() + 300000);
}

TEST(authorization_engine, system_requests_do_not_extend_session) {
  auto fixture = assistant_fixture{"warden_engine_system_touch"};
  fixture.login_owner();
  auto before = fixture.sessions().get_or_create(kOwner).expires_at;
  fixture.clock().advance_seconds(100);

  ASSERT_TRUE(is_granted(fixture.engine().authorize(
      kOwner, system_request("read_whatsapp", std::nullopt))));
  EXPECT_EQ(fixture.sessions().get_or_create(kOwner).expires_at, before);
}

TEST(authorization_engine, edit_file_requires_confirmation) {
  auto fixture = assistant_fixture{"warden_engine_edit_file"};
  fixture.login_owner();

  auto request = fixture.request("edit_file", "notes.txt");
  auto first = fixture.engine().authorize(kOwner, request);
  auto* pending = as<denied_pending_confirmation_t>(first);
  ASSERT_NE(pending, nullptr);
  auto token = pending->token;
  EXPECT_EQ(token.size(), 32u);

  auto prompts = fixture.transport().prompts();
  ASSERT_EQ(prompts.size(), 1u);
  EXPECT_EQ(prompts[0].token, token);
  EXPECT_EQ(prompts[0].principal_id, kOwner);

  request.confirmation_token = token;
  auto waiting = fixture.engine().authorize(kOwner, request);
  auto* still_pending = as<denied_pending_confirmation_t>(waiting);
  ASSERT_NE(still_pending, nullptr);
  EXPECT_EQ(still_pending->token, token);

  EXPECT_EQ(fixture.engine().confirm(kOwner, token, true),
            warden::dispatch::confirmation_status_t::confirmed);
  EXPECT_TRUE(is_granted(fixture.engine().authorize(kOwner, request)));

  // Tokens are single use.
  auto replay = fixture.engine().authorize(kOwner, request);
  auto* error = as<system_error_t>(replay);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, error_code_t::confirmation_mismatch);
}

TEST(authorization_engine, confirmed_token_grants_only_once_across_threads) {
  auto fixture = assistant_fixture{"warden_engine_token_race"};
  fixture.login_owner();

  for (auto round = 0; round < 16; ++round) {
    auto request = fixture.request("edit_file", "notes.txt");
    auto token = std::get<denied_pending_confirmation_t>(
                     fixture.engine().authorize(kOwner, request))
                     .token;
    ASSERT_EQ(fixture.engine().confirm(kOwner, token, true),
              warden::dispatch::confirmation_status_t::confirmed);
    request.confirmation_token = token;

    auto go = std::atomic<bool>{false};
    auto decisions = std::array<decision_t, 2>{};
    {
      auto callers = std::array<std::jthread, 2>{};
      for (auto i = size_t{0}; i < callers.size(); ++i) {
        callers[i] = std::jthread{[&, i] {
          while (!go.load()) {
            std::this_thread::yield();
          }
          decisions[i] = fixture.engine().authorize(kOwner, request);
        }};
      }
      go = true;
    }

    auto granted = 0;
    auto mismatched = 0;
    for (const auto& decision : decisions) {
      if (is_granted(decision)) {
        ++granted;
      } else if (const auto* error = as<system_error_t>(decision);
                 error != nullptr &&
                 error->code == error_code_t::confirmation_mismatch) {
        ++mismatched;
      }
    }
    EXPECT_EQ(granted, 1) << "round " << round;
    EXPECT_EQ(mismatched, 1) << "round " << round;
  }
}

TEST(authorization_engine, confirmation_is_bound_to_payload_and_kind) {
  auto fixture = assistant_fixture{"warden_engine_binding"};
  fixture.login_owner();

  auto request = fixture.request("edit_file", "notes.txt");
  auto token = std::get<denied_pending_confirmation_t>(
                   fixture.engine().authorize(kOwner, request))
                   .token;
  ASSERT_EQ(fixture.engine().confirm(kOwner, token, true),
            warden::dispatch::confirmation_status_t::confirmed);

  auto other_payload = fixture.request("edit_file", "passwords.txt");
  other_payload.confirmation_token = token;
  auto* payload_error = as<system_error_t>(
      fixture.engine().authorize(kOwner, other_payload));
  ASSERT_NE(payload_error, nullptr);
  EXPECT_EQ(payload_error->code, error_code_t::confirmation_mismatch);

  auto other_kind = fixture.request("send_message", "notes.txt");
  other_kind.confirmation_token = token;
  auto* kind_error =
      as<system_error_t>(fixture.engine().authorize(kOwner, other_kind));
  ASSERT_NE(kind_error, nullptr);
  EXPECT_EQ(kind_error->code, error_code_t::confirmation_mismatch);

  request.confirmation_token = token;
  EXPECT_TRUE(is_granted(fixture.engine().authorize(kOwner, request)));
}

TEST(authorization_engine, confirmation_cannot_be_answered_by_another_principal) {
  auto fixture = assistant_fixture{"warden_engine_other_principal"};
  fixture.login_owner();
  auto token = std::get<denied_pending_confirmation_t>(
                   fixture.engine().authorize(
                       kOwner, fixture.request("edit_file", "notes.txt")))
                   .token;
  EXPECT_EQ(fixture.engine().confirm("intruder", token, true),
            warden::dispatch::confirmation_status_t::wrong_principal);
}

TEST(authorization_engine, rejected_confirmation_denies_action) {
  auto fixture = assistant_fixture{"warden_engine_rejected"};
  fixture.login_owner();
  auto request = fixture.request("send_message", "hello");
  request.confirmation_token =
      std::get<denied_pending_confirmation_t>(
          fixture.engine().authorize(kOwner, request))
          .token;
  ASSERT_EQ(fixture.engine().confirm(kOwner, *request.confirmation_token, false),
            warden::dispatch::confirmation_status_t::rejected);

  auto* error =
      as<system_error_t>(fixture.engine().authorize(kOwner, request));
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, error_code_t::confirmation_rejected);
}

TEST(authorization_engine, stale_confirmation_expires) {
  auto fixture = assistant_fixture{"warden_engine_confirmation_expiry"};
  fixture.login_owner();
  auto request = fixture.request("create_reminder", "call mom");
  request.confirmation_token =
      std::get<denied_pending_confirmation_t>(
          fixture.engine().authorize(kOwner, request))
          .token;
  ASSERT_EQ(fixture.engine().confirm(kOwner, *request.confirmation_token, true),
            warden::dispatch::confirmation_status_t::confirmed);

  fixture.clock().advance_seconds(121);
  auto* error =
      as<system_error_t>(fixture.engine().authorize(kOwner, request));
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, error_code_t::confirmation_expired);

  auto audited = fixture.audit().query(
      audit_filter_t{.action_kind = std::string{"create_reminder"},
                     .event = audit_event_type_t::authorization});
  ASSERT_FALSE(audited.empty());
  EXPECT_EQ(audited.back().outcome, audit_outcome_t::denied);
}

TEST(authorization_engine, l4_action_waits_for_delay_after_confirmation) {
  auto fixture = assistant_fixture{"warden_engine_l4_delay"};
  fixture.login_owner();

  auto request = fixture.request("make_call", "+15550100");
  request.confirmation_token =
      std::get<denied_pending_confirmation_t>(
          fixture.engine().authorize(kOwner, request))
          .token;
  ASSERT_EQ(fixture.engine().confirm(kOwner, *request.confirmation_token, true),
            warden::dispatch::confirmation_status_t::confirmed);

  auto* pending =
      as<denied_pending_delay_t>(fixture.engine().authorize(kOwner, request));
  ASSERT_NE(pending, nullptr);
  EXPECT_EQ(pending->remaining, 10000u);

  fixture.clock().advance_seconds(4);
  auto* later =
      as<denied_pending_delay_t>(fixture.engine().authorize(kOwner, request));
  ASSERT_NE(later, nullptr);
  EXPECT_EQ(later->remaining, 6000u);

  fixture.clock().advance_seconds(6);
  EXPECT_TRUE(is_granted(fixture.engine().authorize(kOwner, request)));
}

TEST(authorization_engine, per_action_delay_overrides_global_delay) {
  auto fixture = assistant_fixture{"warden_engine_override"};
  fixture.login_owner();

  auto request = fixture.request("shutdown");
  request.confirmation_token =
      std::get<denied_pending_confirmation_t>(
          fixture.engine().authorize(kOwner, request))
          .token;
  ASSERT_EQ(fixture.engine().confirm(kOwner, *request.confirmation_token, true),
            warden::dispatch::confirmation_status_t::confirmed);

  fixture.clock().advance_seconds(10);
  auto* pending =
      as<denied_pending_delay_t>(fixture.engine().authorize(kOwner, request));
  ASSERT_NE(pending, nullptr);
  EXPECT_EQ(pending->remaining, 20000u);
}

TEST(authorization_engine, call_pickup_standing_approval_uses_ring_start) {
  auto fixture = assistant_fixture{"warden_engine_pickup"};
  auto ring_start = fixture.clock().now();

  fixture.clock().advance_seconds(12);
  auto* pending = as<denied_pending_delay_t>(fixture.engine().authorize(
      kOwner, system_request("call_pickup", ring_start)));
  ASSERT_NE(pending, nullptr);
  EXPECT_EQ(pending->remaining, 8000u);

  fixture.clock().advance_seconds(8);
  EXPECT_TRUE(is_granted(fixture.engine().authorize(
      kOwner, system_request("call_pickup", ring_start))));
  EXPECT_TRUE(fixture.transport().prompts().empty());
}

TEST(authorization_engine, standing_approval_requires_trigger_time) {
  auto fixture = assistant_fixture{"warden_engine_pickup_trigger"};
  auto* error = as<system_error_t>(fixture.engine().authorize(
      kOwner, system_request("call_pickup", std::nullopt)));
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, error_code_t::invalid_request);
}

TEST(authorization_engine, standing_approval_does_not_apply_to_users) {
  auto fixture = assistant_fixture{"warden_engine_pickup_user"};
  auto request = fixture.request("call_pickup");
  request.triggered_at = fixture.clock().now();
  fixture.clock().advance_seconds(30);
  EXPECT_NE(as<denied_needs_auth_t>(
                fixture.engine().authorize(kOwner, request)),
            nullptr);
}

TEST(authorization_engine, every_decision_appends_one_audit_record) {
  auto fixture = assistant_fixture{"warden_engine_audit_count"};
  fixture.enroll_owner();

  auto requests = std::vector<action_request_t>{
      fixture.request("get_time"), fixture.request("read_sms"),
      fixture.request("bank_transfer"), fixture.request("nope")};
  for (const auto& request : requests) {
    auto before = fixture.audit().next_sequence();
    fixture.engine().authorize(kOwner, request);
    EXPECT_EQ(fixture.audit().next_sequence(), before + 1) << request.kind;
  }
}

TEST(authorization_engine, fails_closed_when_audit_is_unavailable) {
  auto fixture = assistant_fixture{"warden_engine_audit_down"};
  fixture.audit().close();
  auto* error = as<system_error_t>(
      fixture.engine().authorize(kOwner, fixture.request("get_time")));
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, error_code_t::audit_unavailable);
}

TEST(authorization_engine, pin_attempts_are_audited) {
  auto fixture = assistant_fixture{"warden_engine_pin_audit"};
  fixture.enroll_owner();
  fixture.engine().verify_pin(kOwner, "0000");
  fixture.engine().verify_pin(kOwner, kOwnerPin);

  auto records = fixture.audit().query(
      audit_filter_t{.event = audit_event_type_t::authentication});
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].outcome, audit_outcome_t::denied);
  EXPECT_EQ(records[0].reason, "invalid_pin");
  EXPECT_EQ(records[1].outcome, audit_outcome_t::granted);
}

TEST(authorization_engine, logout_requires_pin_again) {
  auto fixture = assistant_fixture{"warden_engine_logout"};
  fixture.login_owner();
  fixture.engine().logout(kOwner);
  EXPECT_NE(as<denied_needs_auth_t>(
                fixture.engine().authorize(kOwner, fixture.request("read_sms"))),
            nullptr);
}
