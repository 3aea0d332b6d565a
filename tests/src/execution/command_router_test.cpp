#include <gtest/gtest.h>
#include <warden/testing/assistant_fixture.hpp>

using namespace warden::schema;
using namespace warden::testing;

namespace {

call_summary_t make_call(std::string caller) {
  return call_summary_t{.caller = std::move(caller),
                        .duration = 30000,
                        .action_items = {"Call back"},
                        .summary = "Brief exchange with caller."};
}

}  // namespace

TEST(command_router, get_time_is_always_available) {
  auto fixture = assistant_fixture{"warden_router_time"};
  auto result = fixture.router().execute(kOwner, fixture.request("get_time"));
  EXPECT_TRUE(result.executed);
  EXPECT_TRUE(is_granted(result.decision));
  EXPECT_EQ(result.output, "2023-11-14 22:13:20 UTC");
}

TEST(command_router, status_reports_session_and_call_phase) {
  auto fixture = assistant_fixture{"warden_router_status"};
  auto anonymous =
      fixture.router().execute(kOwner, fixture.request("query_status"));
  EXPECT_EQ(anonymous.output,
            "Session: L1\nPending confirmations: 0\nCall: idle");

  fixture.login_owner();
  fixture.clock().advance_seconds(60);
  auto verified =
      fixture.router().execute(kOwner, fixture.request("query_status"));
  EXPECT_TRUE(verified.output.starts_with("Session: L4 (240s remaining)"))
      << verified.output;

  auto call = fixture.router().execute(kOwner, fixture.request("call_status"));
  EXPECT_EQ(call.output, "Call: idle");
}

TEST(command_router, help_lists_allowed_actions_only) {
  auto fixture = assistant_fixture{"warden_router_help"};
  auto result = fixture.router().execute(kOwner, fixture.request("help"));
  EXPECT_TRUE(result.output.starts_with("Available actions:"));
  EXPECT_NE(result.output.find("read_whatsapp (L2): Read WhatsApp messages"),
            std::string::npos);
  EXPECT_EQ(result.output.find("bank_transfer"), std::string::npos);
}

TEST(command_router, reader_runs_only_after_authentication) {
  auto fixture = assistant_fixture{"warden_router_reader"};
  auto whatsapp = fake_reader{};
  whatsapp.set_items(std::vector<std::string>{"Mom: call me", "Bob: hi"});
  fixture.router().register_reader("whatsapp", whatsapp);
  fixture.enroll_owner();

  auto denied =
      fixture.router().execute(kOwner, fixture.request("read_whatsapp", "unread"));
  EXPECT_FALSE(denied.executed);
  EXPECT_TRUE(std::holds_alternative<denied_needs_auth_t>(denied.decision));
  EXPECT_EQ(whatsapp.reads.load(), 0);

  fixture.engine().verify_pin(kOwner, kOwnerPin);
  auto granted =
      fixture.router().execute(kOwner, fixture.request("read_whatsapp", "unread"));
  EXPECT_TRUE(granted.executed);
  EXPECT_EQ(granted.output, "Mom: call me\nBob: hi");
  EXPECT_EQ(whatsapp.last_query(), "unread");

  whatsapp.set_items(std::vector<std::string>{});
  EXPECT_EQ(fixture.router()
                .execute(kOwner, fixture.request("read_whatsapp"))
                .output,
            "Nothing found.");

  whatsapp.set_items(std::nullopt);
  auto unavailable =
      fixture.router().execute(kOwner, fixture.request("read_whatsapp"));
  EXPECT_FALSE(unavailable.executed);
  EXPECT_TRUE(is_granted(unavailable.decision));
  EXPECT_EQ(unavailable.output, "whatsapp is unavailable");
}

TEST(command_router, missing_reader_is_reported) {
  auto fixture = assistant_fixture{"warden_router_no_reader"};
  fixture.login_owner();
  auto result =
      fixture.router().execute(kOwner, fixture.request("read_contacts"));
  EXPECT_FALSE(result.executed);
  EXPECT_EQ(result.output, "no reader available for contacts");
}

TEST(command_router, executor_runs_after_confirmation) {
  auto fixture = assistant_fixture{"warden_router_executor"};
  auto executor = fake_executor{};
  fixture.router().register_executor(executor);
  fixture.login_owner();

  auto request = fixture.request("edit_file", "notes.txt");
  auto first = fixture.router().execute(kOwner, request);
  auto* pending = std::get_if<denied_pending_confirmation_t>(&first.decision);
  ASSERT_NE(pending, nullptr);
  EXPECT_TRUE(executor.performed().empty());

  ASSERT_EQ(fixture.engine().confirm(kOwner, pending->token, true),
            warden::dispatch::confirmation_status_t::confirmed);
  request.confirmation_token = pending->token;
  auto second = fixture.router().execute(kOwner, request);
  EXPECT_TRUE(second.executed);
  EXPECT_EQ(second.output, "done: edit_file");

  auto performed = executor.performed();
  ASSERT_EQ(performed.size(), 1u);
  EXPECT_EQ(performed[0].first, "edit_file");
  EXPECT_EQ(performed[0].second, "notes.txt");
}

TEST(command_router, blocked_actions_never_reach_executor) {
  auto fixture = assistant_fixture{"warden_router_blocked"};
  auto executor = fake_executor{};
  fixture.router().register_executor(executor);
  fixture.login_owner();

  auto result = fixture.router().execute(
      kOwner, fixture.request("open_app:com.phonepe.app"));
  EXPECT_FALSE(result.executed);
  EXPECT_TRUE(std::holds_alternative<denied_blocked_t>(result.decision));
  EXPECT_TRUE(executor.performed().empty());
}

TEST(command_router, audit_log_view_shows_own_records) {
  auto fixture = assistant_fixture{"warden_router_audit"};
  fixture.login_owner();
  auto result =
      fixture.router().execute(kOwner, fixture.request("view_audit_log"));
  EXPECT_TRUE(result.executed);
  EXPECT_NE(result.output.find("#0 verify_pin granted verified"),
            std::string::npos)
      << result.output;
  EXPECT_NE(result.output.find("view_audit_log granted"), std::string::npos);
}

TEST(command_router, call_history_and_tasks_come_from_archive) {
  auto fixture = assistant_fixture{"warden_router_calls"};
  fixture.login_owner();
  EXPECT_EQ(fixture.router().execute(kOwner, fixture.request("list_calls")).output,
            "No calls recorded.");

  ASSERT_TRUE(fixture.archive().store(make_call("+15550100")).has_value());
  ASSERT_TRUE(fixture.archive().store(make_call("+15550199")).has_value());

  auto calls = fixture.router().execute(kOwner, fixture.request("list_calls"));
  EXPECT_TRUE(calls.output.starts_with("Call from +15550100 (30s, neutral)"))
      << calls.output;
  EXPECT_NE(calls.output.find("\n\nCall from +15550199"), std::string::npos);

  auto tasks = fixture.router().execute(kOwner, fixture.request("list_tasks"));
  EXPECT_EQ(tasks.output,
            "Pending confirmations: 0\nFrom the last call (+15550199):\n- Call "
            "back");
}
