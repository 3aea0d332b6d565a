#include <gtest/gtest.h>
#include <warden/call/prompt_builder.hpp>

using namespace warden::schema;
using warden::call::prompt_builder;

namespace {

prompt_builder make_builder() {
  return prompt_builder{{.owner_name = "Boss"}};
}

utterance_t caller(std::string text) {
  return utterance_t{.speaker = speaker_t::caller, .text = std::move(text)};
}

utterance_t assistant(std::string text) {
  return utterance_t{.speaker = speaker_t::assistant, .text = std::move(text)};
}

}  // namespace

TEST(prompt_builder, redacts_financial_identifiers) {
  auto builder = make_builder();
  EXPECT_EQ(builder.redact("my card is 4111 1111 1111 1111"), "my card is [CARD]");
  EXPECT_EQ(builder.redact("the cvv 123 is on the back"),
            "the [CVV] is on the back");
  EXPECT_EQ(builder.redact("otp: 482913"), "[CODE]");
  EXPECT_EQ(builder.redact("send it to 123456789012"), "send it to [ACCOUNT]");
  EXPECT_EQ(builder.redact("pay ravi@okaxis now"), "pay [UPI] now");
  EXPECT_EQ(builder.redact("branch HDFC0001234"), "branch [IFSC]");
}

TEST(prompt_builder, redacts_owner_name_case_insensitively) {
  auto builder = make_builder();
  EXPECT_EQ(builder.redact("Tell Boss I called"), "Tell [OWNER] I called");
  EXPECT_EQ(builder.redact("is the boss in?"), "is the [OWNER] in?");
  EXPECT_EQ(builder.redact("Bossanova"), "Bossanova");
}

TEST(prompt_builder, leaves_ordinary_text_alone) {
  auto builder = make_builder();
  auto text = std::string{"Please tell them the parcel arrives at 5."};
  EXPECT_EQ(builder.redact(text), text);
}

TEST(prompt_builder, detects_confidential_requests) {
  auto builder = make_builder();
  EXPECT_TRUE(builder.is_confidential_request("Where are you right now?"));
  EXPECT_TRUE(builder.is_confidential_request("What is your PIN?"));
  EXPECT_TRUE(builder.is_confidential_request("Can you read me the card number"));
  EXPECT_TRUE(builder.is_confidential_request("When will you be back home?"));
  EXPECT_FALSE(builder.is_confidential_request("Please ask them to call me back"));
  EXPECT_FALSE(builder.is_confidential_request("The delivery is at the gate"));
}

TEST(prompt_builder, flags_replies_that_leak) {
  auto builder = make_builder();
  EXPECT_TRUE(builder.leaks_sensitive("Boss is in a meeting."));
  EXPECT_TRUE(builder.leaks_sensitive("Their location is downtown."));
  EXPECT_TRUE(builder.leaks_sensitive("The code is otp 123456"));
  EXPECT_TRUE(builder.leaks_sensitive("Their schedule is full."));
  EXPECT_FALSE(builder.leaks_sensitive("I will pass your message along."));
}

TEST(prompt_builder, build_uses_recent_window_and_redacts) {
  auto builder = make_builder();
  auto transcript = std::vector<utterance_t>{
      assistant("Hello, please leave a message."),
      caller("This is Sam, the old message."),
      assistant("Sure."),
      caller("Tell Boss my card 4111 1111 1111 1111 was charged."),
  };
  auto prompt = builder.build(transcript, 2);
  EXPECT_EQ(prompt.find("old message"), std::string::npos);
  EXPECT_NE(prompt.find("Assistant: Sure."), std::string::npos);
  EXPECT_NE(prompt.find("Caller: Tell [OWNER] my card [CARD] was charged."),
            std::string::npos);
  EXPECT_EQ(prompt.find("4111"), std::string::npos);
  EXPECT_EQ(prompt.find("Boss"), std::string::npos);
}

TEST(prompt_builder, constraints_and_greeting_hide_owner) {
  auto builder = prompt_builder{{.owner_name = "Boss", .max_tokens = 64}};
  auto constraints = builder.constraints();
  EXPECT_EQ(constraints.max_tokens, 64u);
  EXPECT_FALSE(constraints.forbidden_topics.empty());
  EXPECT_EQ(constraints.system_prompt.find("Boss"), std::string::npos);
  EXPECT_FALSE(builder.leaks_sensitive(builder.greeting()));
}
