#include <spdlog/spdlog.h>
#include <warden/rpc/bridge_client.hpp>

namespace warden::rpc {

namespace {

class bridge_reader final : public warden::capability::reader {
 public:
  bridge_reader(bridge_client& client, std::string source)
      : client_{client}, source_{std::move(source)} {}

  std::optional<std::vector<std::string>> read(std::string_view query,
                                               std::stop_token stop) override {
    return client_.read(source_, query, std::move(stop));
  }

 private:
  bridge_client& client_;
  std::string source_;
};

warden::capability::audio_t to_audio(const std::string& bytes) {
  return warden::capability::audio_t(bytes.begin(), bytes.end());
}

std::string from_audio(const warden::capability::audio_t& audio) {
  return std::string(audio.begin(), audio.end());
}

}  // namespace

bridge_client::bridge_client(std::shared_ptr<grpc::Channel> channel,
                             settings config)
    : stub_{warden::v1::Bridge::NewStub(std::move(channel))},
      settings_{config} {}

template <typename Fn>
grpc::Status bridge_client::invoke(const std::string_view method,
                                   const std::chrono::milliseconds timeout,
                                   std::stop_token stop,
                                   Fn&& fn) {
  auto context = grpc::ClientContext{};
  context.set_deadline(std::chrono::system_clock::now() + timeout);
  auto cancel =
      std::stop_callback{stop, [&context] { context.TryCancel(); }};
  auto status = fn(context);
  if (!status.ok()) {
    spdlog::error("Bridge call {} failed: {}", method, status.error_message());
  }
  return status;
}

bool bridge_client::deliver(const std::string_view principal_id,
                            const std::string_view text) {
  auto request = warden::v1::DeliverRequest{};
  request.set_principal_id(std::string{principal_id});
  request.set_text(std::string{text});
  auto response = warden::v1::Ack{};
  auto status = invoke("Deliver", settings_.deadline, {}, [&](auto& context) {
    return stub_->Deliver(&context, request, &response);
  });
  return status.ok() && response.ok();
}

bool bridge_client::deliver_confirmation_prompt(
    const std::string_view principal_id,
    const std::string_view token,
    const std::string_view description) {
  auto request = warden::v1::DeliverConfirmationRequest{};
  request.set_principal_id(std::string{principal_id});
  request.set_token(std::string{token});
  request.set_description(std::string{description});
  auto response = warden::v1::Ack{};
  auto status = invoke("DeliverConfirmation", settings_.deadline, {},
                       [&](auto& context) {
                         return stub_->DeliverConfirmation(&context, request,
                                                           &response);
                       });
  return status.ok() && response.ok();
}

bool bridge_client::pickup() {
  auto request = warden::v1::PickupRequest{};
  auto response = warden::v1::Ack{};
  auto status = invoke("Pickup", settings_.deadline, {}, [&](auto& context) {
    return stub_->Pickup(&context, request, &response);
  });
  return status.ok() && response.ok();
}

bool bridge_client::reject() {
  auto request = warden::v1::RejectRequest{};
  auto response = warden::v1::Ack{};
  auto status = invoke("Reject", settings_.deadline, {}, [&](auto& context) {
    return stub_->Reject(&context, request, &response);
  });
  return status.ok() && response.ok();
}

bool bridge_client::play(const warden::capability::audio_t& audio,
                         std::stop_token stop) {
  auto request = warden::v1::PlayRequest{};
  request.set_audio(from_audio(audio));
  auto response = warden::v1::Ack{};
  auto status =
      invoke("Play", settings_.deadline, std::move(stop), [&](auto& context) {
        return stub_->Play(&context, request, &response);
      });
  return status.ok() && response.ok();
}

std::optional<warden::capability::audio_t> bridge_client::capture(
    const warden::schema::duration_milliseconds_t max_duration,
    std::stop_token stop) {
  auto request = warden::v1::CaptureRequest{};
  request.set_max_duration_ms(max_duration);
  auto response = warden::v1::AudioResponse{};
  auto timeout = settings_.deadline +
                 std::chrono::milliseconds{
                     static_cast<std::chrono::milliseconds::rep>(max_duration)};
  auto status =
      invoke("Capture", timeout, std::move(stop), [&](auto& context) {
        return stub_->Capture(&context, request, &response);
      });
  if (!status.ok() || !response.available()) {
    return std::nullopt;
  }
  return to_audio(response.audio());
}

std::optional<warden::capability::audio_t> bridge_client::speak(
    const std::string& text,
    std::stop_token stop) {
  auto request = warden::v1::SpeakRequest{};
  request.set_text(text);
  auto response = warden::v1::AudioResponse{};
  auto status =
      invoke("Speak", settings_.deadline, std::move(stop), [&](auto& context) {
        return stub_->Speak(&context, request, &response);
      });
  if (!status.ok() || !response.available()) {
    return std::nullopt;
  }
  return to_audio(response.audio());
}

std::optional<std::string> bridge_client::transcribe(
    const warden::capability::audio_t& audio,
    std::stop_token stop) {
  auto request = warden::v1::TranscribeRequest{};
  request.set_audio(from_audio(audio));
  auto response = warden::v1::TextResponse{};
  auto status = invoke("Transcribe", settings_.deadline, std::move(stop),
                       [&](auto& context) {
                         return stub_->Transcribe(&context, request, &response);
                       });
  if (!status.ok() || !response.available()) {
    return std::nullopt;
  }
  return response.text();
}

std::optional<std::string> bridge_client::generate(
    const std::string& prompt,
    const warden::capability::generation_constraints_t& constraints,
    std::stop_token stop) {
  auto request = warden::v1::GenerateRequest{};
  request.set_prompt(prompt);
  request.set_system_prompt(constraints.system_prompt);
  request.set_max_tokens(constraints.max_tokens);
  for (const auto& topic : constraints.forbidden_topics) {
    request.add_forbidden_topics(topic);
  }
  auto response = warden::v1::TextResponse{};
  auto status = invoke("Generate", settings_.deadline, std::move(stop),
                       [&](auto& context) {
                         return stub_->Generate(&context, request, &response);
                       });
  if (!status.ok() || !response.available()) {
    return std::nullopt;
  }
  return response.text();
}

std::optional<std::string> bridge_client::perform(
    const std::string_view kind,
    const std::string_view payload,
    std::stop_token stop) {
  auto request = warden::v1::PerformRequest{};
  request.set_kind(std::string{kind});
  request.set_payload(std::string{payload});
  auto response = warden::v1::TextResponse{};
  auto status = invoke("Perform", settings_.deadline, std::move(stop),
                       [&](auto& context) {
                         return stub_->Perform(&context, request, &response);
                       });
  if (!status.ok() || !response.available()) {
    return std::nullopt;
  }
  return response.text();
}

std::optional<std::vector<std::string>> bridge_client::read(
    const std::string_view source,
    const std::string_view query,
    std::stop_token stop) {
  auto request = warden::v1::ReadRequest{};
  request.set_source(std::string{source});
  request.set_query(std::string{query});
  auto response = warden::v1::ReadResponse{};
  auto status =
      invoke("Read", settings_.deadline, std::move(stop), [&](auto& context) {
        return stub_->Read(&context, request, &response);
      });
  if (!status.ok() || !response.available()) {
    return std::nullopt;
  }
  return std::vector<std::string>(response.items().begin(),
                                  response.items().end());
}

std::unique_ptr<warden::capability::reader> bridge_client::make_reader(
    std::string source) {
  return std::make_unique<bridge_reader>(*this, std::move(source));
}

}  // namespace warden::rpc
