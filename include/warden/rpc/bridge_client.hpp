#pragma once

#include <grpcpp/grpcpp.h>
#include <warden/v1/assistant.grpc.pb.h>
#include <warden/capability/brain.hpp>
#include <warden/capability/executor.hpp>
#include <warden/capability/reader.hpp>
#include <warden/capability/telephony.hpp>
#include <warden/capability/voice.hpp>
#include <warden/dispatch/transport.hpp>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>

namespace warden::rpc {

/// Client of the platform bridge. Implements every outbound capability over
/// one channel; each call carries a deadline and is cancelled at the wire
/// when its stop token fires.
class bridge_client final : public warden::dispatch::transport,
                            public warden::capability::telephony,
                            public warden::capability::voice,
                            public warden::capability::brain,
                            public warden::capability::executor {
 public:
  struct settings final {
    std::chrono::milliseconds deadline{5000};
  };

  bridge_client(std::shared_ptr<grpc::Channel> channel, settings config);

  bool deliver(std::string_view principal_id, std::string_view text) override;
  bool deliver_confirmation_prompt(std::string_view principal_id,
                                   std::string_view token,
                                   std::string_view description) override;

  bool pickup() override;
  bool reject() override;
  bool play(const warden::capability::audio_t& audio,
            std::stop_token stop) override;
  std::optional<warden::capability::audio_t> capture(
      warden::schema::duration_milliseconds_t max_duration,
      std::stop_token stop) override;

  std::optional<warden::capability::audio_t> speak(const std::string& text,
                                                   std::stop_token stop) override;
  std::optional<std::string> transcribe(const warden::capability::audio_t& audio,
                                        std::stop_token stop) override;

  std::optional<std::string> generate(
      const std::string& prompt,
      const warden::capability::generation_constraints_t& constraints,
      std::stop_token stop) override;

  std::optional<std::string> perform(std::string_view kind,
                                     std::string_view payload,
                                     std::stop_token stop) override;

  std::optional<std::vector<std::string>> read(std::string_view source,
                                               std::string_view query,
                                               std::stop_token stop);

  /// Reader bound to one bridge data source (`whatsapp`, `sms`, ...).
  std::unique_ptr<warden::capability::reader> make_reader(std::string source);

 private:
  template <typename Fn>
  grpc::Status invoke(std::string_view method,
                      std::chrono::milliseconds timeout,
                      std::stop_token stop,
                      Fn&& fn);

  std::unique_ptr<warden::v1::Bridge::Stub> stub_;
  settings settings_;
};

}  // namespace warden::rpc
