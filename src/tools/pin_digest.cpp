#include <boost/program_options.hpp>
#include <warden/crypto/pin.hpp>

#include <cstdint>
#include <iostream>
#include <string>

namespace {

namespace po = boost::program_options;

constexpr auto kExitInvalidPin = 1;
constexpr auto kExitMismatch = 2;
constexpr auto kExitUsage = 64;

std::string trim_line(std::string line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r' ||
                           line.back() == ' ' || line.back() == '\t')) {
    line.pop_back();
  }
  return line;
}

}  // namespace

int main(int argc, const char** argv) {
  auto iterations = warden::crypto::kPinIterations;
  auto options = po::options_description{"warden_pin options"};
  options.add_options()("help,h", "show help")(
      "iterations", po::value<uint32_t>(&iterations)->default_value(iterations),
      "PBKDF2 iteration count")(
      "verify", po::value<std::string>(),
      "check the PIN on stdin against this digest instead of creating one");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "warden_pin: " << e.what() << std::endl;
    return kExitUsage;
  }

  if (vm.contains("help")) {
    std::cout << "Reads a PIN from stdin and prints the digest to use as "
                 "owner-pin-digest.\n\n"
              << options << std::endl;
    return 0;
  }
  if (iterations == 0) {
    std::cerr << "warden_pin: iterations must be positive" << std::endl;
    return kExitUsage;
  }

  auto pin = std::string{};
  std::getline(std::cin, pin);
  pin = trim_line(std::move(pin));
  if (pin.size() < warden::crypto::kMinPinLength) {
    std::cerr << "warden_pin: PIN must have at least "
              << warden::crypto::kMinPinLength << " characters" << std::endl;
    return kExitInvalidPin;
  }

  if (vm.contains("verify")) {
    auto record =
        warden::crypto::parse_pin_record(vm["verify"].as<std::string>());
    if (!record) {
      std::cerr << "warden_pin: malformed digest" << std::endl;
      return kExitUsage;
    }
    if (!warden::crypto::verify_pin(pin, *record)) {
      std::cout << "mismatch" << std::endl;
      return kExitMismatch;
    }
    std::cout << "match" << std::endl;
    return 0;
  }

  auto record = warden::crypto::make_pin_record(pin, iterations);
  std::cout << warden::crypto::format_pin_record(record) << std::endl;
  return 0;
}
