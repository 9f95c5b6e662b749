// Example: print status announcements seen on the CoAP multicast group.
#include "coapstatus/coapstatus.h"

#include <iostream>
#include <string>
#include <thread>

namespace {

void PrintOption(const coapstatus::Message& message, uint16_t number, const char* label) {
  const auto bytes = message.GetOption(number);
  if (!bytes.has_value()) {
    return;
  }
  coapstatus::OptionValue value;
  if (!coapstatus::DecodeOption(number, bytes.value(), &value)) {
    std::cout << " " << label << "=<invalid>";
    return;
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    std::cout << " " << label << "=" << *text;
  } else {
    std::cout << " " << label << "=" << std::get<uint32_t>(value);
  }
}

}  // namespace

int main(int argc, char** argv) {
  coapstatus::Config config;
  if (argc > 1) {
    config.multicast_interface = argv[1];
  }
  coapstatus::RegisterStatusOptions();

  coapstatus::UdpTransport transport(config);
  coapstatus::ListenOptions options;
  options.port = config.port;
  options.multicast_address = config.multicast_address;

  coapstatus::Transport::ListenerId listener = 0;
  std::string error;
  const bool ok = transport.Listen(
      options,
      [](const coapstatus::Message& message, const coapstatus::Endpoint& source) {
        if (message.code != static_cast<uint8_t>(coapstatus::Code::kStatusAnnouncement)) {
          return std::optional<coapstatus::Message>();
        }
        std::cout << "Announcement from " << source.address << ":" << source.port << " "
                  << message.GetUrl();
        PrintOption(message, coapstatus::kOptionDeviceId, "id");
        PrintOption(message, coapstatus::kOptionStatusValidity, "validity");
        PrintOption(message, coapstatus::kOptionStatusSerial, "serial");
        std::cout << " " << message.PayloadString() << std::endl;
        return std::optional<coapstatus::Message>();
      },
      &listener, &error);
  if (!ok) {
    std::cerr << "Failed to listen: " << error << std::endl;
    return 1;
  }

  std::cout << "Listening on " << config.multicast_address << ":" << config.port
            << ". Press Enter to stop." << std::endl;
  std::thread input([&]() {
    std::string line;
    std::getline(std::cin, line);
    transport.Quit();
  });
  transport.Run();
  input.join();
  transport.CloseListener(listener);
  return 0;
}
