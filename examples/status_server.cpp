// Example: serve a device status and announce it to the CoAP multicast group.
// Each line read from stdin is a JSON object that replaces the status.
#include "coapstatus/coapstatus.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cout << "Usage: coapstatus_server <type> <id> [multicast_interface] "
                 "[interval_seconds]\n";
    return 1;
  }

  coapstatus::Config config;
  if (argc > 3) {
    config.multicast_interface = argv[3];
  }
  if (argc > 4) {
    char* end = nullptr;
    const long seconds = std::strtol(argv[4], &end, 10);
    if (end == argv[4] || *end != '\0' || seconds <= 0) {
      std::cerr << "Invalid interval: " << argv[4] << std::endl;
      return 1;
    }
    config.broadcast_interval = std::chrono::seconds(seconds);
  }
  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Invalid configuration: " << error << std::endl;
    return 1;
  }

  coapstatus::SimpleDevice device(argv[1], argv[2]);
  coapstatus::UdpTransport transport(config);
  coapstatus::Server server(device, transport, config);
  if (!server.Start()) {
    std::cerr << "Failed to start server: " << server.GetLastError() << std::endl;
    return 1;
  }
  std::cout << "Serving " << coapstatus::BuildDeviceIdentifier(device) << " on port "
            << config.port << ". Enter JSON status lines, EOF to stop." << std::endl;

  std::thread input([&]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty()) {
        continue;
      }
      try {
        device.SetStatus(nlohmann::json::parse(line));
      } catch (const nlohmann::json::parse_error& ex) {
        std::cerr << "Ignoring invalid JSON: " << ex.what() << std::endl;
      }
    }
    transport.Quit();
  });

  transport.Run();
  server.Stop();
  input.join();

  const auto metrics = server.GetMetrics();
  std::cout << "announcements=" << metrics.announcements_sent
            << " responses=" << metrics.status_responses
            << " send_errors=" << metrics.send_errors << std::endl;
  return 0;
}
