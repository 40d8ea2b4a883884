// Example: print now-playing and supported-command updates from a device.
#include "mrp/mrp.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <address> [port]" << std::endl;
    return 2;
  }
  mrp::DeviceDescriptor device;
  device.address = argv[1];
  if (argc > 2) {
    device.port = static_cast<uint16_t>(std::atoi(argv[2]));
  }

  mrp::Config config;
  mrp::Session session(device, config);
  std::cout << std::fixed << std::setprecision(1);

  session.SetErrorCallback([](const mrp::Error& error) {
    std::cerr << "error (" << mrp::ErrorKindName(error.kind) << "): " << error.message
              << std::endl;
  });
  session.SetCloseCallback([]() { std::cout << "connection closed" << std::endl; });

  session.AddNowPlayingListener([](const std::optional<mrp::NowPlayingInfo>& info) {
    if (!info.has_value()) {
      std::cout << "Nothing playing" << std::endl;
      return;
    }
    std::cout << "Now playing: " << info->title;
    if (!info->artist.empty()) {
      std::cout << " by " << info->artist;
    }
    if (!info->album.empty()) {
      std::cout << " [" << info->album << "]";
    }
    if (info->elapsed_time.has_value() && info->duration.has_value()) {
      std::cout << " " << info->elapsed_time.value() << "/" << info->duration.value()
                << "s";
    }
    if (!info->app_display_name.empty()) {
      std::cout << " via " << info->app_display_name;
    }
    std::cout << " state=" << static_cast<int>(info->playback_state) << std::endl;
  });
  session.AddSupportedCommandsListener(
      [](const std::vector<mrp::SupportedCommand>& commands) {
        std::cout << "Supported commands:";
        for (const auto& command : commands) {
          std::cout << " " << static_cast<int>(command.command)
                    << (command.enabled ? "" : "(disabled)");
        }
        std::cout << std::endl;
      });

  mrp::Error error;
  if (!session.Open(nullptr, &error)) {
    std::cerr << "Failed to open session: " << session.GetLastError() << std::endl;
    return 1;
  }
  std::cout << "Listening. Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  session.Close();
  return 0;
}
