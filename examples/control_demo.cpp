// Example: open a session and send remote-control keys typed on stdin.
#include "mrp/mrp.h"

#include <cstdlib>
#include <fstream>
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
  config.closed_poll_behavior = mrp::ClosedPollBehavior::kStopTask;
  mrp::Session session(device, config);
  session.SetDebugCallback([](const std::string& message) {
    std::cout << "debug: " << message << std::endl;
  });

  if (!session.Open()) {
    std::cerr << "Failed to open session: " << session.GetLastError() << std::endl;
    return 1;
  }
  std::cout << "Connected as " << session.pairing_id() << std::endl;

  mrp::NowPlayingInfo info;
  mrp::Error error;
  if (session.RequestPlaybackQueue(mrp::PlaybackQueueRequestOptions(), &info, &error)) {
    std::cout << "Current item: " << (info.title.empty() ? "(none)" : info.title)
              << std::endl;
  } else {
    std::cerr << "Queue request failed: " << error.message << std::endl;
  }

  std::cout << "Type a key (up, down, left, right, menu, play, pause, next, "
               "previous, suspend, select), 'wake', 'artwork' or 'quit'."
            << std::endl;
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line == "quit") {
      break;
    }
    if (line == "wake") {
      if (!session.WakeDevice(&error)) {
        std::cerr << "wake failed: " << error.message << std::endl;
      }
      continue;
    }
    if (line == "artwork") {
      std::vector<uint8_t> data;
      if (!session.RequestArtwork(&data, &error)) {
        std::cerr << "artwork failed: " << error.message << std::endl;
        continue;
      }
      std::ofstream out("artwork.jpg", std::ios::binary);
      out.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
      std::cout << "wrote " << data.size() << " bytes to artwork.jpg" << std::endl;
      continue;
    }
    const auto key = mrp::KeyFromString(line);
    if (!key.has_value()) {
      std::cerr << "unknown key: " << line << std::endl;
      continue;
    }
    if (!session.SendKeyCommand(key.value(), &error)) {
      std::cerr << "sending " << mrp::KeyName(key.value())
                << " failed: " << error.message << std::endl;
      if (session.GetState() != mrp::SessionState::kReady) {
        break;
      }
    }
  }
  session.Close();
  return 0;
}
