// Example: query camera devices for their status and recorded files.
#include "multicam/multicam.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "Usage: " << argv[0] << " <address[:port]> [address[:port] ...]\n";
    return 1;
  }

  multicam::Config config;
  config.debug = std::getenv("MULTICAM_DEBUG") != nullptr;

  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Configuration error: " << error << "\n";
    return 1;
  }

  multicam::Session session(config);
  for (int i = 1; i < argc; ++i) {
    std::string address = argv[i];
    uint16_t port = 0;
    const size_t colon = address.rfind(':');
    if (colon != std::string::npos && address.find(':') == colon) {
      port = static_cast<uint16_t>(std::atoi(address.c_str() + colon + 1));
      address = address.substr(0, colon);
    }
    if (!session.AddManualDevice(address, port)) {
      std::cerr << "Ignoring invalid device: " << argv[i] << "\n";
    }
  }

  const multicam::ResultMap status = session.GetDeviceStatus();
  for (const auto& entry : status) {
    if (entry.second.ok()) {
      Json::StreamWriterBuilder writer;
      writer["indentation"] = "";
      std::cout << entry.first << " status: "
                << Json::writeString(writer, entry.second.reply) << "\n";
    } else {
      std::cout << entry.first << " status failed: "
                << multicam::ErrorCodeName(entry.second.error) << " ("
                << entry.second.error_message << ")\n";
    }
  }

  multicam::ResultMap raw;
  const auto listings = session.ListFiles(&raw);
  for (const auto& entry : raw) {
    const auto it = listings.find(entry.first);
    if (it == listings.end()) {
      std::cout << entry.first << ": no listing ("
                << multicam::ErrorCodeName(entry.second.error) << ")\n";
      continue;
    }
    std::cout << entry.first << ": " << it->second.size() << " file(s)\n";
    for (const auto& file : it->second) {
      std::cout << "  " << std::left << std::setw(24) << file.file_id << " "
                << std::setw(28) << file.file_name << " " << file.file_size
                << " bytes\n";
    }
  }

  return 0;
}
