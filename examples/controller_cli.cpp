// Interactive recording controller with menu-driven device and session controls.
#include "multicam/multicam.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

// ANSI color codes for terminal output
const char* kColorReset = "\033[0m";
const char* kColorBold = "\033[1m";
const char* kColorGreen = "\033[32m";
const char* kColorYellow = "\033[33m";
const char* kColorBlue = "\033[34m";
const char* kColorCyan = "\033[36m";
const char* kColorRed = "\033[31m";

std::atomic<bool> g_running{true};

void ClearScreen() {
  std::cout << "\033[2J\033[H";
}

void PrintHeader() {
  std::cout << kColorBold << kColorCyan;
  std::cout << "╔════════════════════════════════════════════════════════════════╗\n";
  std::cout << "║              Multi-Camera Recording Controller                 ║\n";
  std::cout << "╚════════════════════════════════════════════════════════════════╝\n";
  std::cout << kColorReset << "\n";
}

void WaitForEnter() {
  std::cout << "Press Enter to return to menu...";
  std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

std::string Prompt(const std::string& label) {
  std::cout << label;
  std::string line;
  std::getline(std::cin, line);
  return line;
}

void PrintState(multicam::Session& session) {
  std::cout << kColorBold << "Session State:\n" << kColorReset;
  std::cout << "─────────────────────────────────────\n";
  if (session.IsRecording()) {
    std::cout << kColorRed << "● Recording\n" << kColorReset;
  } else {
    std::cout << kColorGreen << "Idle\n" << kColorReset;
  }
  const multicam::SessionMetrics metrics = session.GetMetrics();
  std::cout << "Commands sent: " << metrics.commands_sent
            << "  failures: " << metrics.command_failures
            << "  files downloaded: " << metrics.files_downloaded << "\n\n";
}

void PrintDevices(multicam::Session& session) {
  const auto devices = session.GetDevices();
  std::cout << kColorBold << "Devices (" << devices.size() << "):\n" << kColorReset;
  std::cout << "─────────────────────────────────────\n";
  if (devices.empty()) {
    std::cout << kColorYellow << "No devices registered yet...\n" << kColorReset;
  } else {
    for (const auto& device : devices) {
      std::cout << "  " << kColorGreen << std::left << std::setw(24) << device.name
                << kColorReset << " " << device.address << ":" << device.port;
      if (device.source == multicam::DeviceSource::kManual) {
        std::cout << " (manual)";
      }
      std::cout << "\n";
    }
  }
  std::cout << "\n";
}

void PrintMenu() {
  std::cout << kColorBold << "Commands:\n" << kColorReset;
  std::cout << kColorBlue << "Devices:\n" << kColorReset;
  std::cout << "  1. Add Device\n";
  std::cout << "  2. Remove Device\n";
  std::cout << "  3. Refresh Discovery\n";
  std::cout << "\n";
  std::cout << kColorGreen << "Recording:\n" << kColorReset;
  std::cout << "  4. Start Recording\n";
  std::cout << "  5. Stop Recording\n";
  std::cout << "\n";
  std::cout << kColorYellow << "Information:\n" << kColorReset;
  std::cout << "  6. Device Status\n";
  std::cout << "  7. List Files\n";
  std::cout << "  8. Download File\n";
  std::cout << "\n";
  std::cout << kColorRed << "Other:\n" << kColorReset;
  std::cout << "  q. Quit\n";
  std::cout << "\n";
  std::cout << kColorBold << "Enter choice: " << kColorReset;
}

void PrintResults(const multicam::ResultMap& results) {
  for (const auto& entry : results) {
    const multicam::CommandResult& result = entry.second;
    if (result.ok()) {
      std::cout << kColorGreen << "  ✓ " << kColorReset << entry.first;
      if (!result.file_id.empty()) {
        std::cout << " file " << result.file_id;
      }
      std::cout << "\n";
    } else {
      std::cout << kColorRed << "  ✗ " << kColorReset << entry.first << ": "
                << multicam::ErrorCodeName(result.error) << " "
                << result.error_message << "\n";
    }
  }
}

void PrintOutcome(const multicam::SessionOutcome& outcome) {
  const char* color = outcome.ok() ? kColorGreen : kColorRed;
  std::cout << color << multicam::OutcomeStatusName(outcome.status) << kColorReset;
  if (!outcome.message.empty()) {
    std::cout << ": " << outcome.message;
  }
  std::cout << "\n";
  PrintResults(outcome.results);
  for (const auto& path : outcome.downloaded_files) {
    std::cout << "  downloaded " << path << "\n";
  }
  for (const auto& path : outcome.upload.uploaded) {
    std::cout << "  uploaded " << path << "\n";
  }
}

void HandleAddDevice(multicam::Session& session,
                     multicam::StaticDiscovery& discovery) {
  const std::string address = Prompt("\nDevice address: ");
  if (address.empty()) {
    return;
  }
  const std::string port_text = Prompt("Port [8080]: ");
  const std::string name = Prompt("Name (empty for manual entry): ");
  const uint16_t port = port_text.empty()
                            ? multicam::kDefaultDevicePort
                            : static_cast<uint16_t>(std::atoi(port_text.c_str()));
  bool ok = false;
  if (name.empty()) {
    ok = session.AddManualDevice(address, port);
  } else {
    multicam::Device device;
    device.name = name;
    device.address = address;
    device.port = port;
    discovery.Add(device);
    ok = true;
  }
  if (ok) {
    std::cout << kColorGreen << "✓ Device added\n" << kColorReset;
  } else {
    std::cout << kColorRed << "Error: invalid device\n" << kColorReset;
  }
  std::this_thread::sleep_for(std::chrono::seconds(1));
}

void HandleRemoveDevice(multicam::Session& session,
                        multicam::StaticDiscovery& discovery) {
  const std::string name = Prompt("\nDevice name: ");
  if (name.empty()) {
    return;
  }
  discovery.Remove(name);
  session.RemoveDevice(name);
  std::cout << kColorGreen << "✓ Removed " << name << "\n" << kColorReset;
  std::this_thread::sleep_for(std::chrono::seconds(1));
}

void HandleStart(multicam::Session& session) {
  std::cout << "\nStarting recording...\n";
  PrintOutcome(session.StartRecording());
  WaitForEnter();
}

void HandleStop(multicam::Session& session) {
  std::cout << "\nStopping recording and collecting files...\n";
  PrintOutcome(session.StopRecording());
  WaitForEnter();
}

void HandleStatus(multicam::Session& session) {
  std::cout << "\n";
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  for (const auto& entry : session.GetDeviceStatus()) {
    if (entry.second.ok()) {
      std::cout << "  " << entry.first << ": "
                << Json::writeString(writer, entry.second.reply) << "\n";
    } else {
      std::cout << kColorRed << "  " << entry.first << ": "
                << multicam::ErrorCodeName(entry.second.error) << "\n"
                << kColorReset;
    }
  }
  WaitForEnter();
}

void HandleListFiles(multicam::Session& session) {
  std::cout << "\n";
  multicam::ResultMap raw;
  const auto listings = session.ListFiles(&raw);
  for (const auto& entry : raw) {
    const auto it = listings.find(entry.first);
    if (it == listings.end()) {
      std::cout << kColorRed << "  " << entry.first << ": no listing\n"
                << kColorReset;
      continue;
    }
    std::cout << kColorBold << "  " << entry.first << kColorReset << " ("
              << it->second.size() << " files)\n";
    for (const auto& file : it->second) {
      std::cout << "    " << file.file_id << "  " << file.file_name << "  "
                << file.file_size << " bytes\n";
    }
  }
  WaitForEnter();
}

void HandleDownload(multicam::Session& session) {
  const std::string device = Prompt("\nDevice name: ");
  const std::string file_id = Prompt("File id: ");
  if (device.empty() || file_id.empty()) {
    return;
  }
  const multicam::CommandResult result = session.DownloadFile(device, file_id);
  if (result.ok()) {
    std::cout << kColorGreen << "✓ Saved " << result.local_path << " ("
              << result.bytes_received << " bytes)\n" << kColorReset;
  } else {
    std::cout << kColorRed << "Download failed: "
              << multicam::ErrorCodeName(result.error) << " "
              << result.error_message << "\n" << kColorReset;
  }
  WaitForEnter();
}

}  // namespace

int main(int argc, char** argv) {
  multicam::Config config;
  if (argc > 1) {
    config.download_dir = argv[1];
  }
  std::string upload_root;
  if (argc > 2) {
    upload_root = argv[2];
  }
  config.debug = std::getenv("MULTICAM_DEBUG") != nullptr;

  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Configuration error: " << error << "\n";
    std::cerr << "Usage: " << argv[0] << " [download_dir] [upload_root]\n";
    return 1;
  }

  multicam::Session session(config);
  auto discovery = std::make_shared<multicam::StaticDiscovery>();
  session.SetDiscoveryProvider(discovery);
  if (!upload_root.empty()) {
    session.SetUploader(std::make_shared<multicam::DirectoryUploader>(upload_root));
  }

  session.SetDeviceEventCallback([](const multicam::DeviceEvent& event) {
    if (event.type == multicam::DeviceEventType::kAdded) {
      std::cout << kColorGreen << "\n[Device added: " << event.device.name
                << "]\n" << kColorReset;
    } else if (event.type == multicam::DeviceEventType::kRemoved) {
      std::cout << kColorYellow << "\n[Device removed: " << event.device.name
                << "]\n" << kColorReset;
    }
  });

  while (g_running) {
    ClearScreen();
    PrintHeader();
    PrintState(session);
    PrintDevices(session);
    PrintMenu();

    std::string choice;
    if (!std::getline(std::cin, choice)) {
      break;
    }
    if (choice.empty()) {
      continue;
    }

    switch (choice[0]) {
      case '1':
        HandleAddDevice(session, *discovery);
        break;
      case '2':
        HandleRemoveDevice(session, *discovery);
        break;
      case '3':
        session.Discover();
        break;
      case '4':
        HandleStart(session);
        break;
      case '5':
        HandleStop(session);
        break;
      case '6':
        HandleStatus(session);
        break;
      case '7':
        HandleListFiles(session);
        break;
      case '8':
        HandleDownload(session);
        break;
      case 'q':
      case 'Q':
        g_running = false;
        break;
      default:
        std::cout << kColorRed << "Invalid choice.\n" << kColorReset;
        std::this_thread::sleep_for(std::chrono::seconds(1));
        break;
    }
  }

  if (session.IsRecording()) {
    std::cout << kColorYellow << "Stopping active recording...\n" << kColorReset;
    PrintOutcome(session.StopRecording());
  }
  std::cout << kColorGreen << "✓ Goodbye!\n" << kColorReset;
  return 0;
}
