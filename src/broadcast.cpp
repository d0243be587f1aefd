#include "multicam/multicam.h"
#include "internal.h"

#include <sstream>
#include <thread>

namespace multicam {

Broadcaster::Broadcaster(const Config& config, CommandChannel& channel)
    : config_(config), channel_(channel) {}

double Broadcaster::ResolveTimestamp(Command command,
                                     std::optional<double> timestamp) const {
  if (timestamp.has_value()) {
    return timestamp.value();
  }
  const double now = detail::NowSeconds(config_);
  if (command == Command::kStartRecording) {
    return now + config_.sync_delay_seconds;
  }
  return now;
}

BroadcastReport Broadcaster::Broadcast(Command command,
                                       const std::vector<Device>& devices,
                                       std::optional<double> timestamp,
                                       const std::string& file_id) const {
  BroadcastReport report;
  report.timestamp = ResolveTimestamp(command, timestamp);
  if (devices.empty()) {
    report.error = ErrorCode::kNoDevices;
    report.error_message = std::string("no devices to send ") +
                           CommandName(command) + " to";
    return report;
  }

  CommandEnvelope envelope;
  envelope.command = command;
  envelope.timestamp = report.timestamp;
  envelope.device_id = config_.controller_id;
  envelope.file_id = file_id;

  // One slot per device; each worker writes only its own slot.
  std::vector<CommandResult> slots(devices.size());
  std::vector<std::thread> workers;
  workers.reserve(devices.size());
  size_t started = 0;
  report.dispatched = true;
  bool dispatch_failed = false;
  std::string dispatch_error;
  for (; started < devices.size(); ++started) {
    try {
      workers.emplace_back([this, &slots, &devices, &envelope, started]() {
        slots[started] = SendOne(devices[started], envelope);
      });
    } catch (const std::exception& ex) {
      dispatch_failed = true;
      dispatch_error = ex.what();
    } catch (...) {
      dispatch_failed = true;
      dispatch_error = "unknown exception";
    }
    if (dispatch_failed) {
      report.dispatched = false;
      report.error = ErrorCode::kDispatch;
      std::ostringstream oss;
      oss << "could not start worker for " << devices[started].name << ": "
          << dispatch_error;
      report.error_message = oss.str();
      detail::LogError(report.error_message, &config_);
      break;
    }
  }
  for (auto& worker : workers) {
    worker.join();
  }
  for (size_t i = started; i < devices.size(); ++i) {
    slots[i] = CommandResult::Failure(ErrorCode::kDispatch,
                                      "command was not dispatched");
  }

  for (size_t i = 0; i < devices.size(); ++i) {
    if (!slots[i].ok()) {
      detail::LogError(std::string(CommandName(command)) + " failed: " +
                           slots[i].error_message,
                       &config_);
    }
    report.results[devices[i].name] = std::move(slots[i]);
  }
  return report;
}

CommandResult Broadcaster::SendOne(const Device& device,
                                   const CommandEnvelope& envelope) const {
  try {
    return channel_.Send(device, envelope);
  } catch (const std::exception& ex) {
    return CommandResult::Failure(
        ErrorCode::kConnection,
        detail::DescribeDevice(device) + ": channel threw: " + ex.what());
  } catch (...) {
    return CommandResult::Failure(
        ErrorCode::kConnection,
        detail::DescribeDevice(device) + ": channel threw unknown exception");
  }
}

}  // namespace multicam
