#include "multicam/multicam.h"
#include "multicam/test_hooks.h"
#include "internal.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>

namespace multicam {
namespace {

constexpr const char* kFieldCommand = "command";
constexpr const char* kFieldTimestamp = "timestamp";
constexpr const char* kFieldDeviceId = "deviceId";
constexpr const char* kFieldFileId = "fileId";
constexpr const char* kFieldFileName = "fileName";
constexpr const char* kFieldFileSize = "fileSize";

struct CommandNameEntry {
  Command command;
  const char* name;
};

constexpr CommandNameEntry kCommandNames[] = {
    {Command::kStartRecording, "START_RECORDING"},
    {Command::kStopRecording, "STOP_RECORDING"},
    {Command::kDeviceStatus, "DEVICE_STATUS"},
    {Command::kListFiles, "LIST_FILES"},
    {Command::kGetFile, "GET_VIDEO"},
};

bool ParseJson(const std::string& text, bool fail_if_extra, Json::Value* out,
               std::string* error) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = fail_if_extra;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  const char* begin = text.data();
  if (!reader->parse(begin, begin + text.size(), out, &errors)) {
    if (error) {
      *error = errors;
    }
    return false;
  }
  return true;
}

// "success": false or a non-null "error" marks an explicit rejection.
bool HasRejection(const Json::Value& reply, std::string* message) {
  if (!reply.isObject()) {
    return false;
  }
  const Json::Value& error = reply["error"];
  if (!error.isNull()) {
    *message = error.isString() ? error.asString() : error.toStyledString();
    return true;
  }
  const Json::Value& success = reply["success"];
  if (success.isBool() && !success.asBool()) {
    const Json::Value& text = reply["message"];
    *message = text.isString() ? text.asString() : "device reported failure";
    return true;
  }
  return false;
}

}  // namespace

namespace detail {

void LogError(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[multicam] " << message << std::endl;
}

void LogInfo(const std::string& message, const Config* config) {
  LogError(message, config);
}

void LogDebug(const std::string& message, const Config* config) {
  if (config && !config->debug) {
    return;
  }
  LogError(message, config);
}

double NowSeconds(const Config& config) {
  if (config.clock) {
    return config.clock();
  }
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

uint32_t ReadBe32(const uint8_t* data) {
  return (static_cast<uint32_t>(data[0]) << 24) |
         (static_cast<uint32_t>(data[1]) << 16) |
         (static_cast<uint32_t>(data[2]) << 8) | data[3];
}

void WriteBe32(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
  data[offset] = static_cast<uint8_t>((value >> 24) & 0xFF);
  data[offset + 1] = static_cast<uint8_t>((value >> 16) & 0xFF);
  data[offset + 2] = static_cast<uint8_t>((value >> 8) & 0xFF);
  data[offset + 3] = static_cast<uint8_t>(value & 0xFF);
}

std::string EncodeEnvelope(const CommandEnvelope& envelope) {
  Json::Value root(Json::objectValue);
  root[kFieldCommand] = CommandName(envelope.command);
  root[kFieldTimestamp] = envelope.timestamp;
  root[kFieldDeviceId] = envelope.device_id;
  if (!envelope.file_id.empty()) {
    root[kFieldFileId] = envelope.file_id;
  }
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, root);
}

bool DecodeEnvelope(const std::string& payload, CommandEnvelope* out) {
  Json::Value root;
  if (!ParseJson(payload, true, &root, nullptr) || !root.isObject()) {
    return false;
  }
  const Json::Value& command = root[kFieldCommand];
  if (!command.isString() || !ParseCommandName(command.asString(), &out->command)) {
    return false;
  }
  const Json::Value& timestamp = root[kFieldTimestamp];
  if (!timestamp.isNumeric()) {
    return false;
  }
  out->timestamp = timestamp.asDouble();
  const Json::Value& device_id = root[kFieldDeviceId];
  const Json::Value& file_id = root[kFieldFileId];
  out->device_id = device_id.isString() ? device_id.asString() : std::string();
  out->file_id = file_id.isString() ? file_id.asString() : std::string();
  return true;
}

bool TryParseCompleteReply(const std::string& buffer, bool end_of_stream,
                           Json::Value* out) {
  if (buffer.empty()) {
    return false;
  }
  Json::Value root;
  if (!ParseJson(buffer, true, &root, nullptr)) {
    return false;
  }
  // "12" may still grow into "123"; a bare number ends only with the stream.
  if (root.isNumeric() && !end_of_stream) {
    return false;
  }
  *out = std::move(root);
  return true;
}

bool ParseTransferDescriptor(const std::string& block, TransferDescriptor* out,
                             std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  Json::Value root;
  std::string parse_error;
  if (!ParseJson(block, true, &root, &parse_error)) {
    return fail("undecodable file metadata: " + parse_error);
  }
  if (!root.isObject()) {
    return fail("file metadata is not an object");
  }
  const Json::Value& name = root[kFieldFileName];
  if (!name.isString() || name.asString().empty()) {
    return fail("file metadata has no fileName");
  }
  const Json::Value& size = root[kFieldFileSize];
  if (size.isNull()) {
    return fail("file metadata has no fileSize");
  }
  if (!size.isUInt64()) {
    return fail("file metadata has an invalid fileSize");
  }
  out->file_name = name.asString();
  out->file_size = size.asUInt64();
  return true;
}

CommandResult InterpretReply(Command command, const Json::Value& reply) {
  if (command == Command::kStopRecording) {
    std::string rejection;
    if (HasRejection(reply, &rejection)) {
      return CommandResult::Failure(ErrorCode::kDeviceRejected, rejection);
    }
    if (reply.isObject()) {
      const Json::Value& file_id = reply[kFieldFileId];
      if (file_id.isString() && !file_id.asString().empty()) {
        CommandResult result;
        result.kind = ResultKind::kFileId;
        result.file_id = file_id.asString();
        result.reply = reply;
        return result;
      }
    }
  }
  CommandResult result;
  result.kind = ResultKind::kReply;
  result.reply = reply;
  return result;
}

std::string DescribeDevice(const Device& device) {
  std::ostringstream oss;
  oss << device.name << " (" << device.address << ":" << device.port << ")";
  return oss.str();
}

}  // namespace detail

const char* CommandName(Command command) {
  for (const auto& entry : kCommandNames) {
    if (entry.command == command) {
      return entry.name;
    }
  }
  return "UNKNOWN";
}

bool ParseCommandName(const std::string& name, Command* out) {
  for (const auto& entry : kCommandNames) {
    if (name == entry.name) {
      *out = entry.command;
      return true;
    }
  }
  return false;
}

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kConnection:
      return "connection";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kProtocol:
      return "protocol";
    case ErrorCode::kState:
      return "state";
    case ErrorCode::kUpload:
      return "upload";
    case ErrorCode::kCleanup:
      return "cleanup";
    case ErrorCode::kDeviceRejected:
      return "device_rejected";
    case ErrorCode::kNoDevices:
      return "no_devices";
    case ErrorCode::kDispatch:
      return "dispatch";
    case ErrorCode::kConfig:
      return "config";
    case ErrorCode::kIo:
      return "io";
  }
  return "unknown";
}

const char* OutcomeStatusName(OutcomeStatus status) {
  switch (status) {
    case OutcomeStatus::kSuccess:
      return "success";
    case OutcomeStatus::kPartialSuccess:
      return "partial_success";
    case OutcomeStatus::kUploadFailed:
      return "upload_failed";
    case OutcomeStatus::kDownloadFailed:
      return "download_failed";
    case OutcomeStatus::kNoFiles:
      return "no_files";
    case OutcomeStatus::kDownloaded:
      return "downloaded";
    case OutcomeStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

bool Device::operator==(const Device& other) const {
  return name == other.name && address == other.address &&
         port == other.port && metadata == other.metadata &&
         source == other.source;
}

CommandResult CommandResult::Failure(ErrorCode code, std::string message) {
  CommandResult result;
  result.kind = ResultKind::kFailed;
  result.error = code;
  result.error_message = std::move(message);
  return result;
}

FileIdMap ExtractFileIds(const ResultMap& results) {
  FileIdMap file_ids;
  for (const auto& entry : results) {
    if (entry.second.kind == ResultKind::kFileId &&
        !entry.second.file_id.empty()) {
      file_ids[entry.first] = entry.second.file_id;
    }
  }
  return file_ids;
}

bool ParseFileListing(const Json::Value& reply, std::vector<RemoteFile>* out,
                      std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!reply.isObject() || !reply["files"].isArray()) {
    return fail("reply has no files array");
  }
  std::vector<RemoteFile> files;
  const Json::Value& entries = reply["files"];
  for (Json::ArrayIndex i = 0; i < entries.size(); ++i) {
    const Json::Value& entry = entries[i];
    if (!entry.isObject() || !entry[kFieldFileId].isString()) {
      return fail("files[" + std::to_string(i) + "] has no fileId");
    }
    RemoteFile file;
    file.file_id = entry[kFieldFileId].asString();
    if (entry[kFieldFileName].isString()) {
      file.file_name = entry[kFieldFileName].asString();
    }
    const Json::Value& size = entry[kFieldFileSize];
    if (!size.isNull()) {
      if (!size.isUInt64()) {
        return fail("files[" + std::to_string(i) + "] has an invalid fileSize");
      }
      file.file_size = size.asUInt64();
    }
    const Json::Value& created = entry["creationDate"];
    if (created.isNumeric()) {
      file.creation_date = created.asDouble();
    }
    files.push_back(std::move(file));
  }
  *out = std::move(files);
  return true;
}

size_t BroadcastReport::failure_count() const {
  return static_cast<size_t>(std::count_if(
      results.begin(), results.end(),
      [](const ResultMap::value_type& entry) { return !entry.second.ok(); }));
}

bool SessionOutcome::ok() const {
  return status == OutcomeStatus::kSuccess ||
         status == OutcomeStatus::kPartialSuccess ||
         status == OutcomeStatus::kDownloaded;
}

std::string Config::DefaultDownloadDir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return "./downloads";
  }
  return std::string(home) + "/Downloads/multiCam";
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (controller_id.empty()) {
    return fail("controller_id must not be empty");
  }
  if (download_dir.empty()) {
    return fail("download_dir must not be empty");
  }
  if (!(sync_delay_seconds >= 0.0)) {
    return fail("sync_delay_seconds must be >= 0");
  }
  if (command_timeout.count() <= 0 || list_reply_timeout.count() <= 0 ||
      transfer_idle_timeout.count() <= 0) {
    return fail("timeouts must be positive");
  }
  if (list_reply_timeout > command_timeout) {
    return fail("list_reply_timeout must be <= command_timeout");
  }
  if (transfer_chunk_size == 0) {
    return fail("transfer_chunk_size must be non-zero");
  }
  if (max_metadata_bytes == 0 || max_reply_bytes == 0) {
    return fail("max_metadata_bytes and max_reply_bytes must be non-zero");
  }
  if (max_metadata_bytes > 0xFFFFFFFFu || max_reply_bytes > 0xFFFFFFFFu) {
    return fail("frame size limits must fit the 4-byte length prefix");
  }
  if (default_port == 0) {
    return fail("default_port must be non-zero");
  }
  return true;
}

DeviceRegistry::UpsertResult DeviceRegistry::Upsert(const Device& device) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device.name);
  if (it == devices_.end()) {
    devices_.emplace(device.name, device);
    return UpsertResult::kAdded;
  }
  if (it->second == device) {
    return UpsertResult::kUnchanged;
  }
  it->second = device;
  return UpsertResult::kUpdated;
}

bool DeviceRegistry::Remove(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.erase(name) > 0;
}

std::vector<Device> DeviceRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Device> snapshot;
  snapshot.reserve(devices_.size());
  for (const auto& entry : devices_) {
    snapshot.push_back(entry.second);
  }
  return snapshot;
}

std::optional<Device> DeviceRegistry::Find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(name);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t DeviceRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

void DeviceRegistry::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_.clear();
}

void StaticDiscovery::Add(const Device& device) {
  std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
  DeviceEvent event;
  event.device = device;
  {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    auto it = devices_.find(device.name);
    if (it != devices_.end()) {
      if (it->second == device) {
        return;
      }
      event.type = DeviceEventType::kUpdated;
      it->second = device;
    } else {
      event.type = DeviceEventType::kAdded;
      devices_.emplace(device.name, device);
    }
  }
  Dispatch(event);
}

void StaticDiscovery::Remove(const std::string& name) {
  std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
  DeviceEvent event;
  event.type = DeviceEventType::kRemoved;
  {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    auto it = devices_.find(name);
    if (it == devices_.end()) {
      return;
    }
    event.device = it->second;
    devices_.erase(it);
  }
  Dispatch(event);
}

std::vector<Device> StaticDiscovery::Snapshot() {
  std::lock_guard<std::mutex> lock(devices_mutex_);
  std::vector<Device> snapshot;
  snapshot.reserve(devices_.size());
  for (const auto& entry : devices_) {
    snapshot.push_back(entry.second);
  }
  return snapshot;
}

uint64_t StaticDiscovery::Subscribe(EventCallback callback) {
  std::lock_guard<std::mutex> lock(dispatch_mutex_);
  const uint64_t id = next_id_++;
  subscribers_.emplace(id, std::move(callback));
  return id;
}

void StaticDiscovery::Unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lock(dispatch_mutex_);
  subscribers_.erase(id);
}

void StaticDiscovery::Dispatch(const DeviceEvent& event) {
  for (const auto& entry : subscribers_) {
    if (entry.second) {
      entry.second(event);
    }
  }
}

#ifdef MULTICAM_TESTING
namespace test {

std::string EncodeEnvelope(const CommandEnvelope& envelope) {
  return detail::EncodeEnvelope(envelope);
}

bool DecodeEnvelope(const std::string& payload, CommandEnvelope* out) {
  return detail::DecodeEnvelope(payload, out);
}

std::vector<uint8_t> BuildFrame(const std::string& payload) {
  std::vector<uint8_t> frame(kFrameLengthSize, 0x00);
  detail::WriteBe32(frame, 0, static_cast<uint32_t>(payload.size()));
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

bool TryParseCompleteReply(const std::string& buffer, bool end_of_stream,
                           Json::Value* out) {
  return detail::TryParseCompleteReply(buffer, end_of_stream, out);
}

bool ParseTransferDescriptor(const std::string& block, TransferDescriptor* out,
                             std::string* error) {
  return detail::ParseTransferDescriptor(block, out, error);
}

CommandResult InterpretReply(Command command, const Json::Value& reply) {
  return detail::InterpretReply(command, reply);
}

}  // namespace test
#endif

}  // namespace multicam
