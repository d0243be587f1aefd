#include "multicam/multicam.h"
#include "multicam/test_hooks.h"
#include "internal.h"

#include <atomic>
#include <iomanip>
#include <optional>
#include <set>
#include <sstream>

namespace multicam {
namespace {

using detail::LogDebug;
using detail::LogError;
using detail::LogInfo;

std::string FormatSeconds(double seconds) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << seconds;
  return oss.str();
}

SessionOutcome Rejected(ErrorCode code, const std::string& message) {
  SessionOutcome outcome;
  outcome.status = OutcomeStatus::kFailed;
  outcome.error = code;
  outcome.message = message;
  return outcome;
}

}  // namespace

struct SessionMetricsAtomic {
  std::atomic<uint64_t> commands_sent{0};
  std::atomic<uint64_t> command_failures{0};
  std::atomic<uint64_t> files_downloaded{0};
  std::atomic<uint64_t> bytes_downloaded{0};
  std::atomic<uint64_t> callback_exceptions{0};

  SessionMetrics Snapshot() const {
    SessionMetrics snapshot;
    snapshot.commands_sent = commands_sent.load();
    snapshot.command_failures = command_failures.load();
    snapshot.files_downloaded = files_downloaded.load();
    snapshot.bytes_downloaded = bytes_downloaded.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

struct Session::Impl {
  explicit Impl(Config config) : config_(std::move(config)) {
    config_valid_ = config_.Validate(&config_error_);
    if (!config_valid_) {
      LogError("invalid config: " + config_error_, &config_);
    }
    channel_ = std::make_shared<TcpCommandChannel>(config_);
  }

  ~Impl() {
    std::lock_guard<std::mutex> lock(collaborator_mutex_);
    if (discovery_) {
      discovery_->Unsubscribe(subscription_id_);
    }
  }

  void RecordCallbackException(const char* name) {
    metrics_.callback_exceptions.fetch_add(1);
    LogError(std::string("callback threw exception: ") + name, &config_);
  }

  void RecordResults(const ResultMap& results) {
    for (const auto& entry : results) {
      metrics_.commands_sent.fetch_add(1);
      const CommandResult& result = entry.second;
      metrics_.callback_exceptions.fetch_add(result.callback_exceptions);
      if (!result.ok()) {
        metrics_.command_failures.fetch_add(1);
      }
      if (result.kind == ResultKind::kDownloaded) {
        metrics_.files_downloaded.fetch_add(1);
        metrics_.bytes_downloaded.fetch_add(result.bytes_received);
      }
    }
  }

  std::shared_ptr<CommandChannel> GetChannel() const {
    std::lock_guard<std::mutex> lock(collaborator_mutex_);
    return channel_;
  }

  std::shared_ptr<Uploader> GetUploader() const {
    std::lock_guard<std::mutex> lock(collaborator_mutex_);
    return uploader_;
  }

  std::shared_ptr<DiscoveryProvider> GetDiscovery() const {
    std::lock_guard<std::mutex> lock(collaborator_mutex_);
    return discovery_;
  }

  void SetCommandChannel(std::shared_ptr<CommandChannel> channel) {
    std::lock_guard<std::mutex> lock(collaborator_mutex_);
    if (channel) {
      channel_ = std::move(channel);
    } else {
      channel_ = std::make_shared<TcpCommandChannel>(config_);
    }
  }

  void SetUploader(std::shared_ptr<Uploader> uploader) {
    std::lock_guard<std::mutex> lock(collaborator_mutex_);
    uploader_ = std::move(uploader);
  }

  void SetDiscoveryProvider(std::shared_ptr<DiscoveryProvider> provider) {
    std::lock_guard<std::mutex> lock(collaborator_mutex_);
    if (discovery_) {
      discovery_->Unsubscribe(subscription_id_);
      subscription_id_ = 0;
    }
    discovery_ = std::move(provider);
    if (discovery_) {
      subscription_id_ = discovery_->Subscribe(
          [this](const DeviceEvent& event) { OnDiscoveryEvent(event); });
    }
  }

  void SetDeviceEventCallback(DeviceEventCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    device_event_cb_ = std::move(cb);
  }

  void NotifyDeviceEvent(const DeviceEvent& event) {
    DeviceEventCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = device_event_cb_;
    }
    if (cb_copy) {
      try {
        cb_copy(event);
      } catch (...) {
        RecordCallbackException("DeviceEventCallback");
      }
    }
  }

  // Registry mutations run under fold_mutex_; events are delivered after it
  // is released.
  std::optional<DeviceEvent> UpsertLocked(const Device& device) {
    if (fold_active_) {
      touched_.insert(device.name);
    }
    const DeviceRegistry::UpsertResult result = registry_.Upsert(device);
    if (result == DeviceRegistry::UpsertResult::kUnchanged) {
      return std::nullopt;
    }
    LogDebug((result == DeviceRegistry::UpsertResult::kAdded ? "added "
                                                             : "updated ") +
                 detail::DescribeDevice(device),
             &config_);
    DeviceEvent event;
    event.type = result == DeviceRegistry::UpsertResult::kAdded
                     ? DeviceEventType::kAdded
                     : DeviceEventType::kUpdated;
    event.device = device;
    return event;
  }

  std::optional<DeviceEvent> RemoveLocked(const std::string& name,
                                          bool discovered_only) {
    if (fold_active_) {
      touched_.insert(name);
    }
    const std::optional<Device> existing = registry_.Find(name);
    if (!existing) {
      return std::nullopt;
    }
    if (discovered_only && existing->source != DeviceSource::kDiscovered) {
      return std::nullopt;
    }
    if (!registry_.Remove(name)) {
      return std::nullopt;
    }
    LogDebug("removed " + detail::DescribeDevice(*existing), &config_);
    DeviceEvent event;
    event.type = DeviceEventType::kRemoved;
    event.device = *existing;
    return event;
  }

  void ApplyUpsert(const Device& device) {
    std::optional<DeviceEvent> event;
    {
      std::lock_guard<std::mutex> lock(fold_mutex_);
      event = UpsertLocked(device);
    }
    if (event) {
      NotifyDeviceEvent(*event);
    }
  }

  void ApplyRemove(const std::string& name, bool discovered_only) {
    std::optional<DeviceEvent> event;
    {
      std::lock_guard<std::mutex> lock(fold_mutex_);
      event = RemoveLocked(name, discovered_only);
    }
    if (event) {
      NotifyDeviceEvent(*event);
    }
  }

  void OnDiscoveryEvent(const DeviceEvent& event) {
    if (event.type == DeviceEventType::kRemoved) {
      ApplyRemove(event.device.name, true);
      return;
    }
    Device device = event.device;
    device.source = DeviceSource::kDiscovered;
    ApplyUpsert(device);
  }

  void EndFold() {
    std::lock_guard<std::mutex> lock(fold_mutex_);
    fold_active_ = false;
    touched_.clear();
  }

  // Folds a provider snapshot into the registry. A device that changed
  // through an event while the snapshot was taken keeps that newer state.
  std::vector<Device> Discover() {
    std::lock_guard<std::mutex> discover_lock(discover_mutex_);
    std::shared_ptr<DiscoveryProvider> provider = GetDiscovery();
    if (!provider) {
      return registry_.Snapshot();
    }
    {
      std::lock_guard<std::mutex> lock(fold_mutex_);
      fold_active_ = true;
      touched_.clear();
    }
    std::vector<Device> snapshot;
    try {
      snapshot = provider->Snapshot();
    } catch (...) {
      EndFold();
      throw;
    }

    std::vector<DeviceEvent> events;
    {
      std::lock_guard<std::mutex> lock(fold_mutex_);
      const std::set<std::string> touched = touched_;
      std::set<std::string> reported;
      for (Device device : snapshot) {
        reported.insert(device.name);
        if (touched.count(device.name) != 0) {
          continue;
        }
        device.source = DeviceSource::kDiscovered;
        if (std::optional<DeviceEvent> event = UpsertLocked(device)) {
          events.push_back(std::move(*event));
        }
      }
      for (const Device& existing : registry_.Snapshot()) {
        if (existing.source != DeviceSource::kDiscovered ||
            reported.count(existing.name) != 0 ||
            touched.count(existing.name) != 0) {
          continue;
        }
        if (std::optional<DeviceEvent> event = RemoveLocked(existing.name, true)) {
          events.push_back(std::move(*event));
        }
      }
      fold_active_ = false;
      touched_.clear();
    }
    for (const DeviceEvent& event : events) {
      NotifyDeviceEvent(event);
    }
    return registry_.Snapshot();
  }

  bool AddDevice(const Device& device) {
    if (device.name.empty() || device.address.empty() || device.port == 0) {
      LogError("AddDevice: device needs a name, an address and a port",
               &config_);
      return false;
    }
    ApplyUpsert(device);
    return true;
  }

  bool AddManualDevice(const std::string& address, uint16_t port) {
    Device device;
    device.name = "manual-" + address;
    device.address = address;
    device.port = port == 0 ? config_.default_port : port;
    device.source = DeviceSource::kManual;
    return AddDevice(device);
  }

  BroadcastReport RunBroadcast(Command command,
                               const std::vector<Device>& devices,
                               std::optional<double> timestamp,
                               const std::string& file_id = {}) {
    if (!config_valid_) {
      BroadcastReport report;
      report.error = ErrorCode::kConfig;
      report.error_message = "invalid config: " + config_error_;
      return report;
    }
    std::shared_ptr<CommandChannel> channel = GetChannel();
    Broadcaster broadcaster(config_, *channel);
    BroadcastReport report =
        broadcaster.Broadcast(command, devices, timestamp, file_id);
    RecordResults(report.results);
    return report;
  }

  BroadcastReport Broadcast(Command command, std::optional<double> timestamp) {
    return RunBroadcast(command, registry_.Snapshot(), timestamp);
  }

  SessionOutcome StartRecording() {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    if (!config_valid_) {
      return Rejected(ErrorCode::kConfig, "invalid config: " + config_error_);
    }
    if (recording_.load()) {
      return Rejected(ErrorCode::kState, "recording already in progress");
    }
    const std::vector<Device> devices = registry_.Snapshot();
    if (devices.empty()) {
      return Rejected(ErrorCode::kNoDevices,
                      "no devices available; discover or add devices first");
    }
    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      last_file_ids_.clear();
    }

    BroadcastReport report =
        RunBroadcast(Command::kStartRecording, devices, std::nullopt);
    SessionOutcome outcome;
    outcome.device_count = devices.size();
    outcome.timestamp = report.timestamp;
    outcome.results = std::move(report.results);
    if (!report.dispatched) {
      outcome.status = OutcomeStatus::kFailed;
      outcome.error = report.error;
      outcome.message = "failed to start recording: " + report.error_message;
      LogError(outcome.message, &config_);
      return outcome;
    }
    recording_.store(true);

    size_t failed = 0;
    for (const auto& entry : outcome.results) {
      if (!entry.second.ok()) {
        ++failed;
      }
    }
    std::ostringstream oss;
    oss << "recording started on " << devices.size() << " device(s) at "
        << FormatSeconds(outcome.timestamp) << " (sync delay "
        << config_.sync_delay_seconds << "s)";
    if (failed > 0) {
      oss << "; " << failed << " device(s) did not acknowledge";
      outcome.status = OutcomeStatus::kPartialSuccess;
    } else {
      outcome.status = OutcomeStatus::kSuccess;
    }
    outcome.message = oss.str();
    LogInfo(outcome.message, &config_);
    return outcome;
  }

  SessionOutcome StopRecording() {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    SessionOutcome outcome = RunStopCycle();
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    last_file_ids_.clear();
    return outcome;
  }

  // Caller holds transition_mutex_.
  SessionOutcome RunStopCycle() {
    if (!config_valid_) {
      return Rejected(ErrorCode::kConfig, "invalid config: " + config_error_);
    }
    if (!recording_.load()) {
      return Rejected(ErrorCode::kState, "no recording in progress");
    }
    const std::vector<Device> devices = registry_.Snapshot();
    BroadcastReport report =
        RunBroadcast(Command::kStopRecording, devices, std::nullopt);
    recording_.store(false);

    SessionOutcome outcome;
    outcome.device_count = devices.size();
    outcome.timestamp = report.timestamp;
    outcome.results = std::move(report.results);
    outcome.file_ids = ExtractFileIds(outcome.results);
    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      last_file_ids_ = outcome.file_ids;
    }

    if (outcome.file_ids.empty()) {
      outcome.status = OutcomeStatus::kNoFiles;
      outcome.error = report.dispatched ? ErrorCode::kNone : report.error;
      outcome.message = "recording stopped but no files were returned";
      LogError(outcome.message, &config_);
      return outcome;
    }

    outcome.downloaded_files = DownloadAll(outcome.file_ids, &outcome.downloads);
    if (outcome.downloaded_files.empty()) {
      outcome.status = OutcomeStatus::kDownloadFailed;
      outcome.error = ErrorCode::kConnection;
      for (const auto& entry : outcome.downloads) {
        if (!entry.second.ok()) {
          outcome.error = entry.second.error;
          break;
        }
      }
      outcome.message = std::to_string(outcome.file_ids.size()) +
                        " file(s) available but download failed";
      LogError(outcome.message, &config_);
      return outcome;
    }

    std::shared_ptr<Uploader> uploader = GetUploader();
    if (!uploader) {
      outcome.status = OutcomeStatus::kDownloaded;
      outcome.message = "downloaded " +
                        std::to_string(outcome.downloaded_files.size()) +
                        " file(s) to " + config_.download_dir;
      LogInfo(outcome.message, &config_);
      return outcome;
    }
    UploadAndCleanup(*uploader, &outcome);
    return outcome;
  }

  void UploadAndCleanup(Uploader& uploader, SessionOutcome* outcome) {
    const std::vector<std::string>& files = outcome->downloaded_files;
    try {
      outcome->upload = uploader.UploadBatch(files);
    } catch (const std::exception& ex) {
      outcome->upload = UploadReport();
      outcome->upload.failed = files;
      outcome->upload.error = ex.what();
    }
    const UploadReport& upload = outcome->upload;
    if (!upload.success()) {
      outcome->status = OutcomeStatus::kUploadFailed;
      outcome->error = ErrorCode::kUpload;
      std::ostringstream oss;
      oss << "upload failed for " << upload.failed.size() << " of "
          << files.size() << " file(s); local copies preserved in "
          << config_.download_dir;
      if (!upload.error.empty()) {
        oss << " (" << upload.error << ")";
      }
      outcome->message = oss.str();
      LogError(outcome->message, &config_);
      return;
    }

    try {
      outcome->cleanup = uploader.DeleteLocalFiles(upload.uploaded);
    } catch (const std::exception& ex) {
      outcome->cleanup = CleanupReport();
      outcome->cleanup.failed = upload.uploaded;
      outcome->cleanup.error = ex.what();
    }
    const CleanupReport& cleanup = outcome->cleanup;
    std::ostringstream oss;
    oss << "uploaded " << upload.uploaded.size() << " file(s) to "
        << upload.destination;
    if (cleanup.success()) {
      outcome->status = OutcomeStatus::kSuccess;
      oss << " and removed local copies";
      outcome->message = oss.str();
      LogInfo(outcome->message, &config_);
      return;
    }
    outcome->status = OutcomeStatus::kPartialSuccess;
    outcome->error = ErrorCode::kCleanup;
    oss << "; " << cleanup.failed.size() << " local file(s) could not be removed";
    if (!cleanup.error.empty()) {
      oss << " (" << cleanup.error << ")";
    }
    outcome->message = oss.str();
    LogError(outcome->message, &config_);
  }

  std::vector<std::string> DownloadAll(const FileIdMap& file_ids,
                                       ResultMap* results) {
    std::vector<std::string> paths;
    for (const auto& entry : file_ids) {
      CommandResult result = DownloadFile(entry.first, entry.second);
      if (result.kind == ResultKind::kDownloaded) {
        LogInfo("downloaded " + result.local_path, &config_);
        paths.push_back(result.local_path);
      }
      if (results) {
        (*results)[entry.first] = std::move(result);
      }
    }
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    last_downloaded_files_ = paths;
    return paths;
  }

  CommandResult DownloadFile(const std::string& device_name,
                             const std::string& file_id) {
    if (!config_valid_) {
      return CommandResult::Failure(ErrorCode::kConfig,
                                    "invalid config: " + config_error_);
    }
    const std::optional<Device> device = registry_.Find(device_name);
    if (!device) {
      const std::string message =
          "device " + device_name + " not registered, skipping file " + file_id;
      LogError(message, &config_);
      return CommandResult::Failure(ErrorCode::kNoDevices, message);
    }
    BroadcastReport report =
        RunBroadcast(Command::kGetFile, {*device}, std::nullopt, file_id);
    auto it = report.results.find(device_name);
    if (it == report.results.end()) {
      return CommandResult::Failure(report.error, report.error_message);
    }
    return std::move(it->second);
  }

  std::map<std::string, std::vector<RemoteFile>> ListFiles(ResultMap* raw) {
    BroadcastReport report =
        RunBroadcast(Command::kListFiles, registry_.Snapshot(), std::nullopt);
    std::map<std::string, std::vector<RemoteFile>> listings;
    for (const auto& entry : report.results) {
      if (entry.second.kind != ResultKind::kReply) {
        continue;
      }
      std::vector<RemoteFile> files;
      std::string error;
      if (!ParseFileListing(entry.second.reply, &files, &error)) {
        LogError("LIST_FILES reply from " + entry.first + ": " + error,
                 &config_);
        continue;
      }
      listings[entry.first] = std::move(files);
    }
    if (raw) {
      *raw = std::move(report.results);
    }
    return listings;
  }

  FileIdMap GetLastFileIds() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_file_ids_;
  }

  std::vector<std::string> GetLastDownloadedFiles() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_downloaded_files_;
  }

  Config config_;
  bool config_valid_ = false;
  std::string config_error_;

  DeviceRegistry registry_;
  SessionMetricsAtomic metrics_;

  mutable std::mutex collaborator_mutex_;
  std::shared_ptr<CommandChannel> channel_;
  std::shared_ptr<DiscoveryProvider> discovery_;
  std::shared_ptr<Uploader> uploader_;
  uint64_t subscription_id_ = 0;

  mutable std::mutex callback_mutex_;
  DeviceEventCallback device_event_cb_;

  // Serializes Discover() calls.
  std::mutex discover_mutex_;
  // Guards registry mutations and the names touched during a fold.
  std::mutex fold_mutex_;
  bool fold_active_ = false;
  std::set<std::string> touched_;

  // Held for the whole start or stop transition.
  std::mutex transition_mutex_;
  std::atomic<bool> recording_{false};

  mutable std::mutex state_mutex_;
  FileIdMap last_file_ids_;
  std::vector<std::string> last_downloaded_files_;
};

Session::Session(Config config) : impl_(new Impl(std::move(config))) {}

Session::~Session() = default;

void Session::SetCommandChannel(std::shared_ptr<CommandChannel> channel) {
  impl_->SetCommandChannel(std::move(channel));
}
void Session::SetDiscoveryProvider(std::shared_ptr<DiscoveryProvider> provider) {
  impl_->SetDiscoveryProvider(std::move(provider));
}
void Session::SetUploader(std::shared_ptr<Uploader> uploader) {
  impl_->SetUploader(std::move(uploader));
}
void Session::SetDeviceEventCallback(DeviceEventCallback cb) {
  impl_->SetDeviceEventCallback(std::move(cb));
}

std::vector<Device> Session::Discover() { return impl_->Discover(); }
bool Session::AddDevice(const Device& device) { return impl_->AddDevice(device); }
bool Session::AddManualDevice(const std::string& address, uint16_t port) {
  return impl_->AddManualDevice(address, port);
}
void Session::RemoveDevice(const std::string& name) {
  impl_->ApplyRemove(name, false);
}
std::vector<Device> Session::GetDevices() const {
  return impl_->registry_.Snapshot();
}

BroadcastReport Session::Broadcast(Command command,
                                   std::optional<double> timestamp) {
  return impl_->Broadcast(command, timestamp);
}

SessionOutcome Session::StartRecording() { return impl_->StartRecording(); }
SessionOutcome Session::StopRecording() { return impl_->StopRecording(); }

std::vector<std::string> Session::DownloadAll(const FileIdMap& file_ids) {
  return impl_->DownloadAll(file_ids, nullptr);
}
CommandResult Session::DownloadFile(const std::string& device_name,
                                    const std::string& file_id) {
  return impl_->DownloadFile(device_name, file_id);
}

ResultMap Session::GetDeviceStatus() {
  return impl_->Broadcast(Command::kDeviceStatus, std::nullopt).results;
}
std::map<std::string, std::vector<RemoteFile>> Session::ListFiles(
    ResultMap* raw) {
  return impl_->ListFiles(raw);
}

bool Session::IsRecording() const { return impl_->recording_.load(); }
FileIdMap Session::GetLastFileIds() const { return impl_->GetLastFileIds(); }
std::vector<std::string> Session::GetLastDownloadedFiles() const {
  return impl_->GetLastDownloadedFiles();
}
std::string Session::GetConfigError() const { return impl_->config_error_; }
SessionMetrics Session::GetMetrics() const { return impl_->metrics_.Snapshot(); }

#ifdef MULTICAM_TESTING
namespace test {

void SetRecording(Session& session, bool recording) {
  session.impl_->recording_.store(recording);
}

}  // namespace test
#endif

}  // namespace multicam
