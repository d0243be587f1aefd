#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <json/json.h>

namespace multicam {

class Session;

#ifdef MULTICAM_TESTING
namespace test {
void SetRecording(Session& session, bool recording);
}  // namespace test
#endif

/**
 * Default TCP port of the camera command service.
 */
constexpr uint16_t kDefaultDevicePort = 8080;

/**
 * Default lead time between dispatching START_RECORDING and the shared start
 * instant, in seconds.
 */
constexpr double kDefaultSyncDelaySeconds = 3.0;

/**
 * Size of the big-endian length prefix used by framed replies.
 */
constexpr size_t kFrameLengthSize = 4;

/**
 * Commands understood by camera devices.
 */
enum class Command {
  kStartRecording,
  kStopRecording,
  kDeviceStatus,
  kListFiles,
  kGetFile,
};

/// Wire name of a command ("START_RECORDING", ..., "GET_VIDEO").
const char* CommandName(Command command);
/// Parse a wire name back into a command.
bool ParseCommandName(const std::string& name, Command* out);

/**
 * Error taxonomy shared by channel, broadcast and session results.
 */
enum class ErrorCode {
  kNone,
  kConnection,      // unreachable or refused device
  kTimeout,         // no complete reply within the bound
  kProtocol,        // malformed, truncated or undecodable data
  kState,           // command issued in the wrong session state
  kUpload,          // upload collaborator reported failures
  kCleanup,         // local cleanup after upload incomplete
  kDeviceRejected,  // device replied with an explicit error
  kNoDevices,
  kDispatch,        // worker thread could not be started
  kConfig,
  kIo,              // local storage error
};

const char* ErrorCodeName(ErrorCode code);

enum class DeviceSource {
  kDiscovered,
  kManual,
};

/**
 * A camera device reachable over TCP.
 */
struct Device {
  /// Identity, unique within a session.
  std::string name;
  /// IPv4/IPv6 address or host name.
  std::string address;
  uint16_t port = kDefaultDevicePort;
  /// Free-form metadata reported by discovery (TXT records and similar).
  std::map<std::string, std::string> metadata;
  DeviceSource source = DeviceSource::kDiscovered;

  bool operator==(const Device& other) const;
  bool operator!=(const Device& other) const { return !(*this == other); }
};

/**
 * Registry lifecycle events.
 */
enum class DeviceEventType {
  kAdded,
  kUpdated,
  kRemoved,
};

struct DeviceEvent {
  DeviceEventType type = DeviceEventType::kAdded;
  Device device;
};

/**
 * A single request sent to a device. One envelope is shared by every device of
 * a broadcast and serialized separately for each connection.
 */
struct CommandEnvelope {
  Command command = Command::kDeviceStatus;
  /// Seconds since the Unix epoch (fractional).
  double timestamp = 0.0;
  /// Originator identity ("deviceId" on the wire).
  std::string device_id = "controller";
  /// Required for kGetFile only.
  std::string file_id;
};

enum class ResultKind {
  kReply,         // structured reply payload
  kFileId,        // identifier returned by STOP_RECORDING
  kDownloaded,    // local path written by GET_FILE
  kAcknowledged,  // connection closed without a reply body
  kFailed,
};

/**
 * Per-device outcome of one command.
 */
struct CommandResult {
  ResultKind kind = ResultKind::kFailed;
  Json::Value reply;
  std::string file_id;
  /// Local path of a download. Also set on a failed transfer when a partial
  /// file was left on disk.
  std::string local_path;
  uint64_t bytes_received = 0;
  /// Exceptions thrown by Config::progress_callback during this command.
  uint32_t callback_exceptions = 0;
  ErrorCode error = ErrorCode::kNone;
  std::string error_message;

  bool ok() const { return kind != ResultKind::kFailed; }

  static CommandResult Failure(ErrorCode code, std::string message);
};

/// Device name -> result. Unordered; one entry per targeted device.
using ResultMap = std::unordered_map<std::string, CommandResult>;
/// Device name -> file identifier.
using FileIdMap = std::map<std::string, std::string>;

/// Collect the file identifiers of kFileId results.
FileIdMap ExtractFileIds(const ResultMap& results);

/**
 * Metadata block sent ahead of file content in a GET_FILE reply.
 */
struct TransferDescriptor {
  std::string file_name;
  uint64_t file_size = 0;
};

/**
 * Entry of a LIST_FILES reply.
 */
struct RemoteFile {
  std::string file_id;
  std::string file_name;
  uint64_t file_size = 0;
  /// Seconds since the Unix epoch.
  double creation_date = 0.0;
};

/**
 * Parse a LIST_FILES reply ({"files": [...]}) into RemoteFile entries.
 *
 * @param error Optional output describing the first malformed entry.
 * @return false if the reply has no "files" array or an entry is malformed.
 */
bool ParseFileListing(const Json::Value& reply, std::vector<RemoteFile>* out,
                      std::string* error = nullptr);

/**
 * Framing used for structured (non file transfer) replies.
 */
enum class ReplyFraming {
  /// Decided per reply from its first byte: a byte that can lead a length
  /// within max_reply_bytes selects kLengthPrefixed, anything else (bare
  /// JSON) selects kParseOnArrival.
  kAutoDetect,
  /// 4-byte big-endian length + JSON body.
  kLengthPrefixed,
  /// Bare JSON; reading stops once the received bytes parse as one complete
  /// value, or when the peer closes.
  kParseOnArrival,
};

/**
 * Counters for command traffic and downloads.
 */
struct SessionMetrics {
  uint64_t commands_sent = 0;
  uint64_t command_failures = 0;
  uint64_t files_downloaded = 0;
  uint64_t bytes_downloaded = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Controller configuration for identity, timing and transfer behavior.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;
  /// Wall clock in seconds since the Unix epoch.
  using Clock = std::function<double()>;
  using ProgressCallback = std::function<void(const std::string& device_name,
                                              uint64_t bytes_received,
                                              uint64_t total_bytes)>;

  /// Originator identity sent as "deviceId" with every command.
  std::string controller_id = "controller";
  /// Directory receiving downloaded files (defaults to ~/Downloads/multiCam).
  std::string download_dir = DefaultDownloadDir();

  /// Delay between dispatch and the shared START_RECORDING instant.
  double sync_delay_seconds = kDefaultSyncDelaySeconds;

  /// Overall bound for connect + request + structured reply.
  std::chrono::milliseconds command_timeout{30000};
  /// Idle read bound for LIST_FILES replies, which may be large.
  std::chrono::milliseconds list_reply_timeout{10000};
  /// Idle read bound while receiving file content.
  std::chrono::milliseconds transfer_idle_timeout{30000};

  /// Framing of structured replies.
  ReplyFraming reply_framing = ReplyFraming::kAutoDetect;

  /// Read size used when streaming file content to disk.
  size_t transfer_chunk_size = 8192;
  /// Upper bound for the GET_FILE metadata block.
  size_t max_metadata_bytes = 64 * 1024;
  /// Upper bound for a structured reply.
  size_t max_reply_bytes = 16 * 1024 * 1024;

  /// Port used for manually added devices when none is given.
  uint16_t default_port = kDefaultDevicePort;

  /// Emit debug log lines.
  bool debug = false;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;
  /// Optional clock override (defaults to the system clock).
  Clock clock;
  /// Optional download progress callback. Invoked from broadcast threads;
  /// exceptions are caught, logged and counted in
  /// CommandResult::callback_exceptions.
  ProgressCallback progress_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;

  /// $HOME/Downloads/multiCam, or ./downloads without a home directory.
  static std::string DefaultDownloadDir();
};

/**
 * Thread-safe set of known devices keyed by name.
 */
class DeviceRegistry {
 public:
  enum class UpsertResult {
    kAdded,
    kUpdated,
    kUnchanged,
  };

  /// Insert or replace the entry with the same name.
  UpsertResult Upsert(const Device& device);
  /// Remove an entry; no-op if absent.
  bool Remove(const std::string& name);
  /// Copy of all entries sorted by name.
  std::vector<Device> Snapshot() const;
  std::optional<Device> Find(const std::string& name) const;
  size_t Size() const;
  void Clear();

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Device> devices_;
};

/**
 * One TCP connection with an explicit open/close lifecycle. The socket is
 * closed on destruction.
 */
class Connection {
 public:
  using Deadline = std::chrono::steady_clock::time_point;

  Connection() = default;
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /// Resolve and connect, giving up at the deadline.
  bool Open(const std::string& address, uint16_t port, Deadline deadline);
  void Close();

  bool is_open() const { return fd_ >= 0; }
  int fd() const { return fd_; }

  /// Write every byte or fail.
  bool WriteAll(const void* data, size_t length, Deadline deadline);
  /**
   * Read at most `length` bytes.
   *
   * @return bytes read, 0 on orderly close, -1 on error or timeout.
   */
  long ReadSome(void* buffer, size_t length, Deadline deadline);
  /**
   * Read exactly `length` bytes.
   *
   * @param received Optional output with the number of bytes read, also on
   *     failure.
   * @return false on error, timeout or early close (kProtocol).
   */
  bool ReadExact(void* buffer, size_t length, Deadline deadline,
                 size_t* received = nullptr);

  ErrorCode last_error_code() const { return last_error_code_; }
  const std::string& last_error() const { return last_error_; }

 private:
  bool WaitReady(bool for_write, Deadline deadline);
  void SetError(ErrorCode code, const std::string& message);

  int fd_ = -1;
  ErrorCode last_error_code_ = ErrorCode::kNone;
  std::string last_error_;
};

/**
 * Decodes a GET_FILE reply: 4-byte big-endian metadata length, a JSON
 * {fileName, fileSize} block, then exactly fileSize raw bytes which are
 * streamed to the download directory.
 */
class FileTransferReader {
 public:
  explicit FileTransferReader(const Config& config);

  /**
   * Receive one file from an open connection.
   *
   * @return kDownloaded with the local path, or kFailed. A partial file is
   *     left on disk and its path reported in the failed result.
   */
  CommandResult Read(Connection& connection, const Device& device) const;

  /// Local file name for a download: "<address>_<file name>" with address
  /// separators replaced by '_' and directory parts of the name dropped.
  static std::string LocalFileName(const std::string& address,
                                   const std::string& file_name);

 private:
  const Config& config_;
};

/**
 * Sends one command to one device and correlates the reply.
 */
class CommandChannel {
 public:
  virtual ~CommandChannel() = default;
  /// Never throws; every failure is reported as a kFailed result.
  virtual CommandResult Send(const Device& device,
                             const CommandEnvelope& envelope) = 0;
};

/**
 * CommandChannel opening a fresh TCP connection per command.
 */
class TcpCommandChannel : public CommandChannel {
 public:
  explicit TcpCommandChannel(Config config);

  CommandResult Send(const Device& device,
                     const CommandEnvelope& envelope) override;

 private:
  CommandResult ReadReply(Connection& connection, const Device& device,
                          Command command,
                          Connection::Deadline deadline) const;

  Config config_;
};

/**
 * Result of one broadcast.
 */
struct BroadcastReport {
  ResultMap results;
  /// Timestamp embedded in every envelope.
  double timestamp = 0.0;
  /// False if the device list was empty or a worker could not be started.
  bool dispatched = false;
  ErrorCode error = ErrorCode::kNone;
  std::string error_message;

  size_t failure_count() const;
};

/**
 * Fans a command out to every device concurrently and joins all outcomes.
 */
class Broadcaster {
 public:
  Broadcaster(const Config& config, CommandChannel& channel);

  /**
   * Send `command` to every device, one thread per device, and wait for all.
   *
   * Without an explicit timestamp, START_RECORDING is scheduled at
   * now + sync_delay_seconds and other commands carry now; the value is
   * computed once and shared by every envelope.
   */
  BroadcastReport Broadcast(Command command, const std::vector<Device>& devices,
                            std::optional<double> timestamp = std::nullopt,
                            const std::string& file_id = {}) const;

  /// Instant that Broadcast() would embed for `command` at this moment.
  double ResolveTimestamp(Command command,
                          std::optional<double> timestamp) const;

 private:
  CommandResult SendOne(const Device& device,
                        const CommandEnvelope& envelope) const;

  const Config& config_;
  CommandChannel& channel_;
};

/**
 * Source of devices (mDNS browser, static list, ...).
 */
class DiscoveryProvider {
 public:
  using EventCallback = std::function<void(const DeviceEvent&)>;

  virtual ~DiscoveryProvider() = default;
  /// Devices currently known to the provider.
  virtual std::vector<Device> Snapshot() = 0;
  /// Register for add/update/remove events; returns a subscription id.
  virtual uint64_t Subscribe(EventCallback callback) = 0;
  /// Stop delivering events; waits for an in-flight delivery to finish.
  virtual void Unsubscribe(uint64_t id) = 0;
};

/**
 * In-process discovery provider fed explicitly (manual fleets, tests, or a
 * bridge from an external browser).
 */
class StaticDiscovery : public DiscoveryProvider {
 public:
  void Add(const Device& device);
  void Remove(const std::string& name);

  std::vector<Device> Snapshot() override;
  uint64_t Subscribe(EventCallback callback) override;
  void Unsubscribe(uint64_t id) override;

 private:
  // Caller holds dispatch_mutex_.
  void Dispatch(const DeviceEvent& event);

  std::mutex devices_mutex_;
  std::map<std::string, Device> devices_;
  // Held across each mutation and its delivery. Events arrive in mutation
  // order and Unsubscribe() waits for an in-flight callback.
  std::mutex dispatch_mutex_;
  std::map<uint64_t, EventCallback> subscribers_;
  uint64_t next_id_ = 1;
};

struct UploadReport {
  std::vector<std::string> uploaded;
  std::vector<std::string> failed;
  /// Where the batch went (folder, bucket prefix, ...).
  std::string destination;
  /// Last failure description, if any.
  std::string error;

  bool success() const { return failed.empty(); }
};

struct CleanupReport {
  std::vector<std::string> deleted;
  std::vector<std::string> failed;
  std::string error;

  bool success() const { return failed.empty(); }
};

/**
 * Destination for downloaded recordings. Per-file atomic, batch partial.
 */
class Uploader {
 public:
  virtual ~Uploader() = default;
  virtual UploadReport UploadBatch(const std::vector<std::string>& paths) = 0;
  virtual CleanupReport DeleteLocalFiles(
      const std::vector<std::string>& paths) = 0;
};

/**
 * Uploader copying each batch into <root>/<YYYY-MM-DD>/<HH-MM-SS>/.
 */
class DirectoryUploader : public Uploader {
 public:
  /// An empty session_folder selects a timestamped folder per batch.
  explicit DirectoryUploader(std::string root, std::string session_folder = {});

  UploadReport UploadBatch(const std::vector<std::string>& paths) override;
  CleanupReport DeleteLocalFiles(const std::vector<std::string>& paths) override;

  /// "YYYY-MM-DD/HH-MM-SS/" in local time.
  static std::string MakeSessionFolder(
      std::chrono::system_clock::time_point when);

 private:
  std::string root_;
  std::string session_folder_;
};

enum class OutcomeStatus {
  kSuccess,
  kPartialSuccess,
  kUploadFailed,
  kDownloadFailed,
  kNoFiles,
  kDownloaded,
  kFailed,
};

const char* OutcomeStatusName(OutcomeStatus status);

/**
 * Outcome of StartRecording()/StopRecording().
 */
struct SessionOutcome {
  OutcomeStatus status = OutcomeStatus::kFailed;
  ErrorCode error = ErrorCode::kNone;
  std::string message;
  size_t device_count = 0;
  /// Timestamp carried by the broadcast (the scheduled start for START).
  double timestamp = 0.0;
  /// Per-device results of the START/STOP broadcast.
  ResultMap results;
  FileIdMap file_ids;
  /// Per-device GET_FILE results.
  ResultMap downloads;
  std::vector<std::string> downloaded_files;
  UploadReport upload;
  CleanupReport cleanup;

  bool ok() const;
};

/**
 * Recording session: device registry, Idle/Recording state and the
 * start -> stop -> retrieve -> upload sequence.
 */
class Session {
 public:
  using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

  /// Construct a session using a TCP command channel.
  explicit Session(Config config);
  /// Unsubscribe from discovery and release collaborators.
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Replace the command channel (mock transports, instrumentation).
  void SetCommandChannel(std::shared_ptr<CommandChannel> channel);
  /// Attach a discovery provider and fold its event feed into the registry.
  void SetDiscoveryProvider(std::shared_ptr<DiscoveryProvider> provider);
  /// Attach the collaborator receiving downloaded files.
  void SetUploader(std::shared_ptr<Uploader> uploader);
  /// Set callback invoked on registry changes.
  void SetDeviceEventCallback(DeviceEventCallback cb);

  /// Fold the provider snapshot into the registry and return the registry.
  std::vector<Device> Discover();
  /// Returns false for a device without name, address or port.
  bool AddDevice(const Device& device);
  /// Register "manual-<address>"; port 0 selects Config::default_port.
  bool AddManualDevice(const std::string& address, uint16_t port = 0);
  void RemoveDevice(const std::string& name);
  std::vector<Device> GetDevices() const;

  /// Send a command to every registered device.
  BroadcastReport Broadcast(Command command,
                            std::optional<double> timestamp = std::nullopt);

  /// Broadcast a synchronized START_RECORDING and enter Recording.
  SessionOutcome StartRecording();
  /// Broadcast STOP_RECORDING, return to Idle, download and upload files.
  SessionOutcome StopRecording();

  /// Download every file id from its device; returns the local paths.
  std::vector<std::string> DownloadAll(const FileIdMap& file_ids);
  /// Download one file from one device.
  CommandResult DownloadFile(const std::string& device_name,
                             const std::string& file_id);

  /// DEVICE_STATUS to every device.
  ResultMap GetDeviceStatus();
  /// LIST_FILES to every device, parsed per device. Devices whose reply
  /// failed or could not be parsed are reported through `raw` only.
  std::map<std::string, std::vector<RemoteFile>> ListFiles(
      ResultMap* raw = nullptr);

  bool IsRecording() const;
  /// File ids of the stop-and-retrieve cycle in progress. Empty outside
  /// StopRecording(); the outcome carries the ids of a finished cycle.
  FileIdMap GetLastFileIds() const;
  /// Local paths produced by the latest DownloadAll()/StopRecording().
  std::vector<std::string> GetLastDownloadedFiles() const;
  /// Empty when the configuration is valid.
  std::string GetConfigError() const;
  SessionMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef MULTICAM_TESTING
  friend void test::SetRecording(Session& session, bool recording);
#endif
};

}  // namespace multicam
