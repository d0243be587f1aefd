#include "multicam/multicam.h"
#include "internal.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace multicam {
namespace {

using Deadline = Connection::Deadline;

int RemainingMillis(Deadline deadline) {
  const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (remaining.count() <= 0) {
    return 0;
  }
  return static_cast<int>(std::min<std::chrono::milliseconds::rep>(
      remaining.count(), std::numeric_limits<int>::max()));
}

Deadline EarlierOf(Deadline a, Deadline b) { return std::min(a, b); }

// A frame within `max_reply_bytes` starts with a small high byte, while bare
// JSON starts with a printable character or whitespace.
bool IsLengthPrefixLead(uint8_t first, size_t max_reply_bytes) {
  return (static_cast<uint64_t>(first) << 24) <= max_reply_bytes;
}

std::string SocketError(const char* what) {
  return std::string(what) + " failed: " + std::strerror(errno);
}

}  // namespace

Connection::~Connection() { Close(); }

bool Connection::Open(const std::string& address, uint16_t port,
                      Deadline deadline) {
  if (fd_ >= 0) {
    return true;
  }
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  addrinfo* resolved = nullptr;
  const std::string service = std::to_string(port);
  const int rc = ::getaddrinfo(address.c_str(), service.c_str(), &hints, &resolved);
  if (rc != 0 || resolved == nullptr) {
    SetError(ErrorCode::kConnection,
             "cannot resolve " + address + ": " + ::gai_strerror(rc));
    return false;
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(resolved,
                                                            &::freeaddrinfo);
  for (addrinfo* ai = resolved; ai != nullptr; ai = ai->ai_next) {
    fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd_ < 0) {
      SetError(ErrorCode::kConnection, SocketError("socket()"));
      continue;
    }
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
      SetError(ErrorCode::kConnection, SocketError("fcntl(O_NONBLOCK)"));
      Close();
      continue;
    }
    int nodelay = 1;
    ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) == 0) {
      return true;
    }
    if (errno != EINPROGRESS) {
      std::ostringstream oss;
      oss << "connect(" << address << ":" << port
          << ") failed: " << std::strerror(errno);
      SetError(ErrorCode::kConnection, oss.str());
      Close();
      continue;
    }
    if (!WaitReady(true, deadline)) {
      std::ostringstream oss;
      oss << "connect(" << address << ":" << port << ") "
          << (last_error_code_ == ErrorCode::kTimeout ? "timed out"
                                                      : last_error_);
      SetError(last_error_code_, oss.str());
      Close();
      if (last_error_code_ == ErrorCode::kTimeout) {
        return false;
      }
      continue;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
      so_error = errno;
    }
    if (so_error != 0) {
      std::ostringstream oss;
      oss << "connect(" << address << ":" << port
          << ") failed: " << std::strerror(so_error);
      SetError(ErrorCode::kConnection, oss.str());
      Close();
      continue;
    }
    last_error_code_ = ErrorCode::kNone;
    last_error_.clear();
    return true;
  }
  return false;
}

void Connection::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool Connection::WriteAll(const void* data, size_t length, Deadline deadline) {
  const auto* bytes = static_cast<const uint8_t*>(data);
  size_t sent = 0;
  while (sent < length) {
    const ssize_t n = ::send(fd_, bytes + sent, length - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (!WaitReady(true, deadline)) {
        return false;
      }
      continue;
    }
    SetError(ErrorCode::kConnection, SocketError("send()"));
    return false;
  }
  return true;
}

long Connection::ReadSome(void* buffer, size_t length, Deadline deadline) {
  while (true) {
    const ssize_t n = ::recv(fd_, buffer, length, 0);
    if (n >= 0) {
      return static_cast<long>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      if (!WaitReady(false, deadline)) {
        return -1;
      }
      continue;
    }
    SetError(ErrorCode::kConnection, SocketError("recv()"));
    return -1;
  }
}

bool Connection::ReadExact(void* buffer, size_t length, Deadline deadline,
                           size_t* received) {
  auto* bytes = static_cast<uint8_t*>(buffer);
  size_t total = 0;
  bool ok = true;
  while (total < length) {
    const long n = ReadSome(bytes + total, length - total, deadline);
    if (n < 0) {
      ok = false;
      break;
    }
    if (n == 0) {
      std::ostringstream oss;
      oss << "connection closed after " << total << " of " << length
          << " bytes";
      SetError(ErrorCode::kProtocol, oss.str());
      ok = false;
      break;
    }
    total += static_cast<size_t>(n);
  }
  if (received) {
    *received = total;
  }
  return ok;
}

bool Connection::WaitReady(bool for_write, Deadline deadline) {
  while (true) {
    if (std::chrono::steady_clock::now() >= deadline) {
      SetError(ErrorCode::kTimeout, "operation timed out");
      return false;
    }
    pollfd entry{};
    entry.fd = fd_;
    entry.events = for_write ? POLLOUT : POLLIN;
    const int ready = ::poll(&entry, 1, RemainingMillis(deadline));
    if (ready > 0) {
      // POLLERR/POLLHUP surface through the following send/recv/SO_ERROR.
      return true;
    }
    if (ready < 0 && errno != EINTR) {
      SetError(ErrorCode::kConnection, SocketError("poll()"));
      return false;
    }
  }
}

void Connection::SetError(ErrorCode code, const std::string& message) {
  last_error_code_ = code;
  last_error_ = message;
}

FileTransferReader::FileTransferReader(const Config& config) : config_(config) {}

std::string FileTransferReader::LocalFileName(const std::string& address,
                                              const std::string& file_name) {
  std::string prefix = address;
  std::replace(prefix.begin(), prefix.end(), '.', '_');
  std::replace(prefix.begin(), prefix.end(), ':', '_');

  std::string base = file_name;
  const size_t slash = base.find_last_of("/\\");
  if (slash != std::string::npos) {
    base = base.substr(slash + 1);
  }
  if (base.empty() || base == "." || base == "..") {
    base = "file";
  }
  return prefix + "_" + base;
}

CommandResult FileTransferReader::Read(Connection& connection,
                                       const Device& device) const {
  const std::string who = detail::DescribeDevice(device);
  auto idle_deadline = [this]() {
    return std::chrono::steady_clock::now() + config_.transfer_idle_timeout;
  };
  auto connection_failure = [&](const std::string& stage) {
    return CommandResult::Failure(
        connection.last_error_code(),
        who + ": " + stage + ": " + connection.last_error());
  };

  uint8_t header[kFrameLengthSize];
  if (!connection.ReadExact(header, sizeof(header), idle_deadline())) {
    return connection_failure("reading metadata length");
  }
  const uint32_t metadata_length = detail::ReadBe32(header);
  if (metadata_length == 0 || metadata_length > config_.max_metadata_bytes) {
    return CommandResult::Failure(
        ErrorCode::kProtocol,
        who + ": invalid metadata length " + std::to_string(metadata_length));
  }

  std::string block(metadata_length, '\0');
  if (!connection.ReadExact(&block[0], block.size(), idle_deadline())) {
    return connection_failure("reading metadata");
  }
  TransferDescriptor descriptor;
  std::string error;
  if (!detail::ParseTransferDescriptor(block, &descriptor, &error)) {
    return CommandResult::Failure(ErrorCode::kProtocol, who + ": " + error);
  }

  std::error_code ec;
  const std::filesystem::path dir(config_.download_dir);
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return CommandResult::Failure(
        ErrorCode::kIo, "cannot create " + dir.string() + ": " + ec.message());
  }
  const std::filesystem::path path =
      dir / LocalFileName(device.address, descriptor.file_name);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return CommandResult::Failure(ErrorCode::kIo,
                                  "cannot open " + path.string());
  }
  detail::LogDebug("receiving " + descriptor.file_name + " (" +
                       std::to_string(descriptor.file_size) + " bytes) from " +
                       who,
                   &config_);

  std::vector<char> chunk(config_.transfer_chunk_size);
  uint64_t received = 0;
  uint32_t callback_exceptions = 0;
  auto partial_failure = [&](ErrorCode code, const std::string& message) {
    out.close();
    CommandResult result = CommandResult::Failure(code, message);
    result.local_path = path.string();
    result.bytes_received = received;
    result.callback_exceptions = callback_exceptions;
    return result;
  };
  while (received < descriptor.file_size) {
    const size_t want = static_cast<size_t>(std::min<uint64_t>(
        chunk.size(), descriptor.file_size - received));
    const long n = connection.ReadSome(chunk.data(), want, idle_deadline());
    if (n < 0) {
      return partial_failure(connection.last_error_code(),
                             who + ": reading content: " +
                                 connection.last_error());
    }
    if (n == 0) {
      std::ostringstream oss;
      oss << who << ": connection closed after " << received << " of "
          << descriptor.file_size << " bytes";
      return partial_failure(ErrorCode::kProtocol, oss.str());
    }
    out.write(chunk.data(), n);
    if (!out) {
      return partial_failure(ErrorCode::kIo, "write failed: " + path.string());
    }
    received += static_cast<uint64_t>(n);
    if (config_.progress_callback) {
      try {
        config_.progress_callback(device.name, received, descriptor.file_size);
      } catch (...) {
        ++callback_exceptions;
        detail::LogError("callback threw exception: ProgressCallback",
                         &config_);
      }
    }
  }
  out.close();
  if (!out) {
    return partial_failure(ErrorCode::kIo, "close failed: " + path.string());
  }

  CommandResult result;
  result.kind = ResultKind::kDownloaded;
  result.local_path = path.string();
  result.bytes_received = received;
  result.callback_exceptions = callback_exceptions;
  return result;
}

TcpCommandChannel::TcpCommandChannel(Config config) : config_(std::move(config)) {}

CommandResult TcpCommandChannel::Send(const Device& device,
                                      const CommandEnvelope& envelope) {
  const std::string who = detail::DescribeDevice(device);
  if (envelope.command == Command::kGetFile && envelope.file_id.empty()) {
    return CommandResult::Failure(ErrorCode::kProtocol,
                                  who + ": GET_VIDEO requires a file id");
  }
  const Deadline deadline =
      std::chrono::steady_clock::now() + config_.command_timeout;

  Connection connection;
  if (!connection.Open(device.address, device.port, deadline)) {
    return CommandResult::Failure(connection.last_error_code(),
                                  who + ": " + connection.last_error());
  }
  const std::string request = detail::EncodeEnvelope(envelope);
  detail::LogDebug("-> " + who + " " + request, &config_);
  if (!connection.WriteAll(request.data(), request.size(), deadline)) {
    return CommandResult::Failure(
        connection.last_error_code(),
        who + ": sending request: " + connection.last_error());
  }

  if (envelope.command == Command::kGetFile) {
    FileTransferReader reader(config_);
    return reader.Read(connection, device);
  }
  return ReadReply(connection, device, envelope.command, deadline);
}

CommandResult TcpCommandChannel::ReadReply(Connection& connection,
                                           const Device& device,
                                           Command command,
                                           Deadline deadline) const {
  const std::string who = detail::DescribeDevice(device);
  auto read_failure = [&]() {
    return CommandResult::Failure(
        connection.last_error_code(),
        who + ": reading reply: " + connection.last_error());
  };
  auto read_deadline = [&]() {
    if (command != Command::kListFiles) {
      return deadline;
    }
    return EarlierOf(deadline,
                     std::chrono::steady_clock::now() + config_.list_reply_timeout);
  };
  auto acknowledged = []() {
    CommandResult result;
    result.kind = ResultKind::kAcknowledged;
    return result;
  };

  // Bytes consumed while detecting the framing.
  std::string payload;
  ReplyFraming framing = config_.reply_framing;
  if (framing == ReplyFraming::kAutoDetect) {
    uint8_t first = 0;
    const long n = connection.ReadSome(&first, 1, read_deadline());
    if (n < 0) {
      return read_failure();
    }
    if (n == 0) {
      return acknowledged();
    }
    payload.push_back(static_cast<char>(first));
    framing = IsLengthPrefixLead(first, config_.max_reply_bytes)
                  ? ReplyFraming::kLengthPrefixed
                  : ReplyFraming::kParseOnArrival;
  }

  Json::Value reply;
  if (framing == ReplyFraming::kLengthPrefixed) {
    uint8_t header[kFrameLengthSize];
    const size_t have = payload.size();
    std::copy(payload.begin(), payload.end(), header);
    size_t received = 0;
    if (!connection.ReadExact(header + have, sizeof(header) - have,
                              read_deadline(), &received)) {
      if (have + received == 0 &&
          connection.last_error_code() == ErrorCode::kProtocol) {
        return acknowledged();
      }
      return read_failure();
    }
    const uint32_t length = detail::ReadBe32(header);
    if (length == 0) {
      return acknowledged();
    }
    if (length > config_.max_reply_bytes) {
      return CommandResult::Failure(
          ErrorCode::kProtocol,
          who + ": reply of " + std::to_string(length) + " bytes exceeds limit");
    }
    payload.assign(length, '\0');
    if (!connection.ReadExact(&payload[0], payload.size(), read_deadline())) {
      return read_failure();
    }
    if (!detail::TryParseCompleteReply(payload, true, &reply)) {
      return CommandResult::Failure(ErrorCode::kProtocol,
                                    who + ": undecodable reply");
    }
  } else {
    std::vector<char> chunk(config_.transfer_chunk_size);
    bool complete = detail::TryParseCompleteReply(payload, false, &reply);
    while (!complete) {
      const long n = connection.ReadSome(chunk.data(), chunk.size(),
                                         read_deadline());
      if (n < 0) {
        return read_failure();
      }
      if (n == 0) {
        complete = detail::TryParseCompleteReply(payload, true, &reply);
        break;
      }
      payload.append(chunk.data(), static_cast<size_t>(n));
      if (payload.size() > config_.max_reply_bytes) {
        return CommandResult::Failure(ErrorCode::kProtocol,
                                      who + ": reply exceeds size limit");
      }
      complete = detail::TryParseCompleteReply(payload, false, &reply);
    }
    if (!complete) {
      if (payload.empty()) {
        return acknowledged();
      }
      return CommandResult::Failure(ErrorCode::kProtocol,
                                    who + ": undecodable reply");
    }
  }
  detail::LogDebug("<- " + who + " " + payload, &config_);
  return detail::InterpretReply(command, reply);
}

}  // namespace multicam
