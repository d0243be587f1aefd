// Tests for the TCP command channel against loopback fake devices.
#include "multicam/test_hooks.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <unistd.h>

using multicam_test::FakeDevice;
using multicam_test::Framed;

namespace {

multicam::Config QuietConfig() {
  multicam::Config config;
  config.log_callback = [](const std::string&) {};
  config.command_timeout = std::chrono::milliseconds(2000);
  config.list_reply_timeout = std::chrono::milliseconds(1000);
  return config;
}

multicam::CommandEnvelope Envelope(multicam::Command command) {
  multicam::CommandEnvelope envelope;
  envelope.command = command;
  envelope.timestamp = 1700000000.0;
  return envelope;
}

}  // namespace

TEST(TcpCommandChannelTest, SendsEnvelopeAndReadsFramedReply) {
  FakeDevice device([](const multicam::CommandEnvelope&) {
    return Framed("{\"status\":\"ready\",\"battery\":87}");
  });
  multicam::TcpCommandChannel channel(QuietConfig());

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kDeviceStatus));
  ASSERT_EQ(result.kind, multicam::ResultKind::kReply) << result.error_message;
  EXPECT_EQ(result.reply["status"].asString(), "ready");
  EXPECT_EQ(result.reply["battery"].asInt(), 87);

  const std::vector<multicam::CommandEnvelope> requests = device.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].command, multicam::Command::kDeviceStatus);
  EXPECT_EQ(requests[0].device_id, "controller");
  EXPECT_DOUBLE_EQ(requests[0].timestamp, 1700000000.0);
}

TEST(TcpCommandChannelTest, StopReplySurfacesFileId) {
  FakeDevice device([](const multicam::CommandEnvelope&) {
    return Framed("{\"status\":\"stopped\",\"fileId\":\"rec-7\"}");
  });
  multicam::TcpCommandChannel channel(QuietConfig());

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kStopRecording));
  ASSERT_EQ(result.kind, multicam::ResultKind::kFileId);
  EXPECT_EQ(result.file_id, "rec-7");
}

TEST(TcpCommandChannelTest, EmptyReplyIsAcknowledged) {
  FakeDevice device([](const multicam::CommandEnvelope&) { return std::string(); });
  multicam::TcpCommandChannel channel(QuietConfig());

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kStartRecording));
  EXPECT_EQ(result.kind, multicam::ResultKind::kAcknowledged);
  EXPECT_TRUE(result.ok());
}

TEST(TcpCommandChannelTest, DefaultFramingReadsBareJsonReply) {
  FakeDevice device([](const multicam::CommandEnvelope&) {
    return std::string("{\"fileId\":\"rec-1\"}");
  });
  multicam::TcpCommandChannel channel(QuietConfig());

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kStopRecording));
  ASSERT_EQ(result.kind, multicam::ResultKind::kFileId) << result.error_message;
  EXPECT_EQ(result.file_id, "rec-1");
}

TEST(TcpCommandChannelTest, DefaultFramingReadsBareJsonAcrossFragments) {
  FakeDevice device([](const multicam::CommandEnvelope&) {
    return std::string(" {\"status\":\"recording\",\"battery\":40}");
  });
  multicam::Config config = QuietConfig();
  config.transfer_chunk_size = 3;
  multicam::TcpCommandChannel channel(config);

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kDeviceStatus));
  ASSERT_EQ(result.kind, multicam::ResultKind::kReply) << result.error_message;
  EXPECT_EQ(result.reply["status"].asString(), "recording");
  EXPECT_EQ(result.reply["battery"].asInt(), 40);
}

TEST(TcpCommandChannelTest, ScalarRepliesAreAccepted) {
  FakeDevice text([](const multicam::CommandEnvelope&) {
    return std::string("\"recording\"");
  });
  FakeDevice number([](const multicam::CommandEnvelope&) {
    return std::string("42");
  });
  multicam::TcpCommandChannel channel(QuietConfig());

  const multicam::CommandResult text_result = channel.Send(
      text.device("text"), Envelope(multicam::Command::kDeviceStatus));
  ASSERT_EQ(text_result.kind, multicam::ResultKind::kReply)
      << text_result.error_message;
  EXPECT_EQ(text_result.reply.asString(), "recording");

  const multicam::CommandResult number_result = channel.Send(
      number.device("number"), Envelope(multicam::Command::kDeviceStatus));
  ASSERT_EQ(number_result.kind, multicam::ResultKind::kReply)
      << number_result.error_message;
  EXPECT_EQ(number_result.reply.asInt(), 42);
}

TEST(TcpCommandChannelTest, LegacyFramingToleratesFragmentedReply) {
  FakeDevice device([](const multicam::CommandEnvelope&) {
    return std::string("{\"files\":[{\"fileId\":\"1\"},{\"fileId\":\"2\"}]}");
  });
  multicam::Config config = QuietConfig();
  config.reply_framing = multicam::ReplyFraming::kParseOnArrival;
  // Small reads force the reply to arrive across many partial deliveries.
  config.transfer_chunk_size = 5;
  multicam::TcpCommandChannel channel(config);

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kListFiles));
  ASSERT_EQ(result.kind, multicam::ResultKind::kReply) << result.error_message;
  EXPECT_EQ(result.reply["files"].size(), 2u);
}

TEST(TcpCommandChannelTest, LegacyFramingStopsAtCompleteValue) {
  // The device keeps the connection open after replying; the reader must not
  // wait for end of stream.
  FakeDevice device([](const multicam::CommandEnvelope&) {
    return std::string("{\"status\":\"ok\"}");
  });
  device.set_linger(std::chrono::milliseconds(1000));
  multicam::Config config = QuietConfig();
  config.reply_framing = multicam::ReplyFraming::kParseOnArrival;
  multicam::TcpCommandChannel channel(config);

  const auto started = std::chrono::steady_clock::now();
  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kDeviceStatus));
  EXPECT_EQ(result.kind, multicam::ResultKind::kReply);
  EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::milliseconds(700));
}

TEST(TcpCommandChannelTest, LegacyTruncatedReplyIsProtocolError) {
  FakeDevice device([](const multicam::CommandEnvelope&) {
    return std::string("{\"files\":[");
  });
  multicam::Config config = QuietConfig();
  config.reply_framing = multicam::ReplyFraming::kParseOnArrival;
  multicam::TcpCommandChannel channel(config);

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kListFiles));
  EXPECT_EQ(result.kind, multicam::ResultKind::kFailed);
  EXPECT_EQ(result.error, multicam::ErrorCode::kProtocol);
}

TEST(TcpCommandChannelTest, TruncatedFramedReplyIsProtocolError) {
  FakeDevice device([](const multicam::CommandEnvelope&) {
    return Framed("{\"status\":\"ready\"}").substr(0, 10);
  });
  multicam::TcpCommandChannel channel(QuietConfig());

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kDeviceStatus));
  EXPECT_EQ(result.kind, multicam::ResultKind::kFailed);
  EXPECT_EQ(result.error, multicam::ErrorCode::kProtocol);
}

TEST(TcpCommandChannelTest, OversizedReplyIsRejected) {
  FakeDevice device([](const multicam::CommandEnvelope&) {
    return Framed("{\"blob\":\"" + std::string(512, 'x') + "\"}");
  });
  multicam::Config config = QuietConfig();
  config.max_reply_bytes = 128;
  multicam::TcpCommandChannel channel(config);

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kDeviceStatus));
  EXPECT_EQ(result.kind, multicam::ResultKind::kFailed);
  EXPECT_EQ(result.error, multicam::ErrorCode::kProtocol);
}

TEST(TcpCommandChannelTest, SilentDeviceTimesOut) {
  FakeDevice device([](const multicam::CommandEnvelope&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    return std::string();
  });
  multicam::Config config = QuietConfig();
  config.command_timeout = std::chrono::milliseconds(300);
  config.list_reply_timeout = std::chrono::milliseconds(300);
  multicam::TcpCommandChannel channel(config);

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kDeviceStatus));
  EXPECT_EQ(result.kind, multicam::ResultKind::kFailed);
  EXPECT_EQ(result.error, multicam::ErrorCode::kTimeout);
}

TEST(TcpCommandChannelTest, RefusedConnectionIsReported) {
  multicam::Device device;
  device.name = "gone";
  device.address = "127.0.0.1";
  device.port = multicam_test::UnusedLoopbackPort();
  multicam::TcpCommandChannel channel(QuietConfig());

  const multicam::CommandResult result =
      channel.Send(device, Envelope(multicam::Command::kDeviceStatus));
  EXPECT_EQ(result.kind, multicam::ResultKind::kFailed);
  EXPECT_EQ(result.error, multicam::ErrorCode::kConnection);
  EXPECT_NE(result.error_message.find("gone"), std::string::npos);
}

TEST(TcpCommandChannelTest, RetrievalWithoutFileIdIsRejectedLocally) {
  FakeDevice device([](const multicam::CommandEnvelope&) { return std::string(); });
  multicam::TcpCommandChannel channel(QuietConfig());

  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kGetFile));
  EXPECT_EQ(result.kind, multicam::ResultKind::kFailed);
  EXPECT_TRUE(device.requests().empty());
}

TEST(TcpCommandChannelTest, WorksWithDescriptorsAboveSelectLimit) {
  rlimit limit{};
  ASSERT_EQ(::getrlimit(RLIMIT_NOFILE, &limit), 0);
  const rlim_t wanted = FD_SETSIZE + 64;
  if (limit.rlim_cur < wanted) {
    if (limit.rlim_max < wanted) {
      GTEST_SKIP() << "descriptor limit too low";
    }
    rlimit raised = limit;
    raised.rlim_cur = wanted;
    ASSERT_EQ(::setrlimit(RLIMIT_NOFILE, &raised), 0);
  }

  FakeDevice device([](const multicam::CommandEnvelope&) {
    return Framed("{\"status\":\"ready\"}");
  });
  // Occupy every low descriptor so the connection lands above FD_SETSIZE.
  std::vector<int> fillers;
  while (true) {
    const int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);
    fillers.push_back(fd);
    if (fd >= FD_SETSIZE + 8) {
      break;
    }
  }
  multicam::TcpCommandChannel channel(QuietConfig());
  const multicam::CommandResult result = channel.Send(
      device.device("cam"), Envelope(multicam::Command::kDeviceStatus));

  for (int fd : fillers) {
    ::close(fd);
  }
  ::setrlimit(RLIMIT_NOFILE, &limit);
  ASSERT_EQ(result.kind, multicam::ResultKind::kReply) << result.error_message;
  EXPECT_EQ(result.reply["status"].asString(), "ready");
}
