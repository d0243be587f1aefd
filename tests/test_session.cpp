// Tests for the recording state machine and stop-and-retrieve outcomes.
#include "multicam/test_hooks.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>

using multicam_test::FakeDevice;
using multicam_test::FileReply;
using multicam_test::Framed;
using multicam_test::MakeDevice;
using multicam_test::RecordingChannel;
using multicam_test::ScopedTempDir;

namespace {

multicam::Config QuietConfig() {
  multicam::Config config;
  config.log_callback = [](const std::string&) {};
  config.clock = []() { return 1700000000.0; };
  return config;
}

multicam::CommandResult Ack() {
  multicam::CommandResult result;
  result.kind = multicam::ResultKind::kAcknowledged;
  return result;
}

// STOP answers with "<device>-clip", GET_VIDEO writes a small local file.
class FakeCameraChannel : public RecordingChannel {
 public:
  explicit FakeCameraChannel(const std::string& download_dir,
                             std::set<std::string> no_file = {},
                             std::set<std::string> broken_download = {})
      : RecordingChannel([=](const multicam::Device& device,
                             const multicam::CommandEnvelope& envelope) {
          switch (envelope.command) {
            case multicam::Command::kStopRecording: {
              if (no_file.count(device.name) > 0) {
                return Ack();
              }
              multicam::CommandResult result;
              result.kind = multicam::ResultKind::kFileId;
              result.file_id = device.name + "-clip";
              return result;
            }
            case multicam::Command::kGetFile: {
              if (broken_download.count(device.name) > 0) {
                return multicam::CommandResult::Failure(
                    multicam::ErrorCode::kProtocol, "short stream");
              }
              const std::string path =
                  download_dir + "/" + envelope.file_id + ".mov";
              std::ofstream(path) << "data";
              multicam::CommandResult result;
              result.kind = multicam::ResultKind::kDownloaded;
              result.local_path = path;
              result.bytes_received = 4;
              return result;
            }
            default:
              return Ack();
          }
        }) {}
};

class FakeUploader : public multicam::Uploader {
 public:
  bool fail_upload = false;
  bool fail_cleanup = false;
  std::vector<std::string> uploaded;
  std::vector<std::string> deleted;

  multicam::UploadReport UploadBatch(
      const std::vector<std::string>& paths) override {
    multicam::UploadReport report;
    report.destination = "bucket/2024-01-01/10-00-00/";
    for (size_t i = 0; i < paths.size(); ++i) {
      if (fail_upload && i == 0) {
        report.failed.push_back(paths[i]);
      } else {
        report.uploaded.push_back(paths[i]);
        uploaded.push_back(paths[i]);
      }
    }
    return report;
  }

  multicam::CleanupReport DeleteLocalFiles(
      const std::vector<std::string>& paths) override {
    multicam::CleanupReport report;
    for (const auto& path : paths) {
      if (fail_cleanup) {
        report.failed.push_back(path);
        continue;
      }
      std::filesystem::remove(path);
      report.deleted.push_back(path);
      deleted.push_back(path);
    }
    return report;
  }
};

class SessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = QuietConfig();
    config_.download_dir = dir_.str();
  }

  std::unique_ptr<multicam::Session> MakeSession(
      std::shared_ptr<multicam::CommandChannel> channel, size_t devices = 2) {
    auto session = std::make_unique<multicam::Session>(config_);
    session->SetCommandChannel(std::move(channel));
    for (size_t i = 0; i < devices; ++i) {
      session->AddDevice(MakeDevice("cam-" + std::to_string(i)));
    }
    return session;
  }

  ScopedTempDir dir_;
  multicam::Config config_;
};

}  // namespace

TEST_F(SessionTest, StopWhileIdleIsRejectedWithoutTraffic) {
  auto channel = std::make_shared<RecordingChannel>();
  auto session = MakeSession(channel);

  const multicam::SessionOutcome outcome = session->StopRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kFailed);
  EXPECT_EQ(outcome.error, multicam::ErrorCode::kState);
  EXPECT_EQ(channel->call_count(), 0u);
  EXPECT_FALSE(session->IsRecording());
}

TEST_F(SessionTest, StartWithoutDevicesIsRejectedWithoutTraffic) {
  auto channel = std::make_shared<RecordingChannel>();
  auto session = MakeSession(channel, 0);

  const multicam::SessionOutcome outcome = session->StartRecording();
  EXPECT_EQ(outcome.error, multicam::ErrorCode::kNoDevices);
  EXPECT_EQ(channel->call_count(), 0u);
  EXPECT_FALSE(session->IsRecording());
}

TEST_F(SessionTest, StartWhileRecordingIsRejectedWithoutTraffic) {
  auto channel = std::make_shared<RecordingChannel>();
  auto session = MakeSession(channel);
  multicam::test::SetRecording(*session, true);

  const multicam::SessionOutcome outcome = session->StartRecording();
  EXPECT_EQ(outcome.error, multicam::ErrorCode::kState);
  EXPECT_EQ(channel->call_count(), 0u);
  EXPECT_TRUE(session->IsRecording());
}

TEST_F(SessionTest, StartSchedulesSharedInstantAndEntersRecording) {
  auto channel = std::make_shared<RecordingChannel>();
  auto session = MakeSession(channel, 3);

  const multicam::SessionOutcome outcome = session->StartRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kSuccess);
  EXPECT_DOUBLE_EQ(outcome.timestamp, 1700000003.0);
  EXPECT_EQ(outcome.device_count, 3u);
  EXPECT_EQ(outcome.results.size(), 3u);
  EXPECT_TRUE(session->IsRecording());
  EXPECT_EQ(channel->call_count(), 3u);
}

TEST_F(SessionTest, StartWithDeviceFailuresStillRecords) {
  auto channel = std::make_shared<RecordingChannel>(
      [](const multicam::Device& device, const multicam::CommandEnvelope&) {
        if (device.name == "cam-1") {
          return multicam::CommandResult::Failure(multicam::ErrorCode::kConnection,
                                                  "refused");
        }
        return Ack();
      });
  auto session = MakeSession(channel);

  const multicam::SessionOutcome outcome = session->StartRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kPartialSuccess);
  EXPECT_TRUE(session->IsRecording());
  EXPECT_FALSE(outcome.results.at("cam-1").ok());
}

TEST_F(SessionTest, StopWithoutFileIdsReportsNoFiles) {
  auto channel = std::make_shared<RecordingChannel>();
  auto session = MakeSession(channel);
  ASSERT_TRUE(session->StartRecording().ok());

  const multicam::SessionOutcome outcome = session->StopRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kNoFiles);
  EXPECT_FALSE(session->IsRecording());
  EXPECT_TRUE(outcome.file_ids.empty());
  // START x2 + STOP x2, no retrieval.
  EXPECT_EQ(channel->call_count(), 4u);
}

TEST_F(SessionTest, StopWithoutUploaderDownloadsFiles) {
  auto channel = std::make_shared<FakeCameraChannel>(dir_.str());
  auto session = MakeSession(channel);
  ASSERT_TRUE(session->StartRecording().ok());

  const multicam::SessionOutcome outcome = session->StopRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kDownloaded);
  EXPECT_EQ(outcome.file_ids.size(), 2u);
  EXPECT_EQ(outcome.file_ids.at("cam-0"), "cam-0-clip");
  EXPECT_EQ(outcome.downloaded_files.size(), 2u);
  EXPECT_EQ(session->GetLastDownloadedFiles(), outcome.downloaded_files);
  EXPECT_TRUE(session->GetLastFileIds().empty());

  size_t retrievals = 0;
  for (const auto& call : channel->calls()) {
    if (call.envelope.command == multicam::Command::kGetFile) {
      ++retrievals;
      EXPECT_EQ(call.envelope.file_id, call.device.name + "-clip");
    }
  }
  EXPECT_EQ(retrievals, 2u);

  const multicam::SessionMetrics metrics = session->GetMetrics();
  EXPECT_EQ(metrics.files_downloaded, 2u);
  EXPECT_EQ(metrics.bytes_downloaded, 8u);
}

TEST_F(SessionTest, FullSuccessUploadsAndRemovesLocalCopies) {
  auto channel = std::make_shared<FakeCameraChannel>(dir_.str());
  auto uploader = std::make_shared<FakeUploader>();
  auto session = MakeSession(channel);
  session->SetUploader(uploader);
  ASSERT_TRUE(session->StartRecording().ok());

  const multicam::SessionOutcome outcome = session->StopRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kSuccess) << outcome.message;
  EXPECT_EQ(uploader->uploaded.size(), 2u);
  EXPECT_EQ(uploader->deleted.size(), 2u);
  for (const auto& path : outcome.downloaded_files) {
    EXPECT_FALSE(std::filesystem::exists(path));
  }
}

TEST_F(SessionTest, CleanupFailureIsPartialSuccess) {
  auto channel = std::make_shared<FakeCameraChannel>(dir_.str());
  auto uploader = std::make_shared<FakeUploader>();
  uploader->fail_cleanup = true;
  auto session = MakeSession(channel);
  session->SetUploader(uploader);
  ASSERT_TRUE(session->StartRecording().ok());

  const multicam::SessionOutcome outcome = session->StopRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kPartialSuccess);
  EXPECT_EQ(outcome.error, multicam::ErrorCode::kCleanup);
}

TEST_F(SessionTest, UploadFailureKeepsEveryLocalFile) {
  auto channel = std::make_shared<FakeCameraChannel>(dir_.str());
  auto uploader = std::make_shared<FakeUploader>();
  uploader->fail_upload = true;
  auto session = MakeSession(channel);
  session->SetUploader(uploader);
  ASSERT_TRUE(session->StartRecording().ok());

  const multicam::SessionOutcome outcome = session->StopRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kUploadFailed);
  EXPECT_EQ(outcome.error, multicam::ErrorCode::kUpload);
  EXPECT_TRUE(uploader->deleted.empty());
  for (const auto& path : outcome.downloaded_files) {
    EXPECT_TRUE(std::filesystem::exists(path));
  }
  EXPECT_FALSE(session->IsRecording());
}

TEST_F(SessionTest, FailedDownloadsReportDownloadFailure) {
  auto channel = std::make_shared<FakeCameraChannel>(
      dir_.str(), std::set<std::string>{},
      std::set<std::string>{"cam-0", "cam-1"});
  auto uploader = std::make_shared<FakeUploader>();
  auto session = MakeSession(channel);
  session->SetUploader(uploader);
  ASSERT_TRUE(session->StartRecording().ok());

  const multicam::SessionOutcome outcome = session->StopRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kDownloadFailed);
  EXPECT_EQ(outcome.error, multicam::ErrorCode::kProtocol);
  EXPECT_NE(outcome.message.find("2 file(s) available"), std::string::npos);
  EXPECT_TRUE(uploader->uploaded.empty());
  EXPECT_FALSE(session->IsRecording());
}

TEST_F(SessionTest, FileIdsAreClearedAfterFailedRetrieval) {
  auto channel = std::make_shared<FakeCameraChannel>(
      dir_.str(), std::set<std::string>{}, std::set<std::string>{"cam-0"});
  auto session = MakeSession(channel, 1);
  ASSERT_TRUE(session->StartRecording().ok());

  const multicam::SessionOutcome outcome = session->StopRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kDownloadFailed);
  ASSERT_EQ(outcome.file_ids.size(), 1u);
  EXPECT_EQ(outcome.file_ids.at("cam-0"), "cam-0-clip");
  EXPECT_TRUE(session->GetLastFileIds().empty());
}

TEST_F(SessionTest, OnlyDevicesWithFileIdsAreRetrieved) {
  auto channel = std::make_shared<FakeCameraChannel>(
      dir_.str(), std::set<std::string>{"cam-1"});
  auto session = MakeSession(channel);
  ASSERT_TRUE(session->StartRecording().ok());

  const multicam::SessionOutcome outcome = session->StopRecording();
  EXPECT_EQ(outcome.status, multicam::OutcomeStatus::kDownloaded);
  ASSERT_EQ(outcome.file_ids.size(), 1u);
  EXPECT_EQ(outcome.file_ids.count("cam-0"), 1u);
  EXPECT_EQ(outcome.downloaded_files.size(), 1u);
}

TEST_F(SessionTest, DownloadAllSkipsUnknownDevices) {
  auto channel = std::make_shared<FakeCameraChannel>(dir_.str());
  auto session = MakeSession(channel, 1);

  multicam::FileIdMap file_ids;
  file_ids["cam-0"] = "a";
  file_ids["ghost"] = "b";
  const std::vector<std::string> paths = session->DownloadAll(file_ids);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_EQ(channel->call_count(), 1u);

  const multicam::CommandResult missing = session->DownloadFile("ghost", "b");
  EXPECT_FALSE(missing.ok());
}

TEST_F(SessionTest, StartStopCycleCanRepeat) {
  auto channel = std::make_shared<RecordingChannel>();
  auto session = MakeSession(channel);

  ASSERT_TRUE(session->StartRecording().ok());
  session->StopRecording();
  ASSERT_TRUE(session->StartRecording().ok());
  EXPECT_TRUE(session->GetLastFileIds().empty());
  session->StopRecording();
  EXPECT_FALSE(session->IsRecording());
}

TEST_F(SessionTest, DeviceStatusReachesEveryDevice) {
  auto channel = std::make_shared<RecordingChannel>(
      [](const multicam::Device& device, const multicam::CommandEnvelope&) {
        multicam::CommandResult result;
        result.kind = multicam::ResultKind::kReply;
        result.reply["status"] = device.name == "cam-0" ? "idle" : "recording";
        return result;
      });
  auto session = MakeSession(channel);

  const multicam::ResultMap status = session->GetDeviceStatus();
  ASSERT_EQ(status.size(), 2u);
  EXPECT_EQ(status.at("cam-0").reply["status"].asString(), "idle");
  EXPECT_EQ(status.at("cam-1").reply["status"].asString(), "recording");
  for (const auto& call : channel->calls()) {
    EXPECT_EQ(call.envelope.command, multicam::Command::kDeviceStatus);
    EXPECT_DOUBLE_EQ(call.envelope.timestamp, 1700000000.0);
  }
  EXPECT_EQ(session->GetMetrics().commands_sent, 2u);
}

TEST_F(SessionTest, ListFilesParsesEveryDevice) {
  FakeDevice cam([](const multicam::CommandEnvelope&) {
    return Framed(
        "{\"files\":[{\"fileId\":\"f1\",\"fileName\":\"a.mov\",\"fileSize\":5,"
        "\"creationDate\":1.5}]}");
  });
  FakeDevice broken([](const multicam::CommandEnvelope&) {
    return Framed("{\"status\":\"idle\"}");
  });
  config_.command_timeout = std::chrono::milliseconds(2000);
  config_.list_reply_timeout = std::chrono::milliseconds(1000);
  multicam::Session session(config_);
  session.AddDevice(cam.device("cam"));
  session.AddDevice(broken.device("broken"));

  multicam::ResultMap raw;
  const auto listings = session.ListFiles(&raw);
  EXPECT_EQ(raw.size(), 2u);
  ASSERT_EQ(listings.size(), 1u);
  ASSERT_EQ(listings.at("cam").size(), 1u);
  EXPECT_EQ(listings.at("cam")[0].file_name, "a.mov");
}

TEST_F(SessionTest, EndToEndOverTcp) {
  FakeDevice cam([](const multicam::CommandEnvelope& envelope) {
    switch (envelope.command) {
      case multicam::Command::kStopRecording:
        return Framed("{\"status\":\"stopped\",\"fileId\":\"take-1\"}");
      case multicam::Command::kGetFile:
        return FileReply("take-1.mov", std::string(3000, 'v'));
      default:
        return Framed("{\"status\":\"ok\"}");
    }
  });
  config_.command_timeout = std::chrono::milliseconds(2000);
  config_.list_reply_timeout = std::chrono::milliseconds(1000);
  multicam::Session session(config_);
  session.AddDevice(cam.device("cam"));

  ASSERT_TRUE(session.StartRecording().ok());
  const multicam::SessionOutcome outcome = session.StopRecording();
  ASSERT_EQ(outcome.status, multicam::OutcomeStatus::kDownloaded) << outcome.message;
  ASSERT_EQ(outcome.downloaded_files.size(), 1u);
  EXPECT_EQ(std::filesystem::file_size(outcome.downloaded_files[0]), 3000u);

  const std::vector<multicam::CommandEnvelope> requests = cam.requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[0].command, multicam::Command::kStartRecording);
  EXPECT_DOUBLE_EQ(requests[0].timestamp, 1700000003.0);
  EXPECT_EQ(requests[2].command, multicam::Command::kGetFile);
  EXPECT_EQ(requests[2].file_id, "take-1");
}

TEST_F(SessionTest, PlainJsonDeviceWithDefaultFraming) {
  FakeDevice cam([](const multicam::CommandEnvelope& envelope) {
    switch (envelope.command) {
      case multicam::Command::kStopRecording:
        return std::string("{\"status\":\"stopped\",\"fileId\":\"take-2\"}");
      case multicam::Command::kGetFile:
        return FileReply("take-2.mov", std::string(1200, 'p'));
      default:
        return std::string("{\"status\":\"ok\"}");
    }
  });
  config_.command_timeout = std::chrono::milliseconds(2000);
  config_.list_reply_timeout = std::chrono::milliseconds(1000);
  multicam::Session session(config_);
  session.AddDevice(cam.device("cam"));

  ASSERT_TRUE(session.StartRecording().ok());
  const multicam::SessionOutcome outcome = session.StopRecording();
  ASSERT_EQ(outcome.status, multicam::OutcomeStatus::kDownloaded) << outcome.message;
  EXPECT_EQ(outcome.file_ids.at("cam"), "take-2");
  ASSERT_EQ(outcome.downloaded_files.size(), 1u);
  EXPECT_EQ(std::filesystem::file_size(outcome.downloaded_files[0]), 1200u);
}

TEST_F(SessionTest, ProgressCallbackFailuresReachMetrics) {
  FakeDevice cam([](const multicam::CommandEnvelope&) {
    return FileReply("clip.mov", std::string(5000, 'x'));
  });
  config_.command_timeout = std::chrono::milliseconds(2000);
  config_.list_reply_timeout = std::chrono::milliseconds(1000);
  config_.transfer_idle_timeout = std::chrono::milliseconds(1000);
  config_.progress_callback = [](const std::string&, uint64_t, uint64_t) {
    throw std::runtime_error("progress sink failed");
  };
  multicam::Session session(config_);
  session.AddDevice(cam.device("cam"));

  const multicam::CommandResult result = session.DownloadFile("cam", "rec-1");
  ASSERT_EQ(result.kind, multicam::ResultKind::kDownloaded) << result.error_message;
  EXPECT_GT(result.callback_exceptions, 0u);
  EXPECT_EQ(session.GetMetrics().callback_exceptions, result.callback_exceptions);
}
