#include "multicam/multicam.h"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace multicam {

namespace fs = std::filesystem;

DirectoryUploader::DirectoryUploader(std::string root,
                                     std::string session_folder)
    : root_(std::move(root)), session_folder_(std::move(session_folder)) {}

std::string DirectoryUploader::MakeSessionFolder(
    std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&seconds, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%d/%H-%M-%S/");
  return oss.str();
}

UploadReport DirectoryUploader::UploadBatch(
    const std::vector<std::string>& paths) {
  UploadReport report;
  const std::string folder =
      session_folder_.empty()
          ? MakeSessionFolder(std::chrono::system_clock::now())
          : session_folder_;
  const fs::path destination = fs::path(root_) / folder;
  report.destination = destination.string();

  std::error_code ec;
  fs::create_directories(destination, ec);
  if (ec) {
    report.error = "cannot create " + destination.string() + ": " + ec.message();
    report.failed = paths;
    return report;
  }
  for (const auto& path : paths) {
    const fs::path source(path);
    if (!fs::is_regular_file(source, ec)) {
      report.error = path + " is not a regular file";
      report.failed.push_back(path);
      continue;
    }
    // A failed copy leaves nothing under the target name.
    const fs::path target = destination / source.filename();
    fs::path partial = target;
    partial += ".part";
    fs::copy_file(source, partial, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
      fs::rename(partial, target, ec);
    }
    if (ec) {
      report.error = "cannot copy " + path + ": " + ec.message();
      report.failed.push_back(path);
      std::error_code ignored;
      fs::remove(partial, ignored);
      continue;
    }
    report.uploaded.push_back(path);
  }
  return report;
}

CleanupReport DirectoryUploader::DeleteLocalFiles(
    const std::vector<std::string>& paths) {
  CleanupReport report;
  for (const auto& path : paths) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
      report.error = "cannot delete " + path + ": " + ec.message();
      report.failed.push_back(path);
      continue;
    }
    // fs::remove() returns false for an already missing file, which counts as
    // deleted.
    report.deleted.push_back(path);
  }
  return report;
}

}  // namespace multicam
