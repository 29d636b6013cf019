#include "pkbsync/sync/failure_log.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "pkbsync/util/xdg.hpp"

namespace pkbsync::sync {

namespace {
  nlohmann::json toJson(const FailureRecord& record) {
    nlohmann::json json;
    json["timestamp"] = record.timestamp;
    json["repository"] = record.repository;
    json["path"] = record.path;
    json["phase"] = record.phase;
    json["error"] = record.error;
    json["message"] = record.message;
    json["next_step"] = record.next_step;
    return json;
  }

  FailureRecord fromJson(const nlohmann::json& json) {
    FailureRecord record;
    record.timestamp = json.value("timestamp", "");
    record.repository = json.value("repository", "");
    record.path = json.value("path", "");
    record.phase = json.value("phase", "");
    record.error = json.value("error", "");
    record.message = json.value("message", "");
    record.next_step = json.value("next_step", "");
    return record;
  }
}

FileFailureLog::FileFailureLog(std::filesystem::path path) : path_(std::move(path)) {}

Result<void> FileFailureLog::append(const FailureRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (path_.has_parent_path() &&
      !util::Xdg::ensureDirectory(path_.parent_path(), std::filesystem::perms::owner_all)) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Failed to create directory for " + path_.string()));
  }

  std::ofstream file(path_, std::ios::app);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to open failure log: " + path_.string()));
  }

  file << toJson(record).dump() << '\n';
  file.flush();
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write failure log: " + path_.string()));
  }
  return {};
}

Result<std::vector<FailureRecord>> FileFailureLog::readAll(const std::filesystem::path& path) {
  std::vector<FailureRecord> records;

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return records;
  }

  std::ifstream file(path);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Failed to open failure log: " + path.string()));
  }

  std::string line;
  size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    try {
      records.push_back(fromJson(nlohmann::json::parse(line)));
    } catch (const nlohmann::json::exception& e) {
      spdlog::warn("Skipping malformed failure log line {} in {}: {}", line_number, path.string(),
                   e.what());
    }
  }
  return records;
}

}  // namespace pkbsync::sync
