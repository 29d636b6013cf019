#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "pkbsync/common.hpp"

namespace pkbsync::sync {

/**
 * @brief One unrecoverable sync failure, written so a human can act on it
 */
struct FailureRecord {
  std::string timestamp;   // RFC 3339
  std::string repository;  // repository name
  std::string path;        // working copy path
  std::string phase;       // "scan", "commit", "pull", "push", "stash", "lock", "artifact"
  std::string error;       // error code name
  std::string message;     // git/system output
  std::string next_step;   // what the user should do
};

/**
 * @brief Append-only destination for failure records
 */
class FailureLog {
public:
  virtual ~FailureLog() = default;
  virtual Result<void> append(const FailureRecord& record) = 0;
};

/**
 * @brief Failure records as JSON lines in a single file
 *
 * Existing entries are never rewritten.
 */
class FileFailureLog : public FailureLog {
public:
  explicit FileFailureLog(std::filesystem::path path);

  Result<void> append(const FailureRecord& record) override;

  const std::filesystem::path& path() const { return path_; }

  /**
   * @brief Read every record; unparseable lines are skipped with a warning
   */
  static Result<std::vector<FailureRecord>> readAll(const std::filesystem::path& path);

private:
  std::filesystem::path path_;
  std::mutex mutex_;
};

}  // namespace pkbsync::sync
