#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pkbsync/common.hpp"
#include "pkbsync/sync/artifact_generator.hpp"
#include "pkbsync/sync/change_scanner.hpp"
#include "pkbsync/sync/git_operations.hpp"
#include "pkbsync/sync/repository.hpp"
#include "pkbsync/sync/sync_engine.hpp"

namespace pkbsync::sync {

enum class SyncMode {
  kQuick,  // commit and push only
  kFull    // also regenerate derived artifacts for the primary repository
};

std::string syncModeToString(SyncMode mode);
Result<SyncMode> stringToSyncMode(const std::string& str);

struct OrchestratorReport {
  SyncMode mode = SyncMode::kFull;
  std::vector<SyncReport> repositories;
  bool artifacts_attempted = false;
  std::optional<Error> artifact_error;  // never fails the cycle

  int failedCount() const;

  /**
   * @brief 0 when no repository failed, 1 otherwise
   */
  int exitCode() const;
};

/**
 * @brief Read-only view of one repository for --check
 */
struct RepositoryStatus {
  std::string name;
  std::string path;
  std::optional<Error> error;  // e.g. kNotARepository
  ScanOutcome outcome = ScanOutcome::kClean;
  size_t changed_files = 0;
  std::string operation;
  std::optional<AheadBehind> ahead_behind;  // nullopt when the remote branch is unknown
};

struct StatusReport {
  std::vector<RepositoryStatus> repositories;

  /**
   * @brief 0 unless a repository could not be inspected
   */
  int exitCode() const;
};

/**
 * @brief Runs the sync engine over an ordered repository list
 *
 * Repositories are processed one at a time in the given order. A failed
 * repository never prevents the remaining ones from being attempted.
 */
class SyncOrchestrator {
public:
  /**
   * @param artifacts May be null when no artifact generation is configured
   */
  SyncOrchestrator(SyncEngine& engine, ArtifactGenerator* artifacts);

  OrchestratorReport run(const std::vector<Repository>& repositories, SyncMode mode);

  /**
   * @brief Inspect every repository without locking or changing working trees
   * @param fetch Update remote-tracking refs first so ahead/behind is current
   */
  static StatusReport status(GitOperations& git, const std::vector<Repository>& repositories,
                             bool fetch);

private:
  SyncEngine& engine_;
  ArtifactGenerator* artifacts_;
};

}  // namespace pkbsync::sync
