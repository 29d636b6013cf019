#pragma once

#include <string>
#include <string_view>

#include "pkbsync/common.hpp"
#include "pkbsync/sync/change_set.hpp"
#include "pkbsync/sync/git_operations.hpp"
#include "pkbsync/sync/repository.hpp"

namespace pkbsync::sync {

enum class ScanOutcome {
  kClean,               // nothing to commit
  kDirty,               // changes found
  kConflictInProgress   // unfinished merge/rebase or unmerged paths; never auto-resolved
};

std::string scanOutcomeToString(ScanOutcome outcome);

struct ScanResult {
  ScanOutcome outcome = ScanOutcome::kClean;
  ChangeSet changes;
  std::string operation;  // "rebase", "merge", ... when kConflictInProgress
};

/**
 * @brief Detects local modifications in a working copy
 *
 * Scanning is read-only; it never stages or modifies files.
 */
class ChangeScanner {
public:
  explicit ChangeScanner(const GitOperations& git);

  /**
   * @brief Scan a repository for tracked modifications and untracked files
   * @return ScanResult, kNotARepository when repo.path is not the top level of a
   *         working copy, or kDirectoryNotFound when it does not exist
   */
  Result<ScanResult> scan(const Repository& repo) const;

private:
  const GitOperations& git_;
};

/**
 * @brief Parsed `git status --porcelain=v1 -z` output
 */
struct PorcelainStatus {
  ChangeSet changes;
  bool has_unmerged = false;
};

/**
 * @brief Parse NUL-separated porcelain v1 status records
 *
 * Renames and copies contribute their destination path; ignored entries are skipped.
 */
Result<PorcelainStatus> parsePorcelainStatus(std::string_view output);

}  // namespace pkbsync::sync
