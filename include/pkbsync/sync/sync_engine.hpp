#pragma once

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "pkbsync/common.hpp"
#include "pkbsync/sync/category_classifier.hpp"
#include "pkbsync/sync/change_set.hpp"
#include "pkbsync/sync/failure_log.hpp"
#include "pkbsync/sync/git_operations.hpp"
#include "pkbsync/sync/lock_manager.hpp"
#include "pkbsync/sync/repository.hpp"

namespace pkbsync::sync {

enum class SyncState {
  kIdle,
  kLocking,
  kScanning,
  kCommitting,
  kPullingRebase,
  kConflictRecovery,
  kPushing,
  kPushRetry,
  kDone,
  kFailed,
  kSkipped  // lock held by another live process
};

std::string syncStateToString(SyncState state);

enum class SyncPhase {
  kLock,
  kScan,
  kCommit,
  kPull,
  kStash,
  kPush
};

std::string syncPhaseToString(SyncPhase phase);

enum class AttemptOutcome {
  kOk,
  kConflict,
  kRejected,
  kFailed
};

std::string attemptOutcomeToString(AttemptOutcome outcome);

/**
 * @brief One pull or push against the remote
 */
struct SyncAttempt {
  SyncPhase phase = SyncPhase::kPull;
  AttemptOutcome outcome = AttemptOutcome::kOk;
  int retry_count = 0;  // 0 for the first push, n for the n-th retry
  std::string detail;
};

struct RetryPolicy {
  int max_push_attempts = 3;  // total, including the first push
};

/**
 * @brief Outcome of one engine run for one repository
 */
struct SyncReport {
  std::string repository;
  SyncState final_state = SyncState::kIdle;
  std::vector<SyncAttempt> attempts;
  std::optional<std::string> commit_message;  // set when a commit was made
  std::optional<SyncPhase> failed_phase;
  std::optional<Error> error;
  std::string next_step;
  std::string stash_message;  // recovery stash left behind, if any

  bool failed() const { return final_state == SyncState::kFailed; }
  bool skipped() const { return final_state == SyncState::kSkipped; }
  int pushAttempts() const;
};

/**
 * @brief Called on every state transition with a human readable detail
 */
using ProgressCallback =
    std::function<void(const Repository& repo, SyncState state, const std::string& detail)>;

/**
 * @brief Commit, rebase and push one repository as an explicit state machine
 *
 * Idle -> Locking -> Scanning -> Committing -> PullingRebase
 *      -> (ConflictRecovery) -> Pushing -> (PushRetry)* -> Done | Failed
 *
 * A clean repository goes straight from Scanning to Done. A busy lock ends
 * in Skipped. Every Failed run appends one record to the failure log before
 * run() returns; Done writes nothing there.
 */
class SyncEngine {
public:
  /**
   * @brief Collaborators must outlive the engine
   */
  SyncEngine(GitOperations& git, LockManager& locks, FailureLog& failure_log,
             CategoryClassifier classifier, RetryPolicy policy = {});

  void setProgressCallback(ProgressCallback callback);

  /**
   * @brief Run one full sync cycle for a repository
   */
  SyncReport run(const Repository& repo);

  const RetryPolicy& policy() const { return policy_; }

private:
  struct StepFailure {
    SyncPhase phase;
    Error error;
    std::string next_step;
  };

  using StepResult = std::expected<void, StepFailure>;

  GitOperations& git_;
  LockManager& locks_;
  FailureLog& failure_log_;
  CategoryClassifier classifier_;
  RetryPolicy policy_;
  ProgressCallback progress_;

  StepResult syncLocked(const Repository& repo, SyncReport& report);
  StepResult commitChanges(const Repository& repo, const ChangeSet& changes, SyncReport& report);
  StepResult pullWithRecovery(const Repository& repo, SyncReport& report, int retry_count);
  StepResult pushWithRetry(const Repository& repo, SyncReport& report);

  void transition(const Repository& repo, SyncReport& report, SyncState state,
                  const std::string& detail);
  void fail(const Repository& repo, SyncReport& report, StepFailure failure);
};

}  // namespace pkbsync::sync
