#include "pkbsync/sync/sync_engine.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "pkbsync/sync/change_scanner.hpp"
#include "pkbsync/sync/commit_message.hpp"
#include "pkbsync/util/time.hpp"

namespace pkbsync::sync {

namespace {
  std::string gitHint(const Repository& repo, const std::string& args) {
    return "git -C " + repo.path.string() + " " + args;
  }

  AttemptOutcome outcomeFor(const Error& error) {
    switch (error.code()) {
      case ErrorCode::kRebaseConflict: return AttemptOutcome::kConflict;
      case ErrorCode::kPushRejected: return AttemptOutcome::kRejected;
      default: return AttemptOutcome::kFailed;
    }
  }
}

std::string syncStateToString(SyncState state) {
  switch (state) {
    case SyncState::kIdle: return "idle";
    case SyncState::kLocking: return "locking";
    case SyncState::kScanning: return "scanning";
    case SyncState::kCommitting: return "committing";
    case SyncState::kPullingRebase: return "pulling-rebase";
    case SyncState::kConflictRecovery: return "conflict-recovery";
    case SyncState::kPushing: return "pushing";
    case SyncState::kPushRetry: return "push-retry";
    case SyncState::kDone: return "done";
    case SyncState::kFailed: return "failed";
    case SyncState::kSkipped: return "skipped";
  }
  return "unknown";
}

std::string syncPhaseToString(SyncPhase phase) {
  switch (phase) {
    case SyncPhase::kLock: return "lock";
    case SyncPhase::kScan: return "scan";
    case SyncPhase::kCommit: return "commit";
    case SyncPhase::kPull: return "pull";
    case SyncPhase::kStash: return "stash";
    case SyncPhase::kPush: return "push";
  }
  return "unknown";
}

std::string attemptOutcomeToString(AttemptOutcome outcome) {
  switch (outcome) {
    case AttemptOutcome::kOk: return "ok";
    case AttemptOutcome::kConflict: return "conflict";
    case AttemptOutcome::kRejected: return "rejected";
    case AttemptOutcome::kFailed: return "failed";
  }
  return "unknown";
}

int SyncReport::pushAttempts() const {
  return static_cast<int>(std::count_if(attempts.begin(), attempts.end(),
                                        [](const SyncAttempt& a) { return a.phase == SyncPhase::kPush; }));
}

SyncEngine::SyncEngine(GitOperations& git, LockManager& locks, FailureLog& failure_log,
                       CategoryClassifier classifier, RetryPolicy policy)
  : git_(git), locks_(locks), failure_log_(failure_log),
    classifier_(std::move(classifier)), policy_(policy) {
  if (policy_.max_push_attempts < 1) {
    policy_.max_push_attempts = 1;
  }
}

void SyncEngine::setProgressCallback(ProgressCallback callback) {
  progress_ = std::move(callback);
}

void SyncEngine::transition(const Repository& repo, SyncReport& report, SyncState state,
                            const std::string& detail) {
  spdlog::debug("[{}] {} -> {}: {}", repo.name, syncStateToString(report.final_state),
                syncStateToString(state), detail);
  report.final_state = state;
  if (progress_) {
    progress_(repo, state, detail);
  }
}

void SyncEngine::fail(const Repository& repo, SyncReport& report, StepFailure failure) {
  report.failed_phase = failure.phase;
  report.error = failure.error;
  report.next_step = failure.next_step;

  FailureRecord record;
  record.timestamp = util::Time::toRfc3339(util::Time::now());
  record.repository = repo.name;
  record.path = repo.path.string();
  record.phase = syncPhaseToString(failure.phase);
  record.error = std::string(errorCodeToString(failure.error.code()));
  record.message = failure.error.message();
  record.next_step = failure.next_step;

  auto appended = failure_log_.append(record);
  if (!appended.has_value()) {
    spdlog::critical("[{}] Failed to write failure log: {} (failure was: {})", repo.name,
                     appended.error().message(), failure.error.message());
  }

  spdlog::error("[{}] {} failed: {}", repo.name, record.phase, failure.error.message());
  transition(repo, report, SyncState::kFailed, record.phase + ": " + failure.next_step);
}

SyncReport SyncEngine::run(const Repository& repo) {
  SyncReport report;
  report.repository = repo.name;

  transition(repo, report, SyncState::kLocking, repo.path.string());
  auto lock = locks_.acquire(repo);
  if (!lock.has_value()) {
    fail(repo, report, {SyncPhase::kLock, lock.error(),
                        "Check that the lock directory is writable"});
    return report;
  }
  if (!lock->has_value()) {
    transition(repo, report, SyncState::kSkipped, "another sync is running");
    return report;
  }

  auto result = syncLocked(repo, report);

  auto released = (*lock)->release();
  if (!released.has_value()) {
    spdlog::warn("[{}] {}", repo.name, released.error().message());
  }

  if (!result.has_value()) {
    fail(repo, report, std::move(result.error()));
  }
  return report;
}

SyncEngine::StepResult SyncEngine::syncLocked(const Repository& repo, SyncReport& report) {
  transition(repo, report, SyncState::kScanning, "");
  ChangeScanner scanner(git_);
  auto scan = scanner.scan(repo);
  if (!scan.has_value()) {
    std::string next = scan.error().code() == ErrorCode::kNotARepository ||
                               scan.error().code() == ErrorCode::kDirectoryNotFound
                           ? "Check that " + repo.path.string() + " is a git working copy"
                           : "Inspect " + gitHint(repo, "status");
    return std::unexpected(StepFailure{SyncPhase::kScan, scan.error(), next});
  }

  if (scan->outcome == ScanOutcome::kConflictInProgress) {
    return std::unexpected(StepFailure{
        SyncPhase::kScan,
        makeError(ErrorCode::kConflictInProgress,
                  "A " + scan->operation + " is in progress in " + repo.path.string()),
        "Finish or abort the in-progress " + scan->operation + " (" + gitHint(repo, "status") +
            "), then sync again"});
  }

  if (scan->outcome == ScanOutcome::kClean) {
    transition(repo, report, SyncState::kDone, "clean, nothing to sync");
    return {};
  }

  auto committed = commitChanges(repo, scan->changes, report);
  if (!committed.has_value()) {
    return committed;
  }

  auto pulled = pullWithRecovery(repo, report, 0);
  if (!pulled.has_value()) {
    return pulled;
  }

  return pushWithRetry(repo, report);
}

SyncEngine::StepResult SyncEngine::commitChanges(const Repository& repo, const ChangeSet& changes,
                                                 SyncReport& report) {
  auto plan = buildCommitPlan(changes, classifier_);
  if (!plan.has_value()) {
    return std::unexpected(StepFailure{SyncPhase::kCommit, plan.error(),
                                       "Inspect " + gitHint(repo, "status")});
  }

  transition(repo, report, SyncState::kCommitting, plan->message);

  auto added = git_.addAll(repo);
  if (!added.has_value()) {
    return std::unexpected(StepFailure{SyncPhase::kCommit, added.error(),
                                       "Stage and commit manually: " + gitHint(repo, "status")});
  }

  auto commit = git_.commit(repo, plan->message);
  if (!commit.has_value()) {
    return std::unexpected(StepFailure{SyncPhase::kCommit, commit.error(),
                                       "Stage and commit manually: " + gitHint(repo, "status")});
  }

  report.commit_message = plan->message;
  spdlog::info("[{}] committed {} file(s): {}", repo.name, changes.size(), plan->message);
  return {};
}

SyncEngine::StepResult SyncEngine::pullWithRecovery(const Repository& repo, SyncReport& report,
                                                    int retry_count) {
  const std::string target = repo.remote_name + "/" + repo.default_branch;
  const std::string manual_pull = gitHint(repo, "pull --rebase " + repo.remote_name + " " +
                                                    repo.default_branch);

  transition(repo, report, SyncState::kPullingRebase, target);
  auto first = git_.pullRebase(repo);
  if (first.has_value()) {
    report.attempts.push_back({SyncPhase::kPull, AttemptOutcome::kOk, retry_count, ""});
    return {};
  }
  report.attempts.push_back({SyncPhase::kPull, outcomeFor(first.error()), retry_count,
                             first.error().message()});

  // A hung remote will not get better by stashing
  if (first.error().code() == ErrorCode::kTimeout) {
    auto aborted = git_.abortRebase(repo);
    if (!aborted.has_value()) {
      spdlog::warn("[{}] {}", repo.name, aborted.error().message());
    }
    return std::unexpected(StepFailure{SyncPhase::kPull, first.error(),
                                       "Check network access to remote '" + repo.remote_name + "'"});
  }

  transition(repo, report, SyncState::kConflictRecovery,
             "pull failed, stashing local changes and retrying");

  auto aborted = git_.abortRebase(repo);
  if (!aborted.has_value()) {
    return std::unexpected(StepFailure{SyncPhase::kPull, aborted.error(),
                                       "Abort the rebase manually: " + gitHint(repo, "rebase --abort")});
  }

  const std::string stash_message =
      "pkbsync recovery " + util::Time::compactStamp(util::Time::now());
  auto stashed = git_.stashPush(repo, stash_message);
  if (!stashed.has_value()) {
    return std::unexpected(StepFailure{SyncPhase::kStash, stashed.error(),
                                       "Inspect " + gitHint(repo, "status") + " and pull manually"});
  }
  if (*stashed) {
    report.stash_message = stash_message;
  }

  transition(repo, report, SyncState::kPullingRebase, target + " (after stash)");
  auto second = git_.pullRebase(repo);
  if (!second.has_value()) {
    report.attempts.push_back({SyncPhase::kPull, outcomeFor(second.error()), retry_count,
                               second.error().message()});

    auto abort_again = git_.abortRebase(repo);
    if (!abort_again.has_value()) {
      spdlog::error("[{}] {}", repo.name, abort_again.error().message());
    }

    std::string next = "Resolve manually: " + manual_pull;
    if (*stashed) {
      next += "; local changes are preserved in stash '" + stash_message + "' (" +
              gitHint(repo, "stash list") + ")";
    }
    return std::unexpected(StepFailure{SyncPhase::kPull, second.error(), next});
  }
  report.attempts.push_back({SyncPhase::kPull, AttemptOutcome::kOk, retry_count, "after stash"});

  if (*stashed) {
    auto popped = git_.stashPop(repo);
    if (!popped.has_value()) {
      return std::unexpected(StepFailure{
          SyncPhase::kStash, popped.error(),
          "Your changes are preserved in stash '" + stash_message + "'. Run " +
              gitHint(repo, "status") + ", resolve the conflicted files, then " +
              gitHint(repo, "stash drop") + " once the changes are re-applied"});
    }
    report.stash_message.clear();
  }

  return {};
}

SyncEngine::StepResult SyncEngine::pushWithRetry(const Repository& repo, SyncReport& report) {
  const int max_attempts = policy_.max_push_attempts;
  const std::string target = repo.remote_name + "/" + repo.default_branch;

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    SyncState state = attempt == 1 ? SyncState::kPushing : SyncState::kPushRetry;
    transition(repo, report, state,
               target + " (attempt " + std::to_string(attempt) + "/" +
                   std::to_string(max_attempts) + ")");

    auto pushed = git_.push(repo);
    if (pushed.has_value()) {
      report.attempts.push_back({SyncPhase::kPush, AttemptOutcome::kOk, attempt - 1, ""});
      std::string detail = report.commit_message.value_or("pushed");
      transition(repo, report, SyncState::kDone, detail);
      return {};
    }

    report.attempts.push_back({SyncPhase::kPush, outcomeFor(pushed.error()), attempt - 1,
                               pushed.error().message()});

    if (pushed.error().code() != ErrorCode::kPushRejected) {
      return std::unexpected(StepFailure{SyncPhase::kPush, pushed.error(),
                                         "Check network access and credentials for remote '" +
                                             repo.remote_name + "', then sync again"});
    }

    if (attempt == max_attempts) {
      return std::unexpected(StepFailure{
          SyncPhase::kPush,
          makeError(ErrorCode::kPushRejected,
                    "Push rejected " + std::to_string(max_attempts) + " times: " +
                        pushed.error().message()),
          "The remote keeps diverging; run " +
              gitHint(repo, "pull --rebase " + repo.remote_name + " " + repo.default_branch) +
              " and push manually"});
    }

    auto pulled = pullWithRecovery(repo, report, attempt);
    if (!pulled.has_value()) {
      return pulled;
    }
  }

  return {};
}

}  // namespace pkbsync::sync
