#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pkbsync/common.hpp"
#include "pkbsync/sync/repository.hpp"
#include "pkbsync/util/safe_process.hpp"

namespace pkbsync::sync {

/**
 * @brief Commits ahead of and behind the remote branch
 */
struct AheadBehind {
  int ahead = 0;
  int behind = 0;
};

/**
 * @brief Git primitives used by the scanner and the sync engine
 *
 * Every operation names the repository it acts on, so one instance serves
 * all repositories of a cycle. Failures are classified through ErrorCode:
 * kRebaseConflict, kPushRejected, kStashConflict and kTimeout carry meaning
 * for the sync state machine; anything else is reported as kGitError.
 */
class GitOperations {
public:
  virtual ~GitOperations() = default;

  /**
   * @brief Top-level directory of the working copy containing repo.path
   * @return Path, or kNotARepository
   */
  virtual Result<std::filesystem::path> topLevel(const Repository& repo) const = 0;

  /**
   * @brief Raw `git status --porcelain=v1 -z --untracked-files=all` output
   */
  virtual Result<std::string> statusPorcelain(const Repository& repo) const = 0;

  /**
   * @brief Name of an unfinished merge/rebase/cherry-pick/revert, if any
   */
  virtual Result<std::optional<std::string>> inProgressOperation(const Repository& repo) const = 0;

  /**
   * @brief Stage every change, including deletions and untracked files
   */
  virtual Result<void> addAll(const Repository& repo) = 0;

  /**
   * @brief Commit the index with the given message
   */
  virtual Result<void> commit(const Repository& repo, const std::string& message) = 0;

  /**
   * @brief Fetch the remote branch and rebase local commits on top
   * @return kRebaseConflict when the rebase stopped on a conflict
   */
  virtual Result<void> pullRebase(const Repository& repo) = 0;

  /**
   * @brief Abort a rebase left in progress; succeeds when none is
   */
  virtual Result<void> abortRebase(const Repository& repo) = 0;

  /**
   * @brief Shelve uncommitted changes including untracked files
   * @return true when a stash entry was created, false when there was nothing to save
   */
  virtual Result<bool> stashPush(const Repository& repo, const std::string& message) = 0;

  /**
   * @brief Re-apply and drop the newest stash entry
   * @return kStashConflict when re-applying conflicts (the entry is kept)
   */
  virtual Result<void> stashPop(const Repository& repo) = 0;

  /**
   * @brief Push HEAD to the remote default branch
   * @return kPushRejected when the remote has diverged
   */
  virtual Result<void> push(const Repository& repo) = 0;

  /**
   * @brief Update remote-tracking refs without touching the working tree
   */
  virtual Result<void> fetch(const Repository& repo) = 0;

  /**
   * @brief Compare HEAD with <remote>/<default_branch>
   */
  virtual Result<AheadBehind> aheadBehind(const Repository& repo) const = 0;
};

/**
 * @brief Hard timeouts applied to spawned git commands
 */
struct GitTimeouts {
  std::chrono::milliseconds network{std::chrono::seconds(120)};  // fetch, pull, push
  std::chrono::milliseconds rebase{std::chrono::seconds(60)};    // abort, stash
  std::chrono::milliseconds local{std::chrono::seconds(30)};     // status, add, commit
};

/**
 * @brief GitOperations implemented with the git command line via SafeProcess
 */
class GitCli : public GitOperations {
public:
  explicit GitCli(GitTimeouts timeouts = {});

  Result<std::filesystem::path> topLevel(const Repository& repo) const override;
  Result<std::string> statusPorcelain(const Repository& repo) const override;
  Result<std::optional<std::string>> inProgressOperation(const Repository& repo) const override;
  Result<void> addAll(const Repository& repo) override;
  Result<void> commit(const Repository& repo, const std::string& message) override;
  Result<void> pullRebase(const Repository& repo) override;
  Result<void> abortRebase(const Repository& repo) override;
  Result<bool> stashPush(const Repository& repo, const std::string& message) override;
  Result<void> stashPop(const Repository& repo) override;
  Result<void> push(const Repository& repo) override;
  Result<void> fetch(const Repository& repo) override;
  Result<AheadBehind> aheadBehind(const Repository& repo) const override;

  /**
   * @brief Check if git is available in PATH
   */
  static bool isAvailable();

  /**
   * @brief Make git non-interactive for unattended runs (no prompts, no editor)
   */
  static void prepareEnvironment();

private:
  GitTimeouts timeouts_;

  Result<util::SafeProcess::ProcessResult> run(const Repository& repo,
                                               const std::vector<std::string>& args,
                                               std::chrono::milliseconds timeout) const;

  Result<std::filesystem::path> gitDir(const Repository& repo) const;

  // Object id of refs/stash, empty when there is no stash
  Result<std::string> stashTop(const Repository& repo) const;
};

}  // namespace pkbsync::sync
