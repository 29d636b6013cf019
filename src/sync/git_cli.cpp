#include "pkbsync/sync/git_operations.hpp"

#include <cstdlib>
#include <map>
#include <sstream>

#include <spdlog/spdlog.h>

namespace pkbsync::sync {

namespace {
  bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
  }

  std::string trim(std::string str) {
    while (!str.empty() && (str.back() == '\n' || str.back() == '\r' || str.back() == ' ')) {
      str.pop_back();
    }
    size_t start = str.find_first_not_of(" \n\r\t");
    return start == std::string::npos ? std::string{} : str.substr(start);
  }

  // Combined output for error messages; git reports on both streams
  std::string describe(const util::SafeProcess::ProcessResult& result) {
    std::string text = trim(result.stderr_output);
    std::string out = trim(result.stdout_output);
    if (!out.empty()) {
      text = text.empty() ? out : text + "\n" + out;
    }
    return text.empty() ? "exit code " + std::to_string(result.exit_code) : text;
  }

  // git's own messages are matched below, so they must stay untranslated
  const std::map<std::string, std::string> kGitEnvironment = {
    {"LC_ALL", "C"},
    {"LANGUAGE", "C"},
  };

  Error gitFailure(ErrorCode code, const std::string& action, const Repository& repo,
                   const util::SafeProcess::ProcessResult& result) {
    return makeError(code, action + " failed in " + repo.path.string() + ": " + describe(result));
  }
}

GitCli::GitCli(GitTimeouts timeouts) : timeouts_(timeouts) {}

bool GitCli::isAvailable() {
  return util::SafeProcess::commandExists("git");
}

void GitCli::prepareEnvironment() {
  // Never wait on a credential prompt or an editor when running from cron
  setenv("GIT_TERMINAL_PROMPT", "0", 1);
  setenv("GIT_EDITOR", "true", 1);
  setenv("GIT_MERGE_AUTOEDIT", "no", 1);
}

Result<util::SafeProcess::ProcessResult> GitCli::run(const Repository& repo,
                                                     const std::vector<std::string>& args,
                                                     std::chrono::milliseconds timeout) const {
  std::ostringstream line;
  line << "git";
  for (const auto& arg : args) {
    line << ' ' << arg;
  }
  spdlog::debug("[{}] {}", repo.name, line.str());

  auto result = util::SafeProcess::execute("git", args, repo.path.string(), timeout,
                                             kGitEnvironment);
  if (!result.has_value()) {
    if (result.error().code() == ErrorCode::kTimeout) {
      return std::unexpected(makeError(ErrorCode::kTimeout,
                                       line.str() + " timed out in " + repo.path.string()));
    }
    return std::unexpected(result.error());
  }

  if (!result->success() && !result->stderr_output.empty()) {
    spdlog::debug("[{}] git exited with {}: {}", repo.name, result->exit_code,
                  trim(result->stderr_output));
  }
  return result;
}

Result<std::filesystem::path> GitCli::topLevel(const Repository& repo) const {
  std::error_code ec;
  if (!std::filesystem::is_directory(repo.path, ec)) {
    return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                     "Repository path does not exist: " + repo.path.string()));
  }

  auto result = run(repo, {"rev-parse", "--show-toplevel"}, timeouts_.local);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(makeError(ErrorCode::kNotARepository,
                                     "Not a git repository: " + repo.path.string()));
  }
  return std::filesystem::path(trim(result->stdout_output));
}

Result<std::string> GitCli::statusPorcelain(const Repository& repo) const {
  auto result = run(repo, {"status", "--porcelain=v1", "-z", "--untracked-files=all"},
                    timeouts_.local);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(gitFailure(ErrorCode::kGitError, "git status", repo, *result));
  }
  return result->stdout_output;
}

Result<std::filesystem::path> GitCli::gitDir(const Repository& repo) const {
  auto result = run(repo, {"rev-parse", "--absolute-git-dir"}, timeouts_.local);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(makeError(ErrorCode::kNotARepository,
                                     "Not a git repository: " + repo.path.string()));
  }
  return std::filesystem::path(trim(result->stdout_output));
}

Result<std::optional<std::string>> GitCli::inProgressOperation(const Repository& repo) const {
  auto git_dir = gitDir(repo);
  if (!git_dir.has_value()) {
    return std::unexpected(git_dir.error());
  }

  static const std::pair<const char*, const char*> kMarkers[] = {
    {"rebase-merge", "rebase"},
    {"rebase-apply", "rebase"},
    {"MERGE_HEAD", "merge"},
    {"CHERRY_PICK_HEAD", "cherry-pick"},
    {"REVERT_HEAD", "revert"},
  };

  std::error_code ec;
  for (const auto& [marker, operation] : kMarkers) {
    if (std::filesystem::exists(*git_dir / marker, ec)) {
      return std::optional<std::string>(operation);
    }
  }
  return std::optional<std::string>();
}

Result<void> GitCli::addAll(const Repository& repo) {
  auto result = run(repo, {"add", "-A"}, timeouts_.local);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(gitFailure(ErrorCode::kGitError, "git add", repo, *result));
  }
  return {};
}

Result<void> GitCli::commit(const Repository& repo, const std::string& message) {
  auto result = run(repo, {"commit", "-m", message}, timeouts_.local);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(gitFailure(ErrorCode::kGitError, "git commit", repo, *result));
  }
  return {};
}

Result<void> GitCli::pullRebase(const Repository& repo) {
  auto result = run(repo, {"pull", "--rebase", repo.remote_name, repo.default_branch},
                    timeouts_.network);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (result->success()) {
    return {};
  }

  std::string output = result->stdout_output + result->stderr_output;
  auto in_progress = inProgressOperation(repo);
  bool rebase_stopped = in_progress.has_value() && in_progress->has_value() &&
                        **in_progress == "rebase";
  if (rebase_stopped || contains(output, "CONFLICT") || contains(output, "could not apply")) {
    return std::unexpected(gitFailure(ErrorCode::kRebaseConflict, "git pull --rebase", repo, *result));
  }
  return std::unexpected(gitFailure(ErrorCode::kGitError, "git pull --rebase", repo, *result));
}

Result<void> GitCli::abortRebase(const Repository& repo) {
  auto in_progress = inProgressOperation(repo);
  if (!in_progress.has_value()) {
    return std::unexpected(in_progress.error());
  }
  if (!in_progress->has_value() || **in_progress != "rebase") {
    return {};
  }

  auto result = run(repo, {"rebase", "--abort"}, timeouts_.rebase);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(gitFailure(ErrorCode::kGitError, "git rebase --abort", repo, *result));
  }
  return {};
}

Result<std::string> GitCli::stashTop(const Repository& repo) const {
  auto result = run(repo, {"rev-parse", "-q", "--verify", "refs/stash"}, timeouts_.local);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  // Exit code 1 with -q means the ref does not exist
  return result->success() ? trim(result->stdout_output) : std::string{};
}

Result<bool> GitCli::stashPush(const Repository& repo, const std::string& message) {
  auto before = stashTop(repo);
  if (!before.has_value()) {
    return std::unexpected(before.error());
  }

  auto result = run(repo, {"stash", "push", "--include-untracked", "-m", message},
                    timeouts_.rebase);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(gitFailure(ErrorCode::kGitError, "git stash push", repo, *result));
  }

  auto after = stashTop(repo);
  if (!after.has_value()) {
    return std::unexpected(after.error());
  }
  return !after->empty() && *after != *before;
}

Result<void> GitCli::stashPop(const Repository& repo) {
  auto result = run(repo, {"stash", "pop"}, timeouts_.rebase);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(gitFailure(ErrorCode::kStashConflict, "git stash pop", repo, *result));
  }
  return {};
}

Result<void> GitCli::push(const Repository& repo) {
  auto result = run(repo, {"push", "--porcelain", repo.remote_name, "HEAD:" + repo.default_branch},
                    timeouts_.network);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (result->success()) {
    return {};
  }

  // Porcelain ref lines look like "!<TAB>HEAD:refs/heads/main<TAB>[rejected] (fetch first)"
  bool rejected = false;
  std::istringstream lines(result->stdout_output);
  for (std::string line; std::getline(lines, line);) {
    if (line.starts_with("!\t") && contains(line, "[rejected]")) {
      rejected = true;
    }
  }
  const std::string& err = result->stderr_output;
  if (rejected || contains(err, "[rejected]") || contains(err, "Updates were rejected")) {
    return std::unexpected(gitFailure(ErrorCode::kPushRejected, "git push", repo, *result));
  }
  return std::unexpected(gitFailure(ErrorCode::kGitError, "git push", repo, *result));
}

Result<void> GitCli::fetch(const Repository& repo) {
  auto result = run(repo, {"fetch", repo.remote_name, repo.default_branch}, timeouts_.network);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(gitFailure(ErrorCode::kGitError, "git fetch", repo, *result));
  }
  return {};
}

Result<AheadBehind> GitCli::aheadBehind(const Repository& repo) const {
  std::string range = "HEAD..." + repo.remote_name + "/" + repo.default_branch;
  auto result = run(repo, {"rev-list", "--left-right", "--count", range}, timeouts_.local);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->success()) {
    return std::unexpected(gitFailure(ErrorCode::kGitError, "git rev-list", repo, *result));
  }

  AheadBehind counts;
  std::istringstream stream(result->stdout_output);
  if (!(stream >> counts.ahead >> counts.behind)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Unexpected rev-list output: " + trim(result->stdout_output)));
  }
  return counts;
}

}  // namespace pkbsync::sync
