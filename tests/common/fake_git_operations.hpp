#pragma once

#include <algorithm>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "pkbsync/sync/git_operations.hpp"

namespace pkbsync::test {

// Scripted GitOperations: each queue entry answers one call, an empty queue means success.
// Every call is recorded in calls() as "add", "commit:<msg>", "pull", "abort",
// "stash-push:<msg>", "stash-pop", "push", "fetch".
class FakeGitOperations : public sync::GitOperations {
 public:
  std::string status_output;
  std::optional<std::string> in_progress;
  std::optional<std::filesystem::path> top_level;  // default: repo.path
  std::optional<Error> top_level_error;

  Result<void> add_result;
  Result<void> commit_result;
  std::deque<Result<void>> pull_results;
  std::deque<Result<void>> push_results;
  std::deque<Result<bool>> stash_push_results;  // default: a stash entry was created
  std::deque<Result<void>> stash_pop_results;
  Result<sync::AheadBehind> ahead_behind = sync::AheadBehind{0, 0};

  static Error error(ErrorCode code, const std::string& message = "scripted failure") {
    return makeError(code, message);
  }

  static Result<void> failure(ErrorCode code, const std::string& message = "scripted failure") {
    return std::unexpected(error(code, message));
  }

  const std::vector<std::string>& calls() const { return calls_; }

  int count(const std::string& prefix) const {
    return static_cast<int>(std::count_if(calls_.begin(), calls_.end(), [&](const std::string& c) {
      return c.rfind(prefix, 0) == 0;
    }));
  }

  Result<std::filesystem::path> topLevel(const sync::Repository& repo) const override {
    if (top_level_error.has_value()) {
      return std::unexpected(*top_level_error);
    }
    return top_level.value_or(repo.path);
  }

  Result<std::string> statusPorcelain(const sync::Repository&) const override {
    return status_output;
  }

  Result<std::optional<std::string>> inProgressOperation(const sync::Repository&) const override {
    return in_progress;
  }

  Result<void> addAll(const sync::Repository&) override {
    calls_.push_back("add");
    return add_result;
  }

  Result<void> commit(const sync::Repository&, const std::string& message) override {
    calls_.push_back("commit:" + message);
    return commit_result;
  }

  Result<void> pullRebase(const sync::Repository&) override {
    calls_.push_back("pull");
    return next(pull_results);
  }

  Result<void> abortRebase(const sync::Repository&) override {
    calls_.push_back("abort");
    return {};
  }

  Result<bool> stashPush(const sync::Repository&, const std::string& message) override {
    calls_.push_back("stash-push:" + message);
    if (stash_push_results.empty()) {
      return true;
    }
    auto result = stash_push_results.front();
    stash_push_results.pop_front();
    return result;
  }

  Result<void> stashPop(const sync::Repository&) override {
    calls_.push_back("stash-pop");
    return next(stash_pop_results);
  }

  Result<void> push(const sync::Repository&) override {
    calls_.push_back("push");
    return next(push_results);
  }

  Result<void> fetch(const sync::Repository&) override {
    calls_.push_back("fetch");
    return {};
  }

  Result<sync::AheadBehind> aheadBehind(const sync::Repository&) const override {
    return ahead_behind;
  }

 private:
  std::vector<std::string> calls_;

  static Result<void> next(std::deque<Result<void>>& queue) {
    if (queue.empty()) {
      return {};
    }
    auto result = queue.front();
    queue.pop_front();
    return result;
  }
};

}  // namespace pkbsync::test
