#include "pkbsync/sync/orchestrator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace pkbsync::sync {

std::string syncModeToString(SyncMode mode) {
  switch (mode) {
    case SyncMode::kQuick: return "quick";
    case SyncMode::kFull: return "full";
  }
  return "full";
}

Result<SyncMode> stringToSyncMode(const std::string& str) {
  if (str == "quick") return SyncMode::kQuick;
  if (str == "full") return SyncMode::kFull;
  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "Unknown sync mode: " + str + " (expected full or quick)"));
}

int OrchestratorReport::failedCount() const {
  return static_cast<int>(std::count_if(repositories.begin(), repositories.end(),
                                        [](const SyncReport& r) { return r.failed(); }));
}

int OrchestratorReport::exitCode() const {
  return failedCount() > 0 ? 1 : 0;
}

int StatusReport::exitCode() const {
  bool any_error = std::any_of(repositories.begin(), repositories.end(),
                               [](const RepositoryStatus& s) { return s.error.has_value(); });
  return any_error ? 1 : 0;
}

SyncOrchestrator::SyncOrchestrator(SyncEngine& engine, ArtifactGenerator* artifacts)
  : engine_(engine), artifacts_(artifacts) {}

OrchestratorReport SyncOrchestrator::run(const std::vector<Repository>& repositories,
                                         SyncMode mode) {
  OrchestratorReport report;
  report.mode = mode;

  spdlog::info("Starting {} sync of {} repositories", syncModeToString(mode), repositories.size());

  for (const auto& repo : repositories) {
    SyncReport result = engine_.run(repo);

    if (mode == SyncMode::kFull && repo.primary && artifacts_ != nullptr &&
        result.final_state == SyncState::kDone) {
      report.artifacts_attempted = true;
      auto generated = artifacts_->generate(repo);
      if (!generated.has_value()) {
        spdlog::warn("[{}] artifact regeneration failed: {}", repo.name,
                     generated.error().message());
        report.artifact_error = generated.error();
      }
    }

    report.repositories.push_back(std::move(result));
  }

  int failed = report.failedCount();
  if (failed > 0) {
    spdlog::warn("{} of {} repositories failed to sync", failed, repositories.size());
  } else {
    spdlog::info("All {} repositories synced", repositories.size());
  }
  return report;
}

StatusReport SyncOrchestrator::status(GitOperations& git,
                                      const std::vector<Repository>& repositories, bool fetch) {
  StatusReport report;
  ChangeScanner scanner(git);

  for (const auto& repo : repositories) {
    RepositoryStatus status;
    status.name = repo.name;
    status.path = repo.path.string();

    auto scan = scanner.scan(repo);
    if (!scan.has_value()) {
      status.error = scan.error();
      report.repositories.push_back(std::move(status));
      continue;
    }
    status.outcome = scan->outcome;
    status.changed_files = scan->changes.size();
    status.operation = scan->operation;

    if (fetch) {
      auto fetched = git.fetch(repo);
      if (!fetched.has_value()) {
        spdlog::warn("[{}] fetch failed, ahead/behind may be stale: {}", repo.name,
                     fetched.error().message());
      }
    }

    auto counts = git.aheadBehind(repo);
    if (counts.has_value()) {
      status.ahead_behind = *counts;
    } else {
      spdlog::debug("[{}] {}", repo.name, counts.error().message());
    }

    report.repositories.push_back(std::move(status));
  }
  return report;
}

}  // namespace pkbsync::sync
