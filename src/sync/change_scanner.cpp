#include "pkbsync/sync/change_scanner.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace pkbsync::sync {

namespace {
  bool isUnmerged(char x, char y) {
    // DD, AU, UD, UA, DU, AA, UU
    return x == 'U' || y == 'U' || (x == 'D' && y == 'D') || (x == 'A' && y == 'A');
  }

  std::filesystem::path canonicalOrSelf(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : canonical;
  }
}

std::vector<std::string> ChangeSet::paths() const {
  std::vector<std::string> all;
  all.reserve(modified.size() + untracked.size());
  all.insert(all.end(), modified.begin(), modified.end());
  all.insert(all.end(), untracked.begin(), untracked.end());

  std::sort(all.begin(), all.end());
  all.erase(std::unique(all.begin(), all.end()), all.end());
  all.erase(std::remove(all.begin(), all.end(), std::string()), all.end());
  return all;
}

std::string scanOutcomeToString(ScanOutcome outcome) {
  switch (outcome) {
    case ScanOutcome::kClean: return "clean";
    case ScanOutcome::kDirty: return "dirty";
    case ScanOutcome::kConflictInProgress: return "conflict-in-progress";
  }
  return "unknown";
}

Result<PorcelainStatus> parsePorcelainStatus(std::string_view output) {
  PorcelainStatus status;

  size_t pos = 0;
  while (pos < output.size()) {
    size_t end = output.find('\0', pos);
    if (end == std::string_view::npos) {
      end = output.size();
    }
    std::string_view record = output.substr(pos, end - pos);
    pos = end + 1;

    if (record.empty()) {
      continue;
    }
    if (record.size() < 4 || record[2] != ' ') {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Malformed status record: " + std::string(record)));
    }

    char x = record[0];
    char y = record[1];
    std::string path(record.substr(3));

    // Renames and copies are followed by a separate record holding the source path
    if (x == 'R' || x == 'C' || y == 'R' || y == 'C') {
      size_t source_end = output.find('\0', pos);
      pos = source_end == std::string_view::npos ? output.size() : source_end + 1;
    }

    if (x == '!' && y == '!') {
      continue;
    }
    if (x == '?' && y == '?') {
      status.changes.untracked.push_back(std::move(path));
      continue;
    }
    if (isUnmerged(x, y)) {
      status.has_unmerged = true;
    }
    status.changes.modified.push_back(std::move(path));
  }

  return status;
}

ChangeScanner::ChangeScanner(const GitOperations& git) : git_(git) {}

Result<ScanResult> ChangeScanner::scan(const Repository& repo) const {
  auto top = git_.topLevel(repo);
  if (!top.has_value()) {
    return std::unexpected(top.error());
  }
  if (canonicalOrSelf(*top) != canonicalOrSelf(repo.path)) {
    return std::unexpected(makeError(ErrorCode::kNotARepository,
                                     repo.path.string() + " is not the top level of a working copy (" +
                                     top->string() + " is)"));
  }

  ScanResult result;

  auto operation = git_.inProgressOperation(repo);
  if (!operation.has_value()) {
    return std::unexpected(operation.error());
  }
  if (operation->has_value()) {
    result.outcome = ScanOutcome::kConflictInProgress;
    result.operation = **operation;
    return result;
  }

  auto raw = git_.statusPorcelain(repo);
  if (!raw.has_value()) {
    return std::unexpected(raw.error());
  }

  auto status = parsePorcelainStatus(*raw);
  if (!status.has_value()) {
    return std::unexpected(status.error());
  }

  result.changes = std::move(status->changes);
  if (status->has_unmerged) {
    result.outcome = ScanOutcome::kConflictInProgress;
    result.operation = "merge";
  } else {
    result.outcome = result.changes.empty() ? ScanOutcome::kClean : ScanOutcome::kDirty;
  }

  spdlog::debug("[{}] scan: {} ({} modified, {} untracked)", repo.name,
                scanOutcomeToString(result.outcome), result.changes.modified.size(),
                result.changes.untracked.size());
  return result;
}

}  // namespace pkbsync::sync
