#include "pkbsync/sync/commit_message.hpp"

#include <set>
#include <sstream>

namespace pkbsync::sync {

Result<std::string> composeCommitMessage(const std::vector<ClassifiedPath>& changes) {
  if (changes.empty()) {
    return std::unexpected(makeError(ErrorCode::kEmptyCommitPlan,
                                     "Cannot compose a commit message for an empty change set"));
  }

  if (changes.size() == 1) {
    return changes.front().category.label();
  }

  std::set<std::string> names;
  for (const auto& change : changes) {
    names.insert(change.category.name);
  }

  std::ostringstream message;
  message << "sync: " << changes.size() << " files (";
  bool first = true;
  for (const auto& name : names) {
    if (!first) {
      message << ", ";
    }
    message << name;
    first = false;
  }
  message << ")";

  return message.str();
}

Result<CommitPlan> buildCommitPlan(const ChangeSet& changes, const CategoryClassifier& classifier) {
  std::vector<ClassifiedPath> classified;
  for (const auto& path : changes.paths()) {
    classified.push_back({path, classifier.classify(path)});
  }

  auto message = composeCommitMessage(classified);
  if (!message.has_value()) {
    return std::unexpected(message.error());
  }

  return CommitPlan{changes, std::move(*message)};
}

}  // namespace pkbsync::sync
