#pragma once

#include <string>
#include <vector>

#include "pkbsync/common.hpp"
#include "pkbsync/sync/category_classifier.hpp"
#include "pkbsync/sync/change_set.hpp"

namespace pkbsync::sync {

struct ClassifiedPath {
  std::string path;
  Category category;
};

/**
 * @brief The single commit produced for a ChangeSet
 */
struct CommitPlan {
  ChangeSet files;
  std::string message;
};

/**
 * @brief Compose a commit message for classified paths
 *
 * One file gives "<category>: <detail>"; several give
 * "sync: <n> files (<sorted unique category names>)".
 *
 * @return Message, or kEmptyCommitPlan for empty input
 */
Result<std::string> composeCommitMessage(const std::vector<ClassifiedPath>& changes);

/**
 * @brief Classify every path of a ChangeSet and compose its message
 * @return Plan, or kEmptyCommitPlan for an empty ChangeSet
 */
Result<CommitPlan> buildCommitPlan(const ChangeSet& changes, const CategoryClassifier& classifier);

}  // namespace pkbsync::sync
