#pragma once

#include <string>
#include <vector>

namespace pkbsync::sync {

/**
 * @brief Local mutations of a working copy relative to HEAD
 *
 * Empty if and only if the index and working tree are clean and there are
 * no untracked (non-ignored) files.
 */
struct ChangeSet {
  std::vector<std::string> modified;   // tracked paths with staged or unstaged differences
  std::vector<std::string> untracked;  // paths not yet tracked

  bool empty() const { return modified.empty() && untracked.empty(); }

  // Sorted, de-duplicated union of modified and untracked
  std::vector<std::string> paths() const;

  size_t size() const { return paths().size(); }
};

}  // namespace pkbsync::sync
