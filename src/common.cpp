#include "pkbsync/common.hpp"

#include <sstream>

#ifndef PKBSYNC_VERSION_MAJOR
#define PKBSYNC_VERSION_MAJOR 0
#define PKBSYNC_VERSION_MINOR 1
#define PKBSYNC_VERSION_PATCH 0
#endif

namespace pkbsync {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kDirectoryNotFound:
      return "Directory not found";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kGitError:
      return "Git error";
    case ErrorCode::kNotARepository:
      return "Not a repository";
    case ErrorCode::kConflictInProgress:
      return "Conflict in progress";
    case ErrorCode::kRebaseConflict:
      return "Rebase conflict";
    case ErrorCode::kPushRejected:
      return "Push rejected";
    case ErrorCode::kStashConflict:
      return "Stash conflict";
    case ErrorCode::kEmptyCommitPlan:
      return "Empty commit plan";
    case ErrorCode::kLockError:
      return "Lock error";
    case ErrorCode::kExternalToolError:
      return "External tool error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kProcessError:
      return "Process error";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kNotFound:
      return "Not found";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef PKBSYNC_VERSION_BUILD
  return Version{PKBSYNC_VERSION_MAJOR, PKBSYNC_VERSION_MINOR, PKBSYNC_VERSION_PATCH,
                 PKBSYNC_VERSION_BUILD};
#else
  return Version{PKBSYNC_VERSION_MAJOR, PKBSYNC_VERSION_MINOR, PKBSYNC_VERSION_PATCH, ""};
#endif
}

}  // namespace pkbsync
