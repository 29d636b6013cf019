#pragma once

#include <sys/types.h>

#include <filesystem>

namespace pkbsync::util {

// Signal-driven cleanup for a short-lived sync process.
//
// On SIGINT, SIGTERM or SIGHUP the handler terminates the git child that is
// currently running, unlinks every registered lock file and exits with
// 128 + signo. Only async-signal-safe calls are made from the handler.
class Termination {
 public:
  // Maximum number of lock files tracked at once
  static constexpr int kMaxLockFiles = 8;

  static void installHandlers();

  // pid of the child currently being waited on, 0 when none
  static void setActiveChild(pid_t pid);

  // Returns false when the path is too long or all slots are in use
  static bool registerLockFile(const std::filesystem::path& path);
  static void unregisterLockFile(const std::filesystem::path& path);

  // Number of lock files currently registered (for tests)
  static int registeredLockFiles();

 private:
  Termination() = default;
};

}  // namespace pkbsync::util
