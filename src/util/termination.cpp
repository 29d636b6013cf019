#include "pkbsync/util/termination.hpp"

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <climits>
#include <cstring>

namespace pkbsync::util {

namespace {
  // claimed reserves the slot for a writer; armed makes it visible to the handler
  struct LockSlot {
    std::atomic<bool> claimed{false};
    std::atomic<bool> armed{false};
    char path[PATH_MAX];
  };

  LockSlot lock_slots[Termination::kMaxLockFiles];
  std::atomic<pid_t> active_child{0};

  void handleTermination(int signo) {
    pid_t child = active_child.load();
    if (child > 0) {
      kill(child, SIGTERM);
    }

    for (auto& slot : lock_slots) {
      if (slot.armed.load()) {
        unlink(slot.path);
        slot.armed.store(false);
      }
    }

    _exit(128 + signo);
  }
}

void Termination::installHandlers() {
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = handleTermination;
  sigemptyset(&action.sa_mask);

  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
  sigaction(SIGHUP, &action, nullptr);
}

void Termination::setActiveChild(pid_t pid) {
  active_child.store(pid);
}

bool Termination::registerLockFile(const std::filesystem::path& path) {
  const std::string str = path.string();
  if (str.size() >= PATH_MAX) {
    return false;
  }

  for (auto& slot : lock_slots) {
    bool expected = false;
    if (slot.claimed.compare_exchange_strong(expected, true)) {
      std::memcpy(slot.path, str.c_str(), str.size() + 1);
      slot.armed.store(true);
      return true;
    }
  }
  return false;
}

void Termination::unregisterLockFile(const std::filesystem::path& path) {
  const std::string str = path.string();
  for (auto& slot : lock_slots) {
    if (slot.armed.load() && str == slot.path) {
      slot.armed.store(false);
      slot.claimed.store(false);
      return;
    }
  }
}

int Termination::registeredLockFiles() {
  int count = 0;
  for (const auto& slot : lock_slots) {
    if (slot.armed.load()) {
      ++count;
    }
  }
  return count;
}

}  // namespace pkbsync::util
