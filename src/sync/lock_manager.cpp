#include "pkbsync/sync/lock_manager.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "pkbsync/util/termination.hpp"
#include "pkbsync/util/time.hpp"
#include "pkbsync/util/xdg.hpp"

namespace pkbsync::sync {

namespace {
  constexpr const char* kLockSuffix = ".lock";
  constexpr const char* kReclaimSuffix = ".reclaim";

  // Distinguishes temporary files of concurrent attempts within one process
  std::atomic<uint64_t> temp_counter{0};

  // FNV-1a; stable across builds so separate binaries agree on lock names
  uint64_t fnv1a(std::string_view data) {
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : data) {
      hash ^= c;
      hash *= 1099511628211ULL;
    }
    return hash;
  }

  Error lockError(const std::string& message) {
    return makeError(ErrorCode::kLockError, message);
  }

  // Exclusive flock held for the lifetime of the object
  class ExclusiveFileLock {
  public:
    explicit ExclusiveFileLock(const std::filesystem::path& path) {
      fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
      if (fd_ < 0) {
        errno_ = errno;
        return;
      }
      while (flock(fd_, LOCK_EX) != 0) {
        if (errno != EINTR) {
          errno_ = errno;
          close(fd_);
          fd_ = -1;
          return;
        }
      }
    }

    ~ExclusiveFileLock() {
      if (fd_ >= 0) {
        close(fd_);
      }
    }

    ExclusiveFileLock(const ExclusiveFileLock&) = delete;
    ExclusiveFileLock& operator=(const ExclusiveFileLock&) = delete;

    bool held() const { return fd_ >= 0; }
    int error() const { return errno_; }

  private:
    int fd_ = -1;
    int errno_ = 0;
  };
}

// PosixProcessProbe

bool PosixProcessProbe::isAlive(pid_t pid) const {
  if (pid <= 0) {
    return false;
  }
  if (kill(pid, 0) == 0) {
    return true;
  }
  return errno != ESRCH;
}

// FileLockStore

FileLockStore::FileLockStore(std::filesystem::path directory)
  : directory_(std::move(directory)) {}

std::optional<std::filesystem::path> FileLockStore::pathFor(const std::string& key) const {
  return directory_ / (key + kLockSuffix);
}

Result<bool> FileLockStore::tryCreate(const std::string& key, const LockRecord& record) {
  if (!util::Xdg::ensureDirectory(directory_, std::filesystem::perms::owner_all)) {
    return std::unexpected(lockError("Failed to create lock directory: " + directory_.string()));
  }

  auto lock_path = *pathFor(key);
  auto temp_path = directory_ / (key + kLockSuffix + "." + std::to_string(getpid()) + "." +
                                 std::to_string(temp_counter.fetch_add(1)) + ".tmp");

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    return std::unexpected(lockError("Failed to create " + temp_path.string() + ": " +
                                     std::strerror(errno)));
  }

  std::string line = std::to_string(record.pid) + " " + record.acquired_at + "\n";
  ssize_t written = write(fd, line.data(), line.size());
  int write_errno = errno;
  close(fd);
  if (written != static_cast<ssize_t>(line.size())) {
    unlink(temp_path.c_str());
    return std::unexpected(lockError("Failed to write lock record: " +
                                     std::string(std::strerror(write_errno))));
  }

  // link() fails with EEXIST if another process holds the lock
  int link_result = link(temp_path.c_str(), lock_path.c_str());
  int link_errno = errno;
  unlink(temp_path.c_str());

  if (link_result == 0) {
    return true;
  }
  if (link_errno == EEXIST) {
    return false;
  }
  return std::unexpected(lockError("Failed to create lock " + lock_path.string() + ": " +
                                   std::strerror(link_errno)));
}

Result<std::optional<LockRecord>> FileLockStore::read(const std::string& key) const {
  auto lock_path = *pathFor(key);

  std::ifstream file(lock_path);
  if (!file.is_open()) {
    std::error_code ec;
    if (!std::filesystem::exists(lock_path, ec)) {
      return std::optional<LockRecord>();
    }
    return std::unexpected(lockError("Failed to open lock " + lock_path.string()));
  }

  LockRecord record;
  long pid = 0;
  if (!(file >> pid) || pid <= 0) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Corrupt lock record in " + lock_path.string()));
  }
  record.pid = static_cast<pid_t>(pid);
  file >> record.acquired_at;
  return std::optional<LockRecord>(record);
}

Result<void> FileLockStore::remove(const std::string& key) {
  std::error_code ec;
  std::filesystem::remove(*pathFor(key), ec);
  if (ec) {
    return std::unexpected(lockError("Failed to remove lock " + pathFor(key)->string() + ": " +
                                     ec.message()));
  }
  return {};
}

Result<bool> FileLockStore::reclaim(const std::string& key,
                                    const std::optional<LockRecord>& stale,
                                    const LockRecord& record) {
  if (!util::Xdg::ensureDirectory(directory_, std::filesystem::perms::owner_all)) {
    return std::unexpected(lockError("Failed to create lock directory: " + directory_.string()));
  }

  auto guard_path = directory_ / (key + kReclaimSuffix);
  ExclusiveFileLock guard(guard_path);
  if (!guard.held()) {
    return std::unexpected(lockError("Failed to lock " + guard_path.string() + ": " +
                                     std::strerror(guard.error())));
  }

  auto current = read(key);
  bool matches = stale.has_value()
                     ? current.has_value() && current->has_value() && **current == *stale
                     : !current.has_value() && current.error().code() == ErrorCode::kParseError;
  if (!matches) {
    return false;
  }

  auto removed = remove(key);
  if (!removed.has_value()) {
    return std::unexpected(removed.error());
  }
  return tryCreate(key, record);
}

// LockGuard

LockGuard::LockGuard(LockManager& manager, std::string key,
                     std::optional<std::filesystem::path> path)
  : manager_(&manager), key_(std::move(key)), path_(std::move(path)), held_(true) {
  if (path_.has_value() && !util::Termination::registerLockFile(*path_)) {
    spdlog::warn("Lock {} will not be removed if the process is interrupted", path_->string());
  }
}

LockGuard::~LockGuard() {
  auto result = release();
  if (!result.has_value()) {
    spdlog::error("Failed to release lock {}: {}", key_, result.error().message());
  }
}

LockGuard::LockGuard(LockGuard&& other) noexcept
  : manager_(other.manager_), key_(std::move(other.key_)), path_(std::move(other.path_)),
    held_(other.held_) {
  other.held_ = false;
}

LockGuard& LockGuard::operator=(LockGuard&& other) noexcept {
  if (this != &other) {
    auto result = release();
    if (!result.has_value()) {
      spdlog::error("Failed to release lock {}: {}", key_, result.error().message());
    }
    manager_ = other.manager_;
    key_ = std::move(other.key_);
    path_ = std::move(other.path_);
    held_ = other.held_;
    other.held_ = false;
  }
  return *this;
}

Result<void> LockGuard::release() {
  if (!held_) {
    return {};
  }
  held_ = false;

  if (path_.has_value()) {
    util::Termination::unregisterLockFile(*path_);
  }
  return manager_->release(key_);
}

// LockManager

LockManager::LockManager(LockStore& store, const ProcessProbe& probe, std::chrono::seconds lease)
  : store_(store), probe_(probe), lease_(lease) {}

std::string LockManager::lockKey(const Repository& repo) {
  std::string name;
  for (char c : repo.name) {
    unsigned char uc = static_cast<unsigned char>(c);
    name += (std::isalnum(uc) || c == '-' || c == '_') ? c : '_';
  }
  if (name.empty()) {
    name = "repo";
  }

  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(repo.path, ec);
  std::string path = ec ? repo.path.lexically_normal().string() : canonical.string();

  return fmt::format("{}-{:016x}", name, fnv1a(path));
}

bool LockManager::leaseExpired(const LockRecord& record) const {
  if (lease_.count() <= 0) {
    return false;
  }
  // Without a readable timestamp only the pid decides
  auto acquired = util::Time::fromRfc3339(record.acquired_at);
  if (!acquired.has_value()) {
    return false;
  }
  return util::Time::now() - *acquired > lease_;
}

bool LockManager::isStale(const Result<std::optional<LockRecord>>& record) const {
  if (!record.has_value()) {
    return record.error().code() == ErrorCode::kParseError;
  }
  if (!record->has_value()) {
    return false;
  }
  return !probe_.isAlive((*record)->pid) || leaseExpired(**record);
}

Result<std::optional<LockGuard>> LockManager::acquire(const Repository& repo) {
  return acquireKey(lockKey(repo));
}

Result<std::optional<LockGuard>> LockManager::acquireKey(const std::string& key) {
  LockRecord mine{getpid(), util::Time::toRfc3339(util::Time::now())};

  // A second pass follows a release or a reclaim lost to another acquirer
  for (int attempt = 0; attempt < 2; ++attempt) {
    auto created = store_.tryCreate(key, mine);
    if (!created.has_value()) {
      return std::unexpected(created.error());
    }
    if (*created) {
      spdlog::debug("Acquired lock {}", key);
      return std::optional<LockGuard>(std::in_place, *this, key, store_.pathFor(key));
    }

    auto existing = store_.read(key);
    if (!existing.has_value() && existing.error().code() != ErrorCode::kParseError) {
      return std::unexpected(existing.error());
    }
    if (existing.has_value() && !existing->has_value()) {
      // Released between our attempt and the read
      continue;
    }
    if (!isStale(existing)) {
      spdlog::debug("Lock {} is held by pid {}", key, (*existing)->pid);
      return std::optional<LockGuard>();
    }

    std::optional<LockRecord> stale;
    if (existing.has_value()) {
      stale = **existing;
      if (probe_.isAlive(stale->pid)) {
        spdlog::warn("Reclaiming lock {}: pid {} has held it since {}", key, stale->pid,
                     stale->acquired_at);
      } else {
        spdlog::warn("Reclaiming stale lock {} left by pid {}", key, stale->pid);
      }
    } else {
      spdlog::warn("Reclaiming corrupt lock {}", key);
    }

    auto reclaimed = store_.reclaim(key, stale, mine);
    if (!reclaimed.has_value()) {
      return std::unexpected(reclaimed.error());
    }
    if (*reclaimed) {
      spdlog::debug("Acquired lock {}", key);
      return std::optional<LockGuard>(std::in_place, *this, key, store_.pathFor(key));
    }
    // Another acquirer replaced the record first; look at it again
  }

  return std::optional<LockGuard>();
}

Result<void> LockManager::release(const std::string& key) {
  auto record = store_.read(key);
  if (!record.has_value()) {
    return std::unexpected(record.error());
  }
  if (!record->has_value()) {
    return {};
  }
  if ((*record)->pid != getpid()) {
    spdlog::warn("Lock {} is owned by pid {}; not removing", key, (*record)->pid);
    return {};
  }

  auto removed = store_.remove(key);
  if (removed.has_value()) {
    spdlog::debug("Released lock {}", key);
  }
  return removed;
}

}  // namespace pkbsync::sync
