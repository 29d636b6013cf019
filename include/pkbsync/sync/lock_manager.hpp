#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "pkbsync/common.hpp"
#include "pkbsync/sync/repository.hpp"

namespace pkbsync::sync {

/**
 * @brief Contents of a lock file: owner pid and acquisition time
 */
struct LockRecord {
  pid_t pid = 0;
  std::string acquired_at;  // RFC 3339

  bool operator==(const LockRecord&) const = default;
};

/**
 * @brief Answers whether a process is still alive
 */
class ProcessProbe {
public:
  virtual ~ProcessProbe() = default;
  virtual bool isAlive(pid_t pid) const = 0;
};

/**
 * @brief kill(pid, 0) based probe; EPERM counts as alive
 */
class PosixProcessProbe : public ProcessProbe {
public:
  bool isAlive(pid_t pid) const override;
};

/**
 * @brief Storage for lock records keyed by lock name
 *
 * tryCreate must be atomic: at most one caller can create a given key.
 */
class LockStore {
public:
  virtual ~LockStore() = default;

  /**
   * @brief Atomically create the record for key
   * @return true if created, false if a record already exists
   */
  virtual Result<bool> tryCreate(const std::string& key, const LockRecord& record) = 0;

  /**
   * @brief Read the record for key
   * @return Record, nullopt when none exists, or kParseError for a corrupt record
   */
  virtual Result<std::optional<LockRecord>> read(const std::string& key) const = 0;

  /**
   * @brief Remove the record for key; removing a missing record succeeds
   */
  virtual Result<void> remove(const std::string& key) = 0;

  /**
   * @brief Replace a stale record with record, excluding concurrent reclaimers
   *
   * The stored record is re-checked against stale while no other reclaim of
   * the same key can run, so a record that was already replaced by a new
   * owner is never removed.
   *
   * @param stale The record judged stale, or nullopt for a corrupt record
   * @return true when record now holds the lock, false when the stored
   *         record no longer matches stale or another process got in first
   */
  virtual Result<bool> reclaim(const std::string& key, const std::optional<LockRecord>& stale,
                               const LockRecord& record) = 0;

  /**
   * @brief Filesystem path backing key, if the store is file based
   */
  virtual std::optional<std::filesystem::path> pathFor(const std::string& key) const = 0;
};

/**
 * @brief One "<key>.lock" file per lock inside a directory
 *
 * Records are written to a private temporary file and hard-linked into
 * place, so a visible lock file is always complete. The file holds a single
 * line "<pid> <rfc3339 timestamp>". Reclaims of a key are serialised by an
 * flock on a "<key>.reclaim" file that stays in the directory.
 */
class FileLockStore : public LockStore {
public:
  explicit FileLockStore(std::filesystem::path directory);

  Result<bool> tryCreate(const std::string& key, const LockRecord& record) override;
  Result<std::optional<LockRecord>> read(const std::string& key) const override;
  Result<void> remove(const std::string& key) override;
  Result<bool> reclaim(const std::string& key, const std::optional<LockRecord>& stale,
                       const LockRecord& record) override;
  std::optional<std::filesystem::path> pathFor(const std::string& key) const override;

  const std::filesystem::path& directory() const { return directory_; }

private:
  std::filesystem::path directory_;
};

class LockManager;

/**
 * @brief Held lock; releases on destruction
 *
 * While held, the lock file is registered with the termination handler so a
 * signal removes it before the process exits.
 */
class LockGuard {
public:
  LockGuard(LockManager& manager, std::string key, std::optional<std::filesystem::path> path);
  ~LockGuard();

  LockGuard(const LockGuard&) = delete;
  LockGuard& operator=(const LockGuard&) = delete;
  LockGuard(LockGuard&& other) noexcept;
  LockGuard& operator=(LockGuard&& other) noexcept;

  const std::string& key() const { return key_; }

  /**
   * @brief Release now instead of at destruction
   */
  Result<void> release();

private:
  LockManager* manager_;
  std::string key_;
  std::optional<std::filesystem::path> path_;
  bool held_;
};

/**
 * @brief Per-repository mutual exclusion across processes
 *
 * A lock is stale when its owner is no longer alive, when its record is
 * corrupt, or when it is older than the lease. The lease covers PID reuse:
 * a dead owner's pid taken by an unrelated process would otherwise keep the
 * repository skipped until that process exits.
 */
class LockManager {
public:
  // Longer than any cycle bounded by the git timeouts
  static constexpr std::chrono::seconds kDefaultLease{3600};

  /**
   * @brief store and probe must outlive the manager and every guard it hands out
   * @param lease Age after which a lock is stale even if its pid is alive; 0 disables
   */
  LockManager(LockStore& store, const ProcessProbe& probe,
              std::chrono::seconds lease = kDefaultLease);

  /**
   * @brief Try to take the lock for a repository without blocking
   * @return Guard when acquired, nullopt when another live process holds it,
   *         or kLockError when the store fails
   */
  Result<std::optional<LockGuard>> acquire(const Repository& repo);

  /**
   * @brief Take a lock by raw key
   */
  Result<std::optional<LockGuard>> acquireKey(const std::string& key);

  /**
   * @brief Remove the record for key if this process owns it
   */
  Result<void> release(const std::string& key);

  /**
   * @brief Stable lock key: sanitised repository name plus a hash of its canonical path
   */
  static std::string lockKey(const Repository& repo);

private:
  LockStore& store_;
  const ProcessProbe& probe_;
  std::chrono::seconds lease_;

  bool leaseExpired(const LockRecord& record) const;
  bool isStale(const Result<std::optional<LockRecord>>& record) const;
};

}  // namespace pkbsync::sync
