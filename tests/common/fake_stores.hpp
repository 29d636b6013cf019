#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "pkbsync/sync/artifact_generator.hpp"
#include "pkbsync/sync/failure_log.hpp"
#include "pkbsync/sync/lock_manager.hpp"
#include "pkbsync/util/time.hpp"

namespace pkbsync::test {

// Process probe answering from a fixed set of live pids
class FakeProcessProbe : public sync::ProcessProbe {
 public:
  std::set<pid_t> alive;

  bool isAlive(pid_t pid) const override { return alive.count(pid) > 0; }
};

// Lock record taken just now by pid
inline sync::LockRecord freshRecord(pid_t pid) {
  return {pid, util::Time::toRfc3339(util::Time::now())};
}

// Lock records kept in memory
class MemoryLockStore : public sync::LockStore {
 public:
  Result<bool> tryCreate(const std::string& key, const sync::LockRecord& record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.emplace(key, record).second;
  }

  Result<std::optional<sync::LockRecord>> read(const std::string& key) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
      return std::optional<sync::LockRecord>();
    }
    return std::optional<sync::LockRecord>(it->second);
  }

  Result<void> remove(const std::string& key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(key);
    return {};
  }

  Result<bool> reclaim(const std::string& key, const std::optional<sync::LockRecord>& stale,
                       const sync::LockRecord& record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (!stale.has_value() || it == records_.end() || !(it->second == *stale)) {
      return false;
    }
    it->second = record;
    return true;
  }

  std::optional<std::filesystem::path> pathFor(const std::string&) const override {
    return std::nullopt;
  }

  void put(const std::string& key, const sync::LockRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[key] = record;
  }

  bool contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(key) > 0;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, sync::LockRecord> records_;
};

// Failure records kept in memory
class MemoryFailureLog : public sync::FailureLog {
 public:
  std::vector<sync::FailureRecord> records;

  Result<void> append(const sync::FailureRecord& record) override {
    records.push_back(record);
    return {};
  }
};

// Artifact generator that records the repositories it was asked to regenerate
class RecordingArtifactGenerator : public sync::ArtifactGenerator {
 public:
  std::vector<std::string> generated;
  Result<void> result;

  Result<void> generate(const sync::Repository& repo) override {
    generated.push_back(repo.name);
    return result;
  }
};

}  // namespace pkbsync::test
