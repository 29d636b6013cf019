#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "pkbsync/common.hpp"
#include "pkbsync/sync/category_classifier.hpp"

namespace pkbsync::config {

// Configuration for pkbsync
class Config {
 public:
  // Defaults only; nothing is read from disk
  Config();

  // Repositories
  std::filesystem::path primary_repo;   // ACA_DATA overrides; empty when not configured
  std::filesystem::path sessions_repo;  // AOPS_SESSIONS overrides; empty when not configured
  std::filesystem::path registry;       // polecat.yaml; POLECAT_HOME/polecat.yaml overrides
  std::string remote = "origin";
  std::string branch = "main";

  // State files
  std::filesystem::path failure_log;
  std::filesystem::path lock_dir;
  std::optional<std::filesystem::path> log_file;  // rotating diagnostic log

  // Push attempts, including the first
  int max_push_attempts = 3;

  struct Timeouts {
    int network_seconds = 120;
    int rebase_seconds = 60;
    int local_seconds = 30;
    int artifact_seconds = 300;
    int lock_lease_seconds = 3600;  // 0 disables the lease
  };
  Timeouts timeouts;

  // Full-mode artifact commands as argv lists ({repo} and {name} are expanded)
  std::vector<std::vector<std::string>> artifact_commands;

  // Replaces the built-in category rules when non-empty
  std::vector<sync::CategoryRule> category_rules;

  // Load configuration from file, overriding the values it sets
  Result<void> load(const std::filesystem::path& config_path);

  // Load the default file if present; a missing default file is not an error
  Result<void> loadDefault();

  // Environment variables win over file values
  using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
  void applyEnvironment(const EnvLookup& lookup);
  void applyEnvironment();

  // Validate configuration
  Result<void> validate() const;

  // Classifier built from category_rules, or the built-in rules
  Result<sync::CategoryClassifier> classifier() const;

  std::chrono::milliseconds networkTimeout() const;
  std::chrono::milliseconds rebaseTimeout() const;
  std::chrono::milliseconds localTimeout() const;
  std::chrono::milliseconds artifactTimeout() const;
  std::chrono::seconds lockLease() const;

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  const std::filesystem::path& loadedFrom() const { return config_path_; }

 private:
  std::filesystem::path config_path_;
};

}  // namespace pkbsync::config
