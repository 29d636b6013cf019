#include "pkbsync/config/config.hpp"

#include <cstdlib>

#include <toml++/toml.hpp>

#include "pkbsync/util/xdg.hpp"

namespace pkbsync::config {

namespace {
  std::filesystem::path expandPath(const std::string& value) {
    return util::Xdg::expandHome(value);
  }

  Result<std::vector<sync::CategoryRule>> parseCategoryRules(const toml::array& rules) {
    std::vector<sync::CategoryRule> parsed;
    size_t index = 0;
    for (const auto& node : rules) {
      auto table = node.as_table();
      if (!table) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "category_rules[" + std::to_string(index) +
                                         "] must be a table"));
      }

      sync::CategoryRule rule;
      if (auto value = (*table)["prefix"].value<std::string>()) {
        rule.prefix = *value;
      }
      if (auto value = (*table)["name"].value<std::string>()) {
        rule.name = *value;
      }
      if (auto value = (*table)["detail"].value<std::string>()) {
        auto kind = sync::stringToDetailKind(*value);
        if (!kind.has_value()) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "category_rules[" + std::to_string(index) + "]: " +
                                           kind.error().message()));
        }
        rule.detail = *kind;
      }
      if (auto value = (*table)["detail_prefix"].value<std::string>()) {
        rule.detail_prefix = *value;
      }

      parsed.push_back(std::move(rule));
      ++index;
    }
    return parsed;
  }

  Result<std::vector<std::vector<std::string>>> parseCommands(const toml::array& commands) {
    std::vector<std::vector<std::string>> parsed;
    for (const auto& node : commands) {
      auto argv = node.as_array();
      if (!argv) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "artifacts.commands entries must be arrays of strings"));
      }

      std::vector<std::string> command;
      for (const auto& arg : *argv) {
        auto value = arg.value<std::string>();
        if (!value) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "artifacts.commands entries must be arrays of strings"));
        }
        command.push_back(*value);
      }
      if (!command.empty()) {
        parsed.push_back(std::move(command));
      }
    }
    return parsed;
  }
}

Config::Config() {
  registry = util::Xdg::expandHome("~/.aops/polecat.yaml");
  failure_log = util::Xdg::failureLogFile();
  lock_dir = util::Xdg::lockDir();
  log_file = util::Xdg::diagnosticLogFile();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    // Repositories
    if (auto value = config_data["primary_repo"].value<std::string>()) {
      primary_repo = expandPath(*value);
    }
    if (auto value = config_data["sessions_repo"].value<std::string>()) {
      sessions_repo = expandPath(*value);
    }
    if (auto value = config_data["registry"].value<std::string>()) {
      registry = expandPath(*value);
    }
    if (auto value = config_data["remote"].value<std::string>()) {
      remote = *value;
    }
    if (auto value = config_data["branch"].value<std::string>()) {
      branch = *value;
    }

    // State files
    if (auto value = config_data["failure_log"].value<std::string>()) {
      failure_log = expandPath(*value);
    }
    if (auto value = config_data["lock_dir"].value<std::string>()) {
      lock_dir = expandPath(*value);
    }
    if (auto value = config_data["log_file"].value<std::string>()) {
      if (value->empty()) {
        log_file.reset();
      } else {
        log_file = expandPath(*value);
      }
    }

    if (auto retry_table = config_data["retry"].as_table()) {
      if (auto value = (*retry_table)["max_push_attempts"].value<int>()) {
        max_push_attempts = *value;
      }
    }

    if (auto timeout_table = config_data["timeouts"].as_table()) {
      if (auto value = (*timeout_table)["network_seconds"].value<int>()) {
        timeouts.network_seconds = *value;
      }
      if (auto value = (*timeout_table)["rebase_seconds"].value<int>()) {
        timeouts.rebase_seconds = *value;
      }
      if (auto value = (*timeout_table)["local_seconds"].value<int>()) {
        timeouts.local_seconds = *value;
      }
      if (auto value = (*timeout_table)["artifact_seconds"].value<int>()) {
        timeouts.artifact_seconds = *value;
      }
      if (auto value = (*timeout_table)["lock_lease_seconds"].value<int>()) {
        timeouts.lock_lease_seconds = *value;
      }
    }

    if (auto artifacts_table = config_data["artifacts"].as_table()) {
      if (auto commands = (*artifacts_table)["commands"].as_array()) {
        auto parsed = parseCommands(*commands);
        if (!parsed.has_value()) {
          return std::unexpected(parsed.error());
        }
        artifact_commands = std::move(*parsed);
      }
    }

    if (auto rules = config_data["category_rules"].as_array()) {
      auto parsed = parseCategoryRules(*rules);
      if (!parsed.has_value()) {
        return std::unexpected(parsed.error());
      }
      category_rules = std::move(*parsed);
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::loadDefault() {
  auto default_path = defaultConfigPath();
  if (!std::filesystem::exists(default_path)) {
    return {};
  }
  return load(default_path);
}

void Config::applyEnvironment(const EnvLookup& lookup) {
  if (auto value = lookup("ACA_DATA"); value && !value->empty()) {
    primary_repo = expandPath(*value);
  }
  if (auto value = lookup("AOPS_SESSIONS"); value && !value->empty()) {
    sessions_repo = expandPath(*value);
  }
  if (auto value = lookup("POLECAT_HOME"); value && !value->empty()) {
    registry = expandPath(*value) / "polecat.yaml";
  }
}

void Config::applyEnvironment() {
  applyEnvironment([](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  });
}

Result<void> Config::validate() const {
  if (max_push_attempts < 1) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "retry.max_push_attempts must be at least 1"));
  }

  if (timeouts.network_seconds <= 0 || timeouts.rebase_seconds <= 0 ||
      timeouts.local_seconds <= 0 || timeouts.artifact_seconds <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Timeouts must be positive numbers of seconds"));
  }
  if (timeouts.lock_lease_seconds < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "timeouts.lock_lease_seconds must not be negative"));
  }

  if (remote.empty() || branch.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "remote and branch must not be empty"));
  }

  auto rules = classifier();
  if (!rules.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, rules.error().message()));
  }

  return {};
}

Result<sync::CategoryClassifier> Config::classifier() const {
  if (category_rules.empty()) {
    return sync::CategoryClassifier::withDefaultRules();
  }
  return sync::CategoryClassifier::create(category_rules);
}

std::chrono::milliseconds Config::networkTimeout() const {
  return std::chrono::seconds(timeouts.network_seconds);
}

std::chrono::milliseconds Config::rebaseTimeout() const {
  return std::chrono::seconds(timeouts.rebase_seconds);
}

std::chrono::milliseconds Config::localTimeout() const {
  return std::chrono::seconds(timeouts.local_seconds);
}

std::chrono::milliseconds Config::artifactTimeout() const {
  return std::chrono::seconds(timeouts.artifact_seconds);
}

std::chrono::seconds Config::lockLease() const {
  return std::chrono::seconds(timeouts.lock_lease_seconds);
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

}  // namespace pkbsync::config
