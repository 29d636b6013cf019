#include "pkbsync/util/xdg.hpp"

#include <cstdlib>

namespace pkbsync::util {

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "pkbsync";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".pkbsync_config";
  }

  return std::filesystem::path(home) / ".config" / "pkbsync";
}

std::filesystem::path Xdg::stateHome() {
  std::string xdg_state_home = getEnvVar("XDG_STATE_HOME", "");
  if (!xdg_state_home.empty()) {
    return std::filesystem::path(xdg_state_home) / "pkbsync";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".pkbsync_state";
  }

  return std::filesystem::path(home) / ".local" / "state" / "pkbsync";
}

std::filesystem::path Xdg::runtimeDir() {
  std::string xdg_runtime_dir = getEnvVar("XDG_RUNTIME_DIR", "");
  if (!xdg_runtime_dir.empty()) {
    return std::filesystem::path(xdg_runtime_dir) / "pkbsync";
  }

  // Fallback to temp directory
  return std::filesystem::temp_directory_path() / "pkbsync";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::filesystem::path Xdg::failureLogFile() {
  return stateHome() / "sync-failures.log";
}

std::filesystem::path Xdg::diagnosticLogFile() {
  return stateHome() / "pkbsync.log";
}

std::filesystem::path Xdg::lockDir() {
  return runtimeDir() / "locks";
}

std::filesystem::path Xdg::expandHome(const std::string& path) {
  if (path == "~" || path.starts_with("~/")) {
    std::string home = getEnvVar("HOME", "");
    if (!home.empty()) {
      if (path == "~") {
        return std::filesystem::path(home);
      }
      return std::filesystem::path(home) / path.substr(2);
    }
  }
  return std::filesystem::path(path);
}

bool Xdg::ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms) {
  std::error_code ec;

  if (std::filesystem::exists(path, ec)) {
    return !ec;
  }

  if (!std::filesystem::create_directories(path, ec)) {
    return false;
  }

  std::filesystem::permissions(path, perms, ec);
  return !ec;
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace pkbsync::util
