#pragma once

#include <filesystem>
#include <string>

namespace pkbsync::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG config home directory (~/.config/pkbsync)
  static std::filesystem::path configHome();

  // Get XDG state home directory (~/.local/state/pkbsync)
  static std::filesystem::path stateHome();

  // Get XDG runtime directory (for lock files)
  static std::filesystem::path runtimeDir();

  // Get config file path
  static std::filesystem::path configFile();

  // Default append-only failure log
  static std::filesystem::path failureLogFile();

  // Default diagnostic log
  static std::filesystem::path diagnosticLogFile();

  // Default lock directory
  static std::filesystem::path lockDir();

  // Expand a leading "~" or "~/" using $HOME
  static std::filesystem::path expandHome(const std::string& path);

  // Ensure directory exists with proper permissions
  static bool ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms);

  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace pkbsync::util
