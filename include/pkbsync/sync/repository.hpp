#pragma once

#include <filesystem>
#include <string>

namespace pkbsync::sync {

/**
 * @brief A working copy kept in sync with its remote
 *
 * Registered once through configuration or the project registry and read on
 * every cycle; pkbsync never deletes one.
 */
struct Repository {
  std::string name;                 // Identifier used in logs and lock keys
  std::filesystem::path path;       // Absolute location of the working copy
  std::string remote_name = "origin";
  std::string default_branch = "main";
  bool primary = false;             // The PKB; derived artifacts follow its sync
};

}  // namespace pkbsync::sync
