#pragma once

#include <sys/types.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pkbsync/common.hpp"

namespace pkbsync::util {

/**
 * @brief Process execution without shell interpretation
 *
 * Commands are spawned directly with posix_spawn; arguments are passed
 * verbatim. An optional hard timeout terminates the child (SIGTERM, then
 * SIGKILL after a grace period) so a blocked git never holds a lock forever.
 */
class SafeProcess {
public:
  /**
   * @brief Result of a process execution
   */
  struct ProcessResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    bool success() const { return exit_code == 0; }
  };

  /**
   * @brief Execute a command with arguments safely
   * @param command The command to execute (no shell interpretation)
   * @param args Command arguments
   * @param working_dir Optional working directory
   * @param timeout Optional hard timeout; expiry yields ErrorCode::kTimeout
   * @param environment Variables set for the child on top of the inherited environment
   * @return Result of execution or error
   */
  static Result<ProcessResult> execute(
    const std::string& command,
    const std::vector<std::string>& args = {},
    const std::optional<std::string>& working_dir = std::nullopt,
    std::optional<std::chrono::milliseconds> timeout = std::nullopt,
    const std::map<std::string, std::string>& environment = {}
  );

  /**
   * @brief Execute a command and return only stdout
   * @return stdout output, or kProcessError when the exit code is non-zero
   */
  static Result<std::string> executeForOutput(
    const std::string& command,
    const std::vector<std::string>& args = {},
    const std::optional<std::string>& working_dir = std::nullopt,
    std::optional<std::chrono::milliseconds> timeout = std::nullopt
  );

  /**
   * @brief Check if a command exists in PATH
   */
  static bool commandExists(const std::string& command);

  /**
   * @brief Find the full path of a command in PATH
   * @return Full path to command or nullopt if not found
   */
  static std::optional<std::string> findCommand(const std::string& command);

  /**
   * @brief Validate that a command name is safe for execution
   */
  static bool isValidCommand(const std::string& command);

  /**
   * @brief Validate that an argument is safe for execution
   */
  static bool isValidArgument(const std::string& arg);

  // Grace period between SIGTERM and SIGKILL for timed out children
  static constexpr std::chrono::milliseconds kKillGracePeriod{2000};

private:
  SafeProcess() = default;
};

} // namespace pkbsync::util
