#pragma once

#include <filesystem>
#include <optional>

#include "pkbsync/common.hpp"

namespace pkbsync::util {

// Verbosity chosen on the command line
enum class Verbosity {
  kQuiet,    // errors only
  kNormal,   // warnings and above
  kVerbose,  // info
  kDebug     // debug, including git stderr
};

struct LoggingOptions {
  Verbosity verbosity = Verbosity::kNormal;
  std::optional<std::filesystem::path> log_file;  // rotating diagnostic log
};

// Install the "pkbsync" spdlog logger as the default logger.
// Falls back to console-only logging when the log file cannot be opened.
Result<void> initializeLogging(const LoggingOptions& options);

}  // namespace pkbsync::util
