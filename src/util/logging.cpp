#include "pkbsync/util/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "pkbsync/util/xdg.hpp"

namespace pkbsync::util {

namespace {
  spdlog::level::level_enum consoleLevel(Verbosity verbosity) {
    switch (verbosity) {
      case Verbosity::kQuiet: return spdlog::level::err;
      case Verbosity::kNormal: return spdlog::level::warn;
      case Verbosity::kVerbose: return spdlog::level::info;
      case Verbosity::kDebug: return spdlog::level::debug;
    }
    return spdlog::level::warn;
  }
}

Result<void> initializeLogging(const LoggingOptions& options) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(consoleLevel(options.verbosity));

  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  Result<void> result;

  if (options.log_file.has_value()) {
    try {
      auto parent = options.log_file->parent_path();
      if (!parent.empty()) {
        Xdg::ensureDirectory(parent, std::filesystem::perms::owner_all);
      }
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.log_file->string(), 1024 * 1024 * 5, 3); // 5MB files, 3 backups
      file_sink->set_level(spdlog::level::debug);
      sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
      result = std::unexpected(makeError(ErrorCode::kFileWriteError,
                                         "Failed to setup file logging: " + std::string(e.what())));
    }
  }

  auto logger = std::make_shared<spdlog::logger>("pkbsync", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger->set_level(spdlog::level::debug);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  if (!result.has_value()) {
    spdlog::warn("{}", result.error().message());
  }
  return result;
}

}  // namespace pkbsync::util
