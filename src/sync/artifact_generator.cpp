#include "pkbsync/sync/artifact_generator.hpp"

#include <spdlog/spdlog.h>

#include "pkbsync/util/safe_process.hpp"

namespace pkbsync::sync {

namespace {
  void replaceAll(std::string& str, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
      str.replace(pos, from.size(), to);
      pos += to.size();
    }
  }
}

CommandArtifactGenerator::CommandArtifactGenerator(std::vector<std::vector<std::string>> commands,
                                                   std::chrono::milliseconds timeout)
  : commands_(std::move(commands)), timeout_(timeout) {}

std::string CommandArtifactGenerator::expand(const std::string& arg, const Repository& repo) {
  std::string result = arg;
  replaceAll(result, "{repo}", repo.path.string());
  replaceAll(result, "{name}", repo.name);
  return result;
}

Result<void> CommandArtifactGenerator::generate(const Repository& repo) {
  for (const auto& command : commands_) {
    if (command.empty()) {
      continue;
    }

    std::vector<std::string> args;
    for (size_t i = 1; i < command.size(); ++i) {
      args.push_back(expand(command[i], repo));
    }
    const std::string program = expand(command.front(), repo);

    spdlog::info("[{}] regenerating artifacts: {}", repo.name, program);
    auto result = util::SafeProcess::execute(program, args, repo.path.string(), timeout_);
    if (!result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                       program + ": " + result.error().message()));
    }
    if (!result->success()) {
      return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                       program + " exited with " + std::to_string(result->exit_code) +
                                       ": " + result->stderr_output));
    }
  }
  return {};
}

}  // namespace pkbsync::sync
