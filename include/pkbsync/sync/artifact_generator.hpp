#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "pkbsync/common.hpp"
#include "pkbsync/sync/repository.hpp"

namespace pkbsync::sync {

/**
 * @brief Regenerates derived, read-only artifacts (e.g. a graph snapshot) for a repository
 */
class ArtifactGenerator {
public:
  virtual ~ArtifactGenerator() = default;
  virtual Result<void> generate(const Repository& repo) = 0;
};

/**
 * @brief Runs configured commands in the repository directory
 *
 * Each command is an argv list; "{repo}" expands to the repository path and
 * "{name}" to its name. Commands run in order; the first failure stops the
 * remainder and is returned.
 */
class CommandArtifactGenerator : public ArtifactGenerator {
public:
  CommandArtifactGenerator(std::vector<std::vector<std::string>> commands,
                           std::chrono::milliseconds timeout);

  Result<void> generate(const Repository& repo) override;

  /**
   * @brief Replace "{repo}" and "{name}" placeholders in one argument
   */
  static std::string expand(const std::string& arg, const Repository& repo);

private:
  std::vector<std::vector<std::string>> commands_;
  std::chrono::milliseconds timeout_;
};

}  // namespace pkbsync::sync
