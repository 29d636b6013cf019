#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "pkbsync/common.hpp"
#include "pkbsync/config/config.hpp"
#include "pkbsync/sync/repository.hpp"

namespace pkbsync::config {

/**
 * @brief One project from polecat.yaml
 */
struct RegistryEntry {
  std::string slug;
  std::filesystem::path path;
  std::string default_branch;  // empty: use the configured branch
  std::string remote;          // empty: use the configured remote
};

/**
 * @brief Parse a registry document
 *
 * Expected shape:
 * @code
 * projects:
 *   brain: { path: ~/brain, default_branch: main }
 * @endcode
 * Entries keep document order. Entries without a path are skipped.
 *
 * @return Entries, or kParseError for malformed YAML
 */
Result<std::vector<RegistryEntry>> parseRegistry(const std::string& yaml);

/**
 * @brief Read and parse a registry file; a missing file yields no entries
 */
Result<std::vector<RegistryEntry>> loadRegistry(const std::filesystem::path& path);

/**
 * @brief Ordered repository list for one cycle
 *
 * Primary repository ("pkb", primary) first, then registry projects in file
 * order, then the sessions repository ("sessions"). Entries whose directory
 * does not exist are skipped with a warning; later duplicates of the same
 * canonical path are dropped.
 */
std::vector<sync::Repository> buildRepositoryList(const Config& config,
                                                  const std::vector<RegistryEntry>& registry);

/**
 * @brief Repositories given explicitly on the command line, in order
 *
 * A path equal to the configured primary repository keeps its primary role.
 */
std::vector<sync::Repository> repositoriesFromPaths(const Config& config,
                                                    const std::vector<std::string>& paths);

}  // namespace pkbsync::config
