#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "pkbsync/common.hpp"
#include "pkbsync/config/config.hpp"
#include "pkbsync/sync/orchestrator.hpp"
#include "pkbsync/sync/repository.hpp"

namespace pkbsync::cli {

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitSyncFailed = 1;
constexpr int kExitUsageError = 2;

/**
 * @brief Command line options
 */
struct Options {
  std::string mode = "full";          // positional: full | quick
  bool check = false;                 // --check: read-only status report
  std::string config_file;            // --config: explicit config file (must exist)
  std::string registry_file;          // --registry: override polecat.yaml location
  std::vector<std::string> repos;     // --repo: sync only these working copies
  bool no_registry = false;           // --no-registry: ignore polecat.yaml
  int verbose = 0;                    // -v, -vv
  bool quiet = false;                 // --quiet: no progress lines
};

/**
 * @brief pkbsync command line front end
 */
class Application {
public:
  Application();

  /**
   * @brief Parse arguments and run
   * @return 0 on success, 1 if a repository failed, 2 on usage or configuration errors
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Run with already parsed options
   */
  int execute(const Options& options);

  const Options& options() const { return options_; }

private:
  CLI::App app_;
  Options options_;

  void setupOptions();

  Result<config::Config> loadConfig(const Options& options) const;
  Result<std::vector<sync::Repository>> resolveRepositories(const Options& options,
                                                            const config::Config& config) const;

  int runSync(const Options& options, const config::Config& config,
              const std::vector<sync::Repository>& repositories);
  int runCheck(const config::Config& config, const std::vector<sync::Repository>& repositories);

  static void printSummary(std::ostream& out, const sync::OrchestratorReport& report);
  static void printStatus(std::ostream& out, const sync::StatusReport& report);
};

}  // namespace pkbsync::cli
