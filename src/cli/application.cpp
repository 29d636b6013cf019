#include "pkbsync/cli/application.hpp"

#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "pkbsync/config/repository_registry.hpp"
#include "pkbsync/sync/artifact_generator.hpp"
#include "pkbsync/sync/failure_log.hpp"
#include "pkbsync/sync/git_operations.hpp"
#include "pkbsync/sync/lock_manager.hpp"
#include "pkbsync/sync/sync_engine.hpp"
#include "pkbsync/util/logging.hpp"
#include "pkbsync/util/termination.hpp"
#include "pkbsync/util/xdg.hpp"

namespace pkbsync::cli {

namespace {
  util::Verbosity verbosityFor(const Options& options) {
    if (options.quiet) {
      return util::Verbosity::kQuiet;
    }
    if (options.verbose >= 2) {
      return util::Verbosity::kDebug;
    }
    if (options.verbose == 1) {
      return util::Verbosity::kVerbose;
    }
    return util::Verbosity::kNormal;
  }
}

Application::Application()
    : app_("pkbsync", "Commit, rebase and push personal knowledge base repositories") {
  app_.set_version_flag("--version", pkbsync::getVersion().toString());
  setupOptions();
}

void Application::setupOptions() {
  app_.add_option("mode", options_.mode, "Sync mode: full (default) or quick")
      ->check(CLI::IsMember({"full", "quick"}));
  app_.add_flag("--check", options_.check, "Report repository status without syncing");
  app_.add_option("-c,--config", options_.config_file, "Path to config file");
  app_.add_option("--registry", options_.registry_file, "Path to the repository registry (polecat.yaml)");
  app_.add_option("--repo", options_.repos, "Sync only this working copy (repeatable)");
  app_.add_flag("--no-registry", options_.no_registry, "Ignore the repository registry");
  app_.add_flag("-v,--verbose", options_.verbose, "Verbose output (-vv for debug)");
  app_.add_flag("-q,--quiet", options_.quiet, "Suppress progress output");

  app_.footer(R"(Examples:
  pkbsync                 Full sync of every configured repository
  pkbsync quick           Commit and push only, no artifact regeneration
  pkbsync --check         Show dirty/ahead/behind state without syncing
  pkbsync --repo ~/brain  Sync a single working copy)");
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    int code = app_.exit(e);
    return code == 0 ? kExitOk : kExitUsageError;
  }

  return execute(options_);
}

Result<config::Config> Application::loadConfig(const Options& options) const {
  config::Config config;

  if (!options.config_file.empty()) {
    auto loaded = config.load(util::Xdg::expandHome(options.config_file));
    if (!loaded.has_value()) {
      return std::unexpected(loaded.error());
    }
  } else {
    auto loaded = config.loadDefault();
    if (!loaded.has_value()) {
      return std::unexpected(loaded.error());
    }
  }

  config.applyEnvironment();

  if (!options.registry_file.empty()) {
    config.registry = util::Xdg::expandHome(options.registry_file);
  }

  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }
  return config;
}

Result<std::vector<sync::Repository>> Application::resolveRepositories(
    const Options& options, const config::Config& config) const {
  if (!options.repos.empty()) {
    return config::repositoriesFromPaths(config, options.repos);
  }

  std::vector<config::RegistryEntry> registry;
  if (!options.no_registry) {
    auto loaded = config::loadRegistry(config.registry);
    if (!loaded.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError, loaded.error().message()));
    }
    registry = std::move(*loaded);
  }

  return config::buildRepositoryList(config, registry);
}

int Application::execute(const Options& options) {
  // Console logging first so configuration problems are reported
  auto console = util::initializeLogging({verbosityFor(options), std::nullopt});
  if (!console.has_value()) {
    std::cerr << "Error: " << console.error().message() << std::endl;
  }

  auto config = loadConfig(options);
  if (!config.has_value()) {
    std::cerr << "Error: " << config.error().message() << std::endl;
    return kExitUsageError;
  }

  auto logging = util::initializeLogging({verbosityFor(options), config->log_file});
  if (!logging.has_value()) {
    spdlog::warn("Continuing with console logging only");
  }

  if (!sync::GitCli::isAvailable()) {
    std::cerr << "Error: git is not available. Please install git." << std::endl;
    return kExitUsageError;
  }
  sync::GitCli::prepareEnvironment();

  auto repositories = resolveRepositories(options, *config);
  if (!repositories.has_value()) {
    std::cerr << "Error: " << repositories.error().message() << std::endl;
    return kExitUsageError;
  }
  if (repositories->empty()) {
    spdlog::warn("No repositories to sync; set ACA_DATA, configure primary_repo or pass --repo");
    return kExitOk;
  }

  if (options.check) {
    return runCheck(*config, *repositories);
  }
  return runSync(options, *config, *repositories);
}

int Application::runSync(const Options& options, const config::Config& config,
                         const std::vector<sync::Repository>& repositories) {
  auto mode = sync::stringToSyncMode(options.mode);
  if (!mode.has_value()) {
    std::cerr << "Error: " << mode.error().message() << std::endl;
    return kExitUsageError;
  }

  auto classifier = config.classifier();
  if (!classifier.has_value()) {
    std::cerr << "Error: " << classifier.error().message() << std::endl;
    return kExitUsageError;
  }

  util::Termination::installHandlers();

  sync::GitCli git({config.networkTimeout(), config.rebaseTimeout(), config.localTimeout()});
  sync::FileLockStore lock_store(config.lock_dir);
  sync::PosixProcessProbe probe;
  sync::LockManager locks(lock_store, probe, config.lockLease());
  sync::FileFailureLog failure_log(config.failure_log);

  sync::SyncEngine engine(git, locks, failure_log, std::move(*classifier),
                          sync::RetryPolicy{config.max_push_attempts});
  if (!options.quiet) {
    engine.setProgressCallback([](const sync::Repository& repo, sync::SyncState state,
                                  const std::string& detail) {
      std::cout << "[" << repo.name << "] " << sync::syncStateToString(state);
      if (!detail.empty()) {
        std::cout << ": " << detail;
      }
      std::cout << std::endl;
    });
  }

  std::unique_ptr<sync::CommandArtifactGenerator> artifacts;
  if (!config.artifact_commands.empty()) {
    artifacts = std::make_unique<sync::CommandArtifactGenerator>(config.artifact_commands,
                                                                 config.artifactTimeout());
  }

  sync::SyncOrchestrator orchestrator(engine, artifacts.get());
  auto report = orchestrator.run(repositories, *mode);

  if (!options.quiet) {
    printSummary(std::cout, report);
  }
  if (report.failedCount() > 0) {
    std::cerr << "See " << config.failure_log.string() << " for next steps" << std::endl;
  }
  return report.exitCode();
}

int Application::runCheck(const config::Config& config,
                          const std::vector<sync::Repository>& repositories) {
  sync::GitCli git({config.networkTimeout(), config.rebaseTimeout(), config.localTimeout()});
  auto report = sync::SyncOrchestrator::status(git, repositories, true);
  printStatus(std::cout, report);
  return report.exitCode() == 0 ? kExitOk : kExitSyncFailed;
}

void Application::printSummary(std::ostream& out, const sync::OrchestratorReport& report) {
  int done = 0;
  int skipped = 0;
  for (const auto& repo : report.repositories) {
    if (repo.final_state == sync::SyncState::kDone) {
      ++done;
    } else if (repo.skipped()) {
      ++skipped;
    }
  }

  out << "pkbsync " << sync::syncModeToString(report.mode) << ": " << done << " synced, "
      << skipped << " skipped, " << report.failedCount() << " failed";
  if (report.artifacts_attempted) {
    out << ", artifacts " << (report.artifact_error.has_value() ? "failed" : "regenerated");
  }
  out << std::endl;
}

void Application::printStatus(std::ostream& out, const sync::StatusReport& report) {
  for (const auto& repo : report.repositories) {
    out << "[" << repo.name << "] ";
    if (repo.error.has_value()) {
      out << "error: " << repo.error->message() << std::endl;
      continue;
    }

    switch (repo.outcome) {
      case sync::ScanOutcome::kClean:
        out << "clean";
        break;
      case sync::ScanOutcome::kDirty:
        out << "dirty (" << repo.changed_files << " files)";
        break;
      case sync::ScanOutcome::kConflictInProgress:
        out << repo.operation << " in progress";
        break;
    }

    if (repo.ahead_behind.has_value()) {
      out << ", ahead " << repo.ahead_behind->ahead << ", behind " << repo.ahead_behind->behind;
    } else {
      out << ", no remote tracking information";
    }
    out << "  " << repo.path << std::endl;
  }
}

}  // namespace pkbsync::cli
