#include "pkbsync/config/repository_registry.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "pkbsync/util/xdg.hpp"

namespace pkbsync::config {

namespace {
  constexpr const char* kPrimaryName = "pkb";
  constexpr const char* kSessionsName = "sessions";

  std::filesystem::path canonicalOrSelf(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : canonical;
  }

  class RepositoryListBuilder {
  public:
    void add(sync::Repository repo) {
      std::error_code ec;
      if (!std::filesystem::is_directory(repo.path, ec)) {
        spdlog::warn("Skipping {}: {} does not exist", repo.name, repo.path.string());
        return;
      }

      auto key = canonicalOrSelf(repo.path).string();
      if (!seen_.insert(key).second) {
        spdlog::debug("Skipping {}: {} is already listed", repo.name, key);
        return;
      }
      repositories_.push_back(std::move(repo));
    }

    std::vector<sync::Repository> take() { return std::move(repositories_); }

  private:
    std::set<std::string> seen_;
    std::vector<sync::Repository> repositories_;
  };
}

Result<std::vector<RegistryEntry>> parseRegistry(const std::string& yaml) {
  std::vector<RegistryEntry> entries;

  try {
    YAML::Node root = YAML::Load(yaml);
    if (!root || root.IsNull()) {
      return entries;
    }
    if (!root.IsMap()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Registry must be a mapping with a 'projects' key"));
    }

    YAML::Node projects = root["projects"];
    if (!projects || projects.IsNull()) {
      return entries;
    }
    if (!projects.IsMap()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Registry 'projects' must be a mapping"));
    }

    for (const auto& pair : projects) {
      RegistryEntry entry;
      entry.slug = pair.first.as<std::string>();

      const YAML::Node& project = pair.second;
      if (!project.IsMap() || !project["path"]) {
        spdlog::warn("Registry project '{}' has no path; skipping", entry.slug);
        continue;
      }

      entry.path = util::Xdg::expandHome(project["path"].as<std::string>());
      if (project["default_branch"]) {
        entry.default_branch = project["default_branch"].as<std::string>();
      }
      if (project["remote"]) {
        entry.remote = project["remote"].as<std::string>();
      }
      entries.push_back(std::move(entry));
    }

    return entries;

  } catch (const YAML::Exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "YAML parse error: " + std::string(e.what())));
  }
}

Result<std::vector<RegistryEntry>> loadRegistry(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    spdlog::warn("Repository registry {} not found; syncing configured repositories only",
                 path.string());
    return std::vector<RegistryEntry>{};
  }

  std::ifstream file(path);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Failed to read registry: " + path.string()));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto entries = parseRegistry(buffer.str());
  if (!entries.has_value()) {
    return std::unexpected(makeError(entries.error().code(),
                                     path.string() + ": " + entries.error().message()));
  }
  return entries;
}

std::vector<sync::Repository> buildRepositoryList(const Config& config,
                                                  const std::vector<RegistryEntry>& registry) {
  RepositoryListBuilder builder;

  if (!config.primary_repo.empty()) {
    builder.add({kPrimaryName, config.primary_repo, config.remote, config.branch, true});
  } else {
    spdlog::warn("No primary repository configured (set ACA_DATA or primary_repo)");
  }

  for (const auto& entry : registry) {
    builder.add({entry.slug, entry.path,
                 entry.remote.empty() ? config.remote : entry.remote,
                 entry.default_branch.empty() ? config.branch : entry.default_branch,
                 false});
  }

  if (!config.sessions_repo.empty()) {
    builder.add({kSessionsName, config.sessions_repo, config.remote, config.branch, false});
  }

  return builder.take();
}

std::vector<sync::Repository> repositoriesFromPaths(const Config& config,
                                                    const std::vector<std::string>& paths) {
  RepositoryListBuilder builder;
  std::string primary;
  if (!config.primary_repo.empty()) {
    primary = canonicalOrSelf(config.primary_repo).string();
  }

  for (const auto& raw : paths) {
    auto path = canonicalOrSelf(util::Xdg::expandHome(raw));
    bool is_primary = !primary.empty() && path.string() == primary;

    std::string name = is_primary ? kPrimaryName : path.filename().string();
    if (name.empty()) {
      name = path.string();
    }
    builder.add({name, path, config.remote, config.branch, is_primary});
  }

  return builder.take();
}

}  // namespace pkbsync::config
