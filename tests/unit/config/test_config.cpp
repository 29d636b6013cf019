#include <gtest/gtest.h>

#include <map>

#include "pkbsync/config/config.hpp"
#include "test_helpers.hpp"

using namespace pkbsync::config;
using namespace pkbsync::test;
using pkbsync::ErrorCode;

class ConfigTest : public TempDirTest {
 protected:
  std::filesystem::path writeConfig(const std::string& content) {
    auto path = temp_dir_ / "config.toml";
    writeFile(path, content);
    return path;
  }
};

TEST_F(ConfigTest, DefaultsAreValid) {
  Config config;
  EXPECT_EQ(config.remote, "origin");
  EXPECT_EQ(config.branch, "main");
  EXPECT_EQ(config.max_push_attempts, 3);
  EXPECT_EQ(config.lockLease(), std::chrono::seconds(3600));
  EXPECT_EQ(config.registry.filename(), "polecat.yaml");
  EXPECT_FALSE(config.failure_log.empty());
  EXPECT_FALSE(config.lock_dir.empty());
  EXPECT_TRUE(config.log_file.has_value());
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadsRepositoriesRetryAndTimeouts) {
  auto path = writeConfig(R"(
primary_repo = "/data/brain"
sessions_repo = "/data/sessions"
registry = "/data/polecat.yaml"
remote = "upstream"
branch = "trunk"
failure_log = "/state/failures.jsonl"
lock_dir = "/run/pkbsync"

[retry]
max_push_attempts = 5

[timeouts]
network_seconds = 90
rebase_seconds = 45
local_seconds = 10
artifact_seconds = 600
lock_lease_seconds = 0
)");

  Config config;
  ASSERT_OK(config.load(path));
  EXPECT_EQ(config.primary_repo, "/data/brain");
  EXPECT_EQ(config.sessions_repo, "/data/sessions");
  EXPECT_EQ(config.registry, "/data/polecat.yaml");
  EXPECT_EQ(config.remote, "upstream");
  EXPECT_EQ(config.branch, "trunk");
  EXPECT_EQ(config.failure_log, "/state/failures.jsonl");
  EXPECT_EQ(config.lock_dir, "/run/pkbsync");
  EXPECT_EQ(config.max_push_attempts, 5);
  EXPECT_EQ(config.networkTimeout(), std::chrono::seconds(90));
  EXPECT_EQ(config.rebaseTimeout(), std::chrono::seconds(45));
  EXPECT_EQ(config.localTimeout(), std::chrono::seconds(10));
  EXPECT_EQ(config.artifactTimeout(), std::chrono::seconds(600));
  EXPECT_EQ(config.lockLease(), std::chrono::seconds(0));
  EXPECT_EQ(config.loadedFrom(), path);
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, EmptyLogFileDisablesFileLogging) {
  Config config;
  ASSERT_OK(config.load(writeConfig("log_file = \"\"\n")));
  EXPECT_FALSE(config.log_file.has_value());
}

TEST_F(ConfigTest, LoadsArtifactCommands) {
  auto path = writeConfig(R"(
[artifacts]
commands = [
  ["pkb-index", "--root", "{repo}"],
  ["pkb-graph", "{name}"],
]
)");

  Config config;
  ASSERT_OK(config.load(path));
  ASSERT_EQ(config.artifact_commands.size(), 2u);
  EXPECT_EQ(config.artifact_commands[0],
            (std::vector<std::string>{"pkb-index", "--root", "{repo}"}));
  EXPECT_EQ(config.artifact_commands[1], (std::vector<std::string>{"pkb-graph", "{name}"}));
}

TEST_F(ConfigTest, NonStringArtifactArgumentIsRejected) {
  Config config;
  auto loaded = config.load(writeConfig("[artifacts]\ncommands = [[\"index\", 3]]\n"));
  EXPECT_ERROR(loaded, ErrorCode::kConfigError);
}

TEST_F(ConfigTest, CustomCategoryRulesReplaceDefaults) {
  auto path = writeConfig(R"(
[[category_rules]]
prefix = "journal/"
name = "journal"
detail = "date"

[[category_rules]]
prefix = "research/"
name = "research"
detail = "stem"
detail_prefix = "r/"
)");

  Config config;
  ASSERT_OK(config.load(path));
  ASSERT_EQ(config.category_rules.size(), 2u);
  ASSERT_OK(config.validate());

  auto classifier = config.classifier();
  ASSERT_OK(classifier);
  EXPECT_EQ(classifier->classify("journal/20261019.md").label(), "journal: 2026-10-19");
  EXPECT_EQ(classifier->classify("research/llm.md").label(), "research: r/llm");
}

TEST_F(ConfigTest, UnknownDetailKindIsAConfigError) {
  Config config;
  auto loaded = config.load(writeConfig(
      "[[category_rules]]\nprefix = \"x/\"\nname = \"x\"\ndetail = \"sideways\"\n"));
  EXPECT_ERROR(loaded, ErrorCode::kConfigError);
}

TEST_F(ConfigTest, ShadowedCategoryRulesFailValidation) {
  auto path = writeConfig(R"(
[[category_rules]]
prefix = "notes/"
name = "notes"

[[category_rules]]
prefix = "notes/work/"
name = "work"
)");

  Config config;
  ASSERT_OK(config.load(path));
  EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, MissingFileIsAnError) {
  Config config;
  EXPECT_ERROR(config.load(temp_dir_ / "absent.toml"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, MalformedTomlIsAnError) {
  Config config;
  EXPECT_ERROR(config.load(writeConfig("remote = \n[[[")), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, InvalidValuesFailValidation) {
  Config zero_attempts;
  zero_attempts.max_push_attempts = 0;
  EXPECT_ERROR(zero_attempts.validate(), ErrorCode::kConfigError);

  Config bad_timeout;
  bad_timeout.timeouts.network_seconds = 0;
  EXPECT_ERROR(bad_timeout.validate(), ErrorCode::kConfigError);

  Config negative_lease;
  negative_lease.timeouts.lock_lease_seconds = -1;
  EXPECT_ERROR(negative_lease.validate(), ErrorCode::kConfigError);

  Config no_branch;
  no_branch.branch.clear();
  EXPECT_ERROR(no_branch.validate(), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
  Config config;
  ASSERT_OK(config.load(writeConfig("primary_repo = \"/from/file\"\n")));

  std::map<std::string, std::string> env = {
    {"ACA_DATA", "/from/env/brain"},
    {"AOPS_SESSIONS", "/from/env/sessions"},
    {"POLECAT_HOME", "/from/env/aops"},
  };
  config.applyEnvironment([&env](const std::string& name) -> std::optional<std::string> {
    auto it = env.find(name);
    if (it == env.end()) {
      return std::nullopt;
    }
    return it->second;
  });

  EXPECT_EQ(config.primary_repo, "/from/env/brain");
  EXPECT_EQ(config.sessions_repo, "/from/env/sessions");
  EXPECT_EQ(config.registry, std::filesystem::path("/from/env/aops/polecat.yaml"));
}

TEST_F(ConfigTest, EmptyEnvironmentValuesAreIgnored) {
  Config config;
  ASSERT_OK(config.load(writeConfig("primary_repo = \"/from/file\"\n")));
  config.applyEnvironment([](const std::string&) -> std::optional<std::string> {
    return std::string();
  });
  EXPECT_EQ(config.primary_repo, "/from/file");
}
