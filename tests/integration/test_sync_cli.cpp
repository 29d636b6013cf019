#include <gtest/gtest.h>

#include <cstdlib>
#include <iostream>
#include <sstream>

#include "pkbsync/cli/application.hpp"
#include "test_helpers.hpp"

namespace pkbsync::cli {

class SyncCLITest : public test::GitRemoteTest {
protected:
  void SetUp() override {
    test::GitRemoteTest::SetUp();
    state_dir_ = temp_dir_ / "state";
    std::filesystem::create_directories(state_dir_);
    work_ = clone("work");

    // Keep the caller's environment out of the run
    unsetenv("ACA_DATA");
    unsetenv("AOPS_SESSIONS");
    unsetenv("POLECAT_HOME");
  }

  std::filesystem::path failureLog() const { return state_dir_ / "failures.jsonl"; }

  // Config pointing every state file into the temporary state directory
  std::string writeConfig(const std::string& extra = "") {
    std::ostringstream config;
    config << "primary_repo = \"" << work_.string() << "\"\n"
           << "failure_log = \"" << failureLog().string() << "\"\n"
           << "lock_dir = \"" << (state_dir_ / "locks").string() << "\"\n"
           << "log_file = \"\"\n"
           << extra;
    return createFile("config.toml", config.str()).string();
  }

  std::filesystem::path createFile(const std::string& name, const std::string& content) {
    auto path = state_dir_ / name;
    test::writeFile(path, content);
    return path;
  }

  // Run the CLI and capture stdout and stderr
  std::pair<int, std::string> runCommand(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("pkbsync"));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }

    std::ostringstream cout_output, cerr_output;
    std::streambuf* orig_cout = std::cout.rdbuf();
    std::streambuf* orig_cerr = std::cerr.rdbuf();
    std::cout.rdbuf(cout_output.rdbuf());
    std::cerr.rdbuf(cerr_output.rdbuf());

    int result = 0;
    try {
      Application app;
      result = app.run(static_cast<int>(argv.size()), argv.data());
    } catch (const std::exception&) {
      std::cout.rdbuf(orig_cout);
      std::cerr.rdbuf(orig_cerr);
      throw;
    }

    std::cout.rdbuf(orig_cout);
    std::cerr.rdbuf(orig_cerr);
    return {result, cout_output.str() + cerr_output.str()};
  }

  std::filesystem::path state_dir_;
  std::filesystem::path work_;
};

TEST_F(SyncCLITest, QuickSyncCommitsAndPushes) {
  test::writeFile(work_ / "projects/alpha/plan.md", "# plan\n");

  auto [code, output] = runCommand({"quick", "--config", writeConfig(), "--no-registry"});

  EXPECT_EQ(code, kExitOk) << output;
  EXPECT_NE(output.find("[pkb] done: project: alpha"), std::string::npos) << output;
  EXPECT_NE(output.find("pkbsync quick: 1 synced, 0 skipped, 0 failed"), std::string::npos) << output;
  EXPECT_EQ(lastSubject(remote_, "main"), "project: alpha");
}

TEST_F(SyncCLITest, FullSyncRunsArtifactCommands) {
  auto marker = state_dir_ / "artifact-pkb";
  auto config = writeConfig("[artifacts]\ncommands = [[\"touch\", \"" +
                            (state_dir_ / "artifact-{name}").string() + "\"]]\n");

  auto [code, output] = runCommand({"--config", config, "--no-registry", "--quiet"});

  EXPECT_EQ(code, kExitOk) << output;
  EXPECT_TRUE(std::filesystem::exists(marker));
}

TEST_F(SyncCLITest, QuickSyncSkipsArtifactCommands) {
  auto marker = state_dir_ / "artifact-pkb";
  auto config = writeConfig("[artifacts]\ncommands = [[\"touch\", \"" +
                            (state_dir_ / "artifact-{name}").string() + "\"]]\n");

  auto [code, output] = runCommand({"quick", "--config", config, "--no-registry", "--quiet"});

  EXPECT_EQ(code, kExitOk) << output;
  EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST_F(SyncCLITest, FailedRepositoryExitsWithOneAndPointsAtLog) {
  auto other = clone("other");
  commitAndPush(other, "README.md", "remote wording\n", "remote");
  test::writeFile(work_ / "README.md", "local wording\n");

  auto [code, output] = runCommand({"quick", "--config", writeConfig(), "--no-registry"});

  EXPECT_EQ(code, kExitSyncFailed) << output;
  EXPECT_NE(output.find("See " + failureLog().string()), std::string::npos) << output;
  EXPECT_FALSE(test::readFile(failureLog()).empty());
}

TEST_F(SyncCLITest, CheckReportsWithoutSyncing) {
  test::writeFile(work_ / "notes.md", "draft\n");

  auto [code, output] = runCommand({"--check", "--config", writeConfig(), "--no-registry"});

  EXPECT_EQ(code, kExitOk) << output;
  EXPECT_NE(output.find("[pkb] dirty (1 files), ahead 0, behind 0"), std::string::npos) << output;
  EXPECT_EQ(commitCount(remote_, "main"), 1);
}

TEST_F(SyncCLITest, RegistryProjectsAreSynced) {
  auto project = clone("project");
  test::writeFile(project / "goals/q4.md", "ship\n");
  auto registry = createFile(
      "polecat.yaml", "projects:\n  writing:\n    path: " + project.string() + "\n");

  auto [code, output] = runCommand({"quick", "--config", writeConfig(), "--registry", registry.string()});

  EXPECT_EQ(code, kExitOk) << output;
  EXPECT_NE(output.find("[writing] done: goal: q4"), std::string::npos) << output;
}

TEST_F(SyncCLITest, ExplicitRepoOverridesConfiguredList) {
  auto project = clone("project");
  test::writeFile(project / "goals/q4.md", "ship\n");
  test::writeFile(work_ / "notes.md", "untouched\n");

  auto [code, output] = runCommand({"quick", "--config", writeConfig(), "--repo", project.string()});

  EXPECT_EQ(code, kExitOk) << output;
  EXPECT_NE(output.find("[project] done"), std::string::npos) << output;
  EXPECT_EQ(output.find("[pkb]"), std::string::npos) << output;
}

TEST_F(SyncCLITest, EnvironmentSelectsPrimaryRepository) {
  auto config = createFile(
      "env.toml", "failure_log = \"" + failureLog().string() + "\"\nlock_dir = \"" +
                      (state_dir_ / "locks").string() + "\"\nlog_file = \"\"\n");
  setenv("ACA_DATA", work_.c_str(), 1);
  test::writeFile(work_ / "context/current.md", "focus\n");

  auto [code, output] = runCommand({"quick", "--config", config.string(), "--no-registry"});
  unsetenv("ACA_DATA");

  EXPECT_EQ(code, kExitOk) << output;
  EXPECT_EQ(lastSubject(remote_, "main"), "context: current");
}

TEST_F(SyncCLITest, UsageErrorsExitWithTwo) {
  EXPECT_EQ(runCommand({"sideways"}).first, kExitUsageError);
  EXPECT_EQ(runCommand({"--config", (state_dir_ / "missing.toml").string()}).first,
            kExitUsageError);
}

TEST_F(SyncCLITest, EmptyRepositoryListIsNotAFailure) {
  auto empty = createFile("empty.toml", "failure_log = \"" + failureLog().string() +
                                            "\"\nlog_file = \"\"\n");
  auto [code, output] = runCommand({"--config", empty.string(), "--no-registry"});

  EXPECT_EQ(code, kExitOk) << output;
  EXPECT_FALSE(std::filesystem::exists(failureLog()));
  EXPECT_EQ(commitCount(remote_, "main"), 1);
}

TEST_F(SyncCLITest, HelpAndVersionExitWithZero) {
  EXPECT_EQ(runCommand({"--help"}).first, kExitOk);
  EXPECT_EQ(runCommand({"--version"}).first, kExitOk);
}

}  // namespace pkbsync::cli
