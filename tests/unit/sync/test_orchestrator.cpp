#include <gtest/gtest.h>

#include <set>
#include <string>

#include "pkbsync/sync/orchestrator.hpp"
#include "fake_git_operations.hpp"
#include "fake_stores.hpp"
#include "test_helpers.hpp"

using namespace pkbsync::sync;
using namespace pkbsync::test;
using namespace std::string_literals;
using pkbsync::ErrorCode;

namespace {
  // Fails to resolve the working copy of the named repositories
  class BrokenRepositoryGit : public FakeGitOperations {
   public:
    std::set<std::string> broken;

    pkbsync::Result<std::filesystem::path> topLevel(const Repository& repo) const override {
      if (broken.count(repo.name) > 0) {
        return std::unexpected(error(ErrorCode::kNotARepository, repo.name + " is not a repository"));
      }
      return FakeGitOperations::topLevel(repo);
    }
  };
}

class OrchestratorTest : public TempDirTest {
 protected:
  Repository addRepository(const std::string& name, bool primary = false) {
    Repository repo;
    repo.name = name;
    repo.path = temp_dir_ / name;
    repo.primary = primary;
    std::filesystem::create_directories(repo.path);
    repositories_.push_back(repo);
    return repo;
  }

  OrchestratorReport run(SyncMode mode, ArtifactGenerator* artifacts) {
    SyncEngine engine(git_, locks_, failures_, CategoryClassifier::withDefaultRules());
    SyncOrchestrator orchestrator(engine, artifacts);
    return orchestrator.run(repositories_, mode);
  }

  BrokenRepositoryGit git_;
  MemoryLockStore store_;
  FakeProcessProbe probe_;
  LockManager locks_{store_, probe_};
  MemoryFailureLog failures_;
  RecordingArtifactGenerator artifacts_;
  std::vector<Repository> repositories_;
};

TEST_F(OrchestratorTest, RepositoriesRunInOrder) {
  addRepository("pkb", true);
  addRepository("polecat");
  addRepository("sessions");
  git_.status_output = "?? daily/20261019.md\0"s;

  auto report = run(SyncMode::kQuick, nullptr);

  ASSERT_EQ(report.repositories.size(), 3u);
  EXPECT_EQ(report.repositories[0].repository, "pkb");
  EXPECT_EQ(report.repositories[1].repository, "polecat");
  EXPECT_EQ(report.repositories[2].repository, "sessions");
  EXPECT_EQ(git_.count("push"), 3);
  EXPECT_EQ(report.exitCode(), 0);
}

TEST_F(OrchestratorTest, FailedRepositoryDoesNotStopTheRest) {
  addRepository("pkb", true);
  addRepository("broken");
  addRepository("sessions");
  git_.broken.insert("broken");

  auto report = run(SyncMode::kQuick, nullptr);

  ASSERT_EQ(report.repositories.size(), 3u);
  EXPECT_EQ(report.repositories[0].final_state, SyncState::kDone);
  EXPECT_EQ(report.repositories[1].final_state, SyncState::kFailed);
  EXPECT_EQ(report.repositories[2].final_state, SyncState::kDone);
  EXPECT_EQ(report.failedCount(), 1);
  EXPECT_EQ(report.exitCode(), 1);

  ASSERT_EQ(failures_.records.size(), 1u);
  EXPECT_EQ(failures_.records[0].repository, "broken");
}

TEST_F(OrchestratorTest, SkippedRepositoryIsNotAFailure) {
  auto pkb = addRepository("pkb", true);
  probe_.alive.insert(424242);
  store_.put(LockManager::lockKey(pkb), freshRecord(424242));

  auto report = run(SyncMode::kQuick, nullptr);

  ASSERT_EQ(report.repositories.size(), 1u);
  EXPECT_TRUE(report.repositories[0].skipped());
  EXPECT_EQ(report.exitCode(), 0);
}

TEST_F(OrchestratorTest, FullModeRegeneratesArtifactsForPrimaryOnly) {
  addRepository("pkb", true);
  addRepository("sessions");

  auto report = run(SyncMode::kFull, &artifacts_);

  EXPECT_TRUE(report.artifacts_attempted);
  EXPECT_EQ(artifacts_.generated, (std::vector<std::string>{"pkb"}));
  EXPECT_FALSE(report.artifact_error.has_value());
}

TEST_F(OrchestratorTest, QuickModeNeverRegeneratesArtifacts) {
  addRepository("pkb", true);

  auto report = run(SyncMode::kQuick, &artifacts_);

  EXPECT_FALSE(report.artifacts_attempted);
  EXPECT_TRUE(artifacts_.generated.empty());
}

TEST_F(OrchestratorTest, ArtifactsSkippedWhenPrimaryFails) {
  addRepository("pkb", true);
  git_.broken.insert("pkb");

  auto report = run(SyncMode::kFull, &artifacts_);

  EXPECT_FALSE(report.artifacts_attempted);
  EXPECT_TRUE(artifacts_.generated.empty());
}

TEST_F(OrchestratorTest, ArtifactFailureDoesNotFailTheCycle) {
  addRepository("pkb", true);
  artifacts_.result = std::unexpected(pkbsync::makeError(ErrorCode::kExternalToolError, "indexer crashed"));

  auto report = run(SyncMode::kFull, &artifacts_);

  EXPECT_TRUE(report.artifacts_attempted);
  ASSERT_TRUE(report.artifact_error.has_value());
  EXPECT_EQ(report.artifact_error->code(), ErrorCode::kExternalToolError);
  EXPECT_EQ(report.exitCode(), 0);
}

TEST_F(OrchestratorTest, StatusInspectsWithoutChanging) {
  addRepository("pkb", true);
  addRepository("broken");
  git_.broken.insert("broken");
  git_.status_output = " M projects/alpha/a.md\0?? goals/q4.md\0"s;
  git_.ahead_behind = AheadBehind{2, 1};

  auto status = SyncOrchestrator::status(git_, repositories_, true);

  ASSERT_EQ(status.repositories.size(), 2u);
  const auto& pkb = status.repositories[0];
  EXPECT_FALSE(pkb.error.has_value());
  EXPECT_EQ(pkb.outcome, ScanOutcome::kDirty);
  EXPECT_EQ(pkb.changed_files, 2u);
  ASSERT_TRUE(pkb.ahead_behind.has_value());
  EXPECT_EQ(pkb.ahead_behind->ahead, 2);
  EXPECT_EQ(pkb.ahead_behind->behind, 1);

  ASSERT_TRUE(status.repositories[1].error.has_value());
  EXPECT_EQ(status.repositories[1].error->code(), ErrorCode::kNotARepository);
  EXPECT_EQ(status.exitCode(), 1);

  EXPECT_EQ(git_.count("fetch"), 1);
  EXPECT_EQ(git_.count("add"), 0);
  EXPECT_EQ(git_.count("commit"), 0);
}

TEST(SyncModeTest, StringConversion) {
  EXPECT_EQ(syncModeToString(SyncMode::kQuick), "quick");
  EXPECT_EQ(syncModeToString(SyncMode::kFull), "full");

  auto quick = stringToSyncMode("quick");
  ASSERT_OK(quick);
  EXPECT_EQ(*quick, SyncMode::kQuick);
  EXPECT_ERROR(stringToSyncMode("slow"), ErrorCode::kInvalidArgument);
}
