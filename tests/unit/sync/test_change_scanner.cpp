#include <gtest/gtest.h>

#include <string>

#include "pkbsync/sync/change_scanner.hpp"
#include "pkbsync/sync/git_operations.hpp"
#include "fake_git_operations.hpp"
#include "test_helpers.hpp"

using namespace pkbsync::sync;
using namespace pkbsync::test;
using namespace std::string_literals;
using pkbsync::ErrorCode;
using pkbsync::Result;

TEST(PorcelainStatusTest, ParsesModifiedAndUntracked) {
  auto status = parsePorcelainStatus(" M notes/a.md\0A  notes/b.md\0?? inbox/c.md\0"s);
  ASSERT_OK(status);
  EXPECT_FALSE(status->has_unmerged);
  EXPECT_EQ(status->changes.modified, (std::vector<std::string>{"notes/a.md", "notes/b.md"}));
  EXPECT_EQ(status->changes.untracked, (std::vector<std::string>{"inbox/c.md"}));
}

TEST(PorcelainStatusTest, RenameKeepsDestinationAndSkipsSource) {
  auto status = parsePorcelainStatus("R  projects/new.md\0projects/old.md\0 D gone.md\0"s);
  ASSERT_OK(status);
  EXPECT_EQ(status->changes.modified, (std::vector<std::string>{"projects/new.md", "gone.md"}));
}

TEST(PorcelainStatusTest, PathsWithSpacesSurvive) {
  auto status = parsePorcelainStatus("?? daily/my note.md\0"s);
  ASSERT_OK(status);
  ASSERT_EQ(status->changes.untracked.size(), 1u);
  EXPECT_EQ(status->changes.untracked[0], "daily/my note.md");
}

TEST(PorcelainStatusTest, IgnoredEntriesAreSkipped) {
  auto status = parsePorcelainStatus("!! build/out.o\0"s);
  ASSERT_OK(status);
  EXPECT_TRUE(status->changes.empty());
}

TEST(PorcelainStatusTest, UnmergedEntriesAreFlagged) {
  for (const auto& code : {"UU", "AA", "DD", "AU", "UD"}) {
    auto status = parsePorcelainStatus(std::string(code) + " notes/clash.md" + '\0');
    ASSERT_OK(status);
    EXPECT_TRUE(status->has_unmerged) << code;
  }
}

TEST(PorcelainStatusTest, EmptyOutputIsClean) {
  auto status = parsePorcelainStatus("");
  ASSERT_OK(status);
  EXPECT_TRUE(status->changes.empty());
}

TEST(PorcelainStatusTest, MalformedRecordIsAnError) {
  EXPECT_ERROR(parsePorcelainStatus("XYZ"), ErrorCode::kParseError);
}

class ChangeScannerFakeTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    repo_.name = "pkb";
    repo_.path = temp_dir_;
  }

  Repository repo_;
  FakeGitOperations git_;
};

TEST_F(ChangeScannerFakeTest, SubdirectoryOfAWorkingCopyIsRejected) {
  git_.top_level = temp_dir_.parent_path();
  ChangeScanner scanner(git_);
  EXPECT_ERROR(scanner.scan(repo_), ErrorCode::kNotARepository);
}

TEST_F(ChangeScannerFakeTest, InProgressOperationWinsOverStatus) {
  git_.in_progress = "cherry-pick";
  git_.status_output = " M a.md\0"s;
  ChangeScanner scanner(git_);

  auto result = scanner.scan(repo_);
  ASSERT_OK(result);
  EXPECT_EQ(result->outcome, ScanOutcome::kConflictInProgress);
  EXPECT_EQ(result->operation, "cherry-pick");
}

class ChangeScannerGitTest : public GitRemoteTest {
 protected:
  void SetUp() override {
    GitRemoteTest::SetUp();
    work_ = clone("work");
  }

  Result<ScanResult> scan() {
    ChangeScanner scanner(git_);
    return scanner.scan(repository(work_));
  }

  GitCli git_;
  std::filesystem::path work_;
};

TEST_F(ChangeScannerGitTest, FreshCloneIsClean) {
  auto result = scan();
  ASSERT_OK(result);
  EXPECT_EQ(result->outcome, ScanOutcome::kClean);
  EXPECT_TRUE(result->changes.empty());
}

TEST_F(ChangeScannerGitTest, FindsModifiedStagedAndUntracked) {
  writeFile(work_ / "README.md", "# changed\n");
  writeFile(work_ / "projects/alpha/plan.md", "plan\n");
  writeFile(work_ / "goals/q4.md", "ship\n");
  ASSERT_OK(git(work_, {"add", "goals/q4.md"}));

  auto result = scan();
  ASSERT_OK(result);
  EXPECT_EQ(result->outcome, ScanOutcome::kDirty);
  EXPECT_EQ(result->changes.paths(),
            (std::vector<std::string>{"README.md", "goals/q4.md", "projects/alpha/plan.md"}));
  EXPECT_EQ(result->changes.untracked, (std::vector<std::string>{"projects/alpha/plan.md"}));
}

TEST_F(ChangeScannerGitTest, ScanningDoesNotStage) {
  writeFile(work_ / "notes.md", "draft\n");
  ASSERT_OK(scan());

  auto staged = git(work_, {"diff", "--cached", "--name-only"});
  ASSERT_OK(staged);
  EXPECT_TRUE(staged->empty());
}

TEST_F(ChangeScannerGitTest, RebaseInProgressIsReported) {
  auto other = clone("other");
  commitAndPush(other, "README.md", "remote side\n", "remote edit");

  writeFile(work_ / "README.md", "local side\n");
  ASSERT_OK(git(work_, {"commit", "-q", "-am", "local edit"}));
  auto pulled = git(work_, {"pull", "-q", "--rebase", "origin", "main"});
  ASSERT_FALSE(pulled.has_value());

  auto result = scan();
  ASSERT_OK(result);
  EXPECT_EQ(result->outcome, ScanOutcome::kConflictInProgress);
  EXPECT_EQ(result->operation, "rebase");
}

TEST_F(ChangeScannerGitTest, PlainDirectoryIsNotARepository) {
  auto plain = temp_dir_ / "plain";
  std::filesystem::create_directories(plain);
  ChangeScanner scanner(git_);
  EXPECT_ERROR(scanner.scan(repository(plain)), ErrorCode::kNotARepository);
}

TEST_F(ChangeScannerGitTest, MissingDirectoryIsReported) {
  ChangeScanner scanner(git_);
  EXPECT_ERROR(scanner.scan(repository(temp_dir_ / "missing")), ErrorCode::kDirectoryNotFound);
}

TEST_F(ChangeScannerGitTest, SubdirectoryIsRejected) {
  std::filesystem::create_directories(work_ / "projects");
  ChangeScanner scanner(git_);
  EXPECT_ERROR(scanner.scan(repository(work_ / "projects")), ErrorCode::kNotARepository);
}
