// =============================================================================
// cadvc - Git Client Tests
// =============================================================================
// Runs the git command line in scratch repositories. Skipped where git is not
// installed.
// =============================================================================

#include "cadvc/vcs/vcs_client.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_support.h"

namespace cadvc::vcs {
namespace {

using test::TempDir;

/// @brief Run git and fail the test on a non-zero exit.
void git(const GitClient& client, const std::vector<std::string>& args) {
    auto out = client.capture(args);
    ASSERT_TRUE(out.has_value()) << out.error().message();
}

void commit(const GitClient& client, const std::string& message) {
    git(client, {"-c", "user.name=t", "-c", "user.email=t@example.com", "-c",
                 "commit.gpgsign=false", "commit", "-q", "-m", message});
}

class GitClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto version = client_.run({"--version"});
        if (!version || !version->succeeded()) {
            GTEST_SKIP() << "git is not installed";
        }
        git(client_, {"init", "-q"});
    }

    TempDir dir_;
    GitClient client_{dir_.path()};
};

// =============================================================================
// Helper Tests
// =============================================================================

TEST(GitHelpersTest, NullObjectIds) {
    EXPECT_TRUE(isNullObjectId(kNullObjectId));
    EXPECT_TRUE(isNullObjectId("0000000"));
    EXPECT_FALSE(isNullObjectId(kEmptyTreeObjectId));
    EXPECT_FALSE(isNullObjectId(""));
}

TEST(GitHelpersTest, SplitLinesDropsBlanksAndCarriageReturns) {
    EXPECT_EQ(splitLines("a.FCStd\r\n\nb/c.FCStd\n"),
              (std::vector<std::string>{"a.FCStd", "b/c.FCStd"}));
    EXPECT_TRUE(splitLines("").empty());
}

// =============================================================================
// Staged File Tests
// =============================================================================

TEST_F(GitClientTest, StagedFilesOnUnbornBranch) {
    test::writeFile(dir_ / "a.txt", "one\n");
    git(client_, {"add", "a.txt"});
    EXPECT_FALSE(client_.refExists("HEAD"));

    auto staged = client_.stagedModifiedFiles();
    ASSERT_TRUE(staged.has_value()) << staged.error().message();
    // Additions are not modifications
    EXPECT_TRUE(staged->empty());
}

TEST_F(GitClientTest, StagedModificationAfterFirstCommit) {
    test::writeFile(dir_ / "a.txt", "one\n");
    test::writeFile(dir_ / "b.txt", "two\n");
    git(client_, {"add", "a.txt", "b.txt"});
    commit(client_, "init");
    EXPECT_TRUE(client_.refExists("HEAD"));

    test::writeFile(dir_ / "a.txt", "changed\n");
    test::writeFile(dir_ / "b.txt", "changed but unstaged\n");
    git(client_, {"add", "a.txt"});

    auto staged = client_.stagedModifiedFiles();
    ASSERT_TRUE(staged.has_value()) << staged.error().message();
    EXPECT_EQ(*staged, (std::vector<std::string>{"a.txt"}));
}

}  // namespace
}  // namespace cadvc::vcs
