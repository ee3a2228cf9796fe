// =============================================================================
// cadvc - Subprocess Tests
// =============================================================================
// Unit tests for process launch, output capture, stdin feeding, deadlines and
// launch failure mapping. Uses /bin/sh, which every POSIX system provides.
// =============================================================================

#include "cadvc/io/subprocess.h"

#include <gtest/gtest.h>

#include <chrono>

#include "cadvc/io/file_io.h"
#include "test_support.h"

namespace cadvc::io {
namespace {

using namespace std::chrono_literals;

TEST(SubprocessTest, CapturesStdoutAndStderr) {
    auto result = runProcess({"/bin/sh", "-c", "echo out; echo err 1>&2"});
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_TRUE(result->succeeded());
    EXPECT_EQ(result->stdoutText, "out\n");
    EXPECT_EQ(result->stderrText, "err\n");
    EXPECT_EQ(result->combinedOutput(), "err\nout\n");
}

TEST(SubprocessTest, ReportsExitStatus) {
    auto result = runProcess({"/bin/sh", "-c", "exit 3"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 3);
    EXPECT_FALSE(result->succeeded());
    EXPECT_FALSE(result->timedOut);
}

TEST(SubprocessTest, FeedsStdin) {
    ProcessOptions options;
    options.stdinData = "line one\nline two\n";
    auto result = runProcess({"/bin/sh", "-c", "cat"}, options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, options.stdinData);
}

TEST(SubprocessTest, RunsInWorkingDirectory) {
    test::TempDir dir;
    ProcessOptions options;
    options.workingDirectory = dir.path();
    auto result = runProcess({"/bin/sh", "-c", "echo here > marker.txt"}, options);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->succeeded());
    EXPECT_EQ(readFileText(dir / "marker.txt"), "here\n");
}

TEST(SubprocessTest, KillsChildAtDeadline) {
    ProcessOptions options;
    options.timeout = 200ms;

    const auto start = std::chrono::steady_clock::now();
    auto result = runProcess({"/bin/sh", "-c", "sleep 10"}, options);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->timedOut);
    EXPECT_FALSE(result->succeeded());
    EXPECT_LT(elapsed, 5s);
}

TEST(SubprocessTest, MissingProgramIsNotFound) {
    auto result = runProcess({"cadvc-definitely-not-a-real-program"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kNotFound);
}

TEST(SubprocessTest, EmptyCommandIsUsageError) {
    auto result = runProcess({});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUsageError);
}

TEST(SubprocessTest, FormatCommandLine) {
    EXPECT_EQ(formatCommandLine({"git", "lfs", "lock", "a/.lockfile"}),
              "git lfs lock a/.lockfile");
}

// =============================================================================
// File Helper Tests
// =============================================================================

TEST(FileIoTest, WriteThenReadBytes) {
    test::TempDir dir;
    const auto data = test::randomBytes(1234);
    writeFileBytes(dir / "data.bin", data);
    EXPECT_EQ(readFileBytes(dir / "data.bin"), data);
}

TEST(FileIoTest, MissingFileThrows) {
    test::TempDir dir;
    EXPECT_THROW((void)readFileText(dir / "absent.txt"), IOError);
}

}  // namespace
}  // namespace cadvc::io
