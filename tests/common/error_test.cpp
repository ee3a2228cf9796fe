// =============================================================================
// cadvc - Error Handling Tests
// =============================================================================
// Unit tests for error codes, exit code mapping, Result helpers and the
// exception/Result bridge.
// =============================================================================

#include "cadvc/common/error.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

namespace cadvc {
namespace {

// =============================================================================
// ErrorCode Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodesAreDistinct) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kAlreadyLocked), 8);
    EXPECT_EQ(toExitCode(ErrorCode::kInternal), 12);
}

TEST(ErrorCodeTest, ToStringCoversEveryCode) {
    for (int i = 0; i <= toExitCode(ErrorCode::kInternal); ++i) {
        EXPECT_NE(errorCodeToString(static_cast<ErrorCode>(i)), "unknown error") << i;
    }
}

TEST(ErrorCodeTest, SystemErrorMapping) {
    EXPECT_EQ(errorCodeFromSystem(std::make_error_code(std::errc::no_such_file_or_directory)),
              ErrorCode::kNotFound);
    EXPECT_EQ(errorCodeFromSystem(std::make_error_code(std::errc::permission_denied)),
              ErrorCode::kPermissionDenied);
    EXPECT_EQ(errorCodeFromSystem(std::make_error_code(std::errc::no_space_on_device)),
              ErrorCode::kIOError);
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(CadvcExceptionTest, WhatIncludesCategoryAndContext) {
    FormatError ex("Central directory is damaged",
                   ErrorContext("/tmp/gear.FCStd").withMember("Document.xml"));

    const std::string what = ex.what();
    EXPECT_NE(what.find("[corrupt archive]"), std::string::npos);
    EXPECT_NE(what.find("Central directory is damaged"), std::string::npos);
    EXPECT_NE(what.find("file: /tmp/gear.FCStd"), std::string::npos);
    EXPECT_NE(what.find("member: Document.xml"), std::string::npos);
    EXPECT_EQ(ex.code(), ErrorCode::kCorruptArchive);
    EXPECT_EQ(ex.exitCode(), 5);
}

TEST(CadvcExceptionTest, IOErrorCarriesSystemError) {
    IOError ex("Cannot open", std::make_error_code(std::errc::permission_denied));
    ASSERT_TRUE(ex.systemError().has_value());
    EXPECT_EQ(*ex.systemError(), std::errc::permission_denied);
}

TEST(CadvcExceptionTest, ErrorRoundTripsThroughException) {
    Error error(ErrorCode::kNotLocked, "parts/gear.FCStd is not locked");
    try {
        error.throwException();
        FAIL() << "throwException returned";
    } catch (const CadvcException& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kNotLocked);
        EXPECT_EQ(ex.message(), "parts/gear.FCStd is not locked");
    }
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, LockOwnerTravelsWithError) {
    Error error(ErrorCode::kAlreadyLocked, "locked");
    EXPECT_FALSE(error.lockOwner().has_value());

    error.withLockOwner("bob");
    ASSERT_TRUE(error.lockOwner().has_value());
    EXPECT_EQ(*error.lockOwner(), "bob");
}

TEST(ResultTest, UnwrapOrThrow) {
    EXPECT_EQ(unwrapOrThrow(makeSuccess(7)), 7);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kIOError, "boom")), IOError);
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kUsageError, "bad")), UsageError);
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
}

TEST(ResultTest, TryExecuteMapsExceptions) {
    auto ok = tryExecute([] { return 3; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 3);

    auto cadvc = tryExecute([]() -> int { throw UsageError("nope"); });
    ASSERT_FALSE(cadvc.has_value());
    EXPECT_EQ(cadvc.error().code(), ErrorCode::kUsageError);

    auto fsError = tryExecute([] {
        throw std::filesystem::filesystem_error(
            "stat", std::make_error_code(std::errc::no_such_file_or_directory));
    });
    ASSERT_FALSE(fsError.has_value());
    EXPECT_EQ(fsError.error().code(), ErrorCode::kNotFound);

    auto other = tryExecute([] { throw std::runtime_error("odd"); });
    ASSERT_FALSE(other.has_value());
    EXPECT_EQ(other.error().code(), ErrorCode::kInternal);
}

}  // namespace
}  // namespace cadvc
