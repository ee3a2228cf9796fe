// =============================================================================
// cadvc - Lock Coordinator Tests
// =============================================================================
// Unit tests for marker mapping, acquire/release/steal semantics against an
// in-memory lock server, listing parsing and refusal classification.
// =============================================================================

#include "cadvc/lock/lock_coordinator.h"

#include <gtest/gtest.h>

#include <map>

#include "fakes.h"
#include "test_support.h"

namespace cadvc::lock {
namespace {

namespace fs = std::filesystem;
using test::FakeLockServer;
using test::FakeVcs;
using test::TempDir;

// =============================================================================
// Listing Parsing Tests
// =============================================================================

TEST(LockListingTest, ParsesTabSeparatedLines) {
    const auto records = parseLockListing(
        "part_uncompressed/.lockfile\talice\tID:17\n"
        "sub/gear_uncompressed/.lockfile\tbob\tID:18\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].markerPath, "part_uncompressed/.lockfile");
    EXPECT_EQ(records[0].owner, "alice");
    EXPECT_EQ(records[0].lockId, "17");
    EXPECT_EQ(records[1].owner, "bob");
    EXPECT_FALSE(records[0].archive.has_value());
}

TEST(LockListingTest, ParsesWhitespaceAndSkipsNoise) {
    const auto records = parseLockListing(
        "\n"
        "-- locks --\n"
        "a_uncompressed/.lockfile   carol   ID:3   extra\r\n"
        "lonely\n"
        "b_uncompressed/.lockfile dave\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].owner, "carol");
    EXPECT_EQ(records[0].lockId, "3");
    EXPECT_EQ(records[1].markerPath, "b_uncompressed/.lockfile");
    EXPECT_EQ(records[1].lockId, "");
}

TEST(LockListingTest, TabbedPathsMayContainSpaces) {
    const auto records = parseLockListing("my part_uncompressed/.lockfile\tEve Smith\tID:9\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].markerPath, "my part_uncompressed/.lockfile");
    EXPECT_EQ(records[0].owner, "Eve Smith");
}

// =============================================================================
// Refusal Tests
// =============================================================================

TEST(LockRefusalTest, ExtractOwner) {
    EXPECT_EQ(extractLockOwner("Lock exists: a/.lockfile is already locked by alice"), "alice");
    EXPECT_EQ(extractLockOwner("lock is owned by 'bob'."), "bob");
    EXPECT_EQ(extractLockOwner("Locked By carol, since yesterday"), "carol");
    EXPECT_EQ(extractLockOwner("something went wrong"), kUnknownLockOwner);
}

TEST(LockRefusalTest, Classify) {
    auto held = classifyRefusal("Lock exists\nx is already locked by alice", "x.FCStd");
    EXPECT_EQ(held.code(), ErrorCode::kAlreadyLocked);
    EXPECT_EQ(held.lockOwner(), "alice");

    EXPECT_EQ(classifyRefusal("Unable to unlock: x is not locked", "x.FCStd").code(),
              ErrorCode::kNotLocked);
    EXPECT_EQ(classifyRefusal("Lock not found", "x.FCStd").code(), ErrorCode::kNotLocked);
    EXPECT_EQ(classifyRefusal("no matching locks found", "x.FCStd").code(), ErrorCode::kNotLocked);

    auto anonymous = classifyRefusal("Lock exists", "x.FCStd");
    EXPECT_EQ(anonymous.code(), ErrorCode::kAlreadyLocked);
    EXPECT_EQ(anonymous.lockOwner(), std::string(kUnknownLockOwner));

    EXPECT_EQ(classifyRefusal("api error: 500", "x.FCStd").code(), ErrorCode::kIOError);
}

// =============================================================================
// Coordinator Tests
// =============================================================================

class LockCoordinatorTest : public ::testing::Test {
protected:
    LockCoordinatorTest() : vcs_(dir_.path()) {}

    LockCoordinator make(RepositoryConfig config = {}) {
        return LockCoordinator(std::move(config), dir_.path(), server_, vcs_);
    }

    TempDir dir_;
    FakeLockServer server_;
    FakeVcs vcs_;
};

TEST_F(LockCoordinatorTest, MarkerPathFollowsTreeLocation) {
    auto locks = make();
    EXPECT_EQ(locks.markerPathFor("part.FCStd"), "part_uncompressed/.lockfile");
    EXPECT_EQ(locks.markerPathFor(dir_ / "sub/gear.FCStd"), "sub/gear_uncompressed/.lockfile");

    RepositoryConfig nested;
    nested.subdirectoryMode = true;
    EXPECT_EQ(make(nested).markerPathFor("part.FCStd"), ".freecad_data/part_uncompressed/.lockfile");
}

TEST_F(LockCoordinatorTest, AcquireCreatesAndStagesMarker) {
    auto locks = make();
    ASSERT_TRUE(locks.acquire("part.FCStd", "alice", false).has_value());

    const fs::path marker = dir_ / "part_uncompressed/.lockfile";
    EXPECT_EQ(test::readFile(marker), "part.FCStd\n");
    ASSERT_EQ(vcs_.added.size(), 1u);
    EXPECT_EQ(vcs_.added[0], marker);
    EXPECT_EQ(server_.locks.at("part_uncompressed/.lockfile").owner, "alice");

    // Second acquire finds the marker and the lock already in place
    ASSERT_TRUE(locks.acquire("part.FCStd", "alice", false).has_value());
    EXPECT_EQ(vcs_.added.size(), 1u);
}

TEST_F(LockCoordinatorTest, EmptyActorIsUsageError) {
    auto locks = make();
    auto held = locks.acquire("part.FCStd", "", false);
    ASSERT_FALSE(held.has_value());
    EXPECT_EQ(held.error().code(), ErrorCode::kUsageError);
    EXPECT_EQ(server_.lockCalls, 0);
}

TEST_F(LockCoordinatorTest, StealScenario) {
    auto locks = make();

    ASSERT_TRUE(locks.acquire("part.FCStd", "alice", false).has_value());

    auto refused = locks.acquire("part.FCStd", "bob", false);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code(), ErrorCode::kAlreadyLocked);
    EXPECT_EQ(refused.error().lockOwner(), "alice");

    ASSERT_TRUE(locks.acquire("part.FCStd", "bob", true).has_value());
    EXPECT_EQ(server_.locks.at("part_uncompressed/.lockfile").owner, "bob");
    EXPECT_TRUE(locks.isLockedBy("part.FCStd", "bob").value());
    EXPECT_FALSE(locks.isLockedBy("part.FCStd", "alice").value());

    auto reversed = locks.acquire("part.FCStd", "alice", false);
    ASSERT_FALSE(reversed.has_value());
    EXPECT_EQ(reversed.error().code(), ErrorCode::kAlreadyLocked);
    EXPECT_EQ(reversed.error().lockOwner(), "bob");
}

TEST_F(LockCoordinatorTest, BareRefusalNamesOwnerFromListing) {
    auto locks = make();
    ASSERT_TRUE(locks.acquire("part.FCStd", "alice", false).has_value());
    server_.bareRefusals = true;

    // Re-locking your own archive still succeeds
    EXPECT_TRUE(locks.acquire("part.FCStd", "alice", false).has_value());

    auto refused = locks.acquire("part.FCStd", "bob", false);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code(), ErrorCode::kAlreadyLocked);
    EXPECT_EQ(refused.error().lockOwner(), "alice");
    EXPECT_NE(refused.error().message().find("alice"), std::string::npos);
}

TEST_F(LockCoordinatorTest, ReleaseSemantics) {
    auto locks = make();

    auto idle = locks.release("part.FCStd", "alice", false);
    ASSERT_FALSE(idle.has_value());
    EXPECT_EQ(idle.error().code(), ErrorCode::kNotLocked);

    ASSERT_TRUE(locks.acquire("part.FCStd", "alice", false).has_value());

    auto foreign = locks.release("part.FCStd", "bob", false);
    ASSERT_FALSE(foreign.has_value());
    EXPECT_EQ(foreign.error().code(), ErrorCode::kAlreadyLocked);
    EXPECT_EQ(foreign.error().lockOwner(), "alice");

    ASSERT_TRUE(locks.release("part.FCStd", "alice", false).has_value());
    EXPECT_TRUE(server_.locks.empty());

    // The marker stays behind for the next lock
    EXPECT_TRUE(fs::exists(dir_ / "part_uncompressed/.lockfile"));
}

TEST_F(LockCoordinatorTest, ForcedReleaseOfForeignLock) {
    auto locks = make();
    ASSERT_TRUE(locks.acquire("part.FCStd", "alice", false).has_value());
    ASSERT_TRUE(locks.release("part.FCStd", "bob", true).has_value());
    EXPECT_TRUE(server_.locks.empty());
}

TEST_F(LockCoordinatorTest, ListActiveReadsMarkerIdentity) {
    auto locks = make();
    ASSERT_TRUE(locks.acquire("part.FCStd", "alice", false).has_value());
    ASSERT_TRUE(locks.acquire("sub/gear.FCStd", "bob", false).has_value());
    server_.locks["ghost_uncompressed/.lockfile"] = FakeLockServer::Held{"carol", 99};

    auto records = locks.listActive();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 3u);

    std::map<std::string, LockRecord> byOwner;
    for (const auto& record : *records) {
        byOwner[record.owner] = record;
    }
    EXPECT_EQ(byOwner["alice"].archive, "part.FCStd");
    EXPECT_EQ(byOwner["bob"].archive, "sub/gear.FCStd");
    EXPECT_FALSE(byOwner["carol"].archive.has_value());
    EXPECT_EQ(byOwner["carol"].lockId, "99");
}

TEST_F(LockCoordinatorTest, IsLockedBy) {
    auto locks = make();
    ASSERT_TRUE(locks.acquire("part.FCStd", "alice", false).has_value());

    EXPECT_TRUE(locks.isLockedBy("part.FCStd", "alice").value());
    EXPECT_FALSE(locks.isLockedBy("part.FCStd", "bob").value());
    EXPECT_TRUE(locks.isLockedBy(dir_ / "part.FCStd", "alice").value());
    EXPECT_FALSE(locks.isLockedBy("other.FCStd", "alice").value());
}

TEST_F(LockCoordinatorTest, UnreachableServerPropagates) {
    auto locks = make();
    server_.unreachable = true;

    auto held = locks.acquire("part.FCStd", "alice", false);
    ASSERT_FALSE(held.has_value());
    EXPECT_EQ(held.error().code(), ErrorCode::kTimeout);

    auto listed = locks.listActive();
    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error().code(), ErrorCode::kTimeout);
}

}  // namespace
}  // namespace cadvc::lock
