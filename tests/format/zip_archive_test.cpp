// =============================================================================
// cadvc - ZIP Container Tests
// =============================================================================
// Unit tests for the minizip wrappers: atomic writes, member reads, safe
// extraction, reproducible output and archive digests.
// =============================================================================

#include "cadvc/format/zip_archive.h"

#include <gtest/gtest.h>

#include "cadvc/format/archive_digest.h"
#include "test_support.h"

namespace cadvc::format {
namespace {

namespace fs = std::filesystem;
using test::bytesOf;
using test::TempDir;

// =============================================================================
// Member Name Tests
// =============================================================================

TEST(ZipArchiveTest, SafeMemberNames) {
    EXPECT_TRUE(isSafeMemberName("Document.xml"));
    EXPECT_TRUE(isSafeMemberName("thumbnails/Thumbnail.png"));
    EXPECT_TRUE(isSafeMemberName("a..b/c"));

    EXPECT_FALSE(isSafeMemberName(""));
    EXPECT_FALSE(isSafeMemberName("/etc/passwd"));
    EXPECT_FALSE(isSafeMemberName("C:/Windows"));
    EXPECT_FALSE(isSafeMemberName("../escape"));
    EXPECT_FALSE(isSafeMemberName("a/../../escape"));
    EXPECT_FALSE(isSafeMemberName("a\\..\\escape"));
}

// =============================================================================
// Writer / Reader Tests
// =============================================================================

TEST(ZipArchiveTest, WriteThenRead) {
    TempDir dir;
    const fs::path archive = dir / "doc.FCStd";
    test::makeArchive(archive, {{"Document.xml", bytesOf("<doc/>")},
                                {"sub/data.bin", test::randomBytes(5000)}});

    ZipReader reader(archive);
    ASSERT_EQ(reader.entries().size(), 2u);
    EXPECT_EQ(reader.entries()[0].name, "Document.xml");
    EXPECT_EQ(reader.entries()[0].uncompressedSize, 6u);
    EXPECT_EQ(reader.read("Document.xml"), bytesOf("<doc/>"));
    EXPECT_EQ(reader.read("sub/data.bin"), test::randomBytes(5000));
}

TEST(ZipArchiveTest, WriterLeavesNoTempFile) {
    TempDir dir;
    const fs::path archive = dir / "out.zip";
    {
        ZipWriter writer(archive);
        writer.addFile("a.txt", bytesOf("a"), 6);
        EXPECT_TRUE(fs::exists(writer.tempPath()));
        EXPECT_FALSE(fs::exists(archive));
        writer.finalize();
        EXPECT_TRUE(writer.isFinalized());
        EXPECT_FALSE(fs::exists(writer.tempPath()));
    }
    EXPECT_TRUE(fs::exists(archive));
}

TEST(ZipArchiveTest, AbandonedWriterRemovesTemp) {
    TempDir dir;
    const fs::path archive = dir / "out.zip";
    fs::path temp;
    {
        ZipWriter writer(archive);
        temp = writer.tempPath();
        writer.addFile("a.txt", bytesOf("a"), 6);
    }
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_FALSE(fs::exists(archive));
}

TEST(ZipArchiveTest, OutputIsReproducible) {
    TempDir dir;
    const test::Members members = {{"x.brp", test::randomBytes(2000)},
                                   {"y.xml", bytesOf("<y/>")}};
    test::makeArchive(dir / "one.zip", members);
    test::makeArchive(dir / "two.zip", members);

    EXPECT_EQ(test::readFile(dir / "one.zip"), test::readFile(dir / "two.zip"));
}

TEST(ZipArchiveTest, StoredLevelZero) {
    TempDir dir;
    test::makeArchive(dir / "stored.zip", {{"a.txt", bytesOf(std::string(1000, 'a'))}}, 0);

    ZipReader reader(dir / "stored.zip");
    ASSERT_EQ(reader.entries().size(), 1u);
    EXPECT_EQ(reader.entries()[0].method, kMethodStored);
    EXPECT_EQ(reader.entries()[0].compressedSize, 1000u);
}

TEST(ZipArchiveTest, DeflatedMemberProjectionCoversPayload) {
    auto member = deflateMember("big.brp", test::randomBytes(10000), 6);
    EXPECT_EQ(member.uncompressedSize, 10000u);
    EXPECT_GE(member.projectedSize(), member.payload.size() + kLocalHeaderSize);
}

TEST(ZipArchiveTest, ExtractAllHonoursFilter) {
    TempDir dir;
    test::makeArchive(dir / "a.zip", {{"keep/me.txt", bytesOf("1")},
                                      {"skip/me.txt", bytesOf("2")}});

    ZipReader reader(dir / "a.zip");
    const auto written = reader.extractAll(dir / "out", [](const ZipEntry& entry) {
        return !entry.name.starts_with("skip/");
    });

    EXPECT_EQ(written, 1u);
    EXPECT_EQ(test::readFile(dir / "out/keep/me.txt"), "1");
    EXPECT_FALSE(fs::exists(dir / "out/skip"));
}

// =============================================================================
// Error Tests
// =============================================================================

TEST(ZipArchiveTest, MissingFileIsIOError) {
    TempDir dir;
    EXPECT_THROW(ZipReader(dir / "absent.zip"), IOError);
}

TEST(ZipArchiveTest, GarbageIsFormatError) {
    TempDir dir;
    test::writeFile(dir / "junk.FCStd", "this is not a zip file at all");
    EXPECT_THROW(ZipReader(dir / "junk.FCStd"), FormatError);
}

TEST(ZipArchiveTest, ReadingMissingMemberIsFormatError) {
    TempDir dir;
    test::makeArchive(dir / "a.zip", {{"a.txt", bytesOf("a")}});
    ZipReader reader(dir / "a.zip");
    EXPECT_THROW((void)reader.read("b.txt"), FormatError);
}

// =============================================================================
// Digest Tests
// =============================================================================

TEST(ArchiveDigestTest, IgnoresOrderAndCompressionLevel) {
    TempDir dir;
    test::makeArchive(dir / "a.zip", {{"a.txt", bytesOf("alpha")}, {"b.txt", bytesOf("beta")}},
                      9);
    test::makeArchive(dir / "b.zip", {{"b.txt", bytesOf("beta")}, {"a.txt", bytesOf("alpha")}},
                      0);

    const auto left = digestArchive(dir / "a.zip");
    const auto right = digestArchive(dir / "b.zip");
    EXPECT_EQ(left.combined, right.combined);
    EXPECT_TRUE(compareDigests(left, right).equal());
}

TEST(ArchiveDigestTest, ReportsDifferences) {
    TempDir dir;
    test::makeArchive(dir / "a.zip", {{"same.txt", bytesOf("s")},
                                      {"changed.txt", bytesOf("old")},
                                      {"gone.txt", bytesOf("g")}});
    test::makeArchive(dir / "b.zip", {{"same.txt", bytesOf("s")},
                                      {"changed.txt", bytesOf("new")},
                                      {"added.txt", bytesOf("a")}});

    const auto diff = compareDigests(digestArchive(dir / "a.zip"), digestArchive(dir / "b.zip"));
    EXPECT_FALSE(diff.equal());
    EXPECT_EQ(diff.onlyInLeft, std::vector<std::string>{"gone.txt"});
    EXPECT_EQ(diff.onlyInRight, std::vector<std::string>{"added.txt"});
    EXPECT_EQ(diff.differing, std::vector<std::string>{"changed.txt"});
}

TEST(ArchiveDigestTest, XxHashIsSeedSensitive) {
    const auto data = bytesOf("cadvc");
    EXPECT_EQ(calculateXxHash64(data), calculateXxHash64(data));
    EXPECT_NE(calculateXxHash64(data, 0), calculateXxHash64(data, 1));
}

}  // namespace
}  // namespace cadvc::format
