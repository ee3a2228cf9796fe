// =============================================================================
// cadvc - Archive Transformer Tests
// =============================================================================
// Unit tests for export/import: tree layout, round trips with and without
// chunking, the multi-chunk scenario, failure kinds and change indicators.
// =============================================================================

#include "cadvc/transform/archive_transformer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include <unistd.h>

#include "cadvc/format/archive_digest.h"
#include "cadvc/format/zip_archive.h"
#include "test_support.h"

namespace cadvc::transform {
namespace {

namespace fs = std::filesystem;
using test::bytesOf;
using test::TempDir;

constexpr std::uint64_t kMiB = 1024 * 1024;

std::vector<std::string> memberNames(const fs::path& archive) {
    format::ZipReader reader(archive);
    std::vector<std::string> names;
    for (const auto& entry : reader.entries()) {
        names.push_back(entry.name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// =============================================================================
// Change Indicator Tests
// =============================================================================

TEST(ChangeFileTest, FormatThenParse) {
    const auto text = formatChangeFile("parts/gear.FCStd", std::chrono::system_clock::now());
    EXPECT_NE(text.find("File Last Exported On: "), std::string::npos);
    EXPECT_NE(text.find("FCStd_file_relpath='parts/gear.FCStd'"), std::string::npos);
    EXPECT_EQ(parseChangeFile(text), "parts/gear.FCStd");
}

TEST(ChangeFileTest, ParseVariants) {
    EXPECT_EQ(parseChangeFile("FCStd_file_relpath=\"a b/c.FCStd\"\r\n"), "a b/c.FCStd");
    EXPECT_EQ(parseChangeFile("x\nFCStd_file_relpath=plain.FCStd"), "plain.FCStd");
    EXPECT_FALSE(parseChangeFile("File Last Exported On: 2024-01-01\n").has_value());
    EXPECT_FALSE(parseChangeFile("FCStd_file_relpath=''\n").has_value());
}

TEST(ChangeFileTest, ReadMissingFile) {
    TempDir dir;
    EXPECT_FALSE(readChangeFile(dir / ".changefile").has_value());
}

// =============================================================================
// Path Mapping Tests
// =============================================================================

TEST(ArchiveTransformerTest, TreeRootAndIdentity) {
    TempDir dir;
    RepositoryConfig config;
    ArchiveTransformer transformer(config, dir.path());

    EXPECT_EQ(transformer.treeRootFor("parts/gear.FCStd"), dir / "parts/gear_uncompressed");
    EXPECT_EQ(transformer.identityOf(dir / "parts/gear.FCStd"), "parts/gear.FCStd");
    EXPECT_EQ(transformer.identityOf("parts/gear.FCStd"), "parts/gear.FCStd");

    config.subdirectoryMode = true;
    ArchiveTransformer nested(config, dir.path());
    EXPECT_EQ(nested.treeRootFor("gear.FCStd"), dir / ".freecad_data/gear_uncompressed");
}

// =============================================================================
// Export Tests
// =============================================================================

TEST(ArchiveTransformerTest, ExportLayout) {
    TempDir dir;
    const fs::path archive = dir / "bracket.FCStd";
    test::makeArchive(archive, test::sampleDocument());

    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto exported = transformer.exportArchive(archive);
    ASSERT_TRUE(exported.has_value()) << exported.error().message();

    const fs::path tree = dir / "bracket_uncompressed";
    EXPECT_EQ(exported->treeRoot, tree);
    EXPECT_EQ(exported->relocatedCount, 1u);
    EXPECT_EQ(exported->chunkedCount, 3u);
    EXPECT_EQ(exported->chunkCount, 1u);

    EXPECT_TRUE(fs::exists(tree / "Document.xml"));
    EXPECT_TRUE(fs::exists(tree / "GuiDocument.xml"));
    EXPECT_TRUE(fs::exists(tree / "StringHasher.Table"));
    EXPECT_TRUE(fs::exists(tree / "binaries_1.zip"));
    EXPECT_FALSE(fs::exists(tree / "PartShape.brp"));
    EXPECT_FALSE(fs::exists(tree / "ShapeCache"));
    EXPECT_FALSE(fs::exists(tree / "no_extension/ShapeCache"));
    EXPECT_TRUE(fs::exists(tree / "thumbnails/Thumbnail.png"));

    EXPECT_EQ(readChangeFile(tree / ".changefile"), "bracket.FCStd");

    // The archive itself is untouched
    EXPECT_TRUE(fs::exists(archive));
}

TEST(ArchiveTransformerTest, ExportWithoutChunkingRelocatesExtensionless) {
    TempDir dir;
    const fs::path archive = dir / "bracket.FCStd";
    test::makeArchive(archive, test::sampleDocument());

    RepositoryConfig config;
    config.compressBinaries = false;
    ArchiveTransformer transformer(config, dir.path());
    auto exported = transformer.exportArchive(archive);
    ASSERT_TRUE(exported.has_value());

    const fs::path tree = exported->treeRoot;
    EXPECT_EQ(test::readFile(tree / "no_extension/ShapeCache"), "extensionless member");
    EXPECT_TRUE(fs::exists(tree / "PartShape.brp"));
    EXPECT_TRUE(fs::exists(tree / "thumbnails/Thumbnail.png"));
    EXPECT_EQ(exported->chunkCount, 0u);
}

TEST(ArchiveTransformerTest, ThumbnailsCanBeLeftOut) {
    TempDir dir;
    const fs::path archive = dir / "bracket.FCStd";
    test::makeArchive(archive, test::sampleDocument());

    RepositoryConfig config;
    config.includeThumbnails = false;
    ArchiveTransformer transformer(config, dir.path());
    auto exported = transformer.exportArchive(archive);
    ASSERT_TRUE(exported.has_value());

    EXPECT_FALSE(fs::exists(exported->treeRoot / "thumbnails"));
    EXPECT_TRUE(fs::exists(exported->treeRoot / "Document.xml"));
}

TEST(ArchiveTransformerTest, ReExportReplacesTreeButKeepsLockMarker) {
    TempDir dir;
    const fs::path archive = dir / "bracket.FCStd";
    test::makeArchive(archive, test::sampleDocument());

    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    ASSERT_TRUE(transformer.exportArchive(archive).has_value());

    const fs::path tree = dir / "bracket_uncompressed";
    test::writeFile(tree / ".lockfile", "bracket.FCStd\n");
    test::writeFile(tree / "Stale.xml", "left over");

    test::makeArchive(archive, {{"Document.xml", bytesOf("<new/>")}});
    ASSERT_TRUE(transformer.exportArchive(archive).has_value());

    EXPECT_TRUE(fs::exists(tree / ".lockfile"));
    EXPECT_FALSE(fs::exists(tree / "Stale.xml"));
    EXPECT_FALSE(fs::exists(tree / "binaries_1.zip"));
    EXPECT_EQ(test::readFile(tree / "Document.xml"), "<new/>");
}

TEST(ArchiveTransformerTest, ExportToExplicitTree) {
    TempDir dir;
    const fs::path archive = dir / "a.FCStd";
    test::makeArchive(archive, {{"Document.xml", bytesOf("<d/>")}});

    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto exported = transformer.exportArchive(archive, dir / "elsewhere");
    ASSERT_TRUE(exported.has_value());
    EXPECT_TRUE(fs::exists(dir / "elsewhere/Document.xml"));
    EXPECT_FALSE(fs::exists(dir / "a_uncompressed"));
}

// =============================================================================
// Export Failure Tests
// =============================================================================

TEST(ArchiveTransformerTest, ExportMissingArchive) {
    TempDir dir;
    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto exported = transformer.exportArchive(dir / "absent.FCStd");
    ASSERT_FALSE(exported.has_value());
    EXPECT_EQ(exported.error().code(), ErrorCode::kNotFound);
}

TEST(ArchiveTransformerTest, ExportWrongFileType) {
    TempDir dir;
    test::makeArchive(dir / "a.zip", {{"Document.xml", bytesOf("<d/>")}});
    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto exported = transformer.exportArchive(dir / "a.zip");
    ASSERT_FALSE(exported.has_value());
    EXPECT_EQ(exported.error().code(), ErrorCode::kWrongFileType);
}

TEST(ArchiveTransformerTest, ExportCorruptArchiveLeavesNoTree) {
    TempDir dir;
    test::writeFile(dir / "broken.FCStd", "PK but not really a zip");
    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto exported = transformer.exportArchive(dir / "broken.FCStd");
    ASSERT_FALSE(exported.has_value());
    EXPECT_EQ(exported.error().code(), ErrorCode::kCorruptArchive);
    EXPECT_FALSE(fs::exists(dir / "broken_uncompressed"));
}

TEST(ArchiveTransformerTest, ExportUnreadableArchive) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root bypasses file permissions";
    }
    TempDir dir;
    const fs::path archive = dir / "locked.FCStd";
    test::makeArchive(archive, {{"Document.xml", bytesOf("<d/>")}});
    fs::permissions(archive, fs::perms::none);

    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto exported = transformer.exportArchive(archive);
    fs::permissions(archive, fs::perms::owner_read | fs::perms::owner_write);

    ASSERT_FALSE(exported.has_value());
    EXPECT_EQ(exported.error().code(), ErrorCode::kPermissionDenied);
}

TEST(ArchiveTransformerTest, ExportOversizedBinaryIsFileTooLarge) {
    TempDir dir;
    const fs::path archive = dir / "big.FCStd";
    test::makeArchive(archive, {{"Document.xml", bytesOf("<d/>")},
                                {"model.brp", test::randomBytes(300 * 1024)}});

    RepositoryConfig config;
    config.maxChunkBytes = 100 * 1024;
    ArchiveTransformer transformer(config, dir.path());
    auto exported = transformer.exportArchive(archive);
    ASSERT_FALSE(exported.has_value());
    EXPECT_EQ(exported.error().code(), ErrorCode::kFileTooLarge);
}

TEST(ArchiveTransformerTest, FailedExportCanBeRetried) {
    TempDir dir;
    const fs::path archive = dir / "big.FCStd";
    test::makeArchive(archive, {{"Document.xml", bytesOf("<d/>")},
                                {"a_small.brp", test::randomBytes(1000, 1)},
                                {"b_huge.brp", test::randomBytes(300 * 1024, 2)}});

    RepositoryConfig tight;
    tight.maxChunkBytes = 100 * 1024;
    auto failed = ArchiveTransformer(tight, dir.path()).exportArchive(archive);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kFileTooLarge);

    const fs::path tree = dir / "big_uncompressed";
    EXPECT_TRUE(fs::exists(tree / "binaries_1.zip"));
    EXPECT_FALSE(fs::exists(tree / ".changefile"));

    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto exported = transformer.exportArchive(archive);
    ASSERT_TRUE(exported.has_value()) << exported.error().message();
    EXPECT_EQ(exported->chunkedCount, 2u);

    const fs::path rebuilt = dir / "rebuilt.FCStd";
    ASSERT_TRUE(transformer.importArchive(tree, rebuilt).has_value());
    EXPECT_TRUE(
        format::compareDigests(format::digestArchive(archive), format::digestArchive(rebuilt))
            .equal());
}

// =============================================================================
// Import Tests
// =============================================================================

TEST(ArchiveTransformerTest, RoundTripWithChunking) {
    TempDir dir;
    const fs::path archive = dir / "bracket.FCStd";
    test::makeArchive(archive, test::sampleDocument());

    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto exported = transformer.exportArchive(archive);
    ASSERT_TRUE(exported.has_value());

    const fs::path rebuilt = dir / "rebuilt.FCStd";
    auto imported = transformer.importArchive(exported->treeRoot, rebuilt);
    ASSERT_TRUE(imported.has_value()) << imported.error().message();
    EXPECT_EQ(imported->memberCount, test::sampleDocument().size());
    EXPECT_EQ(imported->unchunkedCount, 3u);

    const auto diff =
        format::compareDigests(format::digestArchive(archive), format::digestArchive(rebuilt));
    EXPECT_TRUE(diff.equal());
    EXPECT_FALSE(fs::exists(rebuilt.string() + ".tmp"));
}

TEST(ArchiveTransformerTest, RoundTripWithoutChunking) {
    TempDir dir;
    const fs::path archive = dir / "bracket.FCStd";
    test::makeArchive(archive, test::sampleDocument());

    RepositoryConfig config;
    config.compressBinaries = false;
    ArchiveTransformer transformer(config, dir.path());
    auto exported = transformer.exportArchive(archive);
    ASSERT_TRUE(exported.has_value());

    const fs::path rebuilt = dir / "rebuilt.FCStd";
    ASSERT_TRUE(transformer.importArchive(exported->treeRoot, rebuilt).has_value());
    EXPECT_TRUE(
        format::compareDigests(format::digestArchive(archive), format::digestArchive(rebuilt))
            .equal());
}

TEST(ArchiveTransformerTest, MultiChunkScenario) {
    TempDir dir;
    const fs::path archive = dir / "bracket.FCStd";
    test::Members members = {{"Document.xml", bytesOf(std::string(500, 'd'))}};
    for (int i = 0; i < 5; ++i) {
        members.emplace_back("model" + std::to_string(i) + ".brp",
                             test::randomBytes(900 * 1024, static_cast<std::uint64_t>(100 + i)));
    }
    test::makeArchive(archive, members);

    RepositoryConfig config;
    config.maxChunkBytes = 2 * kMiB;
    ArchiveTransformer transformer(config, dir.path());
    auto exported = transformer.exportArchive(archive);
    ASSERT_TRUE(exported.has_value()) << exported.error().message();

    const fs::path tree = exported->treeRoot;
    EXPECT_EQ(exported->chunkCount, 3u);
    EXPECT_TRUE(fs::exists(tree / "Document.xml"));
    for (std::uint32_t i = 1; i <= 3; ++i) {
        const fs::path chunk = tree / ("binaries_" + std::to_string(i) + ".zip");
        ASSERT_TRUE(fs::exists(chunk));
        EXPECT_LE(fs::file_size(chunk), 2 * kMiB);
    }

    const fs::path rebuilt = dir / "rebuilt.FCStd";
    ASSERT_TRUE(transformer.importArchive(tree, rebuilt).has_value());
    EXPECT_EQ(memberNames(rebuilt), memberNames(archive));
    EXPECT_TRUE(
        format::compareDigests(format::digestArchive(archive), format::digestArchive(rebuilt))
            .equal());
}

TEST(ArchiveTransformerTest, ImportSkipsMarkersAndChunkArtifacts) {
    TempDir dir;
    const fs::path tree = dir / "t";
    test::writeFile(tree / "Document.xml", "<d/>");
    test::writeFile(tree / ".changefile", "FCStd_file_relpath='t.FCStd'\n");
    test::writeFile(tree / ".lockfile", "t.FCStd\n");
    test::writeFile(tree / "binaries_4.zip.tmp", "partial");
    test::writeFile(tree / "no_extension/Tip", "tip");

    RepositoryConfig config;
    config.compressBinaries = false;
    ArchiveTransformer transformer(config, dir.path());
    auto imported = transformer.importArchive(tree, dir / "t.FCStd");
    ASSERT_TRUE(imported.has_value());

    EXPECT_EQ(memberNames(dir / "t.FCStd"), (std::vector<std::string>{"Document.xml", "Tip"}));
}

TEST(ArchiveTransformerTest, ImportMissingTree) {
    TempDir dir;
    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto imported = transformer.importArchive(dir / "nowhere", dir / "x.FCStd");
    ASSERT_FALSE(imported.has_value());
    EXPECT_EQ(imported.error().code(), ErrorCode::kNotFound);
    EXPECT_FALSE(fs::exists(dir / "x.FCStd"));
}

TEST(ArchiveTransformerTest, ImportCorruptChunkKeepsOldArchive) {
    TempDir dir;
    const fs::path tree = dir / "t";
    test::writeFile(tree / "Document.xml", "<d/>");
    test::writeFile(tree / "binaries_1.zip", "garbage");
    test::makeArchive(dir / "t.FCStd", {{"Document.xml", bytesOf("<old/>")}});
    const auto before = test::readFile(dir / "t.FCStd");

    ArchiveTransformer transformer(RepositoryConfig{}, dir.path());
    auto imported = transformer.importArchive(tree, dir / "t.FCStd");
    ASSERT_FALSE(imported.has_value());
    EXPECT_EQ(imported.error().code(), ErrorCode::kCorruptArchive);
    EXPECT_EQ(test::readFile(dir / "t.FCStd"), before);
}

}  // namespace
}  // namespace cadvc::transform
