// =============================================================================
// cadvc - Chunk Packer Property Tests
// =============================================================================
// Property-based tests for the packing invariants.
//
// **Property 1: Cap**
// *For any* set of files that each fit an empty chunk, every chunk archive
// written is at most the configured cap.
//
// **Property 2: Contiguity and losslessness**
// *For any* such set, chunk indices are exactly 1..N and unpacking restores
// every original file byte-for-byte at its original relative path.
//
// **Property 3: Termination**
// *For any* single file of at least 3x the cap, pack terminates with
// kFileTooLarge and deletes nothing.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "cadvc/algo/chunk_packer.h"
#include "test_support.h"

namespace cadvc::algo::test {

namespace fs = std::filesystem;
using cadvc::test::TempDir;

constexpr std::uint64_t kCap = 64 * 1024;

ChunkPackerConfig propertyConfig() {
    ChunkPackerConfig config;
    config.patterns = {"*.brp"};
    config.maxChunkBytes = kCap;
    config.compressionLevel = 6;
    config.chunkPrefix = "binaries_";
    return config;
}

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Generate a relative path ending in .brp, one to three levels deep.
[[nodiscard]] rc::Gen<std::string> binaryPath() {
    return rc::gen::map(
        rc::gen::tuple(rc::gen::resize(8, rc::gen::nonEmpty(rc::gen::container<std::string>(
                                              rc::gen::inRange('a', static_cast<char>('z' + 1))))),
                       rc::gen::element(std::string{}, std::string{"sub/"},
                                        std::string{"deep/er/"})),
        [](const auto& tuple) {
            const auto& [stem, dir] = tuple;
            return dir + stem + ".brp";
        });
}

/// @brief File size and content seed.
using FileSpec = std::pair<std::size_t, std::uint64_t>;

/// @brief Generate a tree of binary files: path -> (size, seed).
[[nodiscard]] rc::Gen<std::map<std::string, FileSpec>> binaryTree() {
    return rc::gen::resize(
        12, rc::gen::nonEmpty(rc::gen::container<std::map<std::string, FileSpec>>(
                binaryPath(), rc::gen::pair(rc::gen::inRange<std::size_t>(0, 30000),
                                            rc::gen::arbitrary<std::uint64_t>()))));
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

/// @brief Property 1 and 2: cap, contiguity and lossless restore.
RC_GTEST_PROP(ChunkPackerProperty, ChunksRespectCapAndRestoreLosslessly, ()) {
    const auto files = *gen::binaryTree();

    TempDir dir;
    for (const auto& [rel, spec] : files) {
        cadvc::test::writeFile(dir / rel, cadvc::test::randomBytes(spec.first, spec.second));
    }

    ChunkPacker packer(propertyConfig());
    auto packed = packer.pack(dir.path());
    RC_ASSERT(packed.has_value());
    RC_ASSERT(packed->packedFiles == files.size());

    const auto chunks = packer.findChunks(dir.path());
    RC_ASSERT(chunks.size() == packed->chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        RC_ASSERT(chunks[i].index == i + 1);
        RC_ASSERT(fs::file_size(chunks[i].path) <= kCap);
    }

    for (const auto& [rel, spec] : files) {
        RC_ASSERT(!fs::exists(dir / rel));
    }

    auto unpacked = packer.unpack(dir.path());
    RC_ASSERT(unpacked.has_value());
    RC_ASSERT(unpacked->missingIndices.empty());
    RC_ASSERT(unpacked->restoredFiles == files.size());

    for (const auto& [rel, spec] : files) {
        const auto expected = cadvc::test::randomBytes(spec.first, spec.second);
        const auto actual = cadvc::test::readFile(dir / rel);
        RC_ASSERT(actual.size() == expected.size());
        RC_ASSERT(std::equal(actual.begin(), actual.end(), expected.begin(),
                             [](char a, std::uint8_t b) {
                                 return static_cast<std::uint8_t>(a) == b;
                             }));
    }
}

/// @brief Property 3: an oversized file terminates with kFileTooLarge.
RC_GTEST_PROP(ChunkPackerProperty, OversizedFileTerminates, ()) {
    const auto factor = *rc::gen::inRange<std::uint64_t>(3, 6);
    const auto seed = *rc::gen::arbitrary<std::uint64_t>();

    TempDir dir;
    cadvc::test::writeFile(dir / "huge.brp",
                           cadvc::test::randomBytes(static_cast<std::size_t>(factor * kCap), seed));

    ChunkPacker packer(propertyConfig());
    auto packed = packer.pack(dir.path());
    RC_ASSERT(!packed.has_value());
    RC_ASSERT(packed.error().code() == ErrorCode::kFileTooLarge);
    RC_ASSERT(fs::exists(dir / "huge.brp"));
    RC_ASSERT(packer.findChunks(dir.path()).empty());
}

}  // namespace cadvc::algo::test
