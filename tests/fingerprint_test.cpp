//! # Fingerprint Tests
//!
//! CRC32C check values and the 16-digit content fingerprint.

#include "common/fingerprint.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace docforge;
namespace fs = std::filesystem;

// ============================================================================
// CRC32C
// ============================================================================

TEST(Crc32cTest, StandardCheckValue) {
    // Published check value for "123456789"
    EXPECT_EQ(crc32c("123456789"), 0xE3069283u);
}

TEST(Crc32cTest, EmptyInput) {
    EXPECT_EQ(crc32c(""), 0u);
}

TEST(Crc32cTest, TableIsCompileTime) {
    static_assert(CRC32C_TABLE[0] == 0);
    EXPECT_EQ(CRC32C_TABLE[128], CRC32C_POLY);
}

// ============================================================================
// Fingerprint
// ============================================================================

TEST(FingerprintTest, CombinesChecksumAndLength) {
    EXPECT_EQ(fingerprint("123456789"), "e306928300000009");
    EXPECT_EQ(fingerprint(""), "0000000000000000");
}

TEST(FingerprintTest, DiffersOnSingleByteChange) {
    EXPECT_NE(fingerprint("def f(): pass\n"), fingerprint("def g(): pass\n"));
}

TEST(FingerprintTest, FileMatchesContent) {
    auto path = fs::temp_directory_path() / "docforge_fingerprint_test.py";
    {
        std::ofstream out(path, std::ios::binary);
        out << "x = 1\n";
    }
    EXPECT_EQ(fingerprint_file(path.string()), fingerprint("x = 1\n"));
    fs::remove(path);
}

TEST(FingerprintTest, MissingFileIsEmpty) {
    EXPECT_EQ(fingerprint_file("/nonexistent/docforge/none.py"), "");
}
