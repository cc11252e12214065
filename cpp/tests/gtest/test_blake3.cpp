// =============================================================================
// Blake3 Hash Tests
// =============================================================================

#include <gtest/gtest.h>
#include "fleetcrypt/blake3.hpp"
#include <string>
#include <vector>

using namespace fleetcrypt;

class Blake3Test : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Reference vectors from the BLAKE3 test suite
TEST_F(Blake3Test, KnownVectors) {
    std::vector<uint8_t> empty;
    EXPECT_EQ(Blake3Hasher::hash(std::span<const uint8_t>(empty)).to_hex(),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");

    std::vector<uint8_t> one = {0x00};
    EXPECT_EQ(Blake3Hasher::hash(std::span<const uint8_t>(one)).to_hex(),
              "2d3adedff11b61f14c886e35afa036736dcd87a74d27b5c1510225d0f592e213");
}

TEST_F(Blake3Test, Deterministic) {
    auto hash1 = Blake3Hasher::hash(std::string_view("=HQ ENEMY FLEET SIGHTED FLEET7="));
    auto hash2 = Blake3Hasher::hash(std::string_view("=HQ ENEMY FLEET SIGHTED FLEET7="));
    EXPECT_EQ(hash1, hash2);
}

TEST_F(Blake3Test, DifferentInputsDifferentHashes) {
    auto hash1 = Blake3Hasher::hash(std::string_view("CNRJC DGVC"));
    auto hash2 = Blake3Hasher::hash(std::string_view("CNRJC DGVD"));
    EXPECT_NE(hash1, hash2);

    int diff_count = 0;
    for (size_t i = 0; i < hash1.size(); ++i) {
        if (hash1.bytes[i] != hash2.bytes[i]) diff_count++;
    }
    EXPECT_GT(diff_count, 16);
}

TEST_F(Blake3Test, HexConversion) {
    std::string hex = Blake3Hasher::hash(std::string_view("A")).to_hex();
    EXPECT_EQ(hex.length(), 64u);
    for (char c : hex) {
        bool is_hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        EXPECT_TRUE(is_hex);
    }
}

// Both overloads hash the same bytes.
TEST_F(Blake3Test, SpanAndStringAgree) {
    std::string text = "=HQ CNRJC DGVC FLEET7=";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(Blake3Hasher::hash(std::span<const uint8_t>(bytes)),
              Blake3Hasher::hash(std::string_view(text)));
}

// Spans many 1 KiB chunks.
TEST_F(Blake3Test, LargeInput) {
    std::vector<uint8_t> large(1024 * 1024);
    for (size_t i = 0; i < large.size(); ++i) {
        large[i] = static_cast<uint8_t>(i & 0xFF);
    }
    auto hash1 = Blake3Hasher::hash(std::span<const uint8_t>(large));
    large.back() ^= 1;
    auto hash2 = Blake3Hasher::hash(std::span<const uint8_t>(large));
    EXPECT_NE(hash1, hash2);
    EXPECT_NE(hash1, Blake3Hash{});
}
