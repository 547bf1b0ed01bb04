/**
 * @file test_gzip_size.cpp
 * @brief Unit tests for gzip sizing
 */

#include "../../libcrusher/include/gzip_size.hpp"

#include <string>

#include <zlib.h>

#include <gtest/gtest.h>

using namespace crusher;

namespace {

// reference: one-shot gzip stream with the default level
std::uint64_t reference_size(const std::string& data) {
    z_stream zs{};
    EXPECT_EQ(deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY), Z_OK);
    std::string out(deflateBound(&zs, data.size()) + 64, '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(deflate(&zs, Z_FINISH), Z_STREAM_END);
    const std::uint64_t total = zs.total_out;
    deflateEnd(&zs);
    return total;
}

} // namespace

TEST(GzipSizeTest, EmptyInputStillHasHeaderAndTrailer) {
    // 10 byte header, empty deflate block, 8 byte trailer
    EXPECT_EQ(gzip_size(""), 20u);
}

TEST(GzipSizeTest, RepetitiveInputShrinks) {
    const std::string content(100000, 'a');
    const auto size = gzip_size(content);
    EXPECT_GT(size, 0u);
    EXPECT_LT(size, content.size() / 50);
}

TEST(GzipSizeTest, MatchesOneShotCompression) {
    std::string content;
    for (int i = 0; i < 2000; ++i) {
        content += "function f" + std::to_string(i) + "(){return " + std::to_string(i * 7) + ";}\n";
    }
    EXPECT_EQ(gzip_size(content), reference_size(content));
}

TEST(GzipSizeTest, InputLargerThanOneChunk) {
    // crosses the 1 MB input chunk boundary
    std::string content;
    content.reserve(3 * 1024 * 1024);
    unsigned x = 12345;
    while (content.size() < 3 * 1024 * 1024) {
        x = x * 1103515245u + 12345u;
        content.push_back(static_cast<char>('a' + (x >> 16) % 26));
    }
    const auto expected = static_cast<double>(reference_size(content));
    EXPECT_NEAR(static_cast<double>(gzip_size(content)), expected, 64.0);
}
