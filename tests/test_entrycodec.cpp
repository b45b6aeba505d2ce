// tests/test_entrycodec.cpp
#include <chrono>
#include <string>

#include "gtest/gtest.h"

#include "../src/cache/EntryCodec.hpp"

namespace {
    CacheEntry sampleEntry(const std::string& data) {
        CacheEntry entry;
        entry.key = "user:1";
        entry.value = CacheValue{data, "application/json"};
        entry.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
        entry.ttl_seconds = 120;
        entry.tags = {"users", "profile"};
        entry.dependencies = {"db:users"};
        entry.recomputeSize();
        return entry;
    }
}

TEST(EntryCodecTest, PreservesValueMetadataAndBinaryData) {
    EntryCodec codec(false, 0);
    const std::string binary("\x00\x01\xff{\"name\":\"x\"}", 15);
    const CacheEntry original = sampleEntry(binary);

    const std::string payload = codec.encode(original);
    ASSERT_FALSE(payload.empty());
    EXPECT_EQ(static_cast<std::uint8_t>(payload[0]), EntryCodec::FORMAT_PLAIN);

    auto decoded = codec.decode("user:1", payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->value, original.value);
    EXPECT_EQ(decoded->created_at, original.created_at);
    EXPECT_EQ(decoded->ttl_seconds, 120);
    EXPECT_EQ(decoded->tags, original.tags);
    EXPECT_EQ(decoded->dependencies, original.dependencies);
    EXPECT_EQ(decoded->tier, CacheTier::Remote);
    EXPECT_EQ(decoded->size_bytes, original.size_bytes);
}

TEST(EntryCodecTest, CompressesLargeRepetitiveValues) {
    EntryCodec codec(true, 64);
    const CacheEntry original = sampleEntry(std::string(4096, 'a'));

    const std::string payload = codec.encode(original);
    EXPECT_EQ(static_cast<std::uint8_t>(payload[0]), EntryCodec::FORMAT_ZLIB);
    EXPECT_LT(payload.size(), 1024u);

    auto decoded = codec.decode("user:1", payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->value.data, original.value.data);
}

TEST(EntryCodecTest, SmallValuesStayUncompressed) {
    EntryCodec codec(true, 4096);
    const std::string payload = codec.encode(sampleEntry("tiny"));
    EXPECT_EQ(static_cast<std::uint8_t>(payload[0]), EntryCodec::FORMAT_PLAIN);
}

TEST(EntryCodecTest, DecoderWithoutCompressionStillReadsZlibPayloads) {
    EntryCodec writer(true, 16);
    EntryCodec reader(false, 0);
    auto decoded = reader.decode("k", writer.encode(sampleEntry(std::string(1000, 'z'))));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->value.data, std::string(1000, 'z'));
}

TEST(EntryCodecTest, GarbageDecodesToNothing) {
    EntryCodec codec(false, 0);
    EXPECT_FALSE(codec.decode("k", "").has_value());
    EXPECT_FALSE(codec.decode("k", "plain text written by another client").has_value());
    EXPECT_FALSE(codec.decode("k", std::string("\x01\xc1", 2)).has_value());
    EXPECT_FALSE(codec.decode("k", std::string("\x02\x00\x00\x00\x10garbage", 12)).has_value());
    // Declared length beyond the decode limit.
    EXPECT_FALSE(codec.decode("k", std::string("\x02\x7f\xff\xff\xff", 5)).has_value());
}
