#ifndef ENTRYCODEC_HPP
#define ENTRYCODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "../models/CacheEntry.hpp"

// Wire format for remote-tier values:
//   byte 0      0x01 plain | 0x02 zlib
//   [0x02 only] 4-byte big-endian length of the uncompressed envelope
//   rest        MessagePack envelope {v: bin, t: str, c: created ms, ttl, tags, deps}
class EntryCodec {
public:
    static constexpr std::uint8_t FORMAT_PLAIN = 0x01;
    static constexpr std::uint8_t FORMAT_ZLIB = 0x02;
    static constexpr std::size_t MAX_DECODED_BYTES = 64 * 1024 * 1024;

    EntryCodec(bool compression_enabled, std::size_t compression_min_bytes)
        : compression_enabled_(compression_enabled), compression_min_bytes_(compression_min_bytes) {}

    std::string encode(const CacheEntry& entry) const;

    // nullopt for anything that does not parse; the caller treats that as a miss.
    std::optional<CacheEntry> decode(const std::string& key, const std::string& payload) const;

private:
    static std::optional<std::string> inflate(const std::string& payload);

    bool compression_enabled_;
    std::size_t compression_min_bytes_;
};

#endif // ENTRYCODEC_HPP
