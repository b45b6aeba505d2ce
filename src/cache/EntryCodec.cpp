#include "EntryCodec.hpp"

#include <chrono>
#include <vector>

#include <nlohmann/json.hpp>
#include <zlib.h>

using json = nlohmann::json;

std::string EntryCodec::encode(const CacheEntry& entry) const {
    const auto created_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.created_at.time_since_epoch()).count();

    json envelope;
    envelope["v"] = json::binary(std::vector<std::uint8_t>(entry.value.data.begin(), entry.value.data.end()));
    envelope["t"] = entry.value.type;
    envelope["c"] = created_ms;
    envelope["ttl"] = entry.ttl_seconds;
    envelope["tags"] = entry.tags;
    envelope["deps"] = entry.dependencies;

    std::vector<std::uint8_t> packed = json::to_msgpack(envelope);

    if (compression_enabled_ && packed.size() >= compression_min_bytes_) {
        uLongf bound = compressBound(static_cast<uLong>(packed.size()));
        std::string out(5 + bound, '\0');
        int rc = compress2(reinterpret_cast<Bytef*>(&out[5]), &bound,
                           packed.data(), static_cast<uLong>(packed.size()), Z_DEFAULT_COMPRESSION);
        // Only keep the compressed form when it is actually smaller.
        if (rc == Z_OK && bound + 4 < packed.size()) {
            const auto length = static_cast<std::uint32_t>(packed.size());
            out[0] = static_cast<char>(FORMAT_ZLIB);
            out[1] = static_cast<char>((length >> 24) & 0xFF);
            out[2] = static_cast<char>((length >> 16) & 0xFF);
            out[3] = static_cast<char>((length >> 8) & 0xFF);
            out[4] = static_cast<char>(length & 0xFF);
            out.resize(5 + bound);
            return out;
        }
    }

    std::string out;
    out.reserve(packed.size() + 1);
    out.push_back(static_cast<char>(FORMAT_PLAIN));
    out.append(packed.begin(), packed.end());
    return out;
}

std::optional<std::string> EntryCodec::inflate(const std::string& payload) {
    if (payload.size() < 5) {
        return std::nullopt;
    }
    const auto* bytes = reinterpret_cast<const unsigned char*>(payload.data());
    const std::uint32_t length = (static_cast<std::uint32_t>(bytes[1]) << 24) |
                                 (static_cast<std::uint32_t>(bytes[2]) << 16) |
                                 (static_cast<std::uint32_t>(bytes[3]) << 8) |
                                 static_cast<std::uint32_t>(bytes[4]);
    if (length == 0 || length > MAX_DECODED_BYTES) {
        return std::nullopt;
    }

    std::string out(length, '\0');
    uLongf out_len = length;
    int rc = uncompress(reinterpret_cast<Bytef*>(&out[0]), &out_len,
                        reinterpret_cast<const Bytef*>(payload.data() + 5),
                        static_cast<uLong>(payload.size() - 5));
    if (rc != Z_OK || out_len != length) {
        return std::nullopt;
    }
    return out;
}

std::optional<CacheEntry> EntryCodec::decode(const std::string& key, const std::string& payload) const {
    if (payload.empty()) {
        return std::nullopt;
    }

    std::string body;
    const auto format = static_cast<std::uint8_t>(payload[0]);
    if (format == FORMAT_PLAIN) {
        body = payload.substr(1);
    } else if (format == FORMAT_ZLIB) {
        auto inflated = inflate(payload);
        if (!inflated) {
            return std::nullopt;
        }
        body = std::move(*inflated);
    } else {
        return std::nullopt;
    }

    try {
        json envelope = json::from_msgpack(body);
        if (!envelope.is_object() || !envelope.contains("v") || !envelope["v"].is_binary()) {
            return std::nullopt;
        }
        const auto& binary = envelope["v"].get_binary();

        CacheEntry entry;
        entry.key = key;
        entry.value.data.assign(binary.begin(), binary.end());
        entry.value.type = envelope.value("t", std::string());
        entry.created_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(envelope.value("c", static_cast<long long>(0))));
        entry.last_accessed_at = entry.created_at;
        entry.ttl_seconds = envelope.value("ttl", 0);
        if (envelope.contains("tags")) {
            entry.tags = envelope["tags"].get<std::set<std::string>>();
        }
        if (envelope.contains("deps")) {
            entry.dependencies = envelope["deps"].get<std::set<std::string>>();
        }
        entry.tier = CacheTier::Remote;
        entry.recomputeSize();
        return entry;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}
