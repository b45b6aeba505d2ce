#ifndef CACHETIER_HPP
#define CACHETIER_HPP

#include <optional>
#include <string>
#include <vector>

// Ordered fastest to slowest.
enum class CacheTier {
    Memory = 0,
    Remote = 1,
    Persistent = 2
};

inline std::string tierToString(CacheTier tier) {
    switch (tier) {
        case CacheTier::Memory: return "memory";
        case CacheTier::Remote: return "remote";
        case CacheTier::Persistent: return "persistent";
    }
    return "unknown";
}

// "redis" is accepted as an alias for the remote tier.
inline std::optional<CacheTier> tierFromString(const std::string& name) {
    if (name == "memory") return CacheTier::Memory;
    if (name == "remote" || name == "redis") return CacheTier::Remote;
    if (name == "persistent") return CacheTier::Persistent;
    return std::nullopt;
}

inline bool isFasterThan(CacheTier lhs, CacheTier rhs) {
    return static_cast<int>(lhs) < static_cast<int>(rhs);
}

inline const std::vector<CacheTier>& allTiers() {
    static const std::vector<CacheTier> tiers = {CacheTier::Memory, CacheTier::Remote, CacheTier::Persistent};
    return tiers;
}

#endif // CACHETIER_HPP
