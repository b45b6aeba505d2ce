#include "TagDependencyIndex.hpp"

#include <algorithm>
#include <iterator>

void TagDependencyIndex::collect(const std::map<CacheTier, TierCopy>& copies,
                                 std::set<std::string>& tags,
                                 std::set<std::string>& deps) {
    for (const auto& pair : copies) {
        tags.insert(pair.second.tags.begin(), pair.second.tags.end());
        deps.insert(pair.second.dependencies.begin(), pair.second.dependencies.end());
    }
}

void TagDependencyIndex::reindexLocked(const std::string& key,
                                       const std::set<std::string>& old_tags,
                                       const std::set<std::string>& old_deps) {
    std::set<std::string> new_tags;
    std::set<std::string> new_deps;
    auto it = copies_.find(key);
    if (it != copies_.end()) {
        collect(it->second, new_tags, new_deps);
        if (it->second.empty()) {
            copies_.erase(it);
        }
    }

    auto unlink = [&key](std::unordered_map<std::string, std::set<std::string>>& reverse,
                         const std::set<std::string>& before,
                         const std::set<std::string>& after) {
        for (const auto& name : before) {
            if (after.count(name)) continue;
            auto rit = reverse.find(name);
            if (rit == reverse.end()) continue;
            rit->second.erase(key);
            if (rit->second.empty()) {
                reverse.erase(rit);
            }
        }
        for (const auto& name : after) {
            reverse[name].insert(key);
        }
    };
    unlink(tag_to_keys_, old_tags, new_tags);
    unlink(dep_to_keys_, old_deps, new_deps);
}

void TagDependencyIndex::recordTags(const std::string& key,
                                    const std::set<std::string>& tags,
                                    const std::set<std::string>& dependencies,
                                    CacheTier tier,
                                    TimePoint expires_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> old_tags;
    std::set<std::string> old_deps;
    auto it = copies_.find(key);
    if (it != copies_.end()) {
        collect(it->second, old_tags, old_deps);
    }
    if (tags.empty() && dependencies.empty()) {
        if (it == copies_.end()) return;
        it->second.erase(tier);
    } else {
        copies_[key][tier] = TierCopy{tags, dependencies, expires_at};
    }
    reindexLocked(key, old_tags, old_deps);
}

void TagDependencyIndex::removeKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = copies_.find(key);
    if (it == copies_.end()) return;
    std::set<std::string> old_tags;
    std::set<std::string> old_deps;
    collect(it->second, old_tags, old_deps);
    it->second.clear();
    reindexLocked(key, old_tags, old_deps);
}

void TagDependencyIndex::removeTierCopy(const std::string& key, CacheTier tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = copies_.find(key);
    if (it == copies_.end() || it->second.count(tier) == 0) return;
    std::set<std::string> old_tags;
    std::set<std::string> old_deps;
    collect(it->second, old_tags, old_deps);
    it->second.erase(tier);
    reindexLocked(key, old_tags, old_deps);
}

std::set<std::string> TagDependencyIndex::keysForTag(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tag_to_keys_.find(tag);
    return it == tag_to_keys_.end() ? std::set<std::string>{} : it->second;
}

std::set<std::string> TagDependencyIndex::keysForDependency(const std::string& dependency) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = dep_to_keys_.find(dependency);
    return it == dep_to_keys_.end() ? std::set<std::string>{} : it->second;
}

std::set<std::string> TagDependencyIndex::keysForAllTags(const std::vector<std::string>& tags) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> result;
    bool first = true;
    for (const auto& tag : tags) {
        auto it = tag_to_keys_.find(tag);
        if (it == tag_to_keys_.end()) {
            return {};
        }
        if (first) {
            result = it->second;
            first = false;
            continue;
        }
        std::set<std::string> narrowed;
        std::set_intersection(result.begin(), result.end(),
                              it->second.begin(), it->second.end(),
                              std::inserter(narrowed, narrowed.begin()));
        result.swap(narrowed);
        if (result.empty()) break;
    }
    return result;
}

std::vector<CacheTier> TagDependencyIndex::tiersForKey(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CacheTier> tiers;
    auto it = copies_.find(key);
    if (it != copies_.end()) {
        for (const auto& pair : it->second) {
            tiers.push_back(pair.first);
        }
    }
    return tiers;
}

std::size_t TagDependencyIndex::purgeExpired(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> touched;
    for (const auto& pair : copies_) {
        for (const auto& copy : pair.second) {
            if (copy.second.expires_at <= now) {
                touched.push_back(pair.first);
                break;
            }
        }
    }

    std::size_t removed = 0;
    for (const auto& key : touched) {
        auto it = copies_.find(key);
        std::set<std::string> old_tags;
        std::set<std::string> old_deps;
        collect(it->second, old_tags, old_deps);
        for (auto cit = it->second.begin(); cit != it->second.end();) {
            if (cit->second.expires_at <= now) {
                cit = it->second.erase(cit);
                ++removed;
            } else {
                ++cit;
            }
        }
        reindexLocked(key, old_tags, old_deps);
    }
    return removed;
}

bool TagDependencyIndex::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return copies_.count(key) > 0;
}

std::size_t TagDependencyIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return copies_.size();
}

std::size_t TagDependencyIndex::tagCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tag_to_keys_.size();
}

std::size_t TagDependencyIndex::dependencyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dep_to_keys_.size();
}
