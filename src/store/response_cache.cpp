#include "response_cache.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <vector>

namespace curbench {

std::string make_cache_key(const std::string& ns, const std::vector<std::string>& fields) {
    return ns + ":" + to_hex(fnv1a_fields(fields));
}

ResponseCache::ResponseCache(const std::string& path, uint32_t default_ttl, uint32_t max_entries)
    : path_(path), default_ttl_(default_ttl), max_entries_(max_entries) {
    load();
}

ResponseCache::~ResponseCache() {
    try {
        flush();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[cache] Failed to serialize cache " << path_ << ": " << e.what() << "\n";
    }
}

void ResponseCache::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_writes_ > 0) save();
}

std::optional<std::string> ResponseCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    uint64_t now = epoch_seconds();
    if ((now - it->second.timestamp) > it->second.ttl) {
        entries_.erase(it);
        return std::nullopt;
    }

    it->second.last_access = now;
    return it->second.value;
}

void ResponseCache::set(const std::string& key, const std::string& value,
                        uint32_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = epoch_seconds();
    uint32_t ttl = ttl_seconds == 0 ? default_ttl_ : ttl_seconds;
    entries_[key] = CacheEntry{value, now, now, ttl};

    evict();
    if (++pending_writes_ >= kFlushEvery) save();
}

void ResponseCache::evict() {
    // Must be called with mutex_ already held.

    uint64_t now = epoch_seconds();

    // Remove TTL-expired entries first.
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if ((now - it->second.timestamp) > it->second.ttl) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    if (entries_.size() <= max_entries_) return;

    // Still over capacity: evict by oldest last_access.
    std::vector<std::pair<uint64_t, std::string>> key_access; // {last_access, key}
    key_access.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        key_access.emplace_back(entry.last_access, key);
    }
    std::sort(key_access.begin(), key_access.end());

    size_t to_remove = entries_.size() - max_entries_;
    for (size_t i = 0; i < to_remove; ++i) {
        entries_.erase(key_access[i].second);
    }
}

uint32_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    save();
}

void ResponseCache::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_array()) return;

        entries_.clear();
        for (const auto& item : j) {
            std::string key   = item.value("key",         std::string{});
            std::string value = item.value("value",       std::string{});
            uint64_t ts       = item.value("timestamp",   uint64_t{0});
            uint64_t la       = item.value("last_access", uint64_t{0});
            uint32_t ttl      = item.value("ttl",         default_ttl_);

            if (key.empty()) continue;
            entries_[key] = CacheEntry{std::move(value), ts, la, ttl};
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[cache] Ignoring corrupt cache file " << path_ << ": " << e.what() << "\n";
        entries_.clear();
    }
}

void ResponseCache::save() {
    // Must be called with mutex_ already held.

    nlohmann::json j = nlohmann::json::array();
    for (const auto& [key, entry] : entries_) {
        j.push_back({
            {"key",         key},
            {"value",       entry.value},
            {"timestamp",   entry.timestamp},
            {"last_access", entry.last_access},
            {"ttl",         entry.ttl}
        });
    }

    pending_writes_ = 0;
    if (!atomic_write_file(path_, j.dump())) {
        std::cerr << "[cache] Failed to persist cache to " << path_ << "\n";
    }
}

} // namespace curbench
