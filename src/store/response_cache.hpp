#pragma once
#include "../cache.hpp"
#include <string>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include <optional>

namespace curbench {

struct CacheEntry {
    std::string value;
    uint64_t timestamp;
    uint64_t last_access;
    uint32_t ttl;
};

// File-backed cache with per-entry TTL and LRU eviction above max_entries.
// Writes are persisted atomically in batches of kFlushEvery, on flush() and
// on destruction.
class ResponseCache : public Cache {
public:
    static constexpr uint32_t kFlushEvery = 32;

    ResponseCache(const std::string& path, uint32_t default_ttl, uint32_t max_entries);
    ~ResponseCache() override;

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // Look up a cached value. Returns nullopt on miss or expiry.
    std::optional<std::string> get(const std::string& key) override;

    // Store a value; ttl_seconds == 0 uses the default TTL.
    void set(const std::string& key, const std::string& value, uint32_t ttl_seconds) override;

    uint32_t size() const;
    void clear();

    // Persist pending writes now.
    void flush();

private:
    void evict();
    void load();
    void save();

    std::string path_;
    uint32_t default_ttl_;
    uint32_t max_entries_;
    std::unordered_map<std::string, CacheEntry> entries_;
    uint32_t pending_writes_ = 0;
    mutable std::mutex mutex_;
};

} // namespace curbench
