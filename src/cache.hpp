#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace curbench {

// Optional key/value response cache. Absence of a cache (or a miss) must
// never change a result, only latency; stale or duplicate writes are harmless.
class Cache {
public:
    virtual ~Cache() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value,
                     uint32_t ttl_seconds) = 0;
};

// Deterministic cache key: "<ns>:<fnv1a-hex of fields>".
std::string make_cache_key(const std::string& ns, const std::vector<std::string>& fields);

} // namespace curbench
