#pragma once

#include <string>
#include <memory>
#include <optional>
#include <chrono>
#include <atomic>

namespace sw { namespace redis { class Redis; } }

namespace streamguard {

// Key/value store with per-entry TTL. Implementations throw on transport
// failures; callers decide whether to degrade.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
    virtual bool ping() = 0;
};

// Redis-backed store. A failed initial connection leaves the store
// disconnected: get() misses and set() is dropped until a command succeeds.
class RedisCacheStore : public CacheStore {
public:
    explicit RedisCacheStore(const std::string& redis_url);
    ~RedisCacheStore() override;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    bool ping() override;

    bool is_connected() const { return connected_; }

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
};

// "<kind>:<platform>:<id>[:<suffix>]"; platform and suffix are lowercased.
std::string make_cache_key(const std::string& kind, const std::string& platform,
                           const std::string& id, const std::string& suffix = "");

}
