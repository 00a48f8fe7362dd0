#include "cache_store.hpp"
#include "service_logger.hpp"

#include <algorithm>
#include <cctype>
#include <sw/redis++/redis++.h>

namespace streamguard {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string make_cache_key(const std::string& kind, const std::string& platform,
                           const std::string& id, const std::string& suffix) {
    std::string key = kind + ":" + lower(platform) + ":" + id;
    if (!suffix.empty()) {
        key += ":" + lower(suffix);
    }
    return key;
}

RedisCacheStore::RedisCacheStore(const std::string& redis_url) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(redis_url);
        redis_->ping();
        connected_ = true;
        ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::CACHE, "internal",
                           "Redis cache connected");
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::CACHE, "internal",
                           std::string("Redis cache unavailable, lookups bypass cache: ") + e.what());
    }
}

RedisCacheStore::~RedisCacheStore() = default;

std::optional<std::string> RedisCacheStore::get(const std::string& key) {
    if (!redis_) return std::nullopt;
    try {
        auto val = redis_->get(key);
        connected_ = true;
        if (val) {
            return std::string(*val);
        }
        return std::nullopt;
    } catch (const sw::redis::Error&) {
        connected_ = false;
        throw;
    }
}

void RedisCacheStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    if (!redis_) return;
    try {
        redis_->set(key, value, std::chrono::duration_cast<std::chrono::milliseconds>(ttl));
        connected_ = true;
    } catch (const sw::redis::Error&) {
        connected_ = false;
        throw;
    }
}

bool RedisCacheStore::ping() {
    if (!redis_) return false;
    try {
        redis_->ping();
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::CACHE, "internal",
                           std::string("Redis ping failed: ") + e.what());
    }
    return connected_;
}

}
