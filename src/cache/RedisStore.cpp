#include <prism/cache/RedisStore.hpp>
#include <prism/core/Error.hpp>

#include <sw/redis++/redis++.h>

namespace prism {

RedisStore::RedisStore(const std::string &url) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(url);
        redis_->ping();
    } catch (const sw::redis::Error &e) {
        throw CacheUnavailableError("cannot connect to " + url + ": " + e.what());
    }
}

RedisStore::~RedisStore() = default;

std::optional<std::string> RedisStore::Get(const std::string &key) {
    try {
        auto value = redis_->get(key);
        if (!value) {
            return std::nullopt;
        }
        return *value;
    } catch (const sw::redis::Error &e) {
        throw CacheUnavailableError(std::string("GET failed: ") + e.what());
    }
}

void RedisStore::Put(const std::string &key, const std::string &value,
                     std::chrono::milliseconds ttl) {
    try {
        redis_->set(key, value, ttl);
    } catch (const sw::redis::Error &e) {
        throw CacheUnavailableError(std::string("SET failed: ") + e.what());
    }
}

} // namespace prism
