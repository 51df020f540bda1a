#pragma once

/**
 * @file RedisStore.hpp
 * @brief Distributed cache backend (redis-plus-plus)
 *
 * Only built when redis++ is found at configure time (PRISM_HAS_REDIS).
 * Every client failure is reported as CacheUnavailableError.
 */

#include <prism/cache/CacheStore.hpp>

#include <memory>
#include <string>

namespace sw::redis {
class Redis;
}

namespace prism {

class RedisStore : public CacheStore {
  public:
    /**
     * @brief Connect and verify with PING
     * @throws CacheUnavailableError if the server is unreachable
     */
    explicit RedisStore(const std::string &url);
    ~RedisStore() override;

    RedisStore(const RedisStore &) = delete;
    RedisStore &operator=(const RedisStore &) = delete;

    std::optional<std::string> Get(const std::string &key) override;

    void Put(const std::string &key, const std::string &value,
             std::chrono::milliseconds ttl) override;

    [[nodiscard]] std::string Name() const override { return "redis"; }

  private:
    std::unique_ptr<sw::redis::Redis> redis_;
};

} // namespace prism
