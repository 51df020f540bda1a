#pragma once

/**
 * @file CacheStore.hpp
 * @brief Key/value backend interface for the result cache
 */

#include <chrono>
#include <optional>
#include <string>

namespace prism {

/**
 * @brief Minimal get/put store with per-entry expiry
 *
 * Implementations must be safe for concurrent Get/Put. Distributed
 * implementations report connectivity problems as CacheUnavailableError.
 */
class CacheStore {
  public:
    virtual ~CacheStore() = default;

    /// Value for key, or nullopt on miss or expiry
    virtual std::optional<std::string> Get(const std::string &key) = 0;

    virtual void Put(const std::string &key, const std::string &value,
                     std::chrono::milliseconds ttl) = 0;

    /// Backend name reported in capabilities ("local", "redis")
    [[nodiscard]] virtual std::string Name() const = 0;
};

} // namespace prism
