#pragma once

/**
 * @file ResultCache.hpp
 * @brief Evaluation result cache with transparent backend fallback
 *
 * The evaluation service only sees Lookup/Store. When the distributed
 * backend fails, the cache switches permanently to its local LRU/TTL store
 * and logs one warning; CacheUnavailableError never reaches callers.
 */

#include <prism/cache/CacheKey.hpp>
#include <prism/cache/CacheStore.hpp>
#include <prism/cache/LruTtlStore.hpp>
#include <prism/core/Results.hpp>
#include <prism/io/Config.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace prism {

class ResultCache {
  public:
    /**
     * @param primary Preferred backend, or nullptr to use the local store only
     * @param local Fallback store (always present)
     */
    ResultCache(std::unique_ptr<CacheStore> primary, std::unique_ptr<LruTtlStore> local,
                std::chrono::milliseconds ttl, std::string key_prefix);

    /**
     * @brief Build from configuration
     *
     * backend "local" never connects. "auto" and "redis" try the distributed
     * store when a URL is set and fall back to local if it is unreachable or
     * this build has no client library.
     */
    [[nodiscard]] static std::unique_ptr<ResultCache> Create(const CacheConfig &config);

    [[nodiscard]] std::string KeyFor(const std::string &operation,
                                     const EvaluationParams &params) const {
        return DeriveKey(operation, params, key_prefix_);
    }

    /// Cached result, or nullopt on miss (expired and unreadable entries are misses)
    [[nodiscard]] std::optional<EvaluationResult> Lookup(const std::string &key);

    void Store(const std::string &key, const EvaluationResult &result);

    /// Active backend name
    [[nodiscard]] std::string BackendName() const;

    [[nodiscard]] bool degraded() const { return degraded_.load(); }

  private:
    CacheStore &Active();
    void Degrade(const CacheUnavailableError &e);

    std::unique_ptr<CacheStore> primary_;
    std::unique_ptr<LruTtlStore> local_;
    std::chrono::milliseconds ttl_;
    std::string key_prefix_;
    std::atomic<bool> degraded_{false};
};

} // namespace prism
