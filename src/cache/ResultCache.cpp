#include <prism/cache/ResultCache.hpp>
#include <prism/io/LogService.hpp>

#ifdef PRISM_HAS_REDIS
#include <prism/cache/RedisStore.hpp>
#endif

namespace prism {

ResultCache::ResultCache(std::unique_ptr<CacheStore> primary, std::unique_ptr<LruTtlStore> local,
                         std::chrono::milliseconds ttl, std::string key_prefix)
    : primary_(std::move(primary)), local_(std::move(local)), ttl_(ttl),
      key_prefix_(std::move(key_prefix)) {
    if (!local_) {
        local_ = std::make_unique<LruTtlStore>(1024);
    }
}

std::unique_ptr<ResultCache> ResultCache::Create(const CacheConfig &config) {
    auto local = std::make_unique<LruTtlStore>(config.max_items);
    std::unique_ptr<CacheStore> primary;

    if (config.backend != "local" && !config.redis_url.empty()) {
#ifdef PRISM_HAS_REDIS
        try {
            primary = std::make_unique<RedisStore>(config.redis_url);
        } catch (const CacheUnavailableError &e) {
            GetLogService().Warning(std::string(e.what()) + "; using local cache");
        }
#else
        GetLogService().Warning("Distributed cache requested but this build has no redis "
                                "client; using local cache");
#endif
    }
    return std::make_unique<ResultCache>(std::move(primary), std::move(local), config.ttl,
                                         config.key_prefix);
}

CacheStore &ResultCache::Active() {
    if (primary_ && !degraded_.load()) {
        return *primary_;
    }
    return *local_;
}

void ResultCache::Degrade(const CacheUnavailableError &e) {
    if (!degraded_.exchange(true)) {
        GetLogService().Warning(std::string(e.what()) + "; falling back to local cache");
    }
}

std::optional<EvaluationResult> ResultCache::Lookup(const std::string &key) {
    std::optional<std::string> text;
    try {
        text = Active().Get(key);
    } catch (const CacheUnavailableError &e) {
        Degrade(e);
        text = local_->Get(key);
    }
    if (!text) {
        return std::nullopt;
    }

    try {
        return EvaluationResult::FromJSON(nlohmann::json::parse(*text));
    } catch (const nlohmann::json::exception &e) {
        GetLogService().Warning("Discarding unreadable cache entry " + key + ": " + e.what());
    } catch (const Error &e) {
        GetLogService().Warning("Discarding unreadable cache entry " + key + ": " + e.what());
    }
    return std::nullopt;
}

void ResultCache::Store(const std::string &key, const EvaluationResult &result) {
    const std::string text = result.ToJSON().dump();
    try {
        Active().Put(key, text, ttl_);
    } catch (const CacheUnavailableError &e) {
        Degrade(e);
        local_->Put(key, text, ttl_);
    }
}

std::string ResultCache::BackendName() const {
    if (primary_ && !degraded_.load()) {
        return primary_->Name();
    }
    return local_->Name();
}

} // namespace prism
