#pragma once

/**
 * @file LruTtlStore.hpp
 * @brief In-process bounded cache: LRU eviction plus absolute expiry
 *
 * Expiry is fixed at insertion and independent of access. Expired entries
 * are removed lazily when looked up; capacity overflow evicts the least
 * recently used entry.
 */

#include <prism/cache/CacheStore.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace prism {

class LruTtlStore : public CacheStore {
  public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    /**
     * @param max_items Capacity (at least 1)
     * @param now Time source; injectable so tests can advance time
     */
    explicit LruTtlStore(std::size_t max_items, NowFn now = [] { return Clock::now(); })
        : max_items_(max_items == 0 ? 1 : max_items), now_(std::move(now)) {}

    std::optional<std::string> Get(const std::string &key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        if (now_() >= it->second->expires_at) {
            order_.erase(it->second);
            index_.erase(it);
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        return it->second->value;
    }

    void Put(const std::string &key, const std::string &value,
             std::chrono::milliseconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto expires_at = now_() + ttl;
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = value;
            it->second->expires_at = expires_at;
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        order_.push_front(Entry{key, value, expires_at});
        index_[key] = order_.begin();
        while (order_.size() > max_items_) {
            index_.erase(order_.back().key);
            order_.pop_back();
        }
    }

    [[nodiscard]] std::string Name() const override { return "local"; }

    /// Entries currently held, including expired ones not yet looked up
    [[nodiscard]] std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_.size();
    }

    [[nodiscard]] std::size_t Capacity() const { return max_items_; }

  private:
    struct Entry {
        std::string key;
        std::string value;
        Clock::time_point expires_at;
    };

    std::size_t max_items_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::list<Entry> order_; ///< Front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

} // namespace prism
