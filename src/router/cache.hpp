#ifndef BEXT_ROUTER_CACHE_HPP
#define BEXT_ROUTER_CACHE_HPP

#include "router/types.hpp"
#include "router_config.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Bext {

/*
 * Route matches keyed by "METHOD:path", each expiring a fixed time after it
 * was stored. Expired entries are dropped when read or by prune(); with many
 * distinct paths, call prune() periodically to bound the map.
 */
class RouteCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit RouteCache(std::chrono::milliseconds ttl = kDefaultCacheTtl, TimeSource now = {})
        : default_ttl_(ttl), now_(now ? std::move(now) : TimeSource([] { return Clock::now(); })) {}

    std::shared_ptr<const RouteMatch> get(const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        if (now_() >= it->second.expires_at) {
            entries_.erase(it);
            return nullptr;
        }
        return it->second.match;
    }

    void set(const std::string &key, std::shared_ptr<const RouteMatch> match,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry entry{std::move(match), now_() + ttl.value_or(default_ttl_)};
        entries_[key] = std::move(entry);
    }

    /* Removes every expired entry, returns how many were removed */
    size_t prune() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = now_();
        size_t count = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now >= it->second.expires_at) {
                it = entries_.erase(it);
                count++;
            } else {
                ++it;
            }
        }
        return count;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::chrono::milliseconds defaultTtl() const { return default_ttl_; }

private:
    struct Entry {
        std::shared_ptr<const RouteMatch> match;
        Clock::time_point expires_at;
    };

    std::chrono::milliseconds default_ttl_;
    TimeSource now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace Bext

#endif
