// Orexa - Game Server Supervisor
// Time-indexed key-value cache with explicit expiry

#ifndef OREXA_CORE_TTL_CACHE_HPP
#define OREXA_CORE_TTL_CACHE_HPP

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace orexa {
namespace core {

/**
 * @brief Key-value store whose entries expire a fixed time after insertion.
 *
 * Expired entries are treated as absent by get() and are dropped by
 * purgeExpired(). The clock is injectable for tests.
 *
 * ## Thread Safety
 * All methods are thread-safe; the cache owns its own mutex.
 *
 * @tparam K Key type (ordered)
 * @tparam V Value type (copyable)
 */
template<typename K, typename V>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFunction = std::function<Clock::time_point()>;

    explicit TtlCache(std::chrono::milliseconds ttl,
                      NowFunction now = []() { return Clock::now(); })
        : ttl_(ttl)
        , now_(std::move(now)) {}

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    std::optional<V> get(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (now_() - it->second.storedAt > ttl_) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const K& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{std::move(value), now_()};
    }

    void erase(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(key);
    }

    /**
     * @brief Drop every expired entry.
     * @return Number of entries removed
     */
    size_t purgeExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        auto now = now_();
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now - it->second.storedAt > ttl_) {
                it = entries_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    struct Entry {
        V value;
        Clock::time_point storedAt;
    };

    const std::chrono::milliseconds ttl_;
    NowFunction now_;
    mutable std::mutex mutex_;
    std::map<K, Entry> entries_;
};

} // namespace core
} // namespace orexa

#endif // OREXA_CORE_TTL_CACHE_HPP
