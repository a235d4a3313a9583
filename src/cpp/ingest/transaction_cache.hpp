#pragma once
// Per-user cache of stored fingerprints with a time-to-live. Callers refresh
// it from the store on a miss and invalidate it after every import.
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace stmt {

class TransactionCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using FingerprintSet = std::unordered_set<std::string>;

    explicit TransactionCache(std::chrono::milliseconds ttl = std::chrono::seconds(60),
                              NowFn now = [] { return Clock::now(); })
        : ttl_(ttl), now_(std::move(now)) {}

    // nullopt when absent or older than the TTL (expired entries are dropped)
    std::optional<FingerprintSet> get(const std::string& user_id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(user_id);
        if (it == entries_.end()) return std::nullopt;
        if (now_() - it->second.stored_at >= ttl_) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.fingerprints;
    }

    void put(const std::string& user_id, FingerprintSet fingerprints) {
        std::lock_guard<std::mutex> lock(mu_);
        entries_[user_id] = Entry{std::move(fingerprints), now_()};
    }

    void invalidate(const std::string& user_id) {
        std::lock_guard<std::mutex> lock(mu_);
        entries_.erase(user_id);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mu_);
        entries_.clear();
    }

    [[nodiscard]] std::chrono::milliseconds ttl() const { return ttl_; }

private:
    struct Entry {
        FingerprintSet fingerprints;
        Clock::time_point stored_at;
    };

    std::chrono::milliseconds ttl_;
    NowFn now_;
    std::mutex mu_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace stmt
