#include "metrics_store.hpp"

namespace sdc {

bool InMemoryMetricsStore::set_ex(const std::string& key, const std::string& value,
                                  std::chrono::seconds ttl, std::chrono::milliseconds timeout) {
    std::unique_lock<std::timed_mutex> lock(mutex_, timeout);
    if (!lock.owns_lock()) {
        return false;
    }

    auto now = Clock::now();
    entries_[key] = Entry{value, now + ttl};

    // Sweep expired keys at most once a second
    if (now - last_purge_ >= std::chrono::seconds(1)) {
        purge_expired(now);
        last_purge_ = now;
    }
    return true;
}

std::optional<std::string> InMemoryMetricsStore::get(const std::string& key) {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.expires_at <= Clock::now()) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

std::vector<std::string> InMemoryMetricsStore::keys(const std::string& prefix) {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    purge_expired(Clock::now());

    std::vector<std::string> out;
    for (const auto& [key, entry] : entries_) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            out.push_back(key);
        }
    }
    return out;
}

size_t InMemoryMetricsStore::erase_prefix(const std::string& prefix) {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryMetricsStore::size() {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    purge_expired(Clock::now());
    return entries_.size();
}

void InMemoryMetricsStore::purge_expired(Clock::time_point now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace sdc
