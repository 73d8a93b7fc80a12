#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sdc {

// Short-lived key/value metrics with per-key TTL. Writes take a timeout and
// report false instead of blocking past it.
class MetricsStore {
public:
    virtual ~MetricsStore() = default;

    virtual bool set_ex(const std::string& key, const std::string& value,
                        std::chrono::seconds ttl, std::chrono::milliseconds timeout) = 0;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual std::vector<std::string> keys(const std::string& prefix) = 0;

    // Returns number of keys removed
    virtual size_t erase_prefix(const std::string& prefix) = 0;
};

class InMemoryMetricsStore : public MetricsStore {
public:
    using Clock = std::chrono::steady_clock;

    bool set_ex(const std::string& key, const std::string& value,
                std::chrono::seconds ttl, std::chrono::milliseconds timeout) override;
    std::optional<std::string> get(const std::string& key) override;
    std::vector<std::string> keys(const std::string& prefix) override;
    size_t erase_prefix(const std::string& prefix) override;

    size_t size();

private:
    struct Entry {
        std::string value;
        Clock::time_point expires_at;
    };

    void purge_expired(Clock::time_point now);

    std::timed_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    Clock::time_point last_purge_ = Clock::now();
};

} // namespace sdc
