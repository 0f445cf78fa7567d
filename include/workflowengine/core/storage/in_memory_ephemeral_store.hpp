#pragma once

#include <workflowengine/core/storage/ephemeral_store.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace WorkflowEngine {

/**
 * @class InMemoryEphemeralStore
 * @brief Process-local EphemeralStore with per-key expiry
 *
 * Features:
 * - A pipeline executes atomically under one lock
 * - Expired keys read as absent and are evicted lazily or by purgeExpired()
 * - Injectable clock for expiry tests
 * - setAvailable(false) makes every call throw StoreError
 */
class InMemoryEphemeralStore : public EphemeralStore {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    InMemoryEphemeralStore();
    explicit InMemoryEphemeralStore(ClockFn clock);

    PipelineReplies execute(const Pipeline& pipeline) override;
    const char* name() const override { return "InMemoryEphemeralStore"; }

    /**
     * @brief Remove every expired key
     * @return Number of keys removed
     */
    size_t purgeExpired();

    // Direct reads for inspection; expired keys read as nullopt
    std::optional<std::string> peek(const std::string& key) const;
    std::optional<std::chrono::seconds> ttl(const std::string& key) const;
    size_t size() const;

    void setAvailable(bool available) { available_.store(available, std::memory_order_release); }

    /**
     * @brief Number of pipelines executed (one per round trip)
     */
    uint64_t roundTrips() const { return round_trips_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        std::string value;
        std::optional<Clock::time_point> expires_at;
    };

    bool isExpired(const Entry& entry, Clock::time_point now) const {
        return entry.expires_at && *entry.expires_at <= now;
    }

    ClockFn clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::atomic<bool> available_{true};
    std::atomic<uint64_t> round_trips_{0};
};

} // namespace WorkflowEngine
