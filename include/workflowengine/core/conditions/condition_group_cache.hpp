#pragma once

#include <workflowengine/core/conditions/data_condition.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace WorkflowEngine {

/**
 * @class ConditionGroupSource
 * @brief Loads a condition group and its ordered conditions
 */
class ConditionGroupSource {
public:
    virtual ~ConditionGroupSource() = default;

    /**
     * @return nullopt when no group with this id exists
     */
    virtual std::optional<ConditionGroupData> fetchConditionGroup(int64_t group_id) = 0;
};

using ConditionGroupPtr = std::shared_ptr<const ConditionGroupData>;

/**
 * @class ConditionGroupCache
 * @brief Memoized condition group lookup keyed by group id
 *
 * Owned by the evaluation orchestrator and shared by every handler it
 * builds. Writers of condition groups or conditions must call
 * invalidate(group_id); the entry is reloaded lazily on next access.
 * Missing groups are cached as nullptr until invalidated.
 *
 * Thread-safe.
 */
class ConditionGroupCache {
public:
    explicit ConditionGroupCache(ConditionGroupSource& source);

    /**
     * @brief Get the cached group or load it from the source
     * @return nullptr when the group does not exist
     */
    ConditionGroupPtr get(int64_t group_id);

    void invalidate(int64_t group_id);
    void clear();

    size_t size() const;
    uint64_t hits() const { return hits_.load(std::memory_order_relaxed); }
    uint64_t misses() const { return misses_.load(std::memory_order_relaxed); }

private:
    ConditionGroupSource& source_;
    mutable std::mutex mutex_;
    std::unordered_map<int64_t, ConditionGroupPtr> entries_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace WorkflowEngine
