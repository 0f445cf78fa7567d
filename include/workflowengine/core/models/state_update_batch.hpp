#pragma once

#include <workflowengine/core/models/types.hpp>
#include <cstdint>
#include <map>
#include <utility>

namespace WorkflowEngine {

/**
 * @struct StateUpdateBatch
 * @brief Updates staged by one evaluate pass, consumed by one commit
 *
 * Not thread-safe. One batch belongs to one evaluate->commit cycle on one
 * thread; commit clears it.
 */
struct StateUpdateBatch {
    std::map<DetectorGroupKey, int64_t> dedupe_updates;
    std::map<DetectorGroupKey, CounterUpdates> counter_updates;
    std::map<DetectorGroupKey, std::pair<bool, PriorityLevel>> state_updates;

    bool empty() const {
        return dedupe_updates.empty() && counter_updates.empty() && state_updates.empty();
    }

    void clear() {
        dedupe_updates.clear();
        counter_updates.clear();
        state_updates.clear();
    }

    void enqueueDedupeUpdate(const DetectorGroupKey& group_key, int64_t dedupe_value) {
        dedupe_updates[group_key] = dedupe_value;
    }

    void enqueueCounterUpdate(const DetectorGroupKey& group_key, CounterUpdates updates) {
        counter_updates[group_key] = std::move(updates);
    }

    void enqueueStateUpdate(const DetectorGroupKey& group_key, bool is_active, PriorityLevel priority) {
        state_updates[group_key] = {is_active, priority};
    }
};

} // namespace WorkflowEngine
