#pragma once

#include <workflowengine/core/conditions/condition_group_cache.hpp>
#include <workflowengine/core/models/state_update_batch.hpp>
#include <workflowengine/core/models/types.hpp>
#include <workflowengine/core/storage/detector_state_store.hpp>
#include <workflowengine/core/storage/ephemeral_store.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace WorkflowEngine {

// Expiry of dedupe and counter keys in the ephemeral store
constexpr std::chrono::seconds DEFAULT_STATE_TTL{7 * 24 * 60 * 60};

/**
 * @class StatefulDetectorEngine
 * @brief Dedupe, counter and active/priority bookkeeping for one detector
 *
 * Per (detector, group_key) the state is {status, active} with
 * active == (status != OK). evaluate() reads both stores in bulk, decides
 * transitions and stages updates into a StateUpdateBatch; nothing is
 * written until commitStateUpdates() is called with that batch.
 *
 * Ephemeral keys:
 *   "{detector_id}:{group_key}:dedupe_value"
 *   "{detector_id}:{group_key}:{counter_name}"
 * where the no-group key renders as an empty string.
 *
 * Not thread-safe with respect to a shared batch. Separate engines (one per
 * detector) may run concurrently.
 */
class StatefulDetectorEngine {
public:
    /**
     * Computes the counter updates staged for one evaluated group key.
     * Returning an empty map stages an empty update.
     */
    using CounterHook = std::function<CounterUpdates(const DetectorGroupKey& group_key,
                                                     double value,
                                                     const DetectorStateData& state_data)>;

    StatefulDetectorEngine(const Detector& detector,
                           ConditionGroupPtr condition_group,
                           EphemeralStore& ephemeral_store,
                           DetectorStateStore& state_store,
                           std::chrono::seconds state_ttl = DEFAULT_STATE_TTL);

    // Conditions used by subsequent evaluations; nullptr skips evaluation
    void setConditionGroup(ConditionGroupPtr condition_group);

    /**
     * @brief Fetch merged state for every group key
     *
     * One durable query plus one pipeline for dedupe values and, only when
     * counter_names is non-empty, one pipeline for counters. No store is
     * touched when group_keys is empty. Keys without
     * stored data get defaults (inactive, OK, dedupe 0, counters unset).
     */
    std::unordered_map<DetectorGroupKey, DetectorStateData> getStateData(
        const std::vector<DetectorGroupKey>& group_keys,
        const std::vector<std::string>& counter_names);

    /**
     * @brief Evaluate all group values of one packet
     * @return Results for group keys whose state changed, in group key order
     * @throws StoreError when a store is unavailable
     */
    std::vector<DetectorEvaluationResult> evaluate(int64_t dedupe_value,
                                                   const GroupKeyValues& group_values,
                                                   const std::vector<std::string>& counter_names,
                                                   StateUpdateBatch& batch,
                                                   const CounterHook& counter_hook = nullptr);

    std::optional<DetectorEvaluationResult> evaluateGroupKeyValue(
        const DetectorGroupKey& group_key,
        double value,
        const DetectorStateData& state_data,
        int64_t dedupe_value,
        StateUpdateBatch& batch,
        const CounterHook& counter_hook = nullptr);

    /**
     * @brief Flush staged updates to the durable and ephemeral stores
     *
     * Both flushes are idempotent and each clears only the part of the batch
     * it wrote. A failure in the ephemeral flush after a successful durable
     * flush leaves dedupe/counter updates in the batch for a retry.
     */
    void commitStateUpdates(StateUpdateBatch& batch);

    std::string buildDedupeValueKey(const DetectorGroupKey& group_key) const;
    std::string buildCounterValueKey(const DetectorGroupKey& group_key,
                                     const std::string& counter_name) const;

    /**
     * @brief Durable rows for the given keys; keys without a row are absent
     */
    std::unordered_map<DetectorGroupKey, DetectorState> bulkGetDetectorState(
        const std::vector<DetectorGroupKey>& group_keys);

    const Detector& detector() const { return detector_; }

private:
    void commitDetectorState(StateUpdateBatch& batch);
    void commitEphemeralState(StateUpdateBatch& batch);

    const Detector& detector_;
    ConditionGroupPtr condition_group_;
    EphemeralStore& ephemeral_store_;
    DetectorStateStore& state_store_;
    std::chrono::seconds state_ttl_;
};

} // namespace WorkflowEngine
