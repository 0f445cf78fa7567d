#pragma once

#include <workflowengine/core/detector/detector_handler.hpp>
#include <workflowengine/core/detector/handler_context.hpp>
#include <workflowengine/core/detector/stateful_detector_engine.hpp>
#include <workflowengine/core/models/state_update_batch.hpp>
#include <string>
#include <vector>

namespace WorkflowEngine {

/**
 * @class StatefulDetectorHandler
 * @brief DetectorHandler that tracks per-group-key state across packets
 *
 * Subclasses only say how to read a packet: its dedupe value, its group
 * key values, and which counters they track. Everything else (dedupe guard,
 * condition evaluation, transition detection, staging and commit) is done
 * by the StatefulDetectorEngine.
 *
 * Every evaluate() first re-reads the condition group from the shared
 * ConditionGroupCache, so an invalidated group is picked up without
 * rebuilding the handler.
 *
 * evaluate(packet) stages into the handler's own pending batch, flushed by
 * commitStateUpdates(). evaluate(packet, batch) stages into a caller-owned
 * batch instead, to be flushed with commitStateUpdates(batch).
 */
template <typename T>
class StatefulDetectorHandler : public DetectorHandler<T> {
public:
    StatefulDetectorHandler(Detector detector, const HandlerContext& context)
        : DetectorHandler<T>(std::move(detector), context.condition_cache),
          engine_(this->detector(), this->conditionGroupData(),
                  context.ephemeral_store, context.state_store, context.state_ttl) {}

    /**
     * @brief Names of the counters this detector keeps per group key
     */
    virtual std::vector<std::string> counterNames() const { return {}; }

    /**
     * @brief Extract the deduplication value (monotonic per source stream)
     */
    virtual int64_t getDedupeValue(const DataPacket<T>& data_packet) const = 0;

    /**
     * @brief Extract the observation value of every group key in the packet
     */
    virtual GroupKeyValues getGroupKeyValues(const DataPacket<T>& data_packet) const = 0;

    /**
     * @brief Counter updates to stage for one evaluated group key
     * Extension point; the default stages an empty update.
     */
    virtual CounterUpdates computeCounterUpdates(const DetectorGroupKey& group_key,
                                                 double value,
                                                 const DetectorStateData& state_data) const {
        (void)group_key;
        (void)value;
        (void)state_data;
        return {};
    }

    std::vector<DetectorEvaluationResult> evaluate(const DataPacket<T>& data_packet) override {
        return evaluate(data_packet, pending_);
    }

    std::vector<DetectorEvaluationResult> evaluate(const DataPacket<T>& data_packet,
                                                   StateUpdateBatch& batch) {
        if (this->refreshConditionGroup()) {
            engine_.setConditionGroup(this->conditionGroupData());
        }
        const int64_t dedupe_value = getDedupeValue(data_packet);
        const GroupKeyValues group_values = getGroupKeyValues(data_packet);
        return engine_.evaluate(
            dedupe_value, group_values, counterNames(), batch,
            [this](const DetectorGroupKey& group_key, double value, const DetectorStateData& state) {
                return computeCounterUpdates(group_key, value, state);
            });
    }

    void commitStateUpdates() override { engine_.commitStateUpdates(pending_); }
    void commitStateUpdates(StateUpdateBatch& batch) { engine_.commitStateUpdates(batch); }

    bool hasPendingUpdates() const override { return !pending_.empty(); }

    const StateUpdateBatch& pendingUpdates() const { return pending_; }

private:
    StatefulDetectorEngine engine_;
    StateUpdateBatch pending_;
};

} // namespace WorkflowEngine
