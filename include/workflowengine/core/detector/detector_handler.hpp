#pragma once

#include <workflowengine/core/conditions/condition_group_cache.hpp>
#include <workflowengine/core/models/types.hpp>
#include <memory>
#include <vector>

namespace WorkflowEngine {

/**
 * @class DetectorHandlerBase
 * @brief Packet-type independent part of a detector handler
 *
 * Resolves the detector's condition group through the shared cache at
 * construction and again on every refreshConditionGroup(), so writes that
 * invalidate the cache entry reach long-lived handlers. A detector without
 * a group id, or whose group no longer exists, has no group and no
 * conditions.
 */
class DetectorHandlerBase {
public:
    DetectorHandlerBase(Detector detector, ConditionGroupCache& condition_cache);
    virtual ~DetectorHandlerBase() = default;

    DetectorHandlerBase(const DetectorHandlerBase&) = delete;
    DetectorHandlerBase& operator=(const DetectorHandlerBase&) = delete;

    const Detector& detector() const { return detector_; }

    // nullptr when the detector has no usable condition group
    const DataConditionGroup* conditionGroup() const {
        return condition_group_ ? &condition_group_->group : nullptr;
    }
    const std::vector<DataCondition>& conditions() const;
    const ConditionGroupPtr& conditionGroupData() const { return condition_group_; }

    /**
     * @brief Re-read the condition group from the shared cache
     * @return true when the resolved group changed
     */
    bool refreshConditionGroup();

    /**
     * @brief Flush updates staged by previous evaluate() calls
     * Handlers without persistent state have nothing to do.
     */
    virtual void commitStateUpdates() {}

    // true while updates staged by evaluate() wait for commitStateUpdates()
    virtual bool hasPendingUpdates() const { return false; }

    virtual const char* name() const = 0;

private:
    Detector detector_;
    ConditionGroupCache& condition_cache_;
    ConditionGroupPtr condition_group_;
};

/**
 * @class DetectorHandler
 * @brief Per-detector-type evaluation strategy for packets of type T
 */
template <typename T>
class DetectorHandler : public DetectorHandlerBase {
public:
    using DetectorHandlerBase::DetectorHandlerBase;

    /**
     * @brief Evaluate a packet
     * @return One result per group key whose state changed
     */
    virtual std::vector<DetectorEvaluationResult> evaluate(const DataPacket<T>& data_packet) = 0;
};

template <typename T>
using DetectorHandlerPtr = std::unique_ptr<DetectorHandler<T>>;

} // namespace WorkflowEngine
