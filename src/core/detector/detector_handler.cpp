#include <workflowengine/core/detector/detector_handler.hpp>
#include <spdlog/spdlog.h>

namespace WorkflowEngine {

namespace {
const std::vector<DataCondition> kNoConditions;
}

DetectorHandlerBase::DetectorHandlerBase(Detector detector, ConditionGroupCache& condition_cache)
    : detector_(std::move(detector)), condition_cache_(condition_cache) {
    refreshConditionGroup();
}

bool DetectorHandlerBase::refreshConditionGroup() {
    if (!detector_.workflow_condition_group_id) {
        return false;
    }
    auto current = condition_cache_.get(*detector_.workflow_condition_group_id);
    if (current == condition_group_) {
        return false;
    }
    condition_group_ = std::move(current);
    spdlog::debug("[DetectorHandler] detector_id={} reloaded condition group conditions={}",
                  detector_.id, conditions().size());
    return true;
}

const std::vector<DataCondition>& DetectorHandlerBase::conditions() const {
    return condition_group_ ? condition_group_->conditions : kNoConditions;
}

} // namespace WorkflowEngine
