#include <workflowengine/core/conditions/data_condition.hpp>

namespace WorkflowEngine {

const char* toString(ConditionType type) {
    switch (type) {
        case ConditionType::EQUAL:            return "eq";
        case ConditionType::GREATER_OR_EQUAL: return "gte";
        case ConditionType::GREATER:          return "gt";
        case ConditionType::LESS_OR_EQUAL:    return "lte";
        case ConditionType::LESS:             return "lt";
        case ConditionType::NOT_EQUAL:        return "ne";
    }
    return "unknown";
}

std::optional<ConditionType> conditionTypeFromString(const std::string& value) {
    if (value == "eq")  return ConditionType::EQUAL;
    if (value == "gte") return ConditionType::GREATER_OR_EQUAL;
    if (value == "gt")  return ConditionType::GREATER;
    if (value == "lte") return ConditionType::LESS_OR_EQUAL;
    if (value == "lt")  return ConditionType::LESS;
    if (value == "ne")  return ConditionType::NOT_EQUAL;
    return std::nullopt;
}

std::optional<PriorityLevel> DataCondition::evaluateValue(double value) const {
    bool matched = false;
    switch (type) {
        case ConditionType::EQUAL:            matched = value == comparison; break;
        case ConditionType::GREATER_OR_EQUAL: matched = value >= comparison; break;
        case ConditionType::GREATER:          matched = value > comparison; break;
        case ConditionType::LESS_OR_EQUAL:    matched = value <= comparison; break;
        case ConditionType::LESS:             matched = value < comparison; break;
        case ConditionType::NOT_EQUAL:        matched = value != comparison; break;
    }
    if (!matched) {
        return std::nullopt;
    }
    return condition_result;
}

} // namespace WorkflowEngine
