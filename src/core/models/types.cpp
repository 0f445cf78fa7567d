#include <workflowengine/core/models/types.hpp>

namespace WorkflowEngine {

const char* toString(PriorityLevel level) {
    switch (level) {
        case PriorityLevel::OK:     return "OK";
        case PriorityLevel::LOW:    return "LOW";
        case PriorityLevel::MEDIUM: return "MEDIUM";
        case PriorityLevel::HIGH:   return "HIGH";
    }
    return "UNKNOWN";
}

PriorityLevel priorityFromInt(int value) {
    if (value >= static_cast<int>(PriorityLevel::HIGH)) return PriorityLevel::HIGH;
    if (value >= static_cast<int>(PriorityLevel::MEDIUM)) return PriorityLevel::MEDIUM;
    if (value >= static_cast<int>(PriorityLevel::LOW)) return PriorityLevel::LOW;
    return PriorityLevel::OK;
}

std::optional<PriorityLevel> priorityFromString(const std::string& value) {
    if (value == "ok")     return PriorityLevel::OK;
    if (value == "low")    return PriorityLevel::LOW;
    if (value == "medium") return PriorityLevel::MEDIUM;
    if (value == "high")   return PriorityLevel::HIGH;
    return std::nullopt;
}

std::string formatGroupKey(const DetectorGroupKey& group_key) {
    return group_key ? *group_key : std::string();
}

} // namespace WorkflowEngine
