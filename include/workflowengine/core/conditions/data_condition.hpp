#pragma once

#include <workflowengine/core/models/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace WorkflowEngine {

/**
 * @enum ConditionType
 * @brief Comparison applied between the observed value and the threshold
 */
enum class ConditionType {
    EQUAL,
    GREATER_OR_EQUAL,
    GREATER,
    LESS_OR_EQUAL,
    LESS,
    NOT_EQUAL
};

// Short codes used in storage: eq, gte, gt, lte, lt, ne
const char* toString(ConditionType type);
std::optional<ConditionType> conditionTypeFromString(const std::string& value);

/**
 * @struct DataCondition
 * @brief One predicate of a condition group
 */
struct DataCondition {
    int64_t id = 0;
    int64_t condition_group_id = 0;
    ConditionType type = ConditionType::GREATER;
    double comparison = 0.0;
    PriorityLevel condition_result = PriorityLevel::HIGH;

    /**
     * @brief Evaluate an observation value
     * @return condition_result when the comparison holds, nullopt otherwise
     */
    std::optional<PriorityLevel> evaluateValue(double value) const;
};

/**
 * @struct DataConditionGroup
 */
struct DataConditionGroup {
    int64_t id = 0;
    std::string logic_type = "any";
};

/**
 * @struct ConditionGroupData
 * @brief A condition group with its ordered conditions
 */
struct ConditionGroupData {
    DataConditionGroup group;
    std::vector<DataCondition> conditions;
};

} // namespace WorkflowEngine
