// ============================================================================
// DATA CONDITION UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <workflowengine/core/conditions/data_condition.hpp>

using namespace WorkflowEngine;

namespace {

DataCondition makeCondition(ConditionType type, double comparison) {
    DataCondition condition;
    condition.type = type;
    condition.comparison = comparison;
    condition.condition_result = PriorityLevel::MEDIUM;
    return condition;
}

} // namespace

TEST(DataCondition, ComparisonOperators) {
    EXPECT_TRUE(makeCondition(ConditionType::GREATER, 10).evaluateValue(15).has_value());
    EXPECT_FALSE(makeCondition(ConditionType::GREATER, 10).evaluateValue(10).has_value());
    EXPECT_TRUE(makeCondition(ConditionType::GREATER_OR_EQUAL, 10).evaluateValue(10).has_value());
    EXPECT_TRUE(makeCondition(ConditionType::LESS, 10).evaluateValue(5).has_value());
    EXPECT_FALSE(makeCondition(ConditionType::LESS, 10).evaluateValue(10).has_value());
    EXPECT_TRUE(makeCondition(ConditionType::LESS_OR_EQUAL, 10).evaluateValue(10).has_value());
    EXPECT_TRUE(makeCondition(ConditionType::EQUAL, 3).evaluateValue(3).has_value());
    EXPECT_FALSE(makeCondition(ConditionType::NOT_EQUAL, 3).evaluateValue(3).has_value());
}

TEST(DataCondition, MatchYieldsConditionResult) {
    auto condition = makeCondition(ConditionType::GREATER, 10);
    condition.condition_result = PriorityLevel::HIGH;

    EXPECT_EQ(condition.evaluateValue(11), std::optional<PriorityLevel>(PriorityLevel::HIGH));
}

TEST(ConditionType, ShortCodes) {
    for (auto type : {ConditionType::EQUAL, ConditionType::GREATER_OR_EQUAL, ConditionType::GREATER,
                      ConditionType::LESS_OR_EQUAL, ConditionType::LESS, ConditionType::NOT_EQUAL}) {
        EXPECT_EQ(conditionTypeFromString(toString(type)), std::optional<ConditionType>(type));
    }
    EXPECT_FALSE(conditionTypeFromString("between").has_value());
}
