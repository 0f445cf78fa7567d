// ============================================================================
// MODEL TYPES UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <workflowengine/core/models/state_update_batch.hpp>
#include <workflowengine/core/models/types.hpp>

using namespace WorkflowEngine;

TEST(PriorityLevel, OrderingAndNames) {
    EXPECT_LT(PriorityLevel::OK, PriorityLevel::LOW);
    EXPECT_LT(PriorityLevel::LOW, PriorityLevel::MEDIUM);
    EXPECT_LT(PriorityLevel::MEDIUM, PriorityLevel::HIGH);
    EXPECT_STREQ(toString(PriorityLevel::OK), "OK");
    EXPECT_STREQ(toString(PriorityLevel::HIGH), "HIGH");
}

TEST(PriorityLevel, FromIntClampsDown) {
    EXPECT_EQ(priorityFromInt(0), PriorityLevel::OK);
    EXPECT_EQ(priorityFromInt(25), PriorityLevel::LOW);
    EXPECT_EQ(priorityFromInt(49), PriorityLevel::LOW);
    EXPECT_EQ(priorityFromInt(50), PriorityLevel::MEDIUM);
    EXPECT_EQ(priorityFromInt(100), PriorityLevel::HIGH);
    EXPECT_EQ(priorityFromInt(-3), PriorityLevel::OK);
}

TEST(PriorityLevel, FromStringAcceptsLowercaseNames) {
    EXPECT_EQ(priorityFromString("ok"), PriorityLevel::OK);
    EXPECT_EQ(priorityFromString("low"), PriorityLevel::LOW);
    EXPECT_EQ(priorityFromString("medium"), PriorityLevel::MEDIUM);
    EXPECT_EQ(priorityFromString("high"), PriorityLevel::HIGH);
    EXPECT_FALSE(priorityFromString("HIGH").has_value());
    EXPECT_FALSE(priorityFromString("critical").has_value());
}

TEST(GroupKey, Formatting) {
    EXPECT_EQ(formatGroupKey(std::nullopt), "");
    EXPECT_EQ(formatGroupKey(std::string("host-a")), "host-a");
}

// ============================================================================
// STATE UPDATE BATCH TESTS
// ============================================================================

TEST(StateUpdateBatch, LastEnqueueWins) {
    StateUpdateBatch batch;
    EXPECT_TRUE(batch.empty());

    batch.enqueueDedupeUpdate(std::string("a"), 1);
    batch.enqueueDedupeUpdate(std::string("a"), 2);
    batch.enqueueStateUpdate(std::nullopt, true, PriorityLevel::LOW);
    batch.enqueueStateUpdate(std::nullopt, true, PriorityLevel::HIGH);

    EXPECT_FALSE(batch.empty());
    EXPECT_EQ(batch.dedupe_updates.size(), 1u);
    EXPECT_EQ(batch.dedupe_updates.at(std::string("a")), 2);
    EXPECT_EQ(batch.state_updates.at(std::nullopt).second, PriorityLevel::HIGH);

    batch.clear();
    EXPECT_TRUE(batch.empty());
}
