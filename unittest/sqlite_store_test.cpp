// ============================================================================
// SQLITE STORE UNIT TESTS
// ============================================================================
// Tests for detector, condition group and detector state persistence
// ============================================================================

#include <gtest/gtest.h>
#include <workflowengine/core/storage/sqlite_store.hpp>
#include <workflowengine/core/storage/store_error.hpp>
#include <algorithm>
#include <filesystem>

using namespace WorkflowEngine;

namespace {

DetectorState makeState(int64_t detector_id, DetectorGroupKey group_key, bool active,
                        PriorityLevel state) {
    DetectorState row;
    row.detector_id = detector_id;
    row.detector_group_key = std::move(group_key);
    row.active = active;
    row.state = state;
    return row;
}

DataCondition makeCondition(int64_t group_id, ConditionType type, double comparison,
                            PriorityLevel result) {
    DataCondition condition;
    condition.condition_group_id = group_id;
    condition.type = type;
    condition.comparison = comparison;
    condition.condition_result = result;
    return condition;
}

} // namespace

class SqliteStoreTest : public ::testing::Test {
protected:
    SqliteStore store_{":memory:"};
};

// ============================================================================
// DETECTOR TESTS
// ============================================================================

TEST_F(SqliteStoreTest, CreateAndListDetectors) {
    Detector a;
    a.name = "cpu";
    a.type = "metric_threshold";
    a.workflow_condition_group_id = 7;
    Detector b;
    b.name = "disk";
    b.type = "metric_threshold";

    int64_t id_a = store_.createDetector(a);
    int64_t id_b = store_.createDetector(b);

    auto detectors = store_.listDetectors();
    ASSERT_EQ(detectors.size(), 2u);
    EXPECT_EQ(detectors[0].id, id_a);
    EXPECT_EQ(detectors[0].workflow_condition_group_id, std::optional<int64_t>(7));
    EXPECT_EQ(detectors[1].id, id_b);
    EXPECT_FALSE(detectors[1].workflow_condition_group_id.has_value());

    auto loaded = store_.getDetector(id_b);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->name, "disk");
    EXPECT_FALSE(store_.getDetector(999).has_value());
}

// ============================================================================
// CONDITION GROUP TESTS
// ============================================================================

TEST_F(SqliteStoreTest, FetchConditionGroupReturnsConditionsInOrder) {
    int64_t group_id = store_.createConditionGroup({});
    store_.createCondition(makeCondition(group_id, ConditionType::GREATER, 10, PriorityLevel::MEDIUM));
    store_.createCondition(makeCondition(group_id, ConditionType::LESS_OR_EQUAL, -5, PriorityLevel::LOW));

    auto group = store_.fetchConditionGroup(group_id);

    ASSERT_TRUE(group.has_value());
    EXPECT_EQ(group->group.id, group_id);
    EXPECT_EQ(group->group.logic_type, "any");
    ASSERT_EQ(group->conditions.size(), 2u);
    EXPECT_EQ(group->conditions[0].type, ConditionType::GREATER);
    EXPECT_EQ(group->conditions[0].condition_result, PriorityLevel::MEDIUM);
    EXPECT_EQ(group->conditions[1].type, ConditionType::LESS_OR_EQUAL);
    EXPECT_DOUBLE_EQ(group->conditions[1].comparison, -5);
}

TEST_F(SqliteStoreTest, FetchMissingConditionGroup) {
    EXPECT_FALSE(store_.fetchConditionGroup(42).has_value());
}

TEST_F(SqliteStoreTest, DeleteConditionGroupRemovesConditions) {
    int64_t group_id = store_.createConditionGroup({});
    store_.createCondition(makeCondition(group_id, ConditionType::GREATER, 10, PriorityLevel::HIGH));

    store_.deleteConditionGroup(group_id);

    EXPECT_FALSE(store_.fetchConditionGroup(group_id).has_value());
}

TEST_F(SqliteStoreTest, ConditionForUnknownGroupIsRejected) {
    EXPECT_THROW(
        store_.createCondition(makeCondition(99, ConditionType::GREATER, 1, PriorityLevel::HIGH)),
        StoreError
    );
}

TEST_F(SqliteStoreTest, UpdateAndDeleteCondition) {
    int64_t group_id = store_.createConditionGroup({});
    int64_t condition_id = store_.createCondition(
        makeCondition(group_id, ConditionType::GREATER, 10, PriorityLevel::HIGH));

    auto condition = makeCondition(group_id, ConditionType::EQUAL, 3, PriorityLevel::LOW);
    condition.id = condition_id;
    store_.updateCondition(condition);

    auto group = store_.fetchConditionGroup(group_id);
    ASSERT_EQ(group->conditions.size(), 1u);
    EXPECT_EQ(group->conditions[0].type, ConditionType::EQUAL);
    EXPECT_EQ(group->conditions[0].condition_result, PriorityLevel::LOW);

    store_.deleteCondition(condition_id);
    EXPECT_TRUE(store_.fetchConditionGroup(group_id)->conditions.empty());
}

// ============================================================================
// LISTENER TESTS
// ============================================================================

TEST_F(SqliteStoreTest, WritesNotifyConditionGroupListeners) {
    std::vector<int64_t> notified;
    store_.addConditionGroupListener([&notified](int64_t group_id) {
        notified.push_back(group_id);
    });

    int64_t g1 = store_.createConditionGroup({});
    int64_t g2 = store_.createConditionGroup({});
    int64_t condition_id = store_.createCondition(
        makeCondition(g1, ConditionType::GREATER, 10, PriorityLevel::HIGH));
    notified.clear();

    // Moving a condition touches both groups
    auto moved = makeCondition(g2, ConditionType::GREATER, 10, PriorityLevel::HIGH);
    moved.id = condition_id;
    store_.updateCondition(moved);
    EXPECT_EQ(notified, (std::vector<int64_t>{g1, g2}));

    notified.clear();
    store_.deleteCondition(condition_id);
    EXPECT_EQ(notified, (std::vector<int64_t>{g2}));

    notified.clear();
    store_.deleteConditionGroup(g1);
    EXPECT_EQ(notified, (std::vector<int64_t>{g1}));
}

TEST_F(SqliteStoreTest, ListenerMayReadBackThroughStore) {
    std::optional<size_t> seen;
    store_.addConditionGroupListener([this, &seen](int64_t group_id) {
        auto group = store_.fetchConditionGroup(group_id);
        seen = group ? group->conditions.size() : 0;
    });

    int64_t group_id = store_.createConditionGroup({});
    store_.createCondition(makeCondition(group_id, ConditionType::GREATER, 10, PriorityLevel::HIGH));

    EXPECT_EQ(seen, std::optional<size_t>(1));
}

// ============================================================================
// DETECTOR STATE TESTS
// ============================================================================

TEST_F(SqliteStoreTest, FilterMatchesNamedAndNullKeys) {
    store_.bulkCreateDetectorStates({
        makeState(1, std::string("a"), true, PriorityLevel::HIGH),
        makeState(1, std::nullopt, false, PriorityLevel::OK),
        makeState(1, std::string("b"), true, PriorityLevel::LOW),
        makeState(2, std::string("a"), true, PriorityLevel::MEDIUM),
    });

    auto named = store_.filterDetectorStates(1, {std::string("a"), std::string("missing")});
    ASSERT_EQ(named.size(), 1u);
    EXPECT_EQ(named[0].detector_group_key, DetectorGroupKey("a"));
    EXPECT_EQ(named[0].state, PriorityLevel::HIGH);

    auto with_null = store_.filterDetectorStates(1, {std::nullopt, std::string("b")});
    ASSERT_EQ(with_null.size(), 2u);

    auto only_null = store_.filterDetectorStates(2, {std::nullopt});
    EXPECT_TRUE(only_null.empty());

    EXPECT_TRUE(store_.filterDetectorStates(1, {}).empty());
}

TEST_F(SqliteStoreTest, FilterHandlesMoreKeysThanOneQueryHolds) {
    std::vector<DetectorState> rows;
    std::vector<DetectorGroupKey> keys;
    for (int i = 0; i < 1200; ++i) {
        rows.push_back(makeState(1, "host-" + std::to_string(i), true, PriorityLevel::LOW));
        keys.emplace_back("host-" + std::to_string(i));
    }
    store_.bulkCreateDetectorStates(rows);

    EXPECT_EQ(store_.filterDetectorStates(1, keys).size(), 1200u);
}

TEST_F(SqliteStoreTest, NullKeyIsReturnedOnceAcrossChunks) {
    std::vector<DetectorState> rows;
    std::vector<DetectorGroupKey> keys;
    for (int i = 0; i < 1201; ++i) {
        rows.push_back(makeState(1, "host-" + std::to_string(i), true, PriorityLevel::LOW));
        keys.emplace_back("host-" + std::to_string(i));
    }
    rows.push_back(makeState(1, std::nullopt, true, PriorityLevel::HIGH));
    rows.push_back(makeState(2, std::nullopt, true, PriorityLevel::HIGH));
    store_.bulkCreateDetectorStates(rows);
    keys.insert(keys.begin() + 600, std::nullopt);

    auto found = store_.filterDetectorStates(1, keys);
    ASSERT_EQ(found.size(), 1202u);
    auto nulls = std::count_if(found.begin(), found.end(), [](const DetectorState& row) {
        return !row.detector_group_key.has_value();
    });
    EXPECT_EQ(nulls, 1);

    auto only_null = store_.filterDetectorStates(1, {std::nullopt});
    ASSERT_EQ(only_null.size(), 1u);
    EXPECT_EQ(only_null[0].state, PriorityLevel::HIGH);
}

TEST_F(SqliteStoreTest, BulkUpdateMatchesById) {
    store_.bulkCreateDetectorStates({makeState(1, std::string("a"), true, PriorityLevel::HIGH)});
    auto rows = store_.filterDetectorStates(1, {std::string("a")});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_GT(rows[0].id, 0);

    rows[0].active = false;
    rows[0].state = PriorityLevel::OK;
    store_.bulkUpdateDetectorStates(rows);

    auto updated = store_.filterDetectorStates(1, {std::string("a")});
    ASSERT_EQ(updated.size(), 1u);
    EXPECT_FALSE(updated[0].active);
    EXPECT_EQ(updated[0].state, PriorityLevel::OK);
}

TEST_F(SqliteStoreTest, DuplicateRowIsRejectedAtomically) {
    store_.bulkCreateDetectorStates({makeState(1, std::string("a"), true, PriorityLevel::HIGH)});

    EXPECT_THROW(
        store_.bulkCreateDetectorStates({
            makeState(1, std::string("b"), true, PriorityLevel::HIGH),
            makeState(1, std::string("a"), false, PriorityLevel::OK),
        }),
        StoreError
    );
    EXPECT_EQ(store_.countDetectorStates(), 1u);
}

TEST_F(SqliteStoreTest, SingleNullKeyRowPerDetector) {
    store_.bulkCreateDetectorStates({makeState(1, std::nullopt, true, PriorityLevel::HIGH)});

    EXPECT_THROW(
        store_.bulkCreateDetectorStates({makeState(1, std::nullopt, false, PriorityLevel::OK)}),
        StoreError
    );
    store_.bulkCreateDetectorStates({makeState(2, std::nullopt, false, PriorityLevel::OK)});
    EXPECT_EQ(store_.countDetectorStates(), 2u);
}

// ============================================================================
// FILE DATABASE TESTS
// ============================================================================

TEST(SqliteStoreFile, StatePersistsAcrossReopen) {
    std::string path = "unittest/temp_workflow_engine.db";
    std::filesystem::remove(path);
    {
        SqliteStore store(path);
        store.bulkCreateDetectorStates({makeState(1, std::string("a"), true, PriorityLevel::MEDIUM)});
    }
    {
        SqliteStore store(path);
        auto rows = store.filterDetectorStates(1, {std::string("a")});
        ASSERT_EQ(rows.size(), 1u);
        EXPECT_EQ(rows[0].state, PriorityLevel::MEDIUM);
    }
    std::filesystem::remove(path);
}

TEST(SqliteStoreFile, ThrowsOnUnopenablePath) {
    EXPECT_THROW(SqliteStore("unittest/no_such_dir/db.sqlite"), StoreError);
}
