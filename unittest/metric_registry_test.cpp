// ============================================================================
// METRIC REGISTRY UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <workflowengine/core/metrics/registry.hpp>

using namespace WorkflowEngine;

class MetricRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { MetricRegistry::getInstance().reset(); }
};

TEST_F(MetricRegistryTest, NamedCountersAccumulate) {
    auto& registry = MetricRegistry::getInstance();

    registry.incr(MetricNames::SKIPPING_ALREADY_PROCESSED);
    registry.incr(MetricNames::SKIPPING_ALREADY_PROCESSED, 4);

    EXPECT_EQ(registry.get(MetricNames::SKIPPING_ALREADY_PROCESSED), 5u);
    EXPECT_EQ(registry.get("workflow_engine.detector.never_incremented"), 0u);
    EXPECT_EQ(registry.getCounters().at(
        "workflow_engine.detector.skipping_already_processed_update"), 5u);
}

TEST_F(MetricRegistryTest, ComponentMetricsAreStable) {
    auto& registry = MetricRegistry::getInstance();
    Metrics& first = registry.getMetrics("component");
    first.total_packets_evaluated.fetch_add(2);
    first.total_evaluation_time_ns.fetch_add(300);

    Metrics& again = registry.getMetrics("component");
    EXPECT_EQ(&first, &again);

    auto snapshot = registry.getSnapshot("component");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->total_packets_evaluated, 2u);
    EXPECT_EQ(snapshot->get_avg_evaluation_ns(), 150u);
    EXPECT_FALSE(registry.getSnapshot("unknown-component").has_value());
}

TEST_F(MetricRegistryTest, ResetZeroesButKeepsReferences) {
    auto& registry = MetricRegistry::getInstance();
    Metrics& m = registry.getMetrics("component");
    m.total_commits.fetch_add(3);
    registry.incr("counter");
    registry.updateEventTimestamp("component");
    EXPECT_GT(registry.getSnapshot("component")->last_event_timestamp_ms, 0u);

    registry.reset();

    EXPECT_EQ(m.total_commits.load(), 0u);
    EXPECT_EQ(registry.get("counter"), 0u);
    m.total_commits.fetch_add(1);
    EXPECT_EQ(registry.getSnapshot("component")->total_commits, 1u);
}
