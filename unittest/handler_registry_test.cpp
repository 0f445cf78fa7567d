// ============================================================================
// HANDLER REGISTRY UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <workflowengine/core/detector/handler_registry.hpp>
#include <workflowengine/core/detector/metric_threshold_handler.hpp>
#include <workflowengine/core/storage/in_memory_ephemeral_store.hpp>
#include <workflowengine/core/storage/sqlite_store.hpp>

using namespace WorkflowEngine;

class HandlerRegistryTest : public ::testing::Test {
protected:
    Detector makeDetector(int64_t id, const std::string& type) {
        Detector detector;
        detector.id = id;
        detector.name = "detector-" + std::to_string(id);
        detector.type = type;
        return detector;
    }

    SqliteStore store_{":memory:"};
    InMemoryEphemeralStore cache_;
    ConditionGroupCache conditions_{store_};
    HandlerContext context_{cache_, store_, conditions_};
    HandlerRegistry<MetricPacket> registry_;
};

TEST_F(HandlerRegistryTest, BuiltinsRegisterMetricThreshold) {
    EXPECT_FALSE(registry_.contains("metric_threshold"));
    registerBuiltinHandlers(registry_);
    EXPECT_TRUE(registry_.contains("metric_threshold"));

    auto handler = registry_.create(makeDetector(1, "metric_threshold"), context_);
    ASSERT_NE(handler, nullptr);
    EXPECT_STREQ(handler->name(), "MetricThresholdHandler");
    EXPECT_EQ(handler->detector().id, 1);
}

TEST_F(HandlerRegistryTest, UnknownTypeYieldsNull) {
    registerBuiltinHandlers(registry_);
    EXPECT_EQ(registry_.create(makeDetector(1, "uptime"), context_), nullptr);
}

TEST_F(HandlerRegistryTest, CustomFactoryIsUsed) {
    int calls = 0;
    registry_.registerHandler("custom", [&calls](const Detector& detector, const HandlerContext& context) {
        ++calls;
        return DetectorHandlerPtr<MetricPacket>(
            std::make_unique<MetricThresholdHandler>(detector, context));
    });

    auto handler = registry_.create(makeDetector(4, "custom"), context_);
    ASSERT_NE(handler, nullptr);
    EXPECT_EQ(calls, 1);
}

// ============================================================================
// HANDLER CACHE TESTS
// ============================================================================

TEST_F(HandlerRegistryTest, CacheBuildsEachHandlerOnce) {
    registerBuiltinHandlers(registry_);
    HandlerCache<MetricPacket> handlers(registry_, context_);
    auto detector = makeDetector(1, "metric_threshold");

    auto* first = handlers.handlerFor(detector);
    auto* second = handlers.handlerFor(detector);

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(handlers.size(), 1u);
}

TEST_F(HandlerRegistryTest, CacheRemembersMissingHandlers) {
    HandlerCache<MetricPacket> handlers(registry_, context_);

    EXPECT_EQ(handlers.handlerFor(makeDetector(2, "uptime")), nullptr);
    EXPECT_EQ(handlers.handlerFor(makeDetector(2, "uptime")), nullptr);
    EXPECT_EQ(handlers.size(), 1u);
}

TEST_F(HandlerRegistryTest, InvalidateRebuildsHandler) {
    registerBuiltinHandlers(registry_);
    HandlerCache<MetricPacket> handlers(registry_, context_);
    auto detector = makeDetector(1, "metric_threshold");

    ASSERT_NE(handlers.handlerFor(detector), nullptr);
    handlers.invalidate(detector.id);
    EXPECT_EQ(handlers.size(), 0u);
    EXPECT_NE(handlers.handlerFor(detector), nullptr);
    EXPECT_EQ(handlers.size(), 1u);
}

TEST_F(HandlerRegistryTest, InvalidateWaitsForPendingCommit) {
    int builds = 0;
    registry_.registerHandler("counting", [&builds](const Detector& detector, const HandlerContext& context) {
        ++builds;
        return DetectorHandlerPtr<MetricPacket>(
            std::make_unique<MetricThresholdHandler>(detector, context));
    });
    int64_t group_id = store_.createConditionGroup({});
    DataCondition condition;
    condition.condition_group_id = group_id;
    condition.type = ConditionType::GREATER;
    condition.comparison = 10;
    condition.condition_result = PriorityLevel::HIGH;
    store_.createCondition(condition);

    HandlerCache<MetricPacket> handlers(registry_, context_);
    auto detector = makeDetector(1, "counting");
    detector.workflow_condition_group_id = group_id;

    DataPacket<MetricPacket> packet;
    packet.packet.sequence = 1;
    packet.packet.values[std::string("g1")] = 15.0;

    auto* handler = handlers.handlerFor(detector);
    ASSERT_NE(handler, nullptr);
    ASSERT_EQ(handler->evaluate(packet).size(), 1u);
    EXPECT_TRUE(handler->hasPendingUpdates());

    handlers.invalidate(detector.id);
    EXPECT_EQ(handlers.handlerFor(detector), handler);
    EXPECT_EQ(builds, 1);

    handler->commitStateUpdates();
    EXPECT_FALSE(handler->hasPendingUpdates());
    EXPECT_EQ(store_.countDetectorStates(), 1u);

    ASSERT_NE(handlers.handlerFor(detector), nullptr);
    EXPECT_EQ(builds, 2);
    EXPECT_EQ(handlers.size(), 1u);
}
