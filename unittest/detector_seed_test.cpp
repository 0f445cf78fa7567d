// ============================================================================
// DETECTOR SEED UNIT TESTS
// ============================================================================
// Tests for creating configured detectors in the durable store
// ============================================================================

#include <gtest/gtest.h>
#include <workflowengine/core/config/loader.hpp>
#include <workflowengine/core/storage/detector_seed.hpp>
#include <stdexcept>

using namespace WorkflowEngine;

namespace {

AppConfig::DetectorConfig makeDetectorConfig(const std::string& name) {
    AppConfig::DetectorConfig config;
    config.name = name;
    config.conditions.push_back({"gt", 10, "medium"});
    config.conditions.push_back({"gt", 50, "high"});
    return config;
}

} // namespace

class DetectorSeedTest : public ::testing::Test {
protected:
    SqliteStore store_{":memory:"};
};

TEST_F(DetectorSeedTest, CreatesDetectorWithConditionGroup) {
    EXPECT_EQ(seedDetectors(store_, {makeDetectorConfig("cpu")}), 1u);

    auto detectors = store_.listDetectors();
    ASSERT_EQ(detectors.size(), 1u);
    EXPECT_EQ(detectors[0].name, "cpu");
    EXPECT_EQ(detectors[0].type, "metric_threshold");
    ASSERT_TRUE(detectors[0].workflow_condition_group_id.has_value());

    auto group = store_.fetchConditionGroup(*detectors[0].workflow_condition_group_id);
    ASSERT_TRUE(group.has_value());
    ASSERT_EQ(group->conditions.size(), 2u);
    EXPECT_EQ(group->conditions[0].type, ConditionType::GREATER);
    EXPECT_DOUBLE_EQ(group->conditions[0].comparison, 10.0);
    EXPECT_EQ(group->conditions[0].condition_result, PriorityLevel::MEDIUM);
    EXPECT_EQ(group->conditions[1].condition_result, PriorityLevel::HIGH);
}

TEST_F(DetectorSeedTest, SecondSeedCreatesNothing) {
    std::vector<AppConfig::DetectorConfig> configs = {makeDetectorConfig("cpu"),
                                                      makeDetectorConfig("memory")};
    EXPECT_EQ(seedDetectors(store_, configs), 2u);
    EXPECT_EQ(seedDetectors(store_, configs), 0u);
    EXPECT_EQ(store_.listDetectors().size(), 2u);
}

TEST_F(DetectorSeedTest, StoredDetectorIsKeptAsIs) {
    Detector existing;
    existing.name = "cpu";
    existing.type = "uptime_check";
    existing.id = store_.createDetector(existing);

    EXPECT_EQ(seedDetectors(store_, {makeDetectorConfig("cpu"), makeDetectorConfig("disk")}), 1u);

    auto stored = store_.getDetector(existing.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->type, "uptime_check");
    EXPECT_FALSE(stored->workflow_condition_group_id.has_value());
}

TEST_F(DetectorSeedTest, UnknownConditionTypeWritesNothing) {
    auto config = makeDetectorConfig("cpu");
    config.conditions.push_back({"above", 90, "high"});

    EXPECT_THROW(seedDetectors(store_, {config}), std::runtime_error);
    EXPECT_TRUE(store_.listDetectors().empty());
}

TEST_F(DetectorSeedTest, ShippedConfigSeedsTheSampleDetector) {
    auto config = ConfigLoader::loadConfig("config/config.yaml");

    EXPECT_EQ(seedDetectors(store_, config.detectors), config.detectors.size());
    EXPECT_FALSE(store_.listDetectors().empty());
}
