#include <workflowengine/core/storage/detector_seed.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_set>

namespace WorkflowEngine {

namespace {

DataCondition toCondition(const AppConfig::ConditionConfig& config, const std::string& detector_name) {
    auto type = conditionTypeFromString(config.type);
    if (!type) {
        throw std::runtime_error("Detector " + detector_name + ": unknown condition type " + config.type);
    }
    auto result = priorityFromString(config.result);
    if (!result) {
        throw std::runtime_error("Detector " + detector_name + ": unknown condition result " + config.result);
    }

    DataCondition condition;
    condition.type = *type;
    condition.comparison = config.comparison;
    condition.condition_result = *result;
    return condition;
}

} // namespace

size_t seedDetectors(SqliteStore& store, const std::vector<AppConfig::DetectorConfig>& detectors) {
    std::unordered_set<std::string> existing;
    for (const auto& detector : store.listDetectors()) {
        existing.insert(detector.name);
    }

    size_t created = 0;
    for (const auto& config : detectors) {
        if (existing.count(config.name) != 0) {
            spdlog::debug("[DetectorSeed] name={} already stored, skipping", config.name);
            continue;
        }

        // All conditions convert before anything is written
        std::vector<DataCondition> conditions;
        for (const auto& condition : config.conditions) {
            conditions.push_back(toCondition(condition, config.name));
        }

        const int64_t group_id = store.createConditionGroup({});
        for (auto& condition : conditions) {
            condition.condition_group_id = group_id;
            store.createCondition(condition);
        }

        Detector detector;
        detector.name = config.name;
        detector.type = config.type;
        detector.workflow_condition_group_id = group_id;
        detector.id = store.createDetector(detector);
        existing.insert(config.name);
        ++created;

        spdlog::info("[DetectorSeed] Created detector id={} name={} type={} conditions={}",
                     detector.id, detector.name, detector.type, config.conditions.size());
    }
    return created;
}

} // namespace WorkflowEngine
