#include <workflowengine/core/processor/detector_processor.hpp>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace WorkflowEngine {

size_t reportDuplicateGroupKeys(const Detector& detector,
                                const std::vector<DetectorEvaluationResult>& results) {
    std::unordered_set<DetectorGroupKey> detector_group_keys;
    size_t duplicates = 0;

    for (const auto& result : results) {
        if (!detector_group_keys.insert(result.group_key).second) {
            // Should not happen; left in the output for investigation
            spdlog::error("[DetectorBatchProcessor] Duplicate detector state group keys found "
                          "detector_id={} group_key={}",
                          detector.id,
                          result.group_key ? *result.group_key : "<none>");
            ++duplicates;
        }
    }

    if (duplicates > 0) {
        MetricRegistry::getInstance()
            .getMetrics(MetricNames::DETECTOR_PROCESSOR)
            .total_duplicate_group_keys.fetch_add(duplicates, std::memory_order_relaxed);
    }
    return duplicates;
}

} // namespace WorkflowEngine
