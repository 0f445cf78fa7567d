#pragma once

#include <workflowengine/core/detector/handler_registry.hpp>
#include <workflowengine/core/metrics/registry.hpp>
#include <workflowengine/core/models/types.hpp>
#include <utility>
#include <vector>

namespace WorkflowEngine {

using DetectorResults = std::pair<Detector, std::vector<DetectorEvaluationResult>>;

/**
 * @brief Log every group key seen more than once in one detector's results
 *
 * A repeated key is an internal-consistency anomaly: it is logged as an
 * error and counted, but the results are left untouched.
 * @return Number of repeated occurrences
 */
size_t reportDuplicateGroupKeys(const Detector& detector,
                                const std::vector<DetectorEvaluationResult>& results);

/**
 * @class DetectorBatchProcessor
 * @brief Runs a set of detectors against one data packet
 *
 * Detectors are evaluated independently and in input order. A detector
 * with no resolvable handler is skipped silently; a detector whose handler
 * returns no results does not appear in the output.
 *
 * Staged state is not written by process(). Call commitStateUpdates() with
 * the same detectors once the results have been handled.
 */
template <typename T>
class DetectorBatchProcessor {
public:
    explicit DetectorBatchProcessor(HandlerProvider<T>& handlers)
        : handlers_(handlers) {}

    std::vector<DetectorResults> process(const DataPacket<T>& data_packet,
                                         const std::vector<Detector>& detectors) {
        std::vector<DetectorResults> results;

        for (const auto& detector : detectors) {
            DetectorHandler<T>* handler = handlers_.handlerFor(detector);
            if (!handler) {
                continue;
            }

            auto detector_results = handler->evaluate(data_packet);
            reportDuplicateGroupKeys(detector, detector_results);

            if (!detector_results.empty()) {
                results.emplace_back(detector, std::move(detector_results));
            }
        }

        MetricRegistry::getInstance().updateEventTimestamp(MetricNames::DETECTOR_PROCESSOR);
        return results;
    }

    /**
     * @brief Flush every resolvable handler's staged updates
     * @throws StoreError from the first handler whose commit fails
     */
    void commitStateUpdates(const std::vector<Detector>& detectors) {
        for (const auto& detector : detectors) {
            if (DetectorHandler<T>* handler = handlers_.handlerFor(detector)) {
                handler->commitStateUpdates();
            }
        }
    }

private:
    HandlerProvider<T>& handlers_;
};

} // namespace WorkflowEngine
