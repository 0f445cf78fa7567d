#pragma once
#include <workflowengine/core/metrics/metrics.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace WorkflowEngine {

// Compile-time metric names. Counter names are part of the external contract.
namespace MetricNames {
    constexpr std::string_view SKIPPING_ALREADY_PROCESSED =
        "workflow_engine.detector.skipping_already_processed_update";
    constexpr std::string_view SKIPPING_INVALID_CONDITION_GROUP =
        "workflow_engine.detector.skipping_invalid_condition_group";

    constexpr std::string_view STATEFUL_ENGINE = "StatefulDetectorEngine";
    constexpr std::string_view DETECTOR_PROCESSOR = "DetectorBatchProcessor";
}

/**
 * @class MetricRegistry
 * @brief Process-wide registry of named counters and component Metrics
 *
 * References returned by getMetrics() stay valid for the process lifetime.
 */
class MetricRegistry {
public:
    static MetricRegistry& getInstance();

    /**
     * @brief Increment a named counter
     */
    void incr(std::string_view name, uint64_t amount = 1);
    uint64_t get(std::string_view name) const;
    std::unordered_map<std::string, uint64_t> getCounters() const;

    Metrics& getMetrics(std::string_view name);
    std::unordered_map<std::string, MetricSnapshot> getSnapshots();
    std::optional<MetricSnapshot> getSnapshot(const std::string& name);
    void updateEventTimestamp(std::string_view name);

    // Zero every counter; entries and references stay valid
    void reset();

private:
    std::atomic<uint64_t>& counter(std::string_view name);

    static uint64_t now();
    static MetricSnapshot buildSnapshot(const Metrics& m);

    mutable std::mutex mtx_;
    // unique_ptr keeps element addresses stable across rehash
    std::unordered_map<std::string, std::unique_ptr<std::atomic<uint64_t>>> counters_;
    std::unordered_map<std::string, std::unique_ptr<Metrics>> metrics_map_;

    MetricRegistry() = default;
    ~MetricRegistry() = default;
    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;
};

} // namespace WorkflowEngine
