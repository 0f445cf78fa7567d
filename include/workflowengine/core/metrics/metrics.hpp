#pragma once
#include <atomic>
#include <cstdint>

namespace WorkflowEngine {

/**
 * @brief Per-component counters for detector evaluation
 *
 * All counters are lock-free atomics, updated with relaxed ordering.
 */
struct Metrics {
    std::atomic<uint64_t> total_packets_evaluated{0};     // evaluate() calls
    std::atomic<uint64_t> total_results_emitted{0};       // State-change results
    std::atomic<uint64_t> total_skipped_duplicates{0};    // Already-processed group keys
    std::atomic<uint64_t> total_skipped_no_conditions{0}; // Detectors without a condition group
    std::atomic<uint64_t> total_duplicate_group_keys{0};  // Integrity anomalies in one result set
    std::atomic<uint64_t> total_commits{0};               // commitStateUpdates() calls
    std::atomic<uint64_t> total_commit_errors{0};         // Commits aborted by a store failure

    std::atomic<uint64_t> total_evaluation_time_ns{0};
    std::atomic<uint64_t> max_evaluation_time_ns{0};
    std::atomic<uint64_t> last_event_timestamp_ms{0};
};

/**
 * Non-atomic copy of Metrics for consistent reads
 */
struct MetricSnapshot {
    uint64_t total_packets_evaluated = 0;
    uint64_t total_results_emitted = 0;
    uint64_t total_skipped_duplicates = 0;
    uint64_t total_skipped_no_conditions = 0;
    uint64_t total_duplicate_group_keys = 0;
    uint64_t total_commits = 0;
    uint64_t total_commit_errors = 0;
    uint64_t total_evaluation_time_ns = 0;
    uint64_t max_evaluation_time_ns = 0;
    uint64_t last_event_timestamp_ms = 0;

    uint64_t get_avg_evaluation_ns() const {
        return total_packets_evaluated > 0 ? total_evaluation_time_ns / total_packets_evaluated : 0;
    }
};

} // namespace WorkflowEngine
