#include <workflowengine/core/metrics/registry.hpp>
#include <chrono>

namespace WorkflowEngine {

MetricRegistry& MetricRegistry::getInstance() {
    static MetricRegistry instance;
    return instance;
}

std::atomic<uint64_t>& MetricRegistry::counter(std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto [it, inserted] = counters_.try_emplace(std::string(name));
    if (inserted) {
        it->second = std::make_unique<std::atomic<uint64_t>>(0);
    }
    return *it->second;
}

void MetricRegistry::incr(std::string_view name, uint64_t amount) {
    counter(name).fetch_add(amount, std::memory_order_relaxed);
}

uint64_t MetricRegistry::get(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = counters_.find(std::string(name));
    if (it == counters_.end()) return 0;
    return it->second->load(std::memory_order_relaxed);
}

std::unordered_map<std::string, uint64_t> MetricRegistry::getCounters() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::unordered_map<std::string, uint64_t> out;
    out.reserve(counters_.size());
    for (const auto& [name, value] : counters_) {
        out[name] = value->load(std::memory_order_relaxed);
    }
    return out;
}

Metrics& MetricRegistry::getMetrics(std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto [it, inserted] = metrics_map_.try_emplace(std::string(name));
    if (inserted) {
        it->second = std::make_unique<Metrics>();
    }
    return *it->second;
}

std::unordered_map<std::string, MetricSnapshot> MetricRegistry::getSnapshots() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::unordered_map<std::string, MetricSnapshot> snaps;
    snaps.reserve(metrics_map_.size());
    for (const auto& [name, m] : metrics_map_) {
        snaps[name] = buildSnapshot(*m);
    }
    return snaps;
}

std::optional<MetricSnapshot> MetricRegistry::getSnapshot(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = metrics_map_.find(name);
    if (it == metrics_map_.end()) return std::nullopt;
    return buildSnapshot(*it->second);
}

void MetricRegistry::updateEventTimestamp(std::string_view name) {
    getMetrics(name).last_event_timestamp_ms.store(now(), std::memory_order_relaxed);
}

void MetricRegistry::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& [name, value] : counters_) {
        value->store(0, std::memory_order_relaxed);
    }
    for (auto& [name, m] : metrics_map_) {
        m->total_packets_evaluated.store(0, std::memory_order_relaxed);
        m->total_results_emitted.store(0, std::memory_order_relaxed);
        m->total_skipped_duplicates.store(0, std::memory_order_relaxed);
        m->total_skipped_no_conditions.store(0, std::memory_order_relaxed);
        m->total_duplicate_group_keys.store(0, std::memory_order_relaxed);
        m->total_commits.store(0, std::memory_order_relaxed);
        m->total_commit_errors.store(0, std::memory_order_relaxed);
        m->total_evaluation_time_ns.store(0, std::memory_order_relaxed);
        m->max_evaluation_time_ns.store(0, std::memory_order_relaxed);
        m->last_event_timestamp_ms.store(0, std::memory_order_relaxed);
    }
}

uint64_t MetricRegistry::now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

MetricSnapshot MetricRegistry::buildSnapshot(const Metrics& m) {
    MetricSnapshot snap{};
    snap.total_packets_evaluated = m.total_packets_evaluated.load(std::memory_order_relaxed);
    snap.total_results_emitted = m.total_results_emitted.load(std::memory_order_relaxed);
    snap.total_skipped_duplicates = m.total_skipped_duplicates.load(std::memory_order_relaxed);
    snap.total_skipped_no_conditions = m.total_skipped_no_conditions.load(std::memory_order_relaxed);
    snap.total_duplicate_group_keys = m.total_duplicate_group_keys.load(std::memory_order_relaxed);
    snap.total_commits = m.total_commits.load(std::memory_order_relaxed);
    snap.total_commit_errors = m.total_commit_errors.load(std::memory_order_relaxed);
    snap.total_evaluation_time_ns = m.total_evaluation_time_ns.load(std::memory_order_relaxed);
    snap.max_evaluation_time_ns = m.max_evaluation_time_ns.load(std::memory_order_relaxed);
    snap.last_event_timestamp_ms = m.last_event_timestamp_ms.load(std::memory_order_relaxed);
    return snap;
}

} // namespace WorkflowEngine
