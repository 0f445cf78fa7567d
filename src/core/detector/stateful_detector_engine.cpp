#include <workflowengine/core/detector/stateful_detector_engine.hpp>
#include <workflowengine/core/metrics/registry.hpp>
#include <workflowengine/core/storage/store_error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace WorkflowEngine {

namespace {

int64_t parseStoredInt(const std::string& key, const std::string& text) {
    try {
        size_t pos = 0;
        int64_t value = std::stoll(text, &pos);
        if (pos == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // falls through to the StoreError below
    }
    throw StoreError("non-integer value stored at " + key + ": '" + text + "'");
}

uint64_t nowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace

StatefulDetectorEngine::StatefulDetectorEngine(const Detector& detector,
                                               ConditionGroupPtr condition_group,
                                               EphemeralStore& ephemeral_store,
                                               DetectorStateStore& state_store,
                                               std::chrono::seconds state_ttl)
    : detector_(detector),
      condition_group_(std::move(condition_group)),
      ephemeral_store_(ephemeral_store),
      state_store_(state_store),
      state_ttl_(state_ttl) {}

void StatefulDetectorEngine::setConditionGroup(ConditionGroupPtr condition_group) {
    condition_group_ = std::move(condition_group);
}

// ============================================================================
// STATE FETCH
// ============================================================================

std::unordered_map<DetectorGroupKey, DetectorStateData> StatefulDetectorEngine::getStateData(
    const std::vector<DetectorGroupKey>& group_keys,
    const std::vector<std::string>& counter_names) {
    std::unordered_map<DetectorGroupKey, DetectorStateData> results;
    if (group_keys.empty()) {
        return results;
    }
    auto group_key_detectors = bulkGetDetectorState(group_keys);

    Pipeline pipeline;
    for (const auto& gk : group_keys) {
        pipeline.get(buildDedupeValueKey(gk));
    }
    auto dedupe_replies = ephemeral_store_.execute(pipeline);
    if (dedupe_replies.size() != group_keys.size()) {
        throw StoreError("ephemeral store returned " + std::to_string(dedupe_replies.size()) +
                         " replies for " + std::to_string(group_keys.size()) + " dedupe reads");
    }

    PipelineReplies counter_replies;
    if (!counter_names.empty()) {
        pipeline.reset();
        for (const auto& gk : group_keys) {
            for (const auto& counter_name : counter_names) {
                pipeline.get(buildCounterValueKey(gk, counter_name));
            }
        }
        counter_replies = ephemeral_store_.execute(pipeline);
        if (counter_replies.size() != pipeline.size()) {
            throw StoreError("ephemeral store returned " + std::to_string(counter_replies.size()) +
                             " replies for " + std::to_string(pipeline.size()) + " counter reads");
        }
    }

    results.reserve(group_keys.size());
    for (size_t i = 0; i < group_keys.size(); ++i) {
        const auto& gk = group_keys[i];
        DetectorStateData data;
        data.group_key = gk;

        auto it = group_key_detectors.find(gk);
        if (it != group_key_detectors.end()) {
            data.active = it->second.active;
            data.status = it->second.state;
        }

        const auto& dedupe = dedupe_replies[i];
        if (dedupe && !dedupe->empty()) {
            data.dedupe_value = parseStoredInt(buildDedupeValueKey(gk), *dedupe);
        }

        for (size_t c = 0; c < counter_names.size(); ++c) {
            const auto& reply = counter_replies[i * counter_names.size() + c];
            std::optional<int64_t> value;
            if (reply) {
                value = parseStoredInt(buildCounterValueKey(gk, counter_names[c]), *reply);
            }
            data.counter_updates[counter_names[c]] = value;
        }

        results[gk] = std::move(data);
    }
    return results;
}

std::unordered_map<DetectorGroupKey, DetectorState> StatefulDetectorEngine::bulkGetDetectorState(
    const std::vector<DetectorGroupKey>& group_keys) {
    std::unordered_map<DetectorGroupKey, DetectorState> lookup;
    if (group_keys.empty()) {
        return lookup;
    }
    for (auto& row : state_store_.filterDetectorStates(detector_.id, group_keys)) {
        auto key = row.detector_group_key;
        lookup[key] = std::move(row);
    }
    return lookup;
}

// ============================================================================
// EVALUATION
// ============================================================================

std::vector<DetectorEvaluationResult> StatefulDetectorEngine::evaluate(
    int64_t dedupe_value,
    const GroupKeyValues& group_values,
    const std::vector<std::string>& counter_names,
    StateUpdateBatch& batch,
    const CounterHook& counter_hook) {
    auto& m = MetricRegistry::getInstance().getMetrics(MetricNames::STATEFUL_ENGINE);
    const uint64_t start_ns = nowNs();

    std::vector<DetectorGroupKey> group_keys;
    group_keys.reserve(group_values.size());
    for (const auto& [group_key, value] : group_values) {
        group_keys.push_back(group_key);
    }

    auto all_state_data = getStateData(group_keys, counter_names);

    std::vector<DetectorEvaluationResult> results;
    for (const auto& [group_key, value] : group_values) {
        auto result = evaluateGroupKeyValue(group_key, value, all_state_data[group_key],
                                            dedupe_value, batch, counter_hook);
        if (result) {
            results.push_back(std::move(*result));
        }
    }

    const uint64_t elapsed_ns = nowNs() - start_ns;
    m.total_packets_evaluated.fetch_add(1, std::memory_order_relaxed);
    m.total_results_emitted.fetch_add(results.size(), std::memory_order_relaxed);
    m.total_evaluation_time_ns.fetch_add(elapsed_ns, std::memory_order_relaxed);
    uint64_t prev_max = m.max_evaluation_time_ns.load(std::memory_order_relaxed);
    while (elapsed_ns > prev_max &&
           !m.max_evaluation_time_ns.compare_exchange_weak(prev_max, elapsed_ns,
                                                           std::memory_order_relaxed)) {
    }
    MetricRegistry::getInstance().updateEventTimestamp(MetricNames::STATEFUL_ENGINE);

    spdlog::debug("[StatefulDetectorEngine] detector_id={} dedupe_value={} group_keys={} results={}",
                  detector_.id, dedupe_value, group_values.size(), results.size());
    return results;
}

std::optional<DetectorEvaluationResult> StatefulDetectorEngine::evaluateGroupKeyValue(
    const DetectorGroupKey& group_key,
    double value,
    const DetectorStateData& state_data,
    int64_t dedupe_value,
    StateUpdateBatch& batch,
    const CounterHook& counter_hook) {
    auto& registry = MetricRegistry::getInstance();
    auto& m = registry.getMetrics(MetricNames::STATEFUL_ENGINE);

    if (dedupe_value <= state_data.dedupe_value) {
        // Already processed for this group key
        registry.incr(MetricNames::SKIPPING_ALREADY_PROCESSED);
        m.total_skipped_duplicates.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    batch.enqueueDedupeUpdate(group_key, dedupe_value);

    if (!condition_group_) {
        registry.incr(MetricNames::SKIPPING_INVALID_CONDITION_GROUP);
        m.total_skipped_no_conditions.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    PriorityLevel status = PriorityLevel::OK;
    for (const auto& condition : condition_group_->conditions) {
        auto evaluation = condition.evaluateValue(value);
        if (evaluation) {
            status = std::max(status, *evaluation);
        }
    }

    const bool is_active = status != PriorityLevel::OK;

    batch.enqueueCounterUpdate(group_key,
                               counter_hook ? counter_hook(group_key, value, state_data)
                                            : CounterUpdates{});

    if (state_data.active != is_active || state_data.status != status) {
        batch.enqueueStateUpdate(group_key, is_active, status);
        DetectorEvaluationResult result;
        result.group_key = group_key;
        result.is_active = is_active;
        result.priority = status;
        return result;
    }
    return std::nullopt;
}

// ============================================================================
// COMMIT
// ============================================================================

void StatefulDetectorEngine::commitStateUpdates(StateUpdateBatch& batch) {
    auto& m = MetricRegistry::getInstance().getMetrics(MetricNames::STATEFUL_ENGINE);
    try {
        commitDetectorState(batch);
        commitEphemeralState(batch);
    } catch (const StoreError& e) {
        m.total_commit_errors.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[StatefulDetectorEngine] Commit failed for detector_id={}: {}",
                      detector_.id, e.what());
        throw;
    }
    m.total_commits.fetch_add(1, std::memory_order_relaxed);
}

void StatefulDetectorEngine::commitDetectorState(StateUpdateBatch& batch) {
    if (batch.state_updates.empty()) {
        return;
    }

    // Fresh read so a row written since evaluate() is updated, not duplicated
    std::vector<DetectorGroupKey> group_keys;
    group_keys.reserve(batch.state_updates.size());
    for (const auto& [group_key, update] : batch.state_updates) {
        group_keys.push_back(group_key);
    }
    auto detector_state_lookup = bulkGetDetectorState(group_keys);

    std::vector<DetectorState> created;
    std::vector<DetectorState> updated;
    for (const auto& [group_key, update] : batch.state_updates) {
        const auto& [active, priority] = update;
        auto it = detector_state_lookup.find(group_key);
        if (it == detector_state_lookup.end()) {
            DetectorState row;
            row.detector_id = detector_.id;
            row.detector_group_key = group_key;
            row.active = active;
            row.state = priority;
            created.push_back(std::move(row));
        } else if (it->second.active != active || it->second.state != priority) {
            DetectorState row = it->second;
            row.active = active;
            row.state = priority;
            updated.push_back(std::move(row));
        }
    }

    if (!created.empty()) {
        state_store_.bulkCreateDetectorStates(created);
    }
    if (!updated.empty()) {
        state_store_.bulkUpdateDetectorStates(updated);
    }

    spdlog::debug("[StatefulDetectorEngine] detector_id={} committed state created={} updated={}",
                  detector_.id, created.size(), updated.size());
    batch.state_updates.clear();
}

void StatefulDetectorEngine::commitEphemeralState(StateUpdateBatch& batch) {
    Pipeline pipeline;
    for (const auto& [group_key, dedupe_value] : batch.dedupe_updates) {
        pipeline.set(buildDedupeValueKey(group_key), std::to_string(dedupe_value), state_ttl_);
    }

    for (const auto& [group_key, counter_updates] : batch.counter_updates) {
        for (const auto& [counter_name, counter_value] : counter_updates) {
            auto key = buildCounterValueKey(group_key, counter_name);
            if (counter_value) {
                pipeline.set(std::move(key), std::to_string(*counter_value), state_ttl_);
            } else {
                pipeline.del(std::move(key));
            }
        }
    }

    if (!pipeline.empty()) {
        ephemeral_store_.execute(pipeline);
    }
    batch.dedupe_updates.clear();
    batch.counter_updates.clear();
}

// ============================================================================
// KEYS
// ============================================================================

std::string StatefulDetectorEngine::buildDedupeValueKey(const DetectorGroupKey& group_key) const {
    return std::to_string(detector_.id) + ":" + formatGroupKey(group_key) + ":dedupe_value";
}

std::string StatefulDetectorEngine::buildCounterValueKey(const DetectorGroupKey& group_key,
                                                         const std::string& counter_name) const {
    return std::to_string(detector_.id) + ":" + formatGroupKey(group_key) + ":" + counter_name;
}

} // namespace WorkflowEngine
