// ============================================================================
// BENCHMARK: STATEFUL DETECTOR EVALUATE + COMMIT
// ============================================================================
// Throughput of the evaluate->commit cycle on SQLite + in-memory cache
//
// Test scenarios:
// 1. Evaluate only (state fetch + condition evaluation)
// 2. Evaluate + commit with flapping values (every packet writes state)
// 3. Replayed packets (dedupe guard short-circuit)
// 4. Concurrent detectors, one engine per thread
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <memory>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <workflowengine/core/detector/stateful_detector_engine.hpp>
#include <workflowengine/core/storage/in_memory_ephemeral_store.hpp>
#include <workflowengine/core/storage/sqlite_store.hpp>

using namespace WorkflowEngine;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkResult {
    std::string name;
    uint64_t total_ops;
    uint64_t elapsed_ns;
    double ops_per_sec;
    double ns_per_op;
};

void print_header(const std::string& test_name) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST: " << test_name << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    std::cout << std::left << std::setw(30) << r.name
              << std::right
              << std::setw(12) << r.total_ops << " ops | "
              << std::setw(10) << std::fixed << std::setprecision(2) << (r.ops_per_sec / 1e3) << "K ops/s | "
              << std::setw(10) << std::fixed << std::setprecision(1) << r.ns_per_op << " ns/op"
              << std::endl;
}

BenchmarkResult make_result(const std::string& name, uint64_t ops,
                            std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    uint64_t elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    if (elapsed_ns == 0) elapsed_ns = 1;
    return {name, ops, elapsed_ns, (ops * 1e9) / elapsed_ns, (double)elapsed_ns / ops};
}

ConditionGroupPtr make_condition_group() {
    auto data = std::make_shared<ConditionGroupData>();
    data->group.id = 1;

    DataCondition warn;
    warn.type = ConditionType::GREATER;
    warn.comparison = 50;
    warn.condition_result = PriorityLevel::MEDIUM;
    DataCondition critical;
    critical.type = ConditionType::GREATER;
    critical.comparison = 90;
    critical.condition_result = PriorityLevel::HIGH;

    data->conditions = {warn, critical};
    return data;
}

GroupKeyValues make_values(uint64_t group_keys, double value) {
    GroupKeyValues values;
    for (uint64_t g = 0; g < group_keys; ++g) {
        values[std::string("host-") + std::to_string(g)] = value;
    }
    return values;
}

Detector make_detector(int64_t id) {
    Detector detector;
    detector.id = id;
    detector.name = "bench-" + std::to_string(id);
    detector.type = "metric_threshold";
    detector.workflow_condition_group_id = 1;
    return detector;
}

// ============================================================================
// TEST SUITES
// ============================================================================

void test_evaluate_only() {
    print_header("Evaluate only (10K packets, 16 group keys each)");

    const uint64_t NUM_PACKETS = 10000;
    const uint64_t GROUP_KEYS = 16;

    SqliteStore store(":memory:");
    InMemoryEphemeralStore cache;
    Detector detector = make_detector(1);
    StatefulDetectorEngine engine(detector, make_condition_group(), cache, store);
    auto values = make_values(GROUP_KEYS, 75.0);

    auto start = std::chrono::high_resolution_clock::now();
    for (uint64_t i = 0; i < NUM_PACKETS; ++i) {
        StateUpdateBatch batch;
        auto results = engine.evaluate(static_cast<int64_t>(i + 1), values, {}, batch);
        (void)results;
    }
    print_result(make_result("Evaluate (no commit)", NUM_PACKETS * GROUP_KEYS, start));
}

void test_evaluate_commit() {
    print_header("Evaluate + commit, flapping values (5K packets, 16 group keys)");

    const uint64_t NUM_PACKETS = 5000;
    const uint64_t GROUP_KEYS = 16;

    SqliteStore store(":memory:");
    InMemoryEphemeralStore cache;
    Detector detector = make_detector(1);
    StatefulDetectorEngine engine(detector, make_condition_group(), cache, store);
    auto high = make_values(GROUP_KEYS, 95.0);
    auto low = make_values(GROUP_KEYS, 10.0);

    StateUpdateBatch batch;
    uint64_t emitted = 0;
    auto start = std::chrono::high_resolution_clock::now();
    for (uint64_t i = 0; i < NUM_PACKETS; ++i) {
        emitted += engine.evaluate(static_cast<int64_t>(i + 1), (i % 2) ? low : high, {}, batch).size();
        engine.commitStateUpdates(batch);
    }
    print_result(make_result("Evaluate + commit", NUM_PACKETS * GROUP_KEYS, start));
    std::cout << "Results emitted: " << emitted << ", rows: " << store.countDetectorStates() << std::endl;
}

void test_replay() {
    print_header("Replayed packets (10K replays of one committed packet)");

    const uint64_t NUM_REPLAYS = 10000;
    const uint64_t GROUP_KEYS = 16;

    SqliteStore store(":memory:");
    InMemoryEphemeralStore cache;
    Detector detector = make_detector(1);
    StatefulDetectorEngine engine(detector, make_condition_group(), cache, store);
    auto values = make_values(GROUP_KEYS, 95.0);

    StateUpdateBatch batch;
    engine.evaluate(1, values, {}, batch);
    engine.commitStateUpdates(batch);

    auto start = std::chrono::high_resolution_clock::now();
    for (uint64_t i = 0; i < NUM_REPLAYS; ++i) {
        engine.evaluate(1, values, {}, batch);
    }
    print_result(make_result("Replay (dedupe skip)", NUM_REPLAYS * GROUP_KEYS, start));
}

void test_concurrent_detectors() {
    print_header("Concurrent detectors (4 threads, 2K packets each)");

    const uint64_t THREADS = 4;
    const uint64_t PACKETS_PER_THREAD = 2000;
    const uint64_t GROUP_KEYS = 8;

    SqliteStore store(":memory:");
    InMemoryEphemeralStore cache;
    auto group = make_condition_group();

    std::vector<Detector> detectors;
    for (uint64_t t = 0; t < THREADS; ++t) {
        detectors.push_back(make_detector(static_cast<int64_t>(t + 1)));
    }

    auto start = std::chrono::high_resolution_clock::now();
    std::vector<std::thread> thread_vec;
    for (uint64_t t = 0; t < THREADS; ++t) {
        thread_vec.emplace_back([&, t]() {
            StatefulDetectorEngine engine(detectors[t], group, cache, store);
            auto high = make_values(GROUP_KEYS, 95.0);
            auto low = make_values(GROUP_KEYS, 10.0);
            StateUpdateBatch batch;
            for (uint64_t i = 0; i < PACKETS_PER_THREAD; ++i) {
                engine.evaluate(static_cast<int64_t>(i + 1), (i % 2) ? low : high, {}, batch);
                engine.commitStateUpdates(batch);
            }
        });
    }
    for (auto& t : thread_vec) {
        t.join();
    }
    print_result(make_result("Concurrent evaluate + commit",
                             THREADS * PACKETS_PER_THREAD * GROUP_KEYS, start));
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════════════╗\n";
    std::cout << "║         STATEFUL DETECTOR ENGINE PERFORMANCE BENCHMARK              ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════════════╝\n";

    try {
        test_evaluate_only();
        test_evaluate_commit();
        test_replay();
        test_concurrent_detectors();
    } catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    return 0;
}
