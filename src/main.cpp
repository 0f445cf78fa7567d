#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <workflowengine/core/conditions/condition_group_cache.hpp>
#include <workflowengine/core/config/loader.hpp>
#include <workflowengine/core/detector/handler_registry.hpp>
#include <workflowengine/core/detector/metric_threshold_handler.hpp>
#include <workflowengine/core/ingest/packet_loader.hpp>
#include <workflowengine/core/metrics/registry.hpp>
#include <workflowengine/core/processor/detector_processor.hpp>
#include <workflowengine/core/storage/detector_seed.hpp>
#include <workflowengine/core/storage/in_memory_ephemeral_store.hpp>
#include <workflowengine/core/storage/sqlite_store.hpp>
#include <workflowengine/core/storage/store_error.hpp>
#ifdef WORKFLOWENGINE_WITH_REDIS
#include <workflowengine/core/storage/redis_ephemeral_store.hpp>
#endif

using namespace WorkflowEngine;

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("WorkflowEngine v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static AppConfig::AppConfiguration loadConfiguration(const char* configPath) {
    spdlog::info("Loading configuration from: {}", configPath);
    auto config = ConfigLoader::loadConfig(configPath);
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    return config;
}

static std::unique_ptr<EphemeralStore> createEphemeralStore(const AppConfig::EphemeralStoreConfig& cfg) {
    if (cfg.backend == AppConfig::EphemeralBackend::REDIS) {
#ifdef WORKFLOWENGINE_WITH_REDIS
        return std::make_unique<RedisEphemeralStore>(cfg.uri);
#else
        throw std::runtime_error("ephemeral_store.backend 'redis' requires a build with redis-plus-plus");
#endif
    }
    spdlog::warn("Using process-local ephemeral store; dedupe state is lost on exit");
    return std::make_unique<InMemoryEphemeralStore>();
}

static void logResults(const DataPacket<MetricPacket>& packet,
                       const std::vector<DetectorResults>& results) {
    for (const auto& [detector, detector_results] : results) {
        for (const auto& result : detector_results) {
            spdlog::info("[Result] query_id={} sequence={} detector_id={} group_key={} active={} priority={}",
                         packet.query_id, packet.packet.sequence, detector.id,
                         formatGroupKey(result.group_key), result.is_active,
                         toString(result.priority));
        }
    }
}

static void printSummary() {
    auto& registry = MetricRegistry::getInstance();
    for (const auto& [name, snap] : registry.getSnapshots()) {
        spdlog::info("[Metrics] {}: evaluated={} results={} skipped_dup={} skipped_no_cond={} "
                     "dup_keys={} commits={} commit_errors={} avg_eval_ns={}",
                     name, snap.total_packets_evaluated, snap.total_results_emitted,
                     snap.total_skipped_duplicates, snap.total_skipped_no_conditions,
                     snap.total_duplicate_group_keys, snap.total_commits,
                     snap.total_commit_errors, snap.get_avg_evaluation_ns());
    }
    for (const auto& [name, value] : registry.getCounters()) {
        spdlog::info("[Metrics] {} = {}", name, value);
    }
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    setupLogging();

    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    const char* packetsPath = (argc > 2) ? argv[2] : "config/packets.yaml";

    AppConfig::AppConfiguration config;
    try {
        config = loadConfiguration(configPath);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    spdlog::info("Configuration loaded: {} {}", config.app_name, config.version);

    try {
        SqliteStore store(config.durable_store.path);
        auto ephemeral = createEphemeralStore(config.ephemeral_store);

        ConditionGroupCache conditionCache(store);
        store.addConditionGroupListener([&conditionCache](int64_t group_id) {
            conditionCache.invalidate(group_id);
        });

        HandlerRegistry<MetricPacket> registry;
        registerBuiltinHandlers(registry);

        HandlerContext context{*ephemeral, store, conditionCache,
                               std::chrono::seconds(config.ephemeral_store.ttl_seconds)};
        HandlerCache<MetricPacket> handlers(registry, context);
        DetectorBatchProcessor<MetricPacket> processor(handlers);

        const size_t seeded = seedDetectors(store, config.detectors);
        if (seeded > 0) {
            spdlog::info("Seeded {} detectors from {}", seeded, configPath);
        }

        const auto detectors = store.listDetectors();
        spdlog::info("Loaded {} detectors", detectors.size());
        if (detectors.empty()) {
            spdlog::warn("No detectors in {}; packets will produce no results",
                         config.durable_store.path);
        }

        const auto packets = PacketLoader::loadFile(packetsPath);
        for (const auto& packet : packets) {
            auto results = processor.process(packet, detectors);
            logResults(packet, results);
            processor.commitStateUpdates(detectors);
        }

        printSummary();
    } catch (const StoreError& e) {
        spdlog::error("Store failure: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("WorkflowEngine shutdown complete");
    return EXIT_SUCCESS;
}
