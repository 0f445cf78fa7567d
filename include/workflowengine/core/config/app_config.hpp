#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";   // trace|debug|info|warn|error|critical|off
};

struct DurableStoreConfig {
    std::string path;             // SQLite file, ":memory:" for a throwaway db
};

enum class EphemeralBackend {
    MEMORY,
    REDIS
};

struct EphemeralStoreConfig {
    EphemeralBackend backend = EphemeralBackend::MEMORY;
    std::string uri = "tcp://127.0.0.1:6379";   // REDIS only
    int64_t ttl_seconds = 7 * 24 * 60 * 60;
};

struct ConditionConfig {
    std::string type;             // eq|gte|gt|lte|lt|ne
    double comparison = 0.0;
    std::string result;           // ok|low|medium|high
};

// Seeded into the durable store at startup when no detector has this name
struct DetectorConfig {
    std::string name;
    std::string type = "metric_threshold";
    std::vector<ConditionConfig> conditions;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    DurableStoreConfig durable_store;
    EphemeralStoreConfig ephemeral_store;
    std::vector<DetectorConfig> detectors;
};

} // namespace AppConfig
