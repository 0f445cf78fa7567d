#include <workflowengine/core/config/loader.hpp>
#include <workflowengine/core/conditions/data_condition.hpp>
#include <workflowengine/core/models/types.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <stdexcept>
#include <unordered_set>

namespace {

YAML::Node requireNode(const YAML::Node& parent, const std::string& key, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw std::runtime_error("Missing required config field: " + path);
    }
    return node;
}

template <typename T>
T readScalar(const YAML::Node& node, const std::string& path) {
    if (!node.IsScalar()) {
        throw std::runtime_error("Config field " + path + " must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw std::runtime_error("Config field " + path + " has invalid type: " + e.what());
    }
}

template <typename T>
T readRequired(const YAML::Node& parent, const std::string& key, const std::string& path) {
    return readScalar<T>(requireNode(parent, key, path), path);
}

template <typename T>
T readOptional(const YAML::Node& parent, const std::string& key, const std::string& path, T fallback) {
    if (!parent) return fallback;
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) return fallback;
    return readScalar<T>(node, path);
}

bool isValidLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "error" || level == "critical" || level == "off";
}

std::vector<AppConfig::DetectorConfig> readDetectors(const YAML::Node& root) {
    std::vector<AppConfig::DetectorConfig> detectors;
    YAML::Node list = root["detectors"];
    if (!list || list.IsNull()) {
        return detectors;
    }
    if (!list.IsSequence()) {
        throw std::runtime_error("Config field detectors must be a list");
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < list.size(); ++i) {
        const YAML::Node entry = list[i];
        const std::string path = "detectors[" + std::to_string(i) + "]";
        if (!entry.IsMap()) {
            throw std::runtime_error("Config field " + path + " must be a mapping");
        }

        AppConfig::DetectorConfig detector;
        detector.name = readRequired<std::string>(entry, "name", path + ".name");
        if (detector.name.empty()) {
            throw std::runtime_error(path + ".name must not be empty");
        }
        if (!names.insert(detector.name).second) {
            throw std::runtime_error("Duplicate detector name in config: " + detector.name);
        }
        detector.type = readOptional<std::string>(entry, "type", path + ".type", detector.type);

        YAML::Node conditions = entry["conditions"];
        if (conditions && !conditions.IsNull()) {
            if (!conditions.IsSequence()) {
                throw std::runtime_error("Config field " + path + ".conditions must be a list");
            }
            for (size_t c = 0; c < conditions.size(); ++c) {
                const std::string cpath = path + ".conditions[" + std::to_string(c) + "]";
                if (!conditions[c].IsMap()) {
                    throw std::runtime_error("Config field " + cpath + " must be a mapping");
                }
                AppConfig::ConditionConfig condition;
                condition.type = readRequired<std::string>(conditions[c], "type", cpath + ".type");
                if (!WorkflowEngine::conditionTypeFromString(condition.type)) {
                    throw std::runtime_error("Invalid " + cpath + ".type: " + condition.type);
                }
                condition.comparison = readRequired<double>(conditions[c], "comparison",
                                                            cpath + ".comparison");
                condition.result = readRequired<std::string>(conditions[c], "result", cpath + ".result");
                if (!WorkflowEngine::priorityFromString(condition.result)) {
                    throw std::runtime_error("Invalid " + cpath + ".result: " + condition.result);
                }
                detector.conditions.push_back(std::move(condition));
            }
        }
        detectors.push_back(std::move(detector));
    }
    return detectors;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        spdlog::error("Config file not found: {}", filepath);
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Config file " + filepath + " is not valid YAML: " + e.what());
    }

    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + filepath + " must contain a mapping");
    }

    AppConfig::AppConfiguration config;
    config.app_name = readRequired<std::string>(root, "app_name", "app_name");
    config.version = readRequired<std::string>(root, "version", "version");

    // logging (optional)
    YAML::Node logging = root["logging"];
    config.logging.level = readOptional<std::string>(logging, "level", "logging.level",
                                                     config.logging.level);
    if (!isValidLogLevel(config.logging.level)) {
        throw std::runtime_error("Invalid logging.level: " + config.logging.level);
    }

    // durable_store (required)
    YAML::Node durable = requireNode(root, "durable_store", "durable_store");
    config.durable_store.path = readRequired<std::string>(durable, "path", "durable_store.path");
    if (config.durable_store.path.empty()) {
        throw std::runtime_error("durable_store.path must not be empty");
    }

    // ephemeral_store (optional)
    YAML::Node ephemeral = root["ephemeral_store"];
    std::string backend = readOptional<std::string>(ephemeral, "backend", "ephemeral_store.backend",
                                                    std::string("memory"));
    if (backend == "memory") {
        config.ephemeral_store.backend = AppConfig::EphemeralBackend::MEMORY;
    } else if (backend == "redis") {
        config.ephemeral_store.backend = AppConfig::EphemeralBackend::REDIS;
    } else {
        throw std::runtime_error("Invalid ephemeral_store.backend: " + backend);
    }
    config.ephemeral_store.uri = readOptional<std::string>(ephemeral, "uri", "ephemeral_store.uri",
                                                           config.ephemeral_store.uri);
    config.ephemeral_store.ttl_seconds = readOptional<int64_t>(
        ephemeral, "ttl_seconds", "ephemeral_store.ttl_seconds", config.ephemeral_store.ttl_seconds);
    if (config.ephemeral_store.ttl_seconds <= 0) {
        throw std::runtime_error("ephemeral_store.ttl_seconds must be positive");
    }

    // detectors (optional)
    config.detectors = readDetectors(root);

    spdlog::debug("Loaded config {} (app={}, version={}, detectors={})", filepath,
                  config.app_name, config.version, config.detectors.size());
    return config;
}
