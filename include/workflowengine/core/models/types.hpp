#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace WorkflowEngine {

/**
 * @enum PriorityLevel
 * @brief Ordered detector severity. OK is the inactive baseline.
 */
enum class PriorityLevel : int {
    OK = 0,
    LOW = 25,
    MEDIUM = 50,
    HIGH = 75
};

const char* toString(PriorityLevel level);

/**
 * @brief Map a stored integer back to a PriorityLevel
 * Unknown values are clamped to the nearest known level below them.
 */
PriorityLevel priorityFromInt(int value);

// "ok" | "low" | "medium" | "high"; nullopt for anything else
std::optional<PriorityLevel> priorityFromString(const std::string& value);

/**
 * Group key partitioning a packet's observations. nullopt is the
 * distinguished "no group" key.
 */
using DetectorGroupKey = std::optional<std::string>;

// Rendering used for logs and cache keys ("" for the no-group key)
std::string formatGroupKey(const DetectorGroupKey& group_key);

// Named counters: nullopt means "unset this counter"
using CounterUpdates = std::map<std::string, std::optional<int64_t>>;

// Observation value per group key of one packet
using GroupKeyValues = std::map<DetectorGroupKey, double>;

/**
 * @struct Detector
 * @brief A configured monitoring rule
 */
struct Detector {
    int64_t id = 0;
    std::string name;
    std::string type;                                   // Handler kind
    std::optional<int64_t> workflow_condition_group_id;
};

/**
 * @struct DetectorState
 * @brief Durable row, one per (detector, group_key)
 */
struct DetectorState {
    int64_t id = 0;                 // 0 until the row is persisted
    int64_t detector_id = 0;
    DetectorGroupKey detector_group_key;
    bool active = false;
    PriorityLevel state = PriorityLevel::OK;
};

/**
 * @struct DetectorStateData
 * @brief Merged durable + ephemeral snapshot for one group key
 */
struct DetectorStateData {
    DetectorGroupKey group_key;
    bool active = false;
    PriorityLevel status = PriorityLevel::OK;
    // Last processed watermark for this group key, used to reject replays
    int64_t dedupe_value = 0;
    CounterUpdates counter_updates;
};

/**
 * @struct DetectorEvaluationResult
 * @brief Emitted only when a group key changes active flag or priority
 */
struct DetectorEvaluationResult {
    DetectorGroupKey group_key;
    bool is_active = false;
    PriorityLevel priority = PriorityLevel::OK;
    std::unordered_map<std::string, std::string> data;
};

/**
 * @struct DataPacket
 * @brief Typed payload arriving for evaluation
 */
template <typename T>
struct DataPacket {
    std::string query_id;   // Source stream identifier
    T packet;
};

} // namespace WorkflowEngine
