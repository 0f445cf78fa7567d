#pragma once

#include <workflowengine/core/conditions/condition_group_cache.hpp>
#include <workflowengine/core/conditions/data_condition.hpp>
#include <workflowengine/core/storage/detector_state_store.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace WorkflowEngine {

/**
 * @class SqliteStore
 * @brief SQLite access layer for detectors, condition groups, conditions
 *        and durable detector state
 *
 * Every write runs in its own transaction and rolls back on failure.
 * Writes to a condition group or any of its conditions notify the
 * registered listeners with the group id once the transaction commits.
 * Thread-safe: calls are serialized on one connection.
 */
class SqliteStore : public DetectorStateStore, public ConditionGroupSource {
public:
    using ConditionGroupListener = std::function<void(int64_t group_id)>;

    /**
     * @param path Database file, or ":memory:" for a private in-memory db
     * @throws StoreError if the database cannot be opened or initialized
     */
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Detectors
    int64_t createDetector(const Detector& detector);
    std::optional<Detector> getDetector(int64_t detector_id) const;
    std::vector<Detector> listDetectors() const;

    // Condition groups and their conditions
    int64_t createConditionGroup(const DataConditionGroup& group);
    void deleteConditionGroup(int64_t group_id);
    int64_t createCondition(const DataCondition& condition);
    void updateCondition(const DataCondition& condition);
    void deleteCondition(int64_t condition_id);

    void addConditionGroupListener(ConditionGroupListener listener);

    std::optional<ConditionGroupData> fetchConditionGroup(int64_t group_id) override;

    // DetectorStateStore
    std::vector<DetectorState> filterDetectorStates(
        int64_t detector_id, const std::vector<DetectorGroupKey>& group_keys) override;
    void bulkCreateDetectorStates(const std::vector<DetectorState>& states) override;
    void bulkUpdateDetectorStates(const std::vector<DetectorState>& states) override;

    size_t countDetectorStates() const;

private:
    void notifyConditionGroupChanged(int64_t group_id);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace WorkflowEngine
