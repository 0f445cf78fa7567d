#pragma once

#include <workflowengine/core/models/types.hpp>
#include <cstdint>
#include <vector>

namespace WorkflowEngine {

/**
 * @class DetectorStateStore
 * @brief Durable (detector, group_key) -> active/priority rows
 *
 * Each bulk call is one ACID unit. Implementations throw StoreError when
 * the backend cannot serve the request.
 */
class DetectorStateStore {
public:
    virtual ~DetectorStateStore() = default;

    /**
     * @brief Fetch rows of one detector for the given group keys
     * A nullopt key matches the row whose group key is NULL. Keys without
     * a row are simply absent from the result.
     */
    virtual std::vector<DetectorState> filterDetectorStates(
        int64_t detector_id, const std::vector<DetectorGroupKey>& group_keys) = 0;

    virtual void bulkCreateDetectorStates(const std::vector<DetectorState>& states) = 0;

    /**
     * @brief Write the active and state columns of existing rows, matched by id
     */
    virtual void bulkUpdateDetectorStates(const std::vector<DetectorState>& states) = 0;
};

} // namespace WorkflowEngine
