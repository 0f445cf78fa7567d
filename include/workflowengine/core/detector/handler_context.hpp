#pragma once

#include <workflowengine/core/conditions/condition_group_cache.hpp>
#include <workflowengine/core/detector/stateful_detector_engine.hpp>
#include <workflowengine/core/storage/detector_state_store.hpp>
#include <workflowengine/core/storage/ephemeral_store.hpp>
#include <chrono>

namespace WorkflowEngine {

/**
 * @struct HandlerContext
 * @brief Collaborators handed to every handler the orchestrator builds
 *
 * The referenced objects must outlive every handler built with them.
 */
struct HandlerContext {
    EphemeralStore& ephemeral_store;
    DetectorStateStore& state_store;
    ConditionGroupCache& condition_cache;
    std::chrono::seconds state_ttl = DEFAULT_STATE_TTL;
};

} // namespace WorkflowEngine
