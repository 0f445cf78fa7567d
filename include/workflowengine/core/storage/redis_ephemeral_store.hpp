#pragma once

#include <workflowengine/core/storage/ephemeral_store.hpp>
#include <sw/redis++/redis++.h>
#include <string>

namespace WorkflowEngine {

/**
 * @class RedisEphemeralStore
 * @brief EphemeralStore backed by a Redis server through redis-plus-plus
 *
 * Each execute() takes a connection from the client's pool, queues the
 * commands on a pipeline and reads every reply in order. Connection and
 * protocol failures surface as StoreError.
 */
class RedisEphemeralStore : public EphemeralStore {
public:
    explicit RedisEphemeralStore(const std::string& uri);

    PipelineReplies execute(const Pipeline& pipeline) override;
    const char* name() const override { return "RedisEphemeralStore"; }

private:
    sw::redis::Redis redis_;
};

} // namespace WorkflowEngine
