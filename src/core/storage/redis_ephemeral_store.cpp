#include <workflowengine/core/storage/redis_ephemeral_store.hpp>
#include <workflowengine/core/storage/store_error.hpp>
#include <spdlog/spdlog.h>

namespace WorkflowEngine {

RedisEphemeralStore::RedisEphemeralStore(const std::string& uri)
    : redis_(uri) {
    spdlog::info("[RedisEphemeralStore] Client created for {}", uri);
}

PipelineReplies RedisEphemeralStore::execute(const Pipeline& pipeline) {
    PipelineReplies replies;
    if (pipeline.empty()) {
        return replies;
    }
    replies.reserve(pipeline.size());

    try {
        auto pipe = redis_.pipeline(false);
        for (const auto& cmd : pipeline.commands()) {
            switch (cmd.op) {
                case Pipeline::Op::GET:
                    pipe.get(cmd.key);
                    break;
                case Pipeline::Op::SET:
                    pipe.set(cmd.key, cmd.value,
                             std::chrono::duration_cast<std::chrono::milliseconds>(cmd.ttl));
                    break;
                case Pipeline::Op::DEL:
                    pipe.del(cmd.key);
                    break;
            }
        }

        auto raw = pipe.exec();
        const auto& commands = pipeline.commands();
        for (size_t i = 0; i < commands.size(); ++i) {
            switch (commands[i].op) {
                case Pipeline::Op::GET: {
                    auto value = raw.get<sw::redis::OptionalString>(i);
                    if (value) {
                        replies.emplace_back(*value);
                    } else {
                        replies.emplace_back(std::nullopt);
                    }
                    break;
                }
                case Pipeline::Op::SET:
                    replies.emplace_back(std::string(raw.get<bool>(i) ? "OK" : ""));
                    break;
                case Pipeline::Op::DEL:
                    replies.emplace_back(std::to_string(raw.get<long long>(i)));
                    break;
            }
        }
    } catch (const sw::redis::Error& e) {
        spdlog::error("[RedisEphemeralStore] Pipeline of {} commands failed: {}",
                      pipeline.size(), e.what());
        throw StoreError(std::string("redis pipeline failed: ") + e.what());
    }

    return replies;
}

} // namespace WorkflowEngine
