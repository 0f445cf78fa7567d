#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace WorkflowEngine {

/**
 * @class Pipeline
 * @brief Ordered batch of cache commands executed in one round trip
 *
 * Replies come back in command order: GET yields the value or nullopt,
 * SET yields "OK", DEL yields the number of keys removed ("0" or "1").
 */
class Pipeline {
public:
    enum class Op { GET, SET, DEL };

    struct Command {
        Op op;
        std::string key;
        std::string value;             // SET only
        std::chrono::seconds ttl{0};   // SET only, 0 = no expiry
    };

    Pipeline& get(std::string key) {
        commands_.push_back({Op::GET, std::move(key), {}, std::chrono::seconds(0)});
        return *this;
    }

    Pipeline& set(std::string key, std::string value, std::chrono::seconds ttl) {
        commands_.push_back({Op::SET, std::move(key), std::move(value), ttl});
        return *this;
    }

    Pipeline& del(std::string key) {
        commands_.push_back({Op::DEL, std::move(key), {}, std::chrono::seconds(0)});
        return *this;
    }

    const std::vector<Command>& commands() const { return commands_; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }
    void reset() { commands_.clear(); }

private:
    std::vector<Command> commands_;
};

using PipelineReplies = std::vector<std::optional<std::string>>;

/**
 * @class EphemeralStore
 * @brief Fast expiring key-value cache holding dedupe and counter values
 *
 * Implementations must be safe to share between threads and throw
 * StoreError when the backend is unreachable.
 */
class EphemeralStore {
public:
    virtual ~EphemeralStore() = default;

    /**
     * @brief Execute every command of the pipeline in one round trip
     * @return One reply per command, in order
     */
    virtual PipelineReplies execute(const Pipeline& pipeline) = 0;

    virtual const char* name() const = 0;
};

} // namespace WorkflowEngine
