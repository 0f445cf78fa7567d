#include <workflowengine/core/storage/in_memory_ephemeral_store.hpp>
#include <workflowengine/core/storage/store_error.hpp>
#include <spdlog/spdlog.h>

namespace WorkflowEngine {

InMemoryEphemeralStore::InMemoryEphemeralStore()
    : InMemoryEphemeralStore([] { return Clock::now(); }) {}

InMemoryEphemeralStore::InMemoryEphemeralStore(ClockFn clock)
    : clock_(std::move(clock)) {}

PipelineReplies InMemoryEphemeralStore::execute(const Pipeline& pipeline) {
    if (!available_.load(std::memory_order_acquire)) {
        throw StoreError("ephemeral store unavailable");
    }

    PipelineReplies replies;
    replies.reserve(pipeline.size());

    std::lock_guard<std::mutex> lock(mutex_);
    round_trips_.fetch_add(1, std::memory_order_relaxed);
    const auto now = clock_();

    for (const auto& cmd : pipeline.commands()) {
        switch (cmd.op) {
            case Pipeline::Op::GET: {
                auto it = entries_.find(cmd.key);
                if (it == entries_.end()) {
                    replies.emplace_back(std::nullopt);
                } else if (isExpired(it->second, now)) {
                    entries_.erase(it);
                    replies.emplace_back(std::nullopt);
                } else {
                    replies.emplace_back(it->second.value);
                }
                break;
            }
            case Pipeline::Op::SET: {
                Entry entry{cmd.value, std::nullopt};
                if (cmd.ttl.count() > 0) {
                    entry.expires_at = now + cmd.ttl;
                }
                entries_[cmd.key] = std::move(entry);
                replies.emplace_back(std::string("OK"));
                break;
            }
            case Pipeline::Op::DEL: {
                auto it = entries_.find(cmd.key);
                bool removed = it != entries_.end() && !isExpired(it->second, now);
                if (it != entries_.end()) {
                    entries_.erase(it);
                }
                replies.emplace_back(std::string(removed ? "1" : "0"));
                break;
            }
        }
    }

    spdlog::trace("[InMemoryEphemeralStore] Executed pipeline commands={}", pipeline.size());
    return replies;
}

size_t InMemoryEphemeralStore::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (isExpired(it->second, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::info("[InMemoryEphemeralStore] Purged {} expired keys, size={}",
                     removed, entries_.size());
    }
    return removed;
}

std::optional<std::string> InMemoryEphemeralStore::peek(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || isExpired(it->second, clock_())) {
        return std::nullopt;
    }
    return it->second.value;
}

std::optional<std::chrono::seconds> InMemoryEphemeralStore::ttl(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    const auto now = clock_();
    if (it == entries_.end() || isExpired(it->second, now) || !it->second.expires_at) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(*it->second.expires_at - now);
}

size_t InMemoryEphemeralStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace WorkflowEngine
