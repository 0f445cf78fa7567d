#include <workflowengine/core/conditions/condition_group_cache.hpp>
#include <spdlog/spdlog.h>

namespace WorkflowEngine {

ConditionGroupCache::ConditionGroupCache(ConditionGroupSource& source)
    : source_(source) {}

ConditionGroupPtr ConditionGroupCache::get(int64_t group_id) {
    // Held across the load so an invalidate() racing with a reload cannot
    // be overwritten by the stale result
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(group_id);
    if (it != entries_.end()) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second;
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    ConditionGroupPtr loaded;
    if (auto data = source_.fetchConditionGroup(group_id)) {
        loaded = std::make_shared<const ConditionGroupData>(std::move(*data));
        spdlog::debug("[ConditionGroupCache] Loaded group_id={} conditions={}",
                      group_id, loaded->conditions.size());
    } else {
        spdlog::debug("[ConditionGroupCache] group_id={} not found", group_id);
    }
    entries_[group_id] = loaded;
    return loaded;
}

void ConditionGroupCache::invalidate(int64_t group_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(group_id) > 0) {
        spdlog::debug("[ConditionGroupCache] Invalidated group_id={}", group_id);
    }
}

void ConditionGroupCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t ConditionGroupCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace WorkflowEngine
