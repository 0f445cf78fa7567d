#pragma once

#include <workflowengine/core/detector/detector_handler.hpp>
#include <workflowengine/core/detector/handler_context.hpp>
#include <spdlog/spdlog.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace WorkflowEngine {

/**
 * @class HandlerRegistry
 * @brief Maps a detector type to the factory building its handler
 */
template <typename T>
class HandlerRegistry {
public:
    using Factory = std::function<DetectorHandlerPtr<T>(const Detector&, const HandlerContext&)>;

    void registerHandler(const std::string& type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    template <typename Handler>
    void registerHandler(const std::string& type) {
        registerHandler(type, [](const Detector& detector, const HandlerContext& context) {
            return DetectorHandlerPtr<T>(std::make_unique<Handler>(detector, context));
        });
    }

    bool contains(const std::string& type) const {
        return factories_.find(type) != factories_.end();
    }

    /**
     * @return nullptr when no factory is registered for the detector's type
     */
    DetectorHandlerPtr<T> create(const Detector& detector, const HandlerContext& context) const {
        auto it = factories_.find(detector.type);
        if (it == factories_.end()) {
            return nullptr;
        }
        return it->second(detector, context);
    }

private:
    std::unordered_map<std::string, Factory> factories_;
};

/**
 * @class HandlerProvider
 * @brief Resolves the handler of a detector, or nullptr when it has none
 */
template <typename T>
class HandlerProvider {
public:
    virtual ~HandlerProvider() = default;
    virtual DetectorHandler<T>* handlerFor(const Detector& detector) = 0;
};

/**
 * @class HandlerCache
 * @brief Builds each detector's handler once and keeps it by detector id
 *
 * Detectors whose type has no registered factory resolve to nullptr, which
 * is remembered as well. Thread-safe lookup; the returned handler itself
 * must be driven by one thread per evaluate->commit cycle.
 *
 * invalidate() never discards staged updates: a handler that still holds
 * uncommitted state is kept until its commit, and rebuilt on the first
 * lookup after that.
 */
template <typename T>
class HandlerCache : public HandlerProvider<T> {
public:
    HandlerCache(const HandlerRegistry<T>& registry, HandlerContext context)
        : registry_(registry), context_(context) {}

    DetectorHandler<T>* handlerFor(const Detector& detector) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(detector.id);
        if (it != handlers_.end()) {
            if (stale_.count(detector.id) == 0 || hasPendingUpdates(it->second)) {
                return it->second.get();
            }
            spdlog::debug("[HandlerCache] Rebuilding detector_id={} after commit", detector.id);
            handlers_.erase(it);
            stale_.erase(detector.id);
        }
        auto handler = registry_.create(detector, context_);
        if (!handler) {
            spdlog::debug("[HandlerCache] No handler for detector_id={} type={}",
                          detector.id, detector.type);
        }
        auto* raw = handler.get();
        handlers_.emplace(detector.id, std::move(handler));
        return raw;
    }

    /**
     * @brief Rebuild the detector's handler on its next lookup
     * Call after the detector changed. A handler with staged updates is
     * rebuilt only once those updates are committed.
     */
    void invalidate(int64_t detector_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(detector_id);
        if (it == handlers_.end()) {
            return;
        }
        if (hasPendingUpdates(it->second)) {
            spdlog::debug("[HandlerCache] detector_id={} has staged updates; rebuild deferred",
                          detector_id);
            stale_.insert(detector_id);
            return;
        }
        handlers_.erase(it);
        stale_.erase(detector_id);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

private:
    static bool hasPendingUpdates(const DetectorHandlerPtr<T>& handler) {
        return handler && handler->hasPendingUpdates();
    }

    const HandlerRegistry<T>& registry_;
    HandlerContext context_;
    mutable std::mutex mutex_;
    std::unordered_map<int64_t, DetectorHandlerPtr<T>> handlers_;
    std::unordered_set<int64_t> stale_;
};

} // namespace WorkflowEngine
