#pragma once

#include <workflowengine/core/detector/handler_registry.hpp>
#include <workflowengine/core/detector/stateful_detector_handler.hpp>
#include <cstdint>
#include <string>

namespace WorkflowEngine {

/**
 * @struct MetricPacket
 * @brief Numeric observations per group key at one point of a stream
 */
struct MetricPacket {
    int64_t sequence = 0;   // Monotonic per source stream
    GroupKeyValues values;
};

/**
 * @class MetricThresholdHandler
 * @brief Stateful handler for detectors of type "metric_threshold"
 *
 * Dedupe value is the packet sequence; each value is tested against the
 * detector's condition group.
 */
class MetricThresholdHandler : public StatefulDetectorHandler<MetricPacket> {
public:
    static constexpr const char* TYPE = "metric_threshold";

    MetricThresholdHandler(Detector detector, const HandlerContext& context)
        : StatefulDetectorHandler<MetricPacket>(std::move(detector), context) {}

    int64_t getDedupeValue(const DataPacket<MetricPacket>& data_packet) const override {
        return data_packet.packet.sequence;
    }

    GroupKeyValues getGroupKeyValues(const DataPacket<MetricPacket>& data_packet) const override {
        return data_packet.packet.values;
    }

    const char* name() const override { return "MetricThresholdHandler"; }
};

/**
 * @brief Register every built-in MetricPacket handler type
 */
inline void registerBuiltinHandlers(HandlerRegistry<MetricPacket>& registry) {
    registry.registerHandler<MetricThresholdHandler>(MetricThresholdHandler::TYPE);
}

} // namespace WorkflowEngine
