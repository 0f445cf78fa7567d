#pragma once

#include <workflowengine/core/detector/metric_threshold_handler.hpp>
#include <workflowengine/core/models/types.hpp>
#include <string>
#include <vector>

namespace WorkflowEngine {

/**
 * @class PacketLoader
 * @brief Reads MetricPacket data packets from a YAML file
 *
 * Format:
 *   packets:
 *     - query_id: cpu
 *       sequence: 1
 *       values: { host-a: 15, ~: 3 }   # ~ is the no-group key
 */
class PacketLoader {
public:
    /**
     * @throws std::runtime_error on a missing file or malformed packet
     */
    static std::vector<DataPacket<MetricPacket>> loadFile(const std::string& filepath);
};

} // namespace WorkflowEngine
