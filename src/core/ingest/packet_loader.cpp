#include <workflowengine/core/ingest/packet_loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace WorkflowEngine {

std::vector<DataPacket<MetricPacket>> PacketLoader::loadFile(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Packet file not found: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Packet file " + filepath + " is not valid YAML: " + e.what());
    }

    YAML::Node packets = root["packets"];
    if (!packets || !packets.IsSequence()) {
        throw std::runtime_error("Packet file " + filepath + " must contain a 'packets' list");
    }

    std::vector<DataPacket<MetricPacket>> out;
    out.reserve(packets.size());

    for (size_t i = 0; i < packets.size(); ++i) {
        const YAML::Node& entry = packets[i];
        const std::string where = filepath + " packet #" + std::to_string(i);
        if (!entry.IsMap()) {
            throw std::runtime_error(where + " must be a mapping");
        }

        DataPacket<MetricPacket> packet;
        try {
            packet.query_id = entry["query_id"] ? entry["query_id"].as<std::string>() : std::string();
            if (!entry["sequence"]) {
                throw std::runtime_error(where + " is missing 'sequence'");
            }
            packet.packet.sequence = entry["sequence"].as<int64_t>();

            YAML::Node values = entry["values"];
            if (!values || !values.IsMap()) {
                throw std::runtime_error(where + " must have a 'values' mapping");
            }
            for (auto it = values.begin(); it != values.end(); ++it) {
                DetectorGroupKey group_key;
                if (!it->first.IsNull()) {
                    group_key = it->first.as<std::string>();
                }
                packet.packet.values[group_key] = it->second.as<double>();
            }
        } catch (const YAML::BadConversion& e) {
            throw std::runtime_error(where + " has an invalid field: " + e.what());
        }
        out.push_back(std::move(packet));
    }

    spdlog::info("[PacketLoader] Loaded {} packets from {}", out.size(), filepath);
    return out;
}

} // namespace WorkflowEngine
