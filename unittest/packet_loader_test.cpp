// ============================================================================
// PACKET LOADER UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <workflowengine/core/ingest/packet_loader.hpp>
#include <stdexcept>

using namespace WorkflowEngine;

TEST(PacketLoader, LoadsPacketsWithNoGroupKey) {
    auto packets = PacketLoader::loadFile("unittest/fixtures/packets.yaml");

    ASSERT_EQ(packets.size(), 2u);
    EXPECT_EQ(packets[0].query_id, "cpu");
    EXPECT_EQ(packets[0].packet.sequence, 1);
    ASSERT_EQ(packets[0].packet.values.size(), 2u);
    EXPECT_DOUBLE_EQ(packets[0].packet.values.at(std::string("host-a")), 15.0);
    EXPECT_DOUBLE_EQ(packets[0].packet.values.at(std::nullopt), 3.5);

    EXPECT_EQ(packets[1].query_id, "");
    EXPECT_EQ(packets[1].packet.sequence, 2);
    EXPECT_TRUE(packets[1].packet.values.empty());
}

TEST(PacketLoader, SampleStreamLoads) {
    auto packets = PacketLoader::loadFile("config/packets.yaml");
    ASSERT_EQ(packets.size(), 4u);
    EXPECT_EQ(packets[3].packet.values.count(std::nullopt), 1u);
}

TEST(PacketLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(PacketLoader::loadFile("unittest/fixtures/missing.yaml"), std::runtime_error);
}

TEST(PacketLoader, ThrowsOnBadSequence) {
    EXPECT_THROW(PacketLoader::loadFile("unittest/fixtures/bad_packets.yaml"), std::runtime_error);
}

TEST(PacketLoader, ThrowsOnMissingValues) {
    EXPECT_THROW(PacketLoader::loadFile("unittest/fixtures/no_values_packets.yaml"),
                 std::runtime_error);
}

TEST(PacketLoader, ThrowsWithoutPacketList) {
    EXPECT_THROW(PacketLoader::loadFile("config/config.yaml"), std::runtime_error);
}
