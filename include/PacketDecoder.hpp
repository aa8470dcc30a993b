#pragma once
#include <optional>
#include <IPv4Layer.h>
#include <IPv6Layer.h>
#include <Packet.h>
#include <RawPacket.h>
#include "FlowCommonTypes.hpp"

// Turns captured frames into PacketEvents. Non IP frames are skipped.
class PacketDecoder
{
public:
    PacketDecoder() = delete;

    static std::optional<PacketEvent> decode(const pcpp::Packet& parsed_packet);
    static std::optional<PacketEvent> decode(pcpp::RawPacket* raw_packet);

    static FLOW_COMMON_TYPES::Timestamp toTimestamp(const timespec& packet_time);

private:
    static void fillTransport(const pcpp::Packet& parsed_packet, PacketEvent& event);
};
