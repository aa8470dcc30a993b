#pragma once
#include <string>
#include "FlowCommonTypes.hpp"

// Helpers for building PacketEvents in tests

namespace test_packets
{
    using FLOW_COMMON_TYPES::Timestamp;

    inline Timestamp at(const int seconds)
    {
        return Timestamp(std::chrono::seconds(1700000000 + seconds));
    }

    inline FLOW_COMMON_TYPES::TcpFlags flags(const bool syn, const bool ack, const bool fin = false, const bool rst = false)
    {
        FLOW_COMMON_TYPES::TcpFlags tcp_flags;
        tcp_flags.syn = syn;
        tcp_flags.ack = ack;
        tcp_flags.fin = fin;
        tcp_flags.rst = rst;
        return tcp_flags;
    }

    inline PacketEvent makePacket(const std::string& src_ip, const uint16_t src_port, const std::string& dst_ip,
                                  const uint16_t dst_port, const FLOW_COMMON_TYPES::Protocol protocol,
                                  const uint32_t length, const Timestamp timestamp,
                                  const FLOW_COMMON_TYPES::TcpFlags tcp_flags = {})
    {
        PacketEvent packet;
        packet.src_ip = pcpp::IPAddress(src_ip);
        packet.dst_ip = pcpp::IPAddress(dst_ip);
        packet.src_port = src_port;
        packet.dst_port = dst_port;
        packet.protocol = protocol;
        packet.length = length;
        packet.timestamp = timestamp;
        packet.tcp_flags = tcp_flags;
        return packet;
    }

    inline PacketEvent tcp(const std::string& src_ip, const uint16_t src_port, const std::string& dst_ip,
                           const uint16_t dst_port, const uint32_t length, const Timestamp timestamp,
                           const FLOW_COMMON_TYPES::TcpFlags tcp_flags)
    {
        return makePacket(src_ip, src_port, dst_ip, dst_port, FLOW_COMMON_TYPES::TCP_PROTOCOL, length, timestamp,
                          tcp_flags);
    }

    inline PacketEvent udp(const std::string& src_ip, const uint16_t src_port, const std::string& dst_ip,
                           const uint16_t dst_port, const uint32_t length, const Timestamp timestamp)
    {
        return makePacket(src_ip, src_port, dst_ip, dst_port, FLOW_COMMON_TYPES::UDP_PROTOCOL, length, timestamp);
    }
}
