#include "PacketDecoder.hpp"
#include <IcmpLayer.h>
#include <TcpLayer.h>
#include <UdpLayer.h>

std::optional<PacketEvent> PacketDecoder::decode(pcpp::RawPacket* raw_packet)
{
    if (raw_packet == nullptr)
    {
        return std::nullopt;
    }
    const pcpp::Packet parsed_packet(raw_packet);
    return decode(parsed_packet);
}

std::optional<PacketEvent> PacketDecoder::decode(const pcpp::Packet& parsed_packet)
{
    const pcpp::RawPacket* raw_packet = parsed_packet.getRawPacketReadOnly();
    if (raw_packet == nullptr)
    {
        return std::nullopt;
    }

    PacketEvent event;
    if (const auto* ipv4_layer = parsed_packet.getLayerOfType<pcpp::IPv4Layer>())
    {
        event.src_ip = pcpp::IPAddress(ipv4_layer->getSrcIPv4Address());
        event.dst_ip = pcpp::IPAddress(ipv4_layer->getDstIPv4Address());
    }
    else if (const auto* ipv6_layer = parsed_packet.getLayerOfType<pcpp::IPv6Layer>())
    {
        event.src_ip = pcpp::IPAddress(ipv6_layer->getSrcIPv6Address());
        event.dst_ip = pcpp::IPAddress(ipv6_layer->getDstIPv6Address());
    }
    else
    {
        return std::nullopt;
    }

    event.length = static_cast<uint32_t>(raw_packet->getFrameLength());
    event.timestamp = toTimestamp(raw_packet->getPacketTimeStamp());
    fillTransport(parsed_packet, event);
    return event;
}

void PacketDecoder::fillTransport(const pcpp::Packet& parsed_packet, PacketEvent& event)
{
    if (const auto* tcp_layer = parsed_packet.getLayerOfType<pcpp::TcpLayer>())
    {
        const pcpp::tcphdr* tcp_header = tcp_layer->getTcpHeader();
        event.protocol = FLOW_COMMON_TYPES::TCP_PROTOCOL;
        event.src_port = tcp_layer->getSrcPort();
        event.dst_port = tcp_layer->getDstPort();
        event.tcp_flags.fin = tcp_header->finFlag == 1;
        event.tcp_flags.syn = tcp_header->synFlag == 1;
        event.tcp_flags.rst = tcp_header->rstFlag == 1;
        event.tcp_flags.psh = tcp_header->pshFlag == 1;
        event.tcp_flags.ack = tcp_header->ackFlag == 1;
        event.tcp_flags.urg = tcp_header->urgFlag == 1;
    }
    else if (const auto* udp_layer = parsed_packet.getLayerOfType<pcpp::UdpLayer>())
    {
        event.protocol = FLOW_COMMON_TYPES::UDP_PROTOCOL;
        event.src_port = udp_layer->getSrcPort();
        event.dst_port = udp_layer->getDstPort();
    }
    else if (parsed_packet.isPacketOfType(pcpp::ICMP) || parsed_packet.isPacketOfType(pcpp::ICMPv6))
    {
        event.protocol = FLOW_COMMON_TYPES::ICMP_PROTOCOL;
    }
    else
    {
        event.protocol = FLOW_COMMON_TYPES::OTHER_PROTOCOL;
    }
}

FLOW_COMMON_TYPES::Timestamp PacketDecoder::toTimestamp(const timespec& packet_time)
{
    const auto since_epoch = std::chrono::seconds(packet_time.tv_sec) + std::chrono::nanoseconds(packet_time.tv_nsec);
    return FLOW_COMMON_TYPES::Timestamp(std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}
