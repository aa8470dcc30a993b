#include "FlowKeyResolver.hpp"
#include "Config.hpp"

bool FlowKeyResolver::hasPorts(const FLOW_COMMON_TYPES::Protocol protocol)
{
    return protocol == FLOW_COMMON_TYPES::TCP_PROTOCOL || protocol == FLOW_COMMON_TYPES::UDP_PROTOCOL;
}

bool FlowKeyResolver::isUnspecified(const pcpp::IPAddress& ip)
{
    if (ip.isIPv4())
    {
        return ip.getIPv4() == pcpp::IPv4Address::Zero;
    }
    return ip.getIPv6() == pcpp::IPv6Address::Zero;
}

Endpoint FlowKeyResolver::sourceEndpoint(const PacketEvent& packet)
{
    const uint16_t port = hasPorts(packet.protocol) ? packet.src_port : Config::ICMP_SENTINEL_PORT;
    return {packet.src_ip, port};
}

Endpoint FlowKeyResolver::destinationEndpoint(const PacketEvent& packet)
{
    const uint16_t port = hasPorts(packet.protocol) ? packet.dst_port : Config::ICMP_SENTINEL_PORT;
    return {packet.dst_ip, port};
}

bool FlowKeyResolver::isWellFormed(const PacketEvent& packet)
{
    if (packet.protocol == FLOW_COMMON_TYPES::OTHER_PROTOCOL)
    {
        return false;
    }
    return !isUnspecified(packet.src_ip) && !isUnspecified(packet.dst_ip);
}

FlowKey FlowKeyResolver::resolve(const PacketEvent& packet)
{
    const Endpoint src = sourceEndpoint(packet);
    const Endpoint dst = destinationEndpoint(packet);

    FlowKey key;
    key.protocol = packet.protocol;
    if (dst < src)
    {
        key.lower = dst;
        key.upper = src;
    }
    else
    {
        key.lower = src;
        key.upper = dst;
    }
    return key;
}

bool FlowKeyResolver::isFromLowerEndpoint(const PacketEvent& packet)
{
    return !(destinationEndpoint(packet) < sourceEndpoint(packet));
}
