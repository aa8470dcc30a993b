#pragma once
#include "FlowCommonTypes.hpp"

// Maps packets to direction independent flow keys. Stateless.
class FlowKeyResolver
{
public:
    FlowKeyResolver() = delete;

    // Protocol must be TCP, UDP or ICMP and both addresses must be set
    static bool isWellFormed(const PacketEvent& packet);

    static FlowKey resolve(const PacketEvent& packet);

    // True when the packet source is the key's lower endpoint
    static bool isFromLowerEndpoint(const PacketEvent& packet);

private:
    static bool hasPorts(FLOW_COMMON_TYPES::Protocol protocol);
    static bool isUnspecified(const pcpp::IPAddress& ip);
    static Endpoint sourceEndpoint(const PacketEvent& packet);
    static Endpoint destinationEndpoint(const PacketEvent& packet);
};
