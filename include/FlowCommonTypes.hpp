#pragma once
#include <IpAddress.h>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

// This file contains only shared enums and types needed by multiple classes

namespace FLOW_COMMON_TYPES
{
    using Timestamp = std::chrono::system_clock::time_point;
    using SessionId = uint64_t;

    enum Protocol
    {
        TCP_PROTOCOL,
        UDP_PROTOCOL,
        ICMP_PROTOCOL,
        OTHER_PROTOCOL
    };

    enum SessionState
    {
        NEW,
        ESTABLISHED,
        CLOSING,
        ACTIVE,
        CLOSED
    };

    enum Direction
    {
        FROM_INITIATOR,
        FROM_RESPONDER
    };

    struct TcpFlags
    {
        bool fin = false;
        bool syn = false;
        bool rst = false;
        bool psh = false;
        bool ack = false;
        bool urg = false;
    };

    std::string protocolToString(Protocol protocol);
    std::string stateToString(SessionState state);
}

// One decoded packet as handed over by a packet source
struct PacketEvent
{
    pcpp::IPAddress src_ip;
    pcpp::IPAddress dst_ip;
    uint16_t src_port = 0;
    uint16_t dst_port = 0;
    FLOW_COMMON_TYPES::Protocol protocol = FLOW_COMMON_TYPES::OTHER_PROTOCOL;
    uint32_t length = 0;
    FLOW_COMMON_TYPES::Timestamp timestamp{};
    FLOW_COMMON_TYPES::TcpFlags tcp_flags{};
};

struct Endpoint
{
    pcpp::IPAddress ip;
    uint16_t port = 0;

    Endpoint() = default;
    Endpoint(const pcpp::IPAddress& ip, const uint16_t port) : ip(ip), port(port) {}

    bool operator==(const Endpoint& other) const {
        return ip == other.ip && port == other.port;
    }
    bool operator!=(const Endpoint& other) const {
        return !(*this == other);
    }
    bool operator<(const Endpoint& other) const;

    std::string toString() const;
};

// Direction independent flow identifier, lower endpoint first
struct FlowKey
{
    FLOW_COMMON_TYPES::Protocol protocol = FLOW_COMMON_TYPES::OTHER_PROTOCOL;
    Endpoint lower;
    Endpoint upper;

    bool operator==(const FlowKey& other) const {
        return protocol == other.protocol && lower == other.lower && upper == other.upper;
    }

    std::string toString() const;
};

// Orders addresses by family (IPv4 first) and then by network byte order
bool ipAddressLess(const pcpp::IPAddress& lhs, const pcpp::IPAddress& rhs);

struct IpAddressHash
{
    size_t operator()(const pcpp::IPAddress& ip) const {
        if (ip.isIPv4()) {
            return std::hash<uint32_t>()(ip.getIPv4().toInt());
        }
        const uint8_t* bytes = ip.getIPv6().toBytes();
        uint64_t high = 0;
        uint64_t low = 0;
        std::memcpy(&high, bytes, sizeof(high));
        std::memcpy(&low, bytes + sizeof(high), sizeof(low));
        return std::hash<uint64_t>()(high) ^ (std::hash<uint64_t>()(low) << 1);
    }
};

namespace std {
    template <>
    struct hash<FlowKey> {
        size_t operator()(const FlowKey& k) const {
            const IpAddressHash ip_hash;
            size_t seed = hash<int>()(k.protocol);
            seed ^= ip_hash(k.lower.ip) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            seed ^= hash<uint16_t>()(k.lower.port) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            seed ^= ip_hash(k.upper.ip) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            seed ^= hash<uint16_t>()(k.upper.port) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            return seed;
        }
    };
}
