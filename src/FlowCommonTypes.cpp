#include "FlowCommonTypes.hpp"

std::string FLOW_COMMON_TYPES::protocolToString(const Protocol protocol)
{
    switch (protocol)
    {
        case TCP_PROTOCOL:  return "TCP";
        case UDP_PROTOCOL:  return "UDP";
        case ICMP_PROTOCOL: return "ICMP";
        default:            return "OTHER";
    }
}

std::string FLOW_COMMON_TYPES::stateToString(const SessionState state)
{
    switch (state)
    {
        case NEW:         return "NEW";
        case ESTABLISHED: return "ESTABLISHED";
        case CLOSING:     return "CLOSING";
        case ACTIVE:      return "ACTIVE";
        case CLOSED:      return "CLOSED";
        default:          return "UNKNOWN";
    }
}

bool ipAddressLess(const pcpp::IPAddress& lhs, const pcpp::IPAddress& rhs)
{
    if (lhs.isIPv4() != rhs.isIPv4())
    {
        return lhs.isIPv4();
    }
    if (lhs.isIPv4())
    {
        return std::memcmp(lhs.getIPv4().toBytes(), rhs.getIPv4().toBytes(), 4) < 0;
    }
    return std::memcmp(lhs.getIPv6().toBytes(), rhs.getIPv6().toBytes(), 16) < 0;
}

bool Endpoint::operator<(const Endpoint& other) const
{
    if (!(ip == other.ip))
    {
        return ipAddressLess(ip, other.ip);
    }
    return port < other.port;
}

std::string Endpoint::toString() const
{
    if (ip.isIPv6())
    {
        return "[" + ip.toString() + "]:" + std::to_string(port);
    }
    return ip.toString() + ":" + std::to_string(port);
}

std::string FlowKey::toString() const
{
    return lower.toString() + "-" + upper.toString() + "-" + FLOW_COMMON_TYPES::protocolToString(protocol);
}
