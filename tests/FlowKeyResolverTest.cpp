#include <gtest/gtest.h>
#include "FlowKeyResolver.hpp"
#include "TestPackets.hpp"

using namespace test_packets;

TEST(FlowKeyResolverTest, SwappedEndpointsResolveToSameKey)
{
    const PacketEvent outbound = udp("10.0.0.1", 5000, "10.0.0.2", 53, 80, at(0));
    const PacketEvent inbound = udp("10.0.0.2", 53, "10.0.0.1", 5000, 120, at(1));

    EXPECT_EQ(FlowKeyResolver::resolve(outbound), FlowKeyResolver::resolve(inbound));
    EXPECT_EQ(std::hash<FlowKey>()(FlowKeyResolver::resolve(outbound)),
              std::hash<FlowKey>()(FlowKeyResolver::resolve(inbound)));
}

TEST(FlowKeyResolverTest, LowerEndpointOrderedByAddressFirst)
{
    const FlowKey key = FlowKeyResolver::resolve(udp("10.0.0.2", 80, "10.0.0.1", 5000, 60, at(0)));

    EXPECT_EQ(key.lower, Endpoint(pcpp::IPAddress("10.0.0.1"), 5000));
    EXPECT_EQ(key.upper, Endpoint(pcpp::IPAddress("10.0.0.2"), 80));
    EXPECT_EQ(key.protocol, FLOW_COMMON_TYPES::UDP_PROTOCOL);
}

TEST(FlowKeyResolverTest, SameAddressOrderedByPort)
{
    const FlowKey key = FlowKeyResolver::resolve(udp("10.0.0.1", 9000, "10.0.0.1", 53, 60, at(0)));

    EXPECT_EQ(key.lower.port, 53);
    EXPECT_EQ(key.upper.port, 9000);
}

TEST(FlowKeyResolverTest, AddressBytesCompareNumerically)
{
    // "10.0.0.9" sorts after "10.0.0.10" as text but before it as an address
    const FlowKey key = FlowKeyResolver::resolve(udp("10.0.0.10", 1, "10.0.0.9", 2, 60, at(0)));

    EXPECT_EQ(key.lower.ip, pcpp::IPAddress("10.0.0.9"));
}

TEST(FlowKeyResolverTest, Ipv4SortsBeforeIpv6)
{
    EXPECT_TRUE(ipAddressLess(pcpp::IPAddress("192.168.1.1"), pcpp::IPAddress("::1")));
    EXPECT_FALSE(ipAddressLess(pcpp::IPAddress("::1"), pcpp::IPAddress("192.168.1.1")));
}

TEST(FlowKeyResolverTest, IcmpPortsAreZeroed)
{
    const PacketEvent echo = makePacket("10.0.0.1", 8, "10.0.0.2", 0, FLOW_COMMON_TYPES::ICMP_PROTOCOL, 84, at(0));
    const PacketEvent reply = makePacket("10.0.0.2", 0, "10.0.0.1", 0, FLOW_COMMON_TYPES::ICMP_PROTOCOL, 84, at(1));

    const FlowKey key = FlowKeyResolver::resolve(echo);
    EXPECT_EQ(key.lower.port, 0);
    EXPECT_EQ(key.upper.port, 0);
    EXPECT_EQ(key, FlowKeyResolver::resolve(reply));
}

TEST(FlowKeyResolverTest, ProtocolIsPartOfTheKey)
{
    const PacketEvent over_udp = udp("10.0.0.1", 5000, "10.0.0.2", 53, 60, at(0));
    const PacketEvent over_tcp = tcp("10.0.0.1", 5000, "10.0.0.2", 53, 60, at(0), flags(true, false));

    EXPECT_FALSE(FlowKeyResolver::resolve(over_udp) == FlowKeyResolver::resolve(over_tcp));
}

TEST(FlowKeyResolverTest, RejectsMalformedPackets)
{
    EXPECT_TRUE(FlowKeyResolver::isWellFormed(udp("10.0.0.1", 5000, "10.0.0.2", 53, 60, at(0))));
    EXPECT_FALSE(FlowKeyResolver::isWellFormed(
        makePacket("10.0.0.1", 0, "10.0.0.2", 0, FLOW_COMMON_TYPES::OTHER_PROTOCOL, 60, at(0))));
    EXPECT_FALSE(FlowKeyResolver::isWellFormed(udp("0.0.0.0", 68, "10.0.0.2", 67, 300, at(0))));
    EXPECT_FALSE(FlowKeyResolver::isWellFormed(udp("::", 546, "ff02::1:2", 547, 300, at(0))));
}

TEST(FlowKeyResolverTest, ReportsWhichEndpointSent)
{
    EXPECT_TRUE(FlowKeyResolver::isFromLowerEndpoint(udp("10.0.0.1", 5000, "10.0.0.2", 53, 60, at(0))));
    EXPECT_FALSE(FlowKeyResolver::isFromLowerEndpoint(udp("10.0.0.2", 53, "10.0.0.1", 5000, 60, at(0))));
}

TEST(FlowKeyResolverTest, KeyToStringShowsBothEndpoints)
{
    const FlowKey v4 = FlowKeyResolver::resolve(udp("10.0.0.2", 53, "10.0.0.1", 5000, 60, at(0)));
    EXPECT_EQ(v4.toString(), "10.0.0.1:5000-10.0.0.2:53-UDP");

    const FlowKey v6 = FlowKeyResolver::resolve(udp("2001:db8::1", 443, "2001:db8::2", 51000, 60, at(0)));
    EXPECT_EQ(v6.lower.toString(), "[2001:db8::1]:443");
}
