#include <gtest/gtest.h>
#include <stdexcept>
#include "PcapPacketSource.hpp"

namespace
{
    PcapPacketSource::InterfaceCandidate candidate(const std::string& name, const bool loopback = false,
                                                   const bool has_default_gateway = false)
    {
        PcapPacketSource::InterfaceCandidate interface_candidate;
        interface_candidate.name = name;
        interface_candidate.loopback = loopback;
        interface_candidate.has_default_gateway = has_default_gateway;
        return interface_candidate;
    }
}

TEST(PcapPacketSourceTest, RequestedInterfaceIsKept)
{
    const std::vector<PcapPacketSource::InterfaceCandidate> candidates = {
        candidate("lo", true), candidate("wlan0", false, true), candidate("eth0")};

    EXPECT_EQ(PcapPacketSource::selectInterface("eth0", candidates), "eth0");
    EXPECT_EQ(PcapPacketSource::selectInterface("lo", candidates), "lo");
}

TEST(PcapPacketSourceTest, MissingInterfaceFallsBackToDefaultRoute)
{
    const std::vector<PcapPacketSource::InterfaceCandidate> candidates = {
        candidate("lo", true), candidate("docker0"), candidate("enp2s0"), candidate("wlan0", false, true)};

    EXPECT_EQ(PcapPacketSource::selectInterface("eth0", candidates), "wlan0");
}

TEST(PcapPacketSourceTest, WithoutDefaultRoutePhysicalInterfaceIsPreferred)
{
    const std::vector<PcapPacketSource::InterfaceCandidate> candidates = {
        candidate("lo", true), candidate("docker0"), candidate("br-5f2a"), candidate("enp2s0")};

    EXPECT_EQ(PcapPacketSource::selectInterface("eth0", candidates), "enp2s0");
}

TEST(PcapPacketSourceTest, BridgeIsUsedWhenNothingElseRemains)
{
    const std::vector<PcapPacketSource::InterfaceCandidate> candidates = {
        candidate("lo", true), candidate("docker0")};

    EXPECT_EQ(PcapPacketSource::selectInterface("eth0", candidates), "docker0");
}

TEST(PcapPacketSourceTest, OnlyLoopbackIsAnError)
{
    const std::vector<PcapPacketSource::InterfaceCandidate> candidates = {candidate("lo", true)};

    try {
        PcapPacketSource::selectInterface("eth0", candidates);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        // the message lists what is available
        EXPECT_NE(std::string(e.what()).find("lo"), std::string::npos);
    }
    EXPECT_THROW(PcapPacketSource::selectInterface("eth0", {}), std::runtime_error);
}

TEST(PcapPacketSourceTest, ConfiguredNameIsReportedBeforeOpen)
{
    PcapPacketSource source("eth7", true, 16);

    EXPECT_EQ(source.getInterfaceName(), "eth7");
}
