#include "PcapPacketSource.hpp"
#include <stdexcept>
#include "FlowLogger.hpp"
#include "PacketDecoder.hpp"

PcapPacketSource::PcapPacketSource(const std::string& interface_name, const bool promiscuous,
    const std::size_t buffer_capacity) : QueuedPacketSource(buffer_capacity), _interface_name(interface_name),
    _active_interface(interface_name), _promiscuous(promiscuous), _device(nullptr)
{}

PcapPacketSource::~PcapPacketSource()
{
    close();
}

void PcapPacketSource::open()
{
    std::lock_guard lock(_device_mutex);
    if (_device != nullptr)
    {
        return;
    }

    const std::string interface_name = selectInterface(_interface_name, listInterfaces());
    pcpp::PcapLiveDevice* device = pcpp::PcapLiveDeviceList::getInstance().getPcapLiveDeviceByName(interface_name);
    if (device == nullptr)
    {
        throw std::runtime_error("Cannot find interface '" + interface_name + "'");
    }

    const pcpp::PcapLiveDevice::DeviceConfiguration config(
        _promiscuous ? pcpp::PcapLiveDevice::Promiscuous : pcpp::PcapLiveDevice::Normal);
    if (!device->open(config))
    {
        throw std::runtime_error("Cannot open interface '" + interface_name + "'");
    }
    if (!device->startCapture(onPacketArrives, this))
    {
        device->close();
        throw std::runtime_error("Cannot start capture on interface '" + interface_name + "'");
    }
    _device = device;
    _active_interface = interface_name;
    FlowLogger::getInstance().info("Capturing on " + interface_name + (_promiscuous ? " (promiscuous)" : ""));
}

std::vector<PcapPacketSource::InterfaceCandidate> PcapPacketSource::listInterfaces()
{
    std::vector<InterfaceCandidate> candidates;
    for (const pcpp::PcapLiveDevice* device : pcpp::PcapLiveDeviceList::getInstance().getPcapLiveDevicesList())
    {
        InterfaceCandidate candidate;
        candidate.name = device->getName();
        candidate.loopback = device->getLoopback();
        candidate.has_default_gateway = device->getDefaultGateway() != pcpp::IPv4Address::Zero;
        candidates.push_back(candidate);
    }
    return candidates;
}

std::string PcapPacketSource::selectInterface(const std::string& requested,
    const std::vector<InterfaceCandidate>& candidates)
{
    std::string available;
    for (const auto& candidate : candidates)
    {
        if (candidate.name == requested)
        {
            return requested;
        }
        available += (available.empty() ? "" : ", ") + candidate.name;
    }

    FlowLogger::getInstance().warning("Interface '" + requested + "' not found, available interfaces: " +
        (available.empty() ? "none" : available));

    const auto is_virtual = [](const std::string& name) {
        return name.rfind("docker", 0) == 0 || name.rfind("br-", 0) == 0;
    };

    const auto find_first = [&candidates](const auto& predicate) -> const InterfaceCandidate* {
        for (const auto& candidate : candidates)
        {
            if (predicate(candidate)) return &candidate;
        }
        return nullptr;
    };

    const InterfaceCandidate* fallback = find_first([](const InterfaceCandidate& candidate) {
        return !candidate.loopback && candidate.has_default_gateway;
    });
    if (fallback == nullptr)
    {
        fallback = find_first([&is_virtual](const InterfaceCandidate& candidate) {
            return !candidate.loopback && !is_virtual(candidate.name);
        });
    }
    if (fallback == nullptr)
    {
        fallback = find_first([](const InterfaceCandidate& candidate) { return !candidate.loopback; });
    }

    if (fallback == nullptr)
    {
        throw std::runtime_error("No usable interface instead of '" + requested + "', available interfaces: " +
            (available.empty() ? "none" : available));
    }
    FlowLogger::getInstance().info("Switching to interface " + fallback->name);
    return fallback->name;
}

void PcapPacketSource::close()
{
    std::lock_guard lock(_device_mutex);
    if (_device == nullptr)
    {
        return;
    }
    if (_device->captureActive())
    {
        _device->stopCapture();
    }
    _device->close();
    _device = nullptr;
    FlowLogger::getInstance().info("Capture on " + _active_interface + " stopped, " +
        std::to_string(droppedPackets()) + " packets dropped by the capture buffer");
}

std::string PcapPacketSource::getInterfaceName() const
{
    std::lock_guard lock(_device_mutex);
    return _active_interface;
}

void PcapPacketSource::onPacketArrives(pcpp::RawPacket* raw_packet, pcpp::PcapLiveDevice* device, void* cookie)
{
    auto* source = static_cast<PcapPacketSource*>(cookie);
    const std::optional<PacketEvent> event = PacketDecoder::decode(raw_packet);
    if (event)
    {
        source->push(*event);
    }
}
