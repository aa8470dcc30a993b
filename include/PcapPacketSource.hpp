#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <PcapLiveDevice.h>
#include <PcapLiveDeviceList.h>
#include "QueuedPacketSource.hpp"

// Live capture from one network interface. Frames are decoded on the capture thread
// and buffered until the ingestion thread pulls them.
class PcapPacketSource : public QueuedPacketSource
{
public:
    struct InterfaceCandidate
    {
        std::string name;
        bool loopback = false;
        bool has_default_gateway = false;
    };

private:
    std::string _interface_name;
    std::string _active_interface;
    bool _promiscuous;
    pcpp::PcapLiveDevice* _device;
    mutable std::mutex _device_mutex;

    static void onPacketArrives(pcpp::RawPacket* raw_packet, pcpp::PcapLiveDevice* device, void* cookie);
    static std::vector<InterfaceCandidate> listInterfaces();

public:
    PcapPacketSource(const std::string& interface_name, bool promiscuous, std::size_t buffer_capacity);
    ~PcapPacketSource() override;
    PcapPacketSource(const PcapPacketSource&) = delete;
    PcapPacketSource& operator=(const PcapPacketSource&) = delete;

    // Falls back to another interface when the configured one is missing.
    // Throws std::runtime_error when no interface can be found or opened.
    void open() override;
    void close() override;

    // The interface being captured, or the configured one before open()
    std::string getInterfaceName() const override;

    // Requested name if present, otherwise the default-route interface, then the first
    // physical-looking non loopback one, then any non loopback one.
    // Throws std::runtime_error listing the candidates when none fits.
    static std::string selectInterface(const std::string& requested, const std::vector<InterfaceCandidate>& candidates);
};
