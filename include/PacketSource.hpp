#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "FlowCommonTypes.hpp"

// Supplier of decoded packets for the ingestion thread
class PacketSource
{
public:
    virtual ~PacketSource() = default;

    virtual void open() = 0;
    virtual void close() = 0;

    // Blocks up to timeout, empty when no packet arrived
    virtual std::optional<PacketEvent> nextPacket(std::chrono::milliseconds timeout) = 0;

    virtual std::string getInterfaceName() const = 0;
};
