#pragma once
#include "BoundedQueue.hpp"
#include "PacketSource.hpp"

// In-memory packet buffer. Used directly for replays and tests, and as the capture buffer of live sources.
class QueuedPacketSource : public PacketSource
{
protected:
    BoundedQueue<PacketEvent> _packets;

public:
    explicit QueuedPacketSource(std::size_t capacity);
    ~QueuedPacketSource() override = default;

    void open() override;
    void close() override;
    std::optional<PacketEvent> nextPacket(std::chrono::milliseconds timeout) override;
    std::string getInterfaceName() const override;

    // Returns false when the buffer was full and the oldest packet was dropped
    bool push(const PacketEvent& packet);

    std::size_t pendingPackets() const;
    uint64_t droppedPackets() const;
};
