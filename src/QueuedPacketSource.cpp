#include "QueuedPacketSource.hpp"
#include "Config.hpp"

QueuedPacketSource::QueuedPacketSource(const std::size_t capacity) : _packets(capacity)
{}

void QueuedPacketSource::open()
{}

void QueuedPacketSource::close()
{}

std::optional<PacketEvent> QueuedPacketSource::nextPacket(const std::chrono::milliseconds timeout)
{
    return _packets.pop(timeout);
}

std::string QueuedPacketSource::getInterfaceName() const
{
    return Config::REPLAY_SOURCE_NAME;
}

bool QueuedPacketSource::push(const PacketEvent& packet)
{
    return _packets.push(packet);
}

std::size_t QueuedPacketSource::pendingPackets() const
{
    return _packets.size();
}

uint64_t QueuedPacketSource::droppedPackets() const
{
    return _packets.droppedCount();
}
