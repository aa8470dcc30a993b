#include "FlowStateMachine.hpp"

using namespace FLOW_COMMON_TYPES;

ProtocolTracker FlowStateMachine::createTracker(const Protocol protocol)
{
    if (protocol == TCP_PROTOCOL)
    {
        return TcpTracker{};
    }
    return DatagramTracker{};
}

SessionState FlowStateMachine::getState(const ProtocolTracker& tracker)
{
    if (const auto* tcp = std::get_if<TcpTracker>(&tracker))
    {
        return tcp->state;
    }
    return std::get<DatagramTracker>(tracker).state;
}

SessionState FlowStateMachine::advance(ProtocolTracker& tracker, const Direction direction, const TcpFlags& flags)
{
    if (auto* tcp = std::get_if<TcpTracker>(&tracker))
    {
        tcp->state = handleTcpPacket(*tcp, direction, flags);
        return tcp->state;
    }
    // datagram flows have a single live state
    return std::get<DatagramTracker>(tracker).state;
}

void FlowStateMachine::close(ProtocolTracker& tracker)
{
    if (auto* tcp = std::get_if<TcpTracker>(&tracker))
    {
        tcp->state = CLOSED;
    }
    else
    {
        std::get<DatagramTracker>(tracker).state = CLOSED;
    }
}

void FlowStateMachine::recordFin(TcpTracker& tracker, const Direction direction)
{
    if (direction == FROM_INITIATOR)
        tracker.initiator_fin = true;
    else
        tracker.responder_fin = true;
    tracker.last_fin_from = direction;
}

SessionState FlowStateMachine::handleTcpPacket(TcpTracker& tracker, const Direction direction, const TcpFlags& flags)
{
    if (flags.rst)
    {
        // Reset tears the connection down from any state
        return CLOSED;
    }

    switch (tracker.state)
    {
        case NEW:
            return handleNew(tracker, direction, flags);
        case ESTABLISHED:
            return handleEstablished(tracker, direction, flags);
        case CLOSING:
            return handleClosing(tracker, direction, flags);
        default:
            return tracker.state;
    }
}

SessionState FlowStateMachine::handleNew(TcpTracker& tracker, const Direction direction, const TcpFlags& flags)
{
    if (direction == FROM_RESPONDER)
    {
        // Traffic seen in both directions
        tracker.state = ESTABLISHED;
        return handleEstablished(tracker, direction, flags);
    }
    // SYN retransmissions and mid-stream initiator packets
    return NEW;
}

SessionState FlowStateMachine::handleEstablished(TcpTracker& tracker, const Direction direction, const TcpFlags& flags)
{
    if (flags.fin)
    {
        recordFin(tracker, direction);
        return CLOSING;
    }
    return ESTABLISHED;
}

SessionState FlowStateMachine::handleClosing(TcpTracker& tracker, const Direction direction, const TcpFlags& flags)
{
    if (flags.fin)
    {
        // Second FIN or a FIN retransmission
        recordFin(tracker, direction);
        return CLOSING;
    }
    if (flags.ack && tracker.initiator_fin && tracker.responder_fin && direction != tracker.last_fin_from)
    {
        // Final ACK of the last FIN
        return CLOSED;
    }
    return CLOSING;
}
