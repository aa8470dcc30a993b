#pragma once
#include "FlowCommonTypes.hpp"
#include <variant>

// Connection tracking for TCP: NEW -> ESTABLISHED -> CLOSING -> CLOSED
struct TcpTracker
{
    FLOW_COMMON_TYPES::SessionState state = FLOW_COMMON_TYPES::NEW;
    bool initiator_fin = false;
    bool responder_fin = false;
    FLOW_COMMON_TYPES::Direction last_fin_from = FLOW_COMMON_TYPES::FROM_INITIATOR;
};

// UDP and ICMP carry no termination signal, they stay ACTIVE until evicted
struct DatagramTracker
{
    FLOW_COMMON_TYPES::SessionState state = FLOW_COMMON_TYPES::ACTIVE;
};

using ProtocolTracker = std::variant<TcpTracker, DatagramTracker>;

class FlowStateMachine
{
public:
    FlowStateMachine() = delete;

    static ProtocolTracker createTracker(FLOW_COMMON_TYPES::Protocol protocol);

    static FLOW_COMMON_TYPES::SessionState getState(const ProtocolTracker& tracker);

    // Applies one packet and returns the resulting state.
    // Flag combinations with no matching transition leave the state unchanged.
    static FLOW_COMMON_TYPES::SessionState advance(ProtocolTracker& tracker, FLOW_COMMON_TYPES::Direction direction,
                                                   const FLOW_COMMON_TYPES::TcpFlags& flags);

    static void close(ProtocolTracker& tracker);

private:
    static FLOW_COMMON_TYPES::SessionState handleTcpPacket(TcpTracker& tracker, FLOW_COMMON_TYPES::Direction direction,
                                                           const FLOW_COMMON_TYPES::TcpFlags& flags);

    static FLOW_COMMON_TYPES::SessionState handleNew(TcpTracker& tracker, FLOW_COMMON_TYPES::Direction direction,
                                                     const FLOW_COMMON_TYPES::TcpFlags& flags);

    static FLOW_COMMON_TYPES::SessionState handleEstablished(TcpTracker& tracker, FLOW_COMMON_TYPES::Direction direction,
                                                             const FLOW_COMMON_TYPES::TcpFlags& flags);

    static FLOW_COMMON_TYPES::SessionState handleClosing(TcpTracker& tracker, FLOW_COMMON_TYPES::Direction direction,
                                                         const FLOW_COMMON_TYPES::TcpFlags& flags);

    static void recordFin(TcpTracker& tracker, FLOW_COMMON_TYPES::Direction direction);
};
