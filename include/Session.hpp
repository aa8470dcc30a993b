#pragma once
#include "FlowCommonTypes.hpp"
#include "FlowStateMachine.hpp"

struct SessionStatics
{
    uint64_t initiator_packet_count = 0;
    uint64_t initiator_byte_count = 0;
    uint64_t responder_packet_count = 0;
    uint64_t responder_byte_count = 0;
};

struct Session
{
    FLOW_COMMON_TYPES::SessionId id;
    FlowKey key;
    FLOW_COMMON_TYPES::Protocol protocol;
    Endpoint initiator;
    Endpoint responder;
    FLOW_COMMON_TYPES::Timestamp first_seen;
    FLOW_COMMON_TYPES::Timestamp last_seen;
    ProtocolTracker tracker;
    SessionStatics statics{};

    Session(const FLOW_COMMON_TYPES::SessionId id, const FlowKey& key, const Endpoint& initiator,
            const Endpoint& responder, const FLOW_COMMON_TYPES::Timestamp timestamp) : id(id), key(key),
            protocol(key.protocol), initiator(initiator), responder(responder), first_seen(timestamp),
            last_seen(timestamp), tracker(FlowStateMachine::createTracker(key.protocol)) {}

    FLOW_COMMON_TYPES::SessionState state() const { return FlowStateMachine::getState(tracker); }

    uint64_t totalPackets() const { return statics.initiator_packet_count + statics.responder_packet_count; }
    uint64_t totalBytes() const { return statics.initiator_byte_count + statics.responder_byte_count; }
};
