#include "SessionTable.hpp"
#include <algorithm>
#include "FlowLogger.hpp"

SessionTable::SessionTable(const std::size_t max_sessions, StatisticsAggregator& aggregator,
    BoundedQueue<Session>& finalized_queue)
    : _max_sessions(max_sessions), _live_sessions(0), _next_session_id(1), _malformed_packets(0),
      _rejected_sessions(0), _aggregator(aggregator), _finalized_queue(finalized_queue)
{
    const std::size_t reserved_sessions = std::min<std::size_t>(max_sessions, Config::MAX_RESERVED_SESSIONS);
    for (auto& stripe : _stripes)
    {
        // Preallocate space to smoother performance
        stripe.sessions.reserve(reserved_sessions / _stripes.size() + 1);
    }
}

SessionTable::Stripe& SessionTable::getStripe(const FlowKey& key)
{
    return _stripes[std::hash<FlowKey>()(key) % _stripes.size()];
}

const SessionTable::Stripe& SessionTable::getStripe(const FlowKey& key) const
{
    return _stripes[std::hash<FlowKey>()(key) % _stripes.size()];
}

Session SessionTable::createSession(const FlowKey& key, const PacketEvent& packet)
{
    const bool from_lower = FlowKeyResolver::isFromLowerEndpoint(packet);
    const Endpoint& initiator = from_lower ? key.lower : key.upper;
    const Endpoint& responder = from_lower ? key.upper : key.lower;
    return Session(_next_session_id++, key, initiator, responder, packet.timestamp);
}

SessionTable::Direction SessionTable::getDirection(const Session& session, const PacketEvent& packet) const
{
    const bool from_lower = FlowKeyResolver::isFromLowerEndpoint(packet);
    const bool initiator_is_lower = session.initiator == session.key.lower;
    return from_lower == initiator_is_lower ? FLOW_COMMON_TYPES::FROM_INITIATOR : FLOW_COMMON_TYPES::FROM_RESPONDER;
}

SessionTable::Timestamp SessionTable::clampTimestamp(const Session& session, const Timestamp timestamp) const
{
    if (timestamp < session.first_seen)
    {
        FlowLogger::getInstance().warning("Packet timestamp precedes first-seen of session " +
            std::to_string(session.id) + " (" + session.key.toString() + "), clamped to first-seen");
        return session.first_seen;
    }
    return timestamp;
}

void SessionTable::updateStatistics(Session& session, const Direction direction, const uint32_t size,
    const Timestamp timestamp)
{
    session.last_seen = std::max(session.last_seen, timestamp);

    if (direction == FLOW_COMMON_TYPES::FROM_INITIATOR)
    {
        session.statics.initiator_packet_count++;
        session.statics.initiator_byte_count += size;
    }
    else
    {
        session.statics.responder_packet_count++;
        session.statics.responder_byte_count += size;
    }
}

void SessionTable::finalizeClosedSession(Session session)
{
    FlowLogger::getInstance().debug("Session " + std::to_string(session.id) + " (" + session.key.toString() +
        ") closed by the peers");
    _aggregator.finalizeSession(session, session.last_seen);
    if (!_finalized_queue.push(std::move(session)))
    {
        FlowLogger::getInstance().warning("Finalized session buffer is full, oldest session dropped");
    }
}

void SessionTable::dropMalformedPacket(const PacketEvent& packet)
{
    _malformed_packets++;
    if (FlowLogger::getInstance().isEnabled(FlowLogger::DEBUG_LEVEL))
    {
        FlowLogger::getInstance().debug("Dropped malformed packet: " + FLOW_COMMON_TYPES::protocolToString(packet.protocol) +
            " " + packet.src_ip.toString() + " -> " + packet.dst_ip.toString());
    }
}

std::optional<SessionTable::SessionId> SessionTable::ingest(const PacketEvent& packet)
{
    if (!FlowKeyResolver::isWellFormed(packet))
    {
        dropMalformedPacket(packet);
        return std::nullopt;
    }

    const FlowKey key = FlowKeyResolver::resolve(packet);
    std::optional<SessionId> session_id;
    std::optional<Session> closed_session;
    bool is_new_key = false;

    {
        Stripe& stripe = getStripe(key);
        std::unique_lock lock(stripe.mutex);

        auto it = stripe.sessions.find(key);
        if (it == stripe.sessions.end())
        {
            is_new_key = true;
            if (_live_sessions.load() >= _max_sessions)
            {
                _rejected_sessions++;
            }
            else
            {
                it = stripe.sessions.emplace(key, createSession(key, packet)).first;
                _live_sessions++;
            }
        }

        if (it != stripe.sessions.end())
        {
            Session& session = it->second;
            const Direction direction = getDirection(session, packet);
            updateStatistics(session, direction, packet.length, clampTimestamp(session, packet.timestamp));
            session_id = session.id;

            if (FlowStateMachine::advance(session.tracker, direction, packet.tcp_flags) == FLOW_COMMON_TYPES::CLOSED)
            {
                // closed connections leave the table right away
                closed_session = std::move(session);
                stripe.sessions.erase(it);
                _live_sessions--;
            }
        }
    }

    _aggregator.applyDelta(packet.src_ip, packet.dst_ip, packet.length, 1, packet.timestamp);
    if (is_new_key)
    {
        _aggregator.recordFlow(key, packet.timestamp);
    }
    if (closed_session)
    {
        finalizeClosedSession(std::move(*closed_session));
    }
    return session_id;
}

std::vector<Session> SessionTable::evictIdle(const Timestamp now, const std::chrono::seconds idle_threshold)
{
    std::vector<Session> evicted;

    for (auto& stripe : _stripes)
    {
        std::unique_lock lock(stripe.mutex);
        for (auto it = stripe.sessions.begin(); it != stripe.sessions.end();)
        {
            if (now - it->second.last_seen > idle_threshold)
            {
                Session session = std::move(it->second);
                FlowStateMachine::close(session.tracker);
                evicted.push_back(std::move(session));
                it = stripe.sessions.erase(it);
                _live_sessions--;
            }
            else
            {
                ++it;
            }
        }
    }
    return evicted;
}

std::vector<Session> SessionTable::snapshot() const
{
    std::vector<Session> sessions;
    sessions.reserve(_live_sessions.load());

    for (const auto& stripe : _stripes)
    {
        std::shared_lock lock(stripe.mutex);
        for (const auto& pair : stripe.sessions)
        {
            sessions.push_back(pair.second);
        }
    }

    std::sort(sessions.begin(), sessions.end(), [](const Session& lhs, const Session& rhs) {
        if (lhs.last_seen != rhs.last_seen)
        {
            return lhs.last_seen > rhs.last_seen;
        }
        return lhs.id < rhs.id;
    });
    return sessions;
}

std::optional<Session> SessionTable::findSession(const FlowKey& key) const
{
    const Stripe& stripe = getStripe(key);
    std::shared_lock lock(stripe.mutex);
    const auto it = stripe.sessions.find(key);
    if (it == stripe.sessions.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::size_t SessionTable::size() const
{
    return _live_sessions.load();
}

std::size_t SessionTable::maxSessions() const
{
    return _max_sessions;
}

uint64_t SessionTable::malformedPackets() const
{
    return _malformed_packets.load();
}

uint64_t SessionTable::rejectedSessions() const
{
    return _rejected_sessions.load();
}
