#pragma once
#include <array>
#include <atomic>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "BoundedQueue.hpp"
#include "Config.hpp"
#include "FlowKeyResolver.hpp"
#include "Session.hpp"
#include "StatisticsAggregator.hpp"

class SessionTable
{

public:

    using SessionState = FLOW_COMMON_TYPES::SessionState;
    using Direction = FLOW_COMMON_TYPES::Direction;
    using SessionId = FLOW_COMMON_TYPES::SessionId;
    using Timestamp = FLOW_COMMON_TYPES::Timestamp;

    SessionTable(std::size_t max_sessions, StatisticsAggregator& aggregator, BoundedQueue<Session>& finalized_queue);
    ~SessionTable() = default;
    SessionTable(const SessionTable&) = delete;
    SessionTable& operator=(const SessionTable&) = delete;

    // Single writer. Returns the id of the session the packet was accounted to, or nothing when the
    // packet was malformed or the table was full.
    std::optional<SessionId> ingest(const PacketEvent& packet);

    // Removes every session idle for longer than the threshold, one stripe lock at a time
    std::vector<Session> evictIdle(Timestamp now, std::chrono::seconds idle_threshold);

    // Copies of all live sessions, most recently active first
    std::vector<Session> snapshot() const;

    std::optional<Session> findSession(const FlowKey& key) const;
    std::size_t size() const;
    std::size_t maxSessions() const;
    uint64_t malformedPackets() const;
    uint64_t rejectedSessions() const;

private:

    struct Stripe
    {
        mutable std::shared_mutex mutex;
        std::unordered_map<FlowKey, Session> sessions;
    };

    Stripe& getStripe(const FlowKey& key);
    const Stripe& getStripe(const FlowKey& key) const;
    Session createSession(const FlowKey& key, const PacketEvent& packet);
    Direction getDirection(const Session& session, const PacketEvent& packet) const;
    Timestamp clampTimestamp(const Session& session, Timestamp timestamp) const;
    void updateStatistics(Session& session, Direction direction, uint32_t size, Timestamp timestamp);
    void finalizeClosedSession(Session session);
    void dropMalformedPacket(const PacketEvent& packet);

    std::array<Stripe, Config::SESSION_TABLE_STRIPES> _stripes;
    std::size_t _max_sessions;
    std::atomic<std::size_t> _live_sessions;
    std::atomic<SessionId> _next_session_id;
    std::atomic<uint64_t> _malformed_packets;
    std::atomic<uint64_t> _rejected_sessions;
    StatisticsAggregator& _aggregator;
    BoundedQueue<Session>& _finalized_queue;
};
