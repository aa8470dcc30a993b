#pragma once
#include <array>
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "Config.hpp"
#include "Session.hpp"

struct IpStatistic
{
    pcpp::IPAddress ip;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t packets_sent = 0;
    uint64_t packets_received = 0;
    uint64_t session_count = 0; // distinct flow keys ever seen with this address
    FLOW_COMMON_TYPES::Timestamp first_seen{};
    FLOW_COMMON_TYPES::Timestamp last_seen{};

    uint64_t totalBytes() const { return bytes_sent + bytes_received; }
    uint64_t totalPackets() const { return packets_sent + packets_received; }
};

struct HistoryBucket
{
    FLOW_COMMON_TYPES::Timestamp window_start{};
    uint64_t bytes = 0;
    uint64_t packets = 0;
    uint64_t finalized_sessions = 0;
};

struct TrafficSummary
{
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t packets_sent = 0;
    uint64_t packets_received = 0;
    uint64_t total_bytes = 0;   // every packet counted once
    uint64_t total_packets = 0;
    uint64_t live_sessions = 0;
    uint64_t distinct_ips = 0;
    uint64_t finalized_sessions = 0;

    // engine error counters, filled in by the publisher
    uint64_t malformed_packets = 0;
    uint64_t rejected_sessions = 0;
    uint64_t dropped_finalized_sessions = 0;

    // capture state, filled in by the engine
    std::string interface;
    bool running = false;
    std::chrono::seconds uptime{0};
};

class StatisticsAggregator
{
public:
    enum OrderBy
    {
        BY_BYTES,
        BY_PACKETS,
        BY_SESSIONS
    };

    StatisticsAggregator(std::chrono::seconds history_interval, std::size_t history_capacity);
    ~StatisticsAggregator() = default;
    StatisticsAggregator(const StatisticsAggregator&) = delete;
    StatisticsAggregator& operator=(const StatisticsAggregator&) = delete;

    void applyDelta(const pcpp::IPAddress& from, const pcpp::IPAddress& to, uint64_t bytes, uint64_t packets,
                    FLOW_COMMON_TYPES::Timestamp timestamp);
    void recordFlow(const FlowKey& key, FLOW_COMMON_TYPES::Timestamp timestamp);
    void finalizeSession(const Session& session, FLOW_COMMON_TYPES::Timestamp finalized_at);
    void advanceHistory(FLOW_COMMON_TYPES::Timestamp now);

    std::vector<IpStatistic> topIp(std::size_t limit, OrderBy order_by) const;
    std::vector<IpStatistic> ipStats() const;
    std::optional<IpStatistic> getIpStatistic(const pcpp::IPAddress& ip) const;
    std::vector<HistoryBucket> history() const;
    TrafficSummary summary(std::size_t live_sessions) const;

private:
    struct AddressRecord
    {
        IpStatistic stat;
        std::unordered_set<FlowKey> flows;
    };

    struct AddressStripe
    {
        mutable std::mutex mutex;
        std::unordered_map<pcpp::IPAddress, AddressRecord, IpAddressHash> records;
    };

    AddressStripe& getStripe(const pcpp::IPAddress& ip);
    const AddressStripe& getStripe(const pcpp::IPAddress& ip) const;
    static AddressRecord& getOrCreateRecord(AddressStripe& stripe, const pcpp::IPAddress& ip,
                                            FLOW_COMMON_TYPES::Timestamp timestamp);
    static bool isBefore(const IpStatistic& lhs, const IpStatistic& rhs, OrderBy order_by);

    FLOW_COMMON_TYPES::Timestamp getWindowStart(FLOW_COMMON_TYPES::Timestamp timestamp) const;
    HistoryBucket& getBucket(FLOW_COMMON_TYPES::Timestamp timestamp);
    void pushCurrentBucket();

    std::array<AddressStripe, Config::ADDRESS_STATS_STRIPES> _stripes;
    std::chrono::seconds _history_interval;
    std::size_t _history_capacity;
    std::deque<HistoryBucket> _history;
    std::optional<HistoryBucket> _current_bucket;
    std::optional<FLOW_COMMON_TYPES::Timestamp> _last_closed_window;
    mutable std::mutex _history_mutex;
    std::atomic<uint64_t> _finalized_sessions;
};
