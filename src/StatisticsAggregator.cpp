#include "StatisticsAggregator.hpp"
#include <algorithm>
#include <limits>

StatisticsAggregator::StatisticsAggregator(const std::chrono::seconds history_interval, const std::size_t history_capacity)
    : _history_interval(history_interval.count() > 0 ? history_interval : std::chrono::seconds(Config::HISTORY_INTERVAL)),
      _history_capacity(history_capacity), _finalized_sessions(0)
{}

StatisticsAggregator::AddressStripe& StatisticsAggregator::getStripe(const pcpp::IPAddress& ip)
{
    return _stripes[IpAddressHash()(ip) % _stripes.size()];
}

const StatisticsAggregator::AddressStripe& StatisticsAggregator::getStripe(const pcpp::IPAddress& ip) const
{
    return _stripes[IpAddressHash()(ip) % _stripes.size()];
}

StatisticsAggregator::AddressRecord& StatisticsAggregator::getOrCreateRecord(AddressStripe& stripe,
    const pcpp::IPAddress& ip, const FLOW_COMMON_TYPES::Timestamp timestamp)
{
    // called inside critical section
    auto it = stripe.records.find(ip);
    if (it == stripe.records.end())
    {
        AddressRecord record;
        record.stat.ip = ip;
        record.stat.first_seen = timestamp;
        record.stat.last_seen = timestamp;
        it = stripe.records.emplace(ip, std::move(record)).first;
    }
    return it->second;
}

void StatisticsAggregator::applyDelta(const pcpp::IPAddress& from, const pcpp::IPAddress& to, const uint64_t bytes,
    const uint64_t packets, const FLOW_COMMON_TYPES::Timestamp timestamp)
{
    {
        AddressStripe& stripe = getStripe(from);
        std::lock_guard lock(stripe.mutex);
        IpStatistic& sender = getOrCreateRecord(stripe, from, timestamp).stat;
        sender.bytes_sent += bytes;
        sender.packets_sent += packets;
        sender.last_seen = std::max(sender.last_seen, timestamp);
    }
    {
        AddressStripe& stripe = getStripe(to);
        std::lock_guard lock(stripe.mutex);
        IpStatistic& receiver = getOrCreateRecord(stripe, to, timestamp).stat;
        receiver.bytes_received += bytes;
        receiver.packets_received += packets;
        receiver.last_seen = std::max(receiver.last_seen, timestamp);
    }

    std::lock_guard lock(_history_mutex);
    HistoryBucket& bucket = getBucket(timestamp);
    bucket.bytes += bytes;
    bucket.packets += packets;
}

void StatisticsAggregator::recordFlow(const FlowKey& key, const FLOW_COMMON_TYPES::Timestamp timestamp)
{
    for (const auto* ip : {&key.lower.ip, &key.upper.ip})
    {
        AddressStripe& stripe = getStripe(*ip);
        std::lock_guard lock(stripe.mutex);
        AddressRecord& record = getOrCreateRecord(stripe, *ip, timestamp);
        record.flows.insert(key);
        record.stat.session_count = record.flows.size();
    }
}

void StatisticsAggregator::finalizeSession(const Session& session, const FLOW_COMMON_TYPES::Timestamp finalized_at)
{
    _finalized_sessions++;

    std::lock_guard lock(_history_mutex);
    getBucket(std::max(finalized_at, session.last_seen)).finalized_sessions++;
}

void StatisticsAggregator::advanceHistory(const FLOW_COMMON_TYPES::Timestamp now)
{
    std::lock_guard lock(_history_mutex);
    if (_current_bucket && getWindowStart(now) > _current_bucket->window_start)
    {
        pushCurrentBucket();
    }
}

FLOW_COMMON_TYPES::Timestamp StatisticsAggregator::getWindowStart(const FLOW_COMMON_TYPES::Timestamp timestamp) const
{
    const auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch());
    const auto window_index = since_epoch.count() / _history_interval.count();
    return FLOW_COMMON_TYPES::Timestamp(std::chrono::duration_cast<FLOW_COMMON_TYPES::Timestamp::duration>(
        std::chrono::seconds(window_index * _history_interval.count())));
}

HistoryBucket& StatisticsAggregator::getBucket(const FLOW_COMMON_TYPES::Timestamp timestamp)
{
    // called inside critical section
    auto window_start = getWindowStart(timestamp);
    if (_current_bucket && window_start > _current_bucket->window_start)
    {
        pushCurrentBucket();
    }
    if (!_current_bucket)
    {
        // a closed window is never reopened, late packets move on to the next one
        if (_last_closed_window && window_start <= *_last_closed_window)
        {
            window_start = *_last_closed_window + _history_interval;
        }
        _current_bucket = HistoryBucket{};
        _current_bucket->window_start = window_start;
    }
    // late timestamps are accounted to the open window
    return *_current_bucket;
}

void StatisticsAggregator::pushCurrentBucket()
{
    // called inside critical section
    if (!_current_bucket) return;

    _last_closed_window = _current_bucket->window_start;
    _history.push_back(*_current_bucket);
    _current_bucket.reset();
    while (_history.size() > _history_capacity)
    {
        _history.pop_front();
    }
}

bool StatisticsAggregator::isBefore(const IpStatistic& lhs, const IpStatistic& rhs, const OrderBy order_by)
{
    uint64_t lhs_value = 0;
    uint64_t rhs_value = 0;
    switch (order_by)
    {
        case BY_PACKETS:
            lhs_value = lhs.totalPackets();
            rhs_value = rhs.totalPackets();
            break;
        case BY_SESSIONS:
            lhs_value = lhs.session_count;
            rhs_value = rhs.session_count;
            break;
        case BY_BYTES:
        default:
            lhs_value = lhs.totalBytes();
            rhs_value = rhs.totalBytes();
            break;
    }
    if (lhs_value != rhs_value)
    {
        return lhs_value > rhs_value;
    }
    return lhs.ip.toString() < rhs.ip.toString();
}

std::vector<IpStatistic> StatisticsAggregator::topIp(const std::size_t limit, const OrderBy order_by) const
{
    std::vector<IpStatistic> stats;
    for (const auto& stripe : _stripes)
    {
        std::lock_guard lock(stripe.mutex);
        for (const auto& pair : stripe.records)
        {
            stats.push_back(pair.second.stat);
        }
    }

    // sorting happens outside the locks
    const std::size_t count = std::min(limit, stats.size());
    std::partial_sort(stats.begin(), stats.begin() + count, stats.end(),
        [order_by](const IpStatistic& lhs, const IpStatistic& rhs) { return isBefore(lhs, rhs, order_by); });
    stats.resize(count);
    return stats;
}

std::vector<IpStatistic> StatisticsAggregator::ipStats() const
{
    return topIp(std::numeric_limits<std::size_t>::max(), BY_BYTES);
}

std::optional<IpStatistic> StatisticsAggregator::getIpStatistic(const pcpp::IPAddress& ip) const
{
    const AddressStripe& stripe = getStripe(ip);
    std::lock_guard lock(stripe.mutex);
    const auto it = stripe.records.find(ip);
    if (it == stripe.records.end())
    {
        return std::nullopt;
    }
    return it->second.stat;
}

std::vector<HistoryBucket> StatisticsAggregator::history() const
{
    std::lock_guard lock(_history_mutex);
    std::vector<HistoryBucket> buckets(_history.begin(), _history.end());
    if (_current_bucket)
    {
        buckets.push_back(*_current_bucket);
        if (buckets.size() > _history_capacity)
        {
            buckets.erase(buckets.begin());
        }
    }
    return buckets;
}

TrafficSummary StatisticsAggregator::summary(const std::size_t live_sessions) const
{
    TrafficSummary summary;
    for (const auto& stripe : _stripes)
    {
        std::lock_guard lock(stripe.mutex);
        for (const auto& pair : stripe.records)
        {
            const IpStatistic& stat = pair.second.stat;
            summary.bytes_sent += stat.bytes_sent;
            summary.bytes_received += stat.bytes_received;
            summary.packets_sent += stat.packets_sent;
            summary.packets_received += stat.packets_received;
        }
        summary.distinct_ips += stripe.records.size();
    }
    summary.total_bytes = summary.bytes_sent;
    summary.total_packets = summary.packets_sent;
    summary.live_sessions = live_sessions;
    summary.finalized_sessions = _finalized_sessions.load();
    return summary;
}
