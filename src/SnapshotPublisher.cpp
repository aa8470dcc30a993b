#include "SnapshotPublisher.hpp"
#include "FlowLogger.hpp"

SnapshotPublisher::SnapshotPublisher(const SessionTable& session_table, const StatisticsAggregator& aggregator,
    BoundedQueue<Session>& finalized_queue)
    : _session_table(session_table), _aggregator(aggregator), _finalized_queue(finalized_queue)
{}

std::vector<Session> SnapshotPublisher::sessions() const
{
    return _session_table.snapshot();
}

std::vector<IpStatistic> SnapshotPublisher::ipStats() const
{
    return _aggregator.ipStats();
}

std::vector<IpStatistic> SnapshotPublisher::topIp(const std::size_t limit, const StatisticsAggregator::OrderBy order_by) const
{
    return _aggregator.topIp(limit, order_by);
}

std::vector<HistoryBucket> SnapshotPublisher::history() const
{
    return _aggregator.history();
}

TrafficSummary SnapshotPublisher::summary() const
{
    TrafficSummary summary = _aggregator.summary(_session_table.size());
    summary.malformed_packets = _session_table.malformedPackets();
    summary.rejected_sessions = _session_table.rejectedSessions();
    summary.dropped_finalized_sessions = _finalized_queue.droppedCount();
    return summary;
}

std::vector<Session> SnapshotPublisher::drainFinalized()
{
    return _finalized_queue.drain();
}

std::size_t SnapshotPublisher::pendingFinalized() const
{
    return _finalized_queue.size();
}

void SnapshotPublisher::setGeoLocator(std::shared_ptr<GeoLocator> geo_locator)
{
    std::lock_guard lock(_geo_mutex);
    _geo_locator = std::move(geo_locator);
}

std::optional<GeoLocation> SnapshotPublisher::locate(const pcpp::IPAddress& ip) const
{
    std::shared_ptr<GeoLocator> geo_locator;
    {
        std::lock_guard lock(_geo_mutex);
        geo_locator = _geo_locator;
    }
    if (!geo_locator)
    {
        return std::nullopt;
    }
    try {
        return geo_locator->lookup(ip);
    } catch (const std::exception& e) {
        FlowLogger::getInstance().error("Geo lookup for " + ip.toString() + " failed: " + e.what());
        return std::nullopt;
    }
}
