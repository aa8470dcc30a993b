#pragma once
#include <memory>
#include <mutex>
#include "BoundedQueue.hpp"
#include "GeoLocator.hpp"
#include "SessionTable.hpp"
#include "StatisticsAggregator.hpp"

// Read side of the engine. Every call returns copies, never references into live state.
class SnapshotPublisher
{
private:
    const SessionTable& _session_table;
    const StatisticsAggregator& _aggregator;
    BoundedQueue<Session>& _finalized_queue;
    std::shared_ptr<GeoLocator> _geo_locator;
    mutable std::mutex _geo_mutex;

public:
    SnapshotPublisher(const SessionTable& session_table, const StatisticsAggregator& aggregator,
                      BoundedQueue<Session>& finalized_queue);
    ~SnapshotPublisher() = default;
    SnapshotPublisher(const SnapshotPublisher&) = delete;
    SnapshotPublisher& operator=(const SnapshotPublisher&) = delete;

    std::vector<Session> sessions() const;
    std::vector<IpStatistic> ipStats() const;
    std::vector<IpStatistic> topIp(std::size_t limit, StatisticsAggregator::OrderBy order_by) const;
    std::vector<HistoryBucket> history() const;
    TrafficSummary summary() const;

    // Sessions finalized since the previous call, in finalization order
    std::vector<Session> drainFinalized();
    std::size_t pendingFinalized() const;

    void setGeoLocator(std::shared_ptr<GeoLocator> geo_locator);
    std::optional<GeoLocation> locate(const pcpp::IPAddress& ip) const;
};
