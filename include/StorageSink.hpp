#pragma once
#include <vector>
#include "Session.hpp"
#include "StatisticsAggregator.hpp"

// Destination for finalized sessions. Best effort: false means the batch was not stored.
class StorageSink
{
public:
    virtual ~StorageSink() = default;

    // While false the finalized sessions stay buffered in the engine
    virtual bool isAvailable() const = 0;

    virtual bool persist(const std::vector<Session>& finalized_sessions, const std::vector<IpStatistic>& ip_stats) = 0;
};
