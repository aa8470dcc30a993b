#pragma once
#include <json/json.h>
#include <string>
#include <vector>
#include "Session.hpp"
#include "StatisticsAggregator.hpp"

class JsonSerializer
{
public:
    JsonSerializer() = delete;

    // Timestamps are written as milliseconds since the epoch
    static Json::Value toJson(const Session& session);
    static Json::Value toJson(const IpStatistic& ip_statistic);
    static Json::Value toJson(const HistoryBucket& bucket);
    static Json::Value toJson(const TrafficSummary& summary);

    // Backend message carrying finalized sessions and the current per address statistics
    static Json::Value toSnapshotMessage(const std::vector<Session>& sessions, const std::vector<IpStatistic>& ip_stats);

    // Compact single line output
    static std::string writeString(const Json::Value& value);

    static Json::UInt64 toEpochMillis(FLOW_COMMON_TYPES::Timestamp timestamp);
};
