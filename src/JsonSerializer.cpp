#include "JsonSerializer.hpp"

Json::Value JsonSerializer::toJson(const Session& session)
{
    Json::Value value;
    value["id"] = static_cast<Json::UInt64>(session.id);
    value["key"] = session.key.toString();
    value["protocol"] = FLOW_COMMON_TYPES::protocolToString(session.protocol);
    value["state"] = FLOW_COMMON_TYPES::stateToString(session.state());
    value["initiator_ip"] = session.initiator.ip.toString();
    value["initiator_port"] = static_cast<Json::UInt>(session.initiator.port);
    value["responder_ip"] = session.responder.ip.toString();
    value["responder_port"] = static_cast<Json::UInt>(session.responder.port);
    value["first_seen"] = toEpochMillis(session.first_seen);
    value["last_seen"] = toEpochMillis(session.last_seen);
    value["initiator_packets"] = static_cast<Json::UInt64>(session.statics.initiator_packet_count);
    value["initiator_bytes"] = static_cast<Json::UInt64>(session.statics.initiator_byte_count);
    value["responder_packets"] = static_cast<Json::UInt64>(session.statics.responder_packet_count);
    value["responder_bytes"] = static_cast<Json::UInt64>(session.statics.responder_byte_count);
    value["total_packets"] = static_cast<Json::UInt64>(session.totalPackets());
    value["total_bytes"] = static_cast<Json::UInt64>(session.totalBytes());
    return value;
}

Json::Value JsonSerializer::toJson(const IpStatistic& ip_statistic)
{
    Json::Value value;
    value["ip"] = ip_statistic.ip.toString();
    value["bytes_sent"] = static_cast<Json::UInt64>(ip_statistic.bytes_sent);
    value["bytes_received"] = static_cast<Json::UInt64>(ip_statistic.bytes_received);
    value["packets_sent"] = static_cast<Json::UInt64>(ip_statistic.packets_sent);
    value["packets_received"] = static_cast<Json::UInt64>(ip_statistic.packets_received);
    value["session_count"] = static_cast<Json::UInt64>(ip_statistic.session_count);
    value["first_seen"] = toEpochMillis(ip_statistic.first_seen);
    value["last_seen"] = toEpochMillis(ip_statistic.last_seen);
    return value;
}

Json::Value JsonSerializer::toJson(const HistoryBucket& bucket)
{
    Json::Value value;
    value["window_start"] = toEpochMillis(bucket.window_start);
    value["bytes"] = static_cast<Json::UInt64>(bucket.bytes);
    value["packets"] = static_cast<Json::UInt64>(bucket.packets);
    value["finalized_sessions"] = static_cast<Json::UInt64>(bucket.finalized_sessions);
    return value;
}

Json::Value JsonSerializer::toJson(const TrafficSummary& summary)
{
    Json::Value value;
    value["bytes_sent"] = static_cast<Json::UInt64>(summary.bytes_sent);
    value["bytes_received"] = static_cast<Json::UInt64>(summary.bytes_received);
    value["packets_sent"] = static_cast<Json::UInt64>(summary.packets_sent);
    value["packets_received"] = static_cast<Json::UInt64>(summary.packets_received);
    value["total_bytes"] = static_cast<Json::UInt64>(summary.total_bytes);
    value["total_packets"] = static_cast<Json::UInt64>(summary.total_packets);
    value["live_sessions"] = static_cast<Json::UInt64>(summary.live_sessions);
    value["distinct_ips"] = static_cast<Json::UInt64>(summary.distinct_ips);
    value["finalized_sessions"] = static_cast<Json::UInt64>(summary.finalized_sessions);
    value["malformed_packets"] = static_cast<Json::UInt64>(summary.malformed_packets);
    value["rejected_sessions"] = static_cast<Json::UInt64>(summary.rejected_sessions);
    value["dropped_finalized_sessions"] = static_cast<Json::UInt64>(summary.dropped_finalized_sessions);
    value["interface"] = summary.interface;
    value["running"] = summary.running;
    value["uptime_sec"] = static_cast<Json::Int64>(summary.uptime.count());
    return value;
}

Json::Value JsonSerializer::toSnapshotMessage(const std::vector<Session>& sessions,
    const std::vector<IpStatistic>& ip_stats)
{
    Json::Value message;
    message["type"] = "flow snapshot"; // Title field
    message["sessions"] = Json::Value(Json::arrayValue);
    for (const auto& session : sessions)
    {
        message["sessions"].append(toJson(session));
    }
    message["ip_stats"] = Json::Value(Json::arrayValue);
    for (const auto& ip_statistic : ip_stats)
    {
        message["ip_stats"].append(toJson(ip_statistic));
    }
    return message;
}

std::string JsonSerializer::writeString(const Json::Value& value)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

Json::UInt64 JsonSerializer::toEpochMillis(const FLOW_COMMON_TYPES::Timestamp timestamp)
{
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
    return millis < 0 ? 0 : static_cast<Json::UInt64>(millis);
}
