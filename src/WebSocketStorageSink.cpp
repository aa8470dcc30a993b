#include "WebSocketStorageSink.hpp"
#include "JsonSerializer.hpp"

WebSocketStorageSink::WebSocketStorageSink(WebSocketClient& ws_client) : _ws_client(ws_client)
{}

bool WebSocketStorageSink::isAvailable() const
{
    return _ws_client.isConnected();
}

bool WebSocketStorageSink::persist(const std::vector<Session>& finalized_sessions,
    const std::vector<IpStatistic>& ip_stats)
{
    if (!_ws_client.isConnected())
    {
        return false;
    }
    const Json::Value message = JsonSerializer::toSnapshotMessage(finalized_sessions, ip_stats);
    return _ws_client.send(JsonSerializer::writeString(message));
}
