#pragma once
#include "StorageSink.hpp"
#include "WebSocketClient.hpp"

// Ships each batch to the backend as one "flow snapshot" JSON message
class WebSocketStorageSink : public StorageSink
{
private:
    WebSocketClient& _ws_client;

public:
    explicit WebSocketStorageSink(WebSocketClient& ws_client);
    ~WebSocketStorageSink() override = default;

    bool isAvailable() const override;
    bool persist(const std::vector<Session>& finalized_sessions, const std::vector<IpStatistic>& ip_stats) override;
};
