#pragma once
#include <cstddef>

class Config
{
public:
    //CAPTURE
    static auto constexpr DEFAULT_INTERFACE = "eth0";
    static constexpr auto PROMISCUOUS_MODE = true;
    static constexpr auto CAPTURE_BUFFER_CAPACITY = 65536; // packets waiting for the ingestion thread
    static constexpr auto CAPTURE_POLL_TIMEOUT = 100; // ms
    static auto constexpr REPLAY_SOURCE_NAME = "replay"; // in-memory packet source

    //SESSIONS
    static constexpr auto MAX_IDLE_SESSION_TIME = 300; //seconds
    static constexpr auto CLEANUP_IDLE_SESSIONS_TIME = 30; //seconds
    static constexpr auto MAX_SESSIONS = 10000;
    static constexpr std::size_t SESSION_TABLE_STRIPES = 16;
    static constexpr std::size_t MAX_RESERVED_SESSIONS = 65536; // preallocation cap, larger tables grow on demand
    static constexpr auto ICMP_SENTINEL_PORT = 0;

    //STATISTICS
    static constexpr std::size_t ADDRESS_STATS_STRIPES = 16;
    static constexpr auto HISTORY_INTERVAL = 1; //seconds per bucket
    static constexpr auto HISTORY_CAPACITY = 3600; // one hour of one second buckets
    static constexpr auto DEFAULT_TOP_IP_LIMIT = 10;

    //PERSISTENCE
    static constexpr auto FINALIZED_BUFFER_CAPACITY = 10000;
    static constexpr auto PERSIST_INTERVAL = 5; //seconds

    //SETTINGS FILE PATH
    static auto constexpr SETTINGS_PATH = "/etc/netflow-monitor/settings.json";

    //WEBSOCKET
    static auto constexpr BACKEND_URI = "ws://127.0.0.1:8080/netflow";
    static constexpr auto WEBSOCKET_RECONNECT_DELAY = 2; //seconds
};
