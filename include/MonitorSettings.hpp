#pragma once
#include <chrono>
#include <string>
#include "Config.hpp"
#include "FlowLogger.hpp"

// Runtime settings, defaults come from Config
struct MonitorSettings
{
    std::string interface = Config::DEFAULT_INTERFACE;
    bool promiscuous = Config::PROMISCUOUS_MODE;
    std::chrono::seconds session_idle_timeout{Config::MAX_IDLE_SESSION_TIME};
    std::size_t max_sessions = Config::MAX_SESSIONS;
    std::chrono::seconds sweep_interval{Config::CLEANUP_IDLE_SESSIONS_TIME};
    std::chrono::seconds history_interval{Config::HISTORY_INTERVAL};
    std::size_t history_capacity = Config::HISTORY_CAPACITY;
    std::size_t finalized_buffer_capacity = Config::FINALIZED_BUFFER_CAPACITY;
    std::size_t capture_buffer_capacity = Config::CAPTURE_BUFFER_CAPACITY;
    std::chrono::seconds persist_interval{Config::PERSIST_INTERVAL};
    std::string backend_uri = Config::BACKEND_URI; // empty disables the backend
    FlowLogger::Level log_level = FlowLogger::INFO_LEVEL;
};
