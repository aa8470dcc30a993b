#pragma once
#include <atomic>
#include <string>
#include "FlowEngine.hpp"
#include "MonitorSettings.hpp"
#include "PcapPacketSource.hpp"
#include "PersistenceWorker.hpp"
#include "WebSocketClient.hpp"
#include "WebSocketStorageSink.hpp"

class NetFlowMonitor
{
private:
    MonitorSettings _settings;
    std::atomic<bool> _keep_running;
    PcapPacketSource _packet_source;
    FlowEngine _engine;
    WebSocketClient _ws_client;
    WebSocketStorageSink _storage_sink;
    PersistenceWorker _persistence_worker;

    void configureLogging() const;
    void startingBackend();
    static void onApplicationInterruptedCallBack(void* cookie);

    void handleCommand(const std::string& user_input);
    void printSessions();
    void printIpStats();
    void printTopIp(const std::string& arguments);
    void printHistory();
    void printSummary();
    static void printHelp();

public:
    explicit NetFlowMonitor(const MonitorSettings& settings);
    ~NetFlowMonitor();
    NetFlowMonitor(const NetFlowMonitor&) = delete;
    NetFlowMonitor& operator=(const NetFlowMonitor&) = delete;

    void startingCapture();
};
