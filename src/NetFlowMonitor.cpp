#include "NetFlowMonitor.hpp"
#include <Logger.h>
#include <SystemUtils.h>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace
{
    std::string formatTime(const FLOW_COMMON_TYPES::Timestamp timestamp)
    {
        const std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
        std::tm time_tm{};
        localtime_r(&time, &time_tm);
        std::stringstream ss;
        ss << std::put_time(&time_tm, "%H:%M:%S");
        return ss.str();
    }
}

NetFlowMonitor::NetFlowMonitor(const MonitorSettings& settings) : _settings(settings), _keep_running(true),
    _packet_source(settings.interface, settings.promiscuous, settings.capture_buffer_capacity),
    _engine(settings, _packet_source), _storage_sink(_ws_client),
    _persistence_worker(_engine.getPublisher(), _storage_sink, settings.persist_interval)
{
    configureLogging();
    pcpp::ApplicationEventHandler::getInstance().onApplicationInterrupted(onApplicationInterruptedCallBack, &_keep_running);
    _engine.start();
    startingBackend();
}

NetFlowMonitor::~NetFlowMonitor()
{
    FlowLogger::getInstance().clearRemoteSink();
    _engine.stop();
    _persistence_worker.stop();
    _ws_client.stop();
}

void NetFlowMonitor::configureLogging() const
{
    FlowLogger::getInstance().setLevel(_settings.log_level);
    if (_settings.log_level != FlowLogger::DEBUG_LEVEL)
    {
        pcpp::Logger::getInstance().suppressLogs();
    }
}

void NetFlowMonitor::startingBackend()
{
    if (_settings.backend_uri.empty())
    {
        FlowLogger::getInstance().info("No backend configured, finalized sessions are kept in memory only");
        return;
    }
    _ws_client.start(_settings.backend_uri);
    FlowLogger::getInstance().setRemoteSink([this](const std::string& line) { _ws_client.send(line); });
    _persistence_worker.start();
}

void NetFlowMonitor::onApplicationInterruptedCallBack(void* cookie)
{
    auto* keep_running = static_cast<std::atomic<bool>*>(cookie);

    *keep_running = false;
    std::cout << std::endl << "Shutting down..." << std::endl;
}

void NetFlowMonitor::startingCapture()
{
    std::cout << "starting capturing packets on " << _packet_source.getInterfaceName() << "...\n";

    std::string user_input;
    std::cout << "------------------------------\n";
    printHelp();
    std::cout << "------------------------------\n";
    while (_keep_running)
    {
        if (!std::getline(std::cin, user_input))
        {
            break;
        }
        std::cout << "------------------------------\n";
        handleCommand(user_input);
    }
}

void NetFlowMonitor::handleCommand(const std::string& user_input)
{
    std::istringstream input(user_input);
    std::string command;
    input >> command;
    std::string arguments;
    std::getline(input, arguments);

    if (command == "sessions")
    {
        printSessions();
    }
    else if (command == "ips")
    {
        printIpStats();
    }
    else if (command == "top")
    {
        printTopIp(arguments);
    }
    else if (command == "history")
    {
        printHistory();
    }
    else if (command == "summary")
    {
        printSummary();
    }
    else if (command == "start")
    {
        try {
            _engine.start();
        } catch (const std::exception& e) {
            FlowLogger::getInstance().error(std::string("Failed to start capture: ") + e.what());
        }
    }
    else if (command == "stop")
    {
        _engine.stop();
    }
    else if (command == "exit")
    {
        _keep_running = false;
    }
    else if (command.empty())
    {
        return;
    }
    else
    {
        std::cout << "Invalid input. Please try again.\n";
        printHelp();
    }
}

void NetFlowMonitor::printHelp()
{
    std::cout << "Commands: 'sessions', 'ips', 'top [bytes|packets|sessions] [N]', 'history', 'summary',\n"
              << "'start', 'stop' or 'exit'\n";
}

void NetFlowMonitor::printSessions()
{
    const std::vector<Session> sessions = _engine.getPublisher().sessions();
    std::cout << std::setw(8) << "Id"
              << std::setw(8) << "Proto"
              << std::setw(14) << "State"
              << std::setw(30) << "Initiator"
              << std::setw(30) << "Responder"
              << std::setw(12) << "Idle Time"
              << std::setw(12) << "Packets"
              << std::setw(14) << "Bytes"
              << std::endl;

    std::cout << std::string(128, '-') << std::endl;

    const auto current_time = std::chrono::system_clock::now();
    for (const auto& session : sessions)
    {
        const auto idle_duration = std::chrono::duration_cast<std::chrono::seconds>(
            current_time - session.last_seen).count();

        std::cout << std::setw(8) << session.id
                  << std::setw(8) << FLOW_COMMON_TYPES::protocolToString(session.protocol)
                  << std::setw(14) << FLOW_COMMON_TYPES::stateToString(session.state())
                  << std::setw(30) << session.initiator.toString()
                  << std::setw(30) << session.responder.toString()
                  << std::setw(12) << (std::to_string(idle_duration) + "s")
                  << std::setw(12) << session.totalPackets()
                  << std::setw(14) << session.totalBytes()
                  << std::endl;
    }
    std::cout << sessions.size() << " live sessions\n";
}

void NetFlowMonitor::printIpStats()
{
    const std::vector<IpStatistic> ip_stats = _engine.getPublisher().ipStats();
    std::cout << std::setw(40) << "IP"
              << std::setw(14) << "Bytes Sent"
              << std::setw(14) << "Bytes Recv"
              << std::setw(14) << "Pkts Sent"
              << std::setw(14) << "Pkts Recv"
              << std::setw(10) << "Flows"
              << std::setw(12) << "Last Seen"
              << std::endl;

    std::cout << std::string(118, '-') << std::endl;

    for (const auto& ip_statistic : ip_stats)
    {
        std::cout << std::setw(40) << ip_statistic.ip.toString()
                  << std::setw(14) << ip_statistic.bytes_sent
                  << std::setw(14) << ip_statistic.bytes_received
                  << std::setw(14) << ip_statistic.packets_sent
                  << std::setw(14) << ip_statistic.packets_received
                  << std::setw(10) << ip_statistic.session_count
                  << std::setw(12) << formatTime(ip_statistic.last_seen)
                  << std::endl;
    }
}

void NetFlowMonitor::printTopIp(const std::string& arguments)
{
    std::istringstream input(arguments);
    std::string order_name = "bytes";
    std::size_t limit = Config::DEFAULT_TOP_IP_LIMIT;
    input >> order_name;
    if (!(input >> limit))
    {
        limit = Config::DEFAULT_TOP_IP_LIMIT;
    }

    StatisticsAggregator::OrderBy order_by;
    if (order_name == "bytes") order_by = StatisticsAggregator::BY_BYTES;
    else if (order_name == "packets") order_by = StatisticsAggregator::BY_PACKETS;
    else if (order_name == "sessions") order_by = StatisticsAggregator::BY_SESSIONS;
    else
    {
        std::cout << "Unknown ordering '" << order_name << "', use bytes, packets or sessions\n";
        return;
    }

    const std::vector<IpStatistic> top = _engine.getPublisher().topIp(limit, order_by);
    std::cout << std::setw(6) << "Rank"
              << std::setw(40) << "IP"
              << std::setw(16) << "Total Bytes"
              << std::setw(16) << "Total Packets"
              << std::setw(10) << "Flows"
              << std::endl;

    std::cout << std::string(88, '-') << std::endl;

    std::size_t rank = 1;
    for (const auto& ip_statistic : top)
    {
        std::cout << std::setw(6) << rank++
                  << std::setw(40) << ip_statistic.ip.toString()
                  << std::setw(16) << ip_statistic.totalBytes()
                  << std::setw(16) << ip_statistic.totalPackets()
                  << std::setw(10) << ip_statistic.session_count
                  << std::endl;
    }
}

void NetFlowMonitor::printHistory()
{
    const std::vector<HistoryBucket> history = _engine.getPublisher().history();
    std::cout << std::setw(12) << "Window"
              << std::setw(14) << "Bytes"
              << std::setw(12) << "Packets"
              << std::setw(12) << "Finalized"
              << std::endl;

    std::cout << std::string(50, '-') << std::endl;

    // the latest windows are the interesting ones
    const std::size_t max_rows = 20;
    const std::size_t first = history.size() > max_rows ? history.size() - max_rows : 0;
    for (std::size_t i = first; i < history.size(); ++i)
    {
        const HistoryBucket& bucket = history[i];
        std::cout << std::setw(12) << formatTime(bucket.window_start)
                  << std::setw(14) << bucket.bytes
                  << std::setw(12) << bucket.packets
                  << std::setw(12) << bucket.finalized_sessions
                  << std::endl;
    }
}

void NetFlowMonitor::printSummary()
{
    const TrafficSummary summary = _engine.summary();
    std::cout << "Interface:            " << summary.interface << "\n"
              << "Capture:              " << (summary.running ? "running" : "stopped") << "\n"
              << "Uptime:               " << summary.uptime.count() << "s\n"
              << "Total bytes:          " << summary.total_bytes << "\n"
              << "Total packets:        " << summary.total_packets << "\n"
              << "Live sessions:        " << summary.live_sessions << "\n"
              << "Distinct IPs:         " << summary.distinct_ips << "\n"
              << "Finalized sessions:   " << summary.finalized_sessions << "\n"
              << "Malformed packets:    " << summary.malformed_packets << "\n"
              << "Rejected sessions:    " << summary.rejected_sessions << "\n"
              << "Dropped finalized:    " << summary.dropped_finalized_sessions << "\n"
              << "Capture drops:        " << _packet_source.droppedPackets() << "\n"
              << "Persisted sessions:   " << _persistence_worker.persistedSessions() << "\n";
}
