#include "FlowEngine.hpp"
#include "FlowLogger.hpp"

FlowEngine::FlowEngine(const MonitorSettings& settings, PacketSource& source) : _settings(settings), _source(source),
    _aggregator(settings.history_interval, settings.history_capacity),
    _finalized_queue(settings.finalized_buffer_capacity),
    _session_table(settings.max_sessions, _aggregator, _finalized_queue),
    _sweeper(_session_table, _aggregator, _finalized_queue, settings.session_idle_timeout, settings.sweep_interval),
    _publisher(_session_table, _aggregator, _finalized_queue), _stop_flag(false), _running(false)
{}

FlowEngine::~FlowEngine()
{
    stop();
}

std::optional<FLOW_COMMON_TYPES::SessionId> FlowEngine::ingest(const PacketEvent& packet)
{
    return _session_table.ingest(packet);
}

void FlowEngine::start()
{
    std::lock_guard lock(_control_mutex);
    if (_running)
    {
        return;
    }
    _source.open();
    _stop_flag = false;
    _ingest_thread = std::thread(&FlowEngine::runIngestThread, this);
    _sweeper.start();
    _started_at = std::chrono::steady_clock::now();
    _running = true;
    FlowLogger::getInstance().info("Flow engine started");
}

void FlowEngine::stop()
{
    std::lock_guard lock(_control_mutex);
    if (!_running)
    {
        return;
    }
    _stop_flag = true;
    if (_ingest_thread.joinable())
    {
        _ingest_thread.join();
    }
    _sweeper.stop();
    _source.close();
    _running = false;
    FlowLogger::getInstance().info("Flow engine stopped, " + std::to_string(_session_table.size()) + " live sessions");
}

bool FlowEngine::isRunning() const
{
    return _running;
}

std::size_t FlowEngine::sweepNow(const FLOW_COMMON_TYPES::Timestamp now)
{
    return _sweeper.sweepOnce(now);
}

TrafficSummary FlowEngine::summary() const
{
    TrafficSummary summary = _publisher.summary();
    summary.interface = _source.getInterfaceName();

    std::lock_guard lock(_control_mutex);
    summary.running = _running;
    if (_running)
    {
        summary.uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - _started_at);
    }
    return summary;
}

SnapshotPublisher& FlowEngine::getPublisher()
{
    return _publisher;
}

const SessionTable& FlowEngine::getSessionTable() const
{
    return _session_table;
}

const StatisticsAggregator& FlowEngine::getAggregator() const
{
    return _aggregator;
}

const MonitorSettings& FlowEngine::getSettings() const
{
    return _settings;
}

void FlowEngine::runIngestThread()
{
    const std::chrono::milliseconds poll_timeout(Config::CAPTURE_POLL_TIMEOUT);
    while (!_stop_flag)
    {
        try {
            const std::optional<PacketEvent> packet = _source.nextPacket(poll_timeout);
            if (packet)
            {
                ingest(*packet);
            }
        } catch (const std::exception& e) {
            FlowLogger::getInstance().error(std::string("Ingestion error: ") + e.what());
        }
    }
}
