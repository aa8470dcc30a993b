#include "EvictionSweeper.hpp"
#include "FlowLogger.hpp"

EvictionSweeper::EvictionSweeper(SessionTable& session_table, StatisticsAggregator& aggregator,
    BoundedQueue<Session>& finalized_queue, const std::chrono::seconds idle_threshold,
    const std::chrono::seconds sweep_interval)
    : _session_table(session_table), _aggregator(aggregator), _finalized_queue(finalized_queue),
      _idle_threshold(idle_threshold), _sweep_interval(sweep_interval), _stop_flag(true)
{}

EvictionSweeper::~EvictionSweeper()
{
    stop();
}

std::size_t EvictionSweeper::sweepOnce(const FLOW_COMMON_TYPES::Timestamp now)
{
    std::vector<Session> evicted = _session_table.evictIdle(now, _idle_threshold);
    std::size_t dropped = 0;

    for (auto& session : evicted)
    {
        _aggregator.finalizeSession(session, now);
        if (!_finalized_queue.push(std::move(session)))
        {
            dropped++;
        }
    }
    _aggregator.advanceHistory(now);

    if (!evicted.empty())
    {
        FlowLogger::getInstance().info("Evicted " + std::to_string(evicted.size()) + " idle sessions, " +
            std::to_string(_session_table.size()) + " still active");
    }
    if (dropped > 0)
    {
        FlowLogger::getInstance().warning("Finalized session buffer is full, dropped " + std::to_string(dropped) +
            " oldest sessions");
    }
    return evicted.size();
}

void EvictionSweeper::runSweepThread()
{
    while (!_stop_flag.load())
    {
        try {
            sweepOnce(std::chrono::system_clock::now());
        } catch (const std::exception& e) {
            FlowLogger::getInstance().error(std::string("Eviction sweep failed: ") + e.what());
        }

        std::unique_lock lock(_wake_mutex);
        _wake_condition.wait_for(lock, _sweep_interval, [this] { return _stop_flag.load(); });
    }
}

void EvictionSweeper::start()
{
    std::lock_guard control_lock(_control_mutex);
    if (!_stop_flag.load()) return;

    _stop_flag.store(false);
    _sweep_thread = std::thread(&EvictionSweeper::runSweepThread, this);
}

void EvictionSweeper::stop()
{
    std::lock_guard control_lock(_control_mutex);
    {
        std::lock_guard lock(_wake_mutex);
        _stop_flag.store(true);
    }
    _wake_condition.notify_all();

    if (_sweep_thread.joinable())
    {
        _sweep_thread.join();
    }
}

bool EvictionSweeper::isRunning() const
{
    return !_stop_flag.load();
}
