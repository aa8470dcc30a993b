#include "PersistenceWorker.hpp"
#include "FlowLogger.hpp"

PersistenceWorker::PersistenceWorker(SnapshotPublisher& publisher, StorageSink& sink,
    const std::chrono::seconds persist_interval) : _publisher(publisher), _sink(sink),
    _persist_interval(persist_interval), _stop_flag(true), _persisted_sessions(0), _failed_batches(0)
{}

PersistenceWorker::~PersistenceWorker()
{
    stop();
}

bool PersistenceWorker::flushOnce()
{
    std::lock_guard flush_lock(_flush_mutex);
    if (!_sink.isAvailable())
    {
        // keep sessions in the bounded finalized queue until storage is back
        FlowLogger::getInstance().debug("Storage unavailable, " + std::to_string(_publisher.pendingFinalized()) +
            " finalized sessions waiting");
        return false;
    }

    const std::vector<Session> finalized_sessions = _publisher.drainFinalized();
    const std::vector<IpStatistic> ip_stats = _publisher.ipStats();
    if (finalized_sessions.empty() && ip_stats.empty())
    {
        return true;
    }

    bool persisted = false;
    try {
        persisted = _sink.persist(finalized_sessions, ip_stats);
    } catch (const std::exception& e) {
        FlowLogger::getInstance().error(std::string("Storage sink threw: ") + e.what());
    }

    if (!persisted)
    {
        _failed_batches++;
        FlowLogger::getInstance().error("Failed to persist batch, dropped " +
            std::to_string(finalized_sessions.size()) + " finalized sessions");
        return false;
    }
    _persisted_sessions += finalized_sessions.size();
    if (!finalized_sessions.empty())
    {
        FlowLogger::getInstance().debug("Persisted " + std::to_string(finalized_sessions.size()) +
            " finalized sessions");
    }
    return true;
}

void PersistenceWorker::runPersistThread()
{
    while (!_stop_flag.load())
    {
        {
            std::unique_lock lock(_wake_mutex);
            _wake_condition.wait_for(lock, _persist_interval, [this] { return _stop_flag.load(); });
        }
        if (_stop_flag.load()) break;
        try {
            flushOnce();
        } catch (const std::exception& e) {
            FlowLogger::getInstance().error(std::string("Persistence cycle failed: ") + e.what());
        }
    }
}

void PersistenceWorker::start()
{
    std::lock_guard control_lock(_control_mutex);
    if (!_stop_flag.load()) return;

    _stop_flag.store(false);
    _persist_thread = std::thread(&PersistenceWorker::runPersistThread, this);
}

void PersistenceWorker::stop()
{
    std::lock_guard control_lock(_control_mutex);
    if (_stop_flag.load() && !_persist_thread.joinable()) return;
    {
        std::lock_guard lock(_wake_mutex);
        _stop_flag.store(true);
    }
    _wake_condition.notify_all();

    if (_persist_thread.joinable())
    {
        _persist_thread.join();
    }
    flushOnce();
}

bool PersistenceWorker::isRunning() const
{
    return !_stop_flag.load();
}

uint64_t PersistenceWorker::persistedSessions() const
{
    return _persisted_sessions.load();
}

uint64_t PersistenceWorker::failedBatches() const
{
    return _failed_batches.load();
}
