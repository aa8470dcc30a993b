#pragma once
#include <atomic>
#include <mutex>
#include <thread>
#include "BoundedQueue.hpp"
#include "EvictionSweeper.hpp"
#include "MonitorSettings.hpp"
#include "PacketSource.hpp"
#include "SessionTable.hpp"
#include "SnapshotPublisher.hpp"
#include "StatisticsAggregator.hpp"

// Owns the whole tracking pipeline. The packet source is owned by the caller and must outlive the engine.
class FlowEngine
{
private:
    MonitorSettings _settings;
    PacketSource& _source;
    StatisticsAggregator _aggregator;
    BoundedQueue<Session> _finalized_queue;
    SessionTable _session_table;
    EvictionSweeper _sweeper;
    SnapshotPublisher _publisher;

    std::atomic<bool> _stop_flag;
    std::atomic<bool> _running;
    std::thread _ingest_thread;
    std::chrono::steady_clock::time_point _started_at;
    mutable std::mutex _control_mutex;

    void runIngestThread();

public:
    FlowEngine(const MonitorSettings& settings, PacketSource& source);
    ~FlowEngine();
    FlowEngine(const FlowEngine&) = delete;
    FlowEngine& operator=(const FlowEngine&) = delete;

    // Synchronous ingestion path, used by the ingestion thread and by replays
    std::optional<FLOW_COMMON_TYPES::SessionId> ingest(const PacketEvent& packet);

    // Both are no-ops when the engine is already in the requested state
    void start();
    void stop();
    bool isRunning() const;

    std::size_t sweepNow(FLOW_COMMON_TYPES::Timestamp now);

    // Publisher summary plus the capture interface, running flag and uptime of the current run
    TrafficSummary summary() const;

    SnapshotPublisher& getPublisher();
    const SessionTable& getSessionTable() const;
    const StatisticsAggregator& getAggregator() const;
    const MonitorSettings& getSettings() const;
};
