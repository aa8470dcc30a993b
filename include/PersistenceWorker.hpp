#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include "SnapshotPublisher.hpp"
#include "StorageSink.hpp"

// Periodically hands finalized sessions and address statistics to a storage sink
class PersistenceWorker
{
private:
    SnapshotPublisher& _publisher;
    StorageSink& _sink;
    std::chrono::seconds _persist_interval;

    std::atomic<bool> _stop_flag;
    std::atomic<uint64_t> _persisted_sessions;
    std::atomic<uint64_t> _failed_batches;
    std::thread _persist_thread;
    std::mutex _wake_mutex;
    std::condition_variable _wake_condition;
    std::mutex _control_mutex;
    std::mutex _flush_mutex;

    void runPersistThread();

public:
    PersistenceWorker(SnapshotPublisher& publisher, StorageSink& sink, std::chrono::seconds persist_interval);
    ~PersistenceWorker();
    PersistenceWorker(const PersistenceWorker&) = delete;
    PersistenceWorker& operator=(const PersistenceWorker&) = delete;

    // Drains the finalized queue into the sink. Nothing is drained while the sink is unavailable,
    // a batch the sink fails to store is logged and dropped.
    bool flushOnce();

    void start();
    // Flushes one last time after the thread has stopped
    void stop();
    bool isRunning() const;

    uint64_t persistedSessions() const;
    uint64_t failedBatches() const;
};
