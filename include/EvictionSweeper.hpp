#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include "BoundedQueue.hpp"
#include "SessionTable.hpp"
#include "StatisticsAggregator.hpp"

class EvictionSweeper
{
private:
    SessionTable& _session_table;
    StatisticsAggregator& _aggregator;
    BoundedQueue<Session>& _finalized_queue;
    std::chrono::seconds _idle_threshold;
    std::chrono::seconds _sweep_interval;

    std::atomic<bool> _stop_flag;
    std::thread _sweep_thread;
    std::mutex _wake_mutex;
    std::condition_variable _wake_condition;
    std::mutex _control_mutex;

    void runSweepThread();

public:
    EvictionSweeper(SessionTable& session_table, StatisticsAggregator& aggregator,
                    BoundedQueue<Session>& finalized_queue, std::chrono::seconds idle_threshold,
                    std::chrono::seconds sweep_interval);
    ~EvictionSweeper();
    EvictionSweeper(const EvictionSweeper&) = delete;
    EvictionSweeper& operator=(const EvictionSweeper&) = delete;

    // One eviction cycle, returns the number of evicted sessions
    std::size_t sweepOnce(FLOW_COMMON_TYPES::Timestamp now);

    void start();
    void stop();
    bool isRunning() const;
};
