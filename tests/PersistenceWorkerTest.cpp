#include <gtest/gtest.h>
#include <stdexcept>
#include "PersistenceWorker.hpp"
#include "TestPackets.hpp"

using namespace test_packets;

namespace
{
    class RecordingSink : public StorageSink
    {
    public:
        enum Behaviour { ACCEPT, REJECT, THROW };

        Behaviour behaviour = ACCEPT;
        bool available = true;
        int calls = 0;
        std::vector<Session> sessions;
        std::size_t last_ip_stats = 0;

        bool isAvailable() const override
        {
            return available;
        }

        bool persist(const std::vector<Session>& finalized_sessions, const std::vector<IpStatistic>& ip_stats) override
        {
            calls++;
            if (behaviour == THROW)
            {
                throw std::runtime_error("backend unreachable");
            }
            if (behaviour == REJECT)
            {
                return false;
            }
            sessions.insert(sessions.end(), finalized_sessions.begin(), finalized_sessions.end());
            last_ip_stats = ip_stats.size();
            return true;
        }
    };
}

class PersistenceWorkerTest : public ::testing::Test
{
protected:
    StatisticsAggregator _aggregator{std::chrono::seconds(1), 60};
    BoundedQueue<Session> _finalized_queue{100};
    SessionTable _session_table{100, _aggregator, _finalized_queue};
    SnapshotPublisher _publisher{_session_table, _aggregator, _finalized_queue};
    RecordingSink _sink;

    void resetConnection(const uint16_t port)
    {
        _session_table.ingest(tcp("10.0.0.1", port, "10.0.0.2", 80, 60, at(0), flags(true, false)));
        _session_table.ingest(tcp("10.0.0.2", 80, "10.0.0.1", port, 40, at(0), flags(false, true, false, true)));
    }
};

TEST_F(PersistenceWorkerTest, FlushHandsFinalizedSessionsToSink)
{
    PersistenceWorker worker(_publisher, _sink, std::chrono::seconds(60));
    resetConnection(5000);
    resetConnection(5001);

    EXPECT_TRUE(worker.flushOnce());
    EXPECT_EQ(_sink.sessions.size(), 2u);
    EXPECT_EQ(_sink.last_ip_stats, 2u);
    EXPECT_EQ(worker.persistedSessions(), 2u);
    EXPECT_EQ(_finalized_queue.size(), 0u);
}

TEST_F(PersistenceWorkerTest, NothingToPersistSkipsSink)
{
    PersistenceWorker worker(_publisher, _sink, std::chrono::seconds(60));

    EXPECT_TRUE(worker.flushOnce());
    EXPECT_EQ(_sink.calls, 0);
}

TEST_F(PersistenceWorkerTest, RejectedBatchIsDropped)
{
    PersistenceWorker worker(_publisher, _sink, std::chrono::seconds(60));
    _sink.behaviour = RecordingSink::REJECT;
    resetConnection(5000);

    EXPECT_FALSE(worker.flushOnce());
    EXPECT_EQ(worker.failedBatches(), 1u);
    EXPECT_EQ(worker.persistedSessions(), 0u);
    EXPECT_EQ(_finalized_queue.size(), 0u);
}

TEST_F(PersistenceWorkerTest, ThrowingSinkDoesNotEscape)
{
    PersistenceWorker worker(_publisher, _sink, std::chrono::seconds(60));
    _sink.behaviour = RecordingSink::THROW;
    resetConnection(5000);

    EXPECT_NO_THROW(EXPECT_FALSE(worker.flushOnce()));
    EXPECT_EQ(worker.failedBatches(), 1u);
}

TEST_F(PersistenceWorkerTest, StopFlushesPendingSessions)
{
    PersistenceWorker worker(_publisher, _sink, std::chrono::seconds(60));
    worker.start();
    worker.start();
    EXPECT_TRUE(worker.isRunning());

    resetConnection(5000);
    worker.stop();
    worker.stop();

    EXPECT_FALSE(worker.isRunning());
    EXPECT_EQ(_sink.sessions.size(), 1u);
    EXPECT_EQ(_sink.calls, 1);
}

TEST_F(PersistenceWorkerTest, UnavailableSinkKeepsSessionsBuffered)
{
    PersistenceWorker worker(_publisher, _sink, std::chrono::seconds(60));
    _sink.available = false;
    resetConnection(5000);
    resetConnection(5001);

    EXPECT_FALSE(worker.flushOnce());
    EXPECT_FALSE(worker.flushOnce());
    EXPECT_EQ(_sink.calls, 0);
    EXPECT_EQ(worker.failedBatches(), 0u);
    EXPECT_EQ(_finalized_queue.size(), 2u);

    _sink.available = true;
    EXPECT_TRUE(worker.flushOnce());
    EXPECT_EQ(_sink.sessions.size(), 2u);
    EXPECT_EQ(worker.persistedSessions(), 2u);
    EXPECT_EQ(_finalized_queue.size(), 0u);
}

TEST(PersistenceWorkerOutageTest, OutageDropsOldestFinalizedSessions)
{
    StatisticsAggregator aggregator(std::chrono::seconds(1), 60);
    BoundedQueue<Session> finalized_queue(2);
    SessionTable session_table(100, aggregator, finalized_queue);
    SnapshotPublisher publisher(session_table, aggregator, finalized_queue);
    RecordingSink sink;
    sink.available = false;
    PersistenceWorker worker(publisher, sink, std::chrono::seconds(60));

    for (uint16_t port = 5000; port < 5003; port++)
    {
        session_table.ingest(tcp("10.0.0.1", port, "10.0.0.2", 80, 60, at(0), flags(true, false)));
        session_table.ingest(tcp("10.0.0.2", 80, "10.0.0.1", port, 40, at(0), flags(false, true, false, true)));
        EXPECT_FALSE(worker.flushOnce());
    }
    EXPECT_EQ(finalized_queue.droppedCount(), 1u);

    sink.available = true;
    EXPECT_TRUE(worker.flushOnce());
    ASSERT_EQ(sink.sessions.size(), 2u);
    EXPECT_EQ(sink.sessions[0].initiator.port, 5001);
    EXPECT_EQ(sink.sessions[1].initiator.port, 5002);
}
