#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "FlowEngine.hpp"
#include "QueuedPacketSource.hpp"
#include "TestPackets.hpp"

using namespace test_packets;

namespace
{
    class UnavailableSource : public PacketSource
    {
    public:
        void open() override { throw std::runtime_error("interface is down"); }
        void close() override {}
        std::optional<PacketEvent> nextPacket(std::chrono::milliseconds) override { return std::nullopt; }
        std::string getInterfaceName() const override { return "down0"; }
    };

    template <typename Predicate>
    bool waitFor(Predicate predicate)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }
}

class FlowEngineTest : public ::testing::Test
{
protected:
    MonitorSettings _settings;
    QueuedPacketSource _source{1000};
};

TEST_F(FlowEngineTest, IngestIsSynchronous)
{
    FlowEngine engine(_settings, _source);
    const auto id = engine.ingest(udp("10.0.0.1", 5000, "10.0.0.2", 53, 100, at(0)));

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(engine.getPublisher().sessions().size(), 1u);
    EXPECT_EQ(engine.getPublisher().sessions().front().id, *id);
}

TEST_F(FlowEngineTest, StartAndStopAreIdempotent)
{
    FlowEngine engine(_settings, _source);
    EXPECT_FALSE(engine.isRunning());

    engine.start();
    engine.start();
    EXPECT_TRUE(engine.isRunning());

    engine.stop();
    engine.stop();
    EXPECT_FALSE(engine.isRunning());

    engine.start();
    EXPECT_TRUE(engine.isRunning());
}

TEST_F(FlowEngineTest, IngestionThreadConsumesSource)
{
    FlowEngine engine(_settings, _source);
    const auto now = std::chrono::system_clock::now();
    _source.push(udp("10.0.0.1", 5000, "10.0.0.2", 53, 100, now));
    _source.push(udp("10.0.0.2", 53, "10.0.0.1", 5000, 300, now));
    _source.push(udp("10.0.0.3", 6000, "10.0.0.2", 53, 80, now));

    engine.start();
    EXPECT_TRUE(waitFor([&engine] { return engine.getPublisher().summary().total_packets == 3; }));
    engine.stop();

    const TrafficSummary summary = engine.getPublisher().summary();
    EXPECT_EQ(summary.total_bytes, 480u);
    EXPECT_EQ(summary.live_sessions, 2u);
    EXPECT_EQ(_source.pendingPackets(), 0u);
}

TEST_F(FlowEngineTest, SummaryReportsCaptureState)
{
    FlowEngine engine(_settings, _source);
    engine.ingest(udp("10.0.0.1", 5000, "10.0.0.2", 53, 100, at(0)));

    TrafficSummary summary = engine.summary();
    EXPECT_EQ(summary.interface, Config::REPLAY_SOURCE_NAME);
    EXPECT_FALSE(summary.running);
    EXPECT_EQ(summary.uptime.count(), 0);
    EXPECT_EQ(summary.total_bytes, 100u);

    engine.start();
    summary = engine.summary();
    EXPECT_TRUE(summary.running);
    EXPECT_GE(summary.uptime.count(), 0);

    engine.stop();
    summary = engine.summary();
    EXPECT_FALSE(summary.running);
    EXPECT_EQ(summary.uptime.count(), 0);
}

TEST_F(FlowEngineTest, SweepNowUsesConfiguredIdleTimeout)
{
    _settings.session_idle_timeout = std::chrono::seconds(30);
    FlowEngine engine(_settings, _source);
    engine.ingest(udp("10.0.0.1", 5000, "10.0.0.2", 53, 100, at(0)));

    EXPECT_EQ(engine.sweepNow(at(30)), 0u);
    EXPECT_EQ(engine.sweepNow(at(31)), 1u);
    EXPECT_EQ(engine.getPublisher().drainFinalized().size(), 1u);
}

TEST_F(FlowEngineTest, CapacityComesFromSettings)
{
    _settings.max_sessions = 2;
    FlowEngine engine(_settings, _source);
    for (uint16_t port = 1; port <= 4; port++)
    {
        engine.ingest(udp("10.0.0.1", port, "10.0.0.2", 53, 10, at(0)));
    }

    EXPECT_EQ(engine.getSessionTable().size(), 2u);
    EXPECT_EQ(engine.getPublisher().summary().rejected_sessions, 2u);
}

TEST_F(FlowEngineTest, ConcurrentReadersAndSweepConserveTotals)
{
    constexpr int packet_count = 20000;
    constexpr uint32_t packet_length = 100;
    _settings.session_idle_timeout = std::chrono::seconds(1);
    _settings.finalized_buffer_capacity = packet_count;
    FlowEngine engine(_settings, _source);
    SnapshotPublisher& publisher = engine.getPublisher();

    std::atomic<bool> writer_done(false);
    std::atomic<int> written(0);
    std::vector<Session> drained;

    std::thread writer([&] {
        for (int i = 0; i < packet_count; i++)
        {
            const uint16_t port = static_cast<uint16_t>(1000 + i % 50);
            if (i % 2 == 0)
                engine.ingest(udp("10.0.0.1", port, "10.0.0.2", 53, packet_length, at(i / 100)));
            else
                engine.ingest(udp("10.0.0.2", 53, "10.0.0.1", port, packet_length, at(i / 100)));
            written++;
        }
        writer_done = true;
    });

    std::thread reader([&] {
        while (!writer_done)
        {
            publisher.sessions();
            publisher.summary();
            publisher.topIp(5, StatisticsAggregator::BY_BYTES);
            publisher.history();
            std::vector<Session> batch = publisher.drainFinalized();
            drained.insert(drained.end(), batch.begin(), batch.end());
        }
    });

    std::thread sweeper([&] {
        while (!writer_done)
        {
            // evicts everything older than the writer's current second
            engine.sweepNow(at(written.load() / 100 + 1));
        }
    });

    writer.join();
    reader.join();
    sweeper.join();

    const TrafficSummary summary = publisher.summary();
    EXPECT_EQ(summary.packets_sent, static_cast<uint64_t>(packet_count));
    EXPECT_EQ(summary.bytes_sent, static_cast<uint64_t>(packet_count) * packet_length);
    EXPECT_EQ(summary.bytes_received, summary.bytes_sent);
    EXPECT_EQ(summary.rejected_sessions, 0u);
    EXPECT_EQ(summary.dropped_finalized_sessions, 0u);

    std::vector<Session> remaining = publisher.drainFinalized();
    drained.insert(drained.end(), remaining.begin(), remaining.end());
    uint64_t session_packets = 0;
    uint64_t session_bytes = 0;
    for (const auto& session : drained)
    {
        session_packets += session.totalPackets();
        session_bytes += session.totalBytes();
    }
    for (const auto& session : publisher.sessions())
    {
        session_packets += session.totalPackets();
        session_bytes += session.totalBytes();
    }
    EXPECT_EQ(session_packets, static_cast<uint64_t>(packet_count));
    EXPECT_EQ(session_bytes, static_cast<uint64_t>(packet_count) * packet_length);
    EXPECT_LE(publisher.sessions().size(), 50u);
}

TEST(FlowEngineSourceTest, SourceFailurePropagatesFromStart)
{
    UnavailableSource source;
    FlowEngine engine(MonitorSettings{}, source);

    EXPECT_THROW(engine.start(), std::runtime_error);
    EXPECT_FALSE(engine.isRunning());
}
