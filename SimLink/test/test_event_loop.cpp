#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "../include/core/EventLoop.hpp"
#include "../include/core/INetworkIOEvents.hpp"
#include "../include/core/ThreadPool.hpp"
#include "../include/platform/UDPSocket.hpp"

using namespace SimLink::Networking;
using namespace SimLink::Threading;
using namespace std::chrono_literals;

namespace {

    template <typename Pred>
    bool RunUntil(EventLoop& loop, Pred done, std::chrono::milliseconds limit = 2000ms) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!done() && std::chrono::steady_clock::now() < deadline) {
            loop.RunOnce(10ms);
        }
        return done();
    }

    class RecordingEvents : public INetworkIOEvents {
    public:
        std::vector<std::vector<uint8_t>> datagrams;
        std::vector<NetworkEndpoint> senders;
        int errors = 0;

        void OnRawDataReceived(const NetworkEndpoint& sender, const uint8_t* data, uint32_t size) override {
            senders.push_back(sender);
            datagrams.emplace_back(data, data + size);
        }
        void OnNetworkError(const std::string&, int) override { ++errors; }
    };

} // namespace

// ---------- EventLoop ----------

TEST(EventLoopTest, OneShotTimerFiresOnce) {
    EventLoop loop;
    ASSERT_TRUE(loop.IsValid());

    int fired = 0;
    loop.ScheduleOnce(5ms, [&fired]() { ++fired; });
    ASSERT_TRUE(RunUntil(loop, [&fired]() { return fired > 0; }));
    loop.RunOnce(20ms);
    EXPECT_EQ(fired, 1);
}

TEST(EventLoopTest, RepeatingTimerCancelsItself) {
    EventLoop loop;
    int fired = 0;
    EventLoop::TimerId id = 0;
    id = loop.ScheduleRepeating(2ms, [&]() {
        if (++fired == 3) loop.CancelTimer(id);
    });

    ASSERT_TRUE(RunUntil(loop, [&fired]() { return fired >= 3; }));
    loop.RunOnce(20ms);
    EXPECT_EQ(fired, 3);
}

TEST(EventLoopTest, PostFromAnotherThread) {
    EventLoop loop;
    std::thread::id ranOn;
    bool ran = false;

    std::thread poster([&]() { loop.Post([&]() { ranOn = std::this_thread::get_id(); ran = true; }); });
    poster.join();

    ASSERT_TRUE(RunUntil(loop, [&ran]() { return ran; }));
    EXPECT_EQ(ranOn, std::this_thread::get_id());
}

TEST(EventLoopTest, StopEndsRun) {
    EventLoop loop;
    loop.ScheduleOnce(5ms, [&loop]() { loop.Stop(); });
    loop.Run();
    EXPECT_FALSE(loop.IsRunning());
}

TEST(EventLoopTest, RejectsBadReaders) {
    EventLoop loop;
    EXPECT_FALSE(loop.AddReader(-1, []() {}));
    EXPECT_FALSE(loop.AddReader(0, {}));
}

// ---------- UDPSocket ----------

TEST(UDPSocketTest, LoopbackDatagram) {
    EventLoop loop;
    RecordingEvents senderEvents;
    RecordingEvents receiverEvents;

    UDPSocket sender(loop);
    UDPSocket receiver(loop);
    ASSERT_TRUE(sender.Init("127.0.0.1", 0, &senderEvents));
    ASSERT_TRUE(receiver.Init("127.0.0.1", 0, &receiverEvents));
    ASSERT_TRUE(sender.Start());
    ASSERT_TRUE(receiver.Start());
    ASSERT_NE(receiver.GetLocalPort(), 0);

    const std::vector<uint8_t> payload{ 0x40, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x07 };
    ASSERT_TRUE(sender.SendData(NetworkEndpoint("127.0.0.1", receiver.GetLocalPort()),
        payload.data(), static_cast<uint32_t>(payload.size())));

    ASSERT_TRUE(RunUntil(loop, [&]() { return !receiverEvents.datagrams.empty(); }));
    EXPECT_EQ(receiverEvents.datagrams.front(), payload);
    EXPECT_EQ(receiverEvents.senders.front(), NetworkEndpoint("127.0.0.1", sender.GetLocalPort()));
    EXPECT_EQ(receiverEvents.errors, 0);

    receiver.Stop();
    EXPECT_FALSE(receiver.IsRunning());
    EXPECT_FALSE(receiver.SendData(NetworkEndpoint("127.0.0.1", sender.GetLocalPort()),
        payload.data(), static_cast<uint32_t>(payload.size())));
}

TEST(UDPSocketTest, OversizedDatagramIsDropped) {
    EventLoop loop;
    RecordingEvents senderEvents;
    RecordingEvents receiverEvents;

    UDPSocket sender(loop);
    UDPSocket receiver(loop, 64);
    ASSERT_TRUE(sender.Init("127.0.0.1", 0, &senderEvents));
    ASSERT_TRUE(receiver.Init("127.0.0.1", 0, &receiverEvents));
    ASSERT_TRUE(sender.Start());
    ASSERT_TRUE(receiver.Start());

    const NetworkEndpoint to("127.0.0.1", receiver.GetLocalPort());
    const std::vector<uint8_t> big(200, 0xAB);
    const std::vector<uint8_t> small{ 0x00, 0x00, 0x00, 0x00, 0x02, 0x00, 0xFF, 0xFF, 0x00, 0x01 };
    ASSERT_TRUE(sender.SendData(to, big.data(), static_cast<uint32_t>(big.size())));
    ASSERT_TRUE(sender.SendData(to, small.data(), static_cast<uint32_t>(small.size())));

    ASSERT_TRUE(RunUntil(loop, [&]() { return !receiverEvents.datagrams.empty(); }));
    loop.RunOnce(20ms);
    ASSERT_EQ(receiverEvents.datagrams.size(), 1u);
    EXPECT_EQ(receiverEvents.datagrams.front(), small);
    EXPECT_EQ(receiverEvents.errors, 0);
}

TEST(UDPSocketTest, StartWithoutInitFails) {
    EventLoop loop;
    UDPSocket socket(loop);
    EXPECT_FALSE(socket.Start());
    EXPECT_FALSE(socket.IsRunning());
}

// ---------- TaskThreadPool ----------

TEST(ThreadPoolTest, RunsTasksOffTheCallingThread) {
    TaskThreadPool pool(2, "PoolTest");
    EXPECT_EQ(pool.getThreadCount(), 2u);

    auto sum = pool.enqueue([](int a, int b) { return a + b; }, 20, 22);
    auto where = pool.enqueue([]() { return std::this_thread::get_id(); });
    EXPECT_EQ(sum.get(), 42);
    EXPECT_NE(where.get(), std::this_thread::get_id());
}

TEST(ThreadPoolTest, StopDrainsQueueAndRefusesMore) {
    TaskThreadPool pool(1);
    std::atomic<int> done{ 0 };
    for (int i = 0; i < 10; ++i) {
        pool.enqueue([&done]() { ++done; });
    }
    pool.stop();
    EXPECT_EQ(done.load(), 10);
    EXPECT_TRUE(pool.isStopped());
    EXPECT_THROW(pool.enqueue([]() {}), std::runtime_error);
    pool.stop();
}

TEST(ThreadPoolTest, ExceptionsTravelThroughFuture) {
    TaskThreadPool pool(1);
    auto f = pool.enqueue([]() -> int { throw std::logic_error("bad task"); });
    EXPECT_THROW(f.get(), std::logic_error);
}
