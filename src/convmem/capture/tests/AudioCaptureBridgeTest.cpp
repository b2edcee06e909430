#include "convmem/capture/AudioCaptureBridge.h"

#include <gtest/gtest.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

using namespace convmem::capture;
using namespace std::chrono_literals;

static std::vector<std::uint8_t> bytes(std::initializer_list<std::uint8_t> b) {
    return std::vector<std::uint8_t>(b);
}

TEST(AudioCaptureBridgeTests, AsyncTakeDeliversInEnqueueOrder) {
    boost::asio::io_context ioc;
    AudioCaptureBridge bridge(ioc);

    for (std::uint8_t i = 1; i <= 5; ++i) {
        const std::uint8_t pcm[2] = {i, i};
        ASSERT_TRUE(bridge.enqueue(pcm, sizeof(pcm)));
    }

    std::vector<std::uint8_t> order;
    std::function<void()> takeNext = [&]() {
        bridge.asyncTake([&](AudioFrame f) {
            if (f.sentinel) return;
            order.push_back(f.pcm.at(0));
            takeNext();
        });
    };
    takeNext();
    bridge.pushSentinel();
    ioc.run();

    EXPECT_EQ(order, (std::vector<std::uint8_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(bridge.enqueuedCount(), 5u);
}

TEST(AudioCaptureBridgeTests, PendingTakeCompletesOnLoopWhenFrameArrives) {
    boost::asio::io_context ioc;
    AudioCaptureBridge bridge(ioc);

    std::thread::id handlerThread;
    std::vector<std::uint8_t> got;
    bridge.asyncTake([&](AudioFrame f) {
        handlerThread = std::this_thread::get_id();
        got = f.pcm;
    });

    // 模拟音频驱动线程
    std::thread producer([&]() {
        std::this_thread::sleep_for(20ms);
        AudioFrame f;
        f.pcm = bytes({7, 8});
        bridge.enqueue(std::move(f));
    });

    auto guard = boost::asio::make_work_guard(ioc);
    std::thread loop([&]() { ioc.run(); });
    producer.join();

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (got.empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    guard.reset();
    loop.join();

    EXPECT_EQ(got, bytes({7, 8}));
    EXPECT_NE(handlerThread, std::this_thread::get_id());
}

TEST(AudioCaptureBridgeTests, SentinelUnblocksPendingTake) {
    boost::asio::io_context ioc;
    AudioCaptureBridge bridge(ioc);

    bool sawSentinel = false;
    bridge.asyncTake([&](AudioFrame f) { sawSentinel = f.sentinel; });
    bridge.pushSentinel();
    ioc.run();

    EXPECT_TRUE(sawSentinel);
    EXPECT_TRUE(bridge.isClosed());
}

TEST(AudioCaptureBridgeTests, EnqueueAfterCloseIsRejected) {
    boost::asio::io_context ioc;
    AudioCaptureBridge bridge(ioc);
    bridge.pushSentinel();

    const std::uint8_t pcm[1] = {1};
    EXPECT_FALSE(bridge.enqueue(pcm, 1));
    EXPECT_EQ(bridge.enqueuedCount(), 0u);

    // sentinel 取走后再 take 仍返回 sentinel
    int sentinels = 0;
    bridge.asyncTake([&](AudioFrame f) { sentinels += f.sentinel ? 1 : 0; });
    ioc.run();
    ioc.restart();
    bridge.asyncTake([&](AudioFrame f) { sentinels += f.sentinel ? 1 : 0; });
    ioc.run();
    EXPECT_EQ(sentinels, 2);
}

TEST(AudioCaptureBridgeTests, EmptyOrNullFramesIgnored) {
    boost::asio::io_context ioc;
    AudioCaptureBridge bridge(ioc);
    EXPECT_FALSE(bridge.enqueue(nullptr, 16));
    const std::uint8_t pcm[1] = {1};
    EXPECT_FALSE(bridge.enqueue(pcm, 0));
    EXPECT_EQ(bridge.size(), 0u);
}

TEST(AudioCaptureBridgeTests, BoundedQueueDropsOldest) {
    boost::asio::io_context ioc;
    AudioCaptureBridge bridge(ioc, 3);

    for (std::uint8_t i = 1; i <= 5; ++i) {
        const std::uint8_t pcm[1] = {i};
        bridge.enqueue(pcm, 1);
    }
    EXPECT_EQ(bridge.size(), 3u);
    EXPECT_EQ(bridge.droppedCount(), 2u);
    EXPECT_EQ(bridge.enqueuedCount(), 5u);

    auto f = bridge.take(100ms);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->pcm, bytes({3}));
}

TEST(AudioCaptureBridgeTests, BlockingTakeTimesOut) {
    boost::asio::io_context ioc;
    AudioCaptureBridge bridge(ioc);

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(bridge.take(30ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 25ms);

    std::thread producer([&]() {
        std::this_thread::sleep_for(10ms);
        const std::uint8_t pcm[2] = {4, 2};
        bridge.enqueue(pcm, 2);
    });
    auto f = bridge.take(2s);
    producer.join();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->pcm, bytes({4, 2}));
}

TEST(AudioCaptureBridgeTests, ConcurrentProducersPreserveCount) {
    boost::asio::io_context ioc;
    AudioCaptureBridge bridge(ioc);

    constexpr int kPerThread = 500;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&bridge, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                const std::uint8_t pcm[2] = {static_cast<std::uint8_t>(t), static_cast<std::uint8_t>(i & 0xff)};
                bridge.enqueue(pcm, 2);
            }
        });
    }
    for (auto& p : producers) p.join();

    EXPECT_EQ(bridge.enqueuedCount(), static_cast<std::uint64_t>(4 * kPerThread));
    EXPECT_EQ(bridge.size(), static_cast<std::size_t>(4 * kPerThread));
}
