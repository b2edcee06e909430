#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include <boost/asio/io_context.hpp>

namespace convmem::capture {

/**
 * @brief 一帧原始 PCM；sentinel 帧不携带数据，仅用于停机时唤醒等待中的消费者
 */
struct AudioFrame {
    std::vector<std::uint8_t> pcm;
    bool sentinel{false};

    static AudioFrame makeSentinel() {
        AudioFrame f;
        f.sentinel = true;
        return f;
    }
};

/**
 * @brief 音频回调线程 → 会话事件循环的线程安全交接队列
 *
 * - enqueue()：可在音频硬件线程上调用，只做加锁入队与 post，不阻塞、不做 IO。
 * - asyncTake()：事件循环侧的"挂起直到有帧"，handler 总是经由 io_context 投递执行。
 * - take()：带超时的阻塞版本，供同步消费者使用。
 * - pushSentinel()：关闭入队并追加 sentinel，确保挂起的 take 能观察到停机。
 *
 * 帧按 enqueue 的调用顺序交付。队列有上限时丢弃最旧的帧并计数。
 */
class AudioCaptureBridge {
public:
    using TakeHandler = std::function<void(AudioFrame frame)>;

    /**
     * @param ioc 消费者所在的事件循环
     * @param maxQueuedFrames 队列上限（0 表示不限）
     */
    explicit AudioCaptureBridge(boost::asio::io_context& ioc, std::size_t maxQueuedFrames = 0);

    AudioCaptureBridge(const AudioCaptureBridge&) = delete;
    AudioCaptureBridge& operator=(const AudioCaptureBridge&) = delete;

    // 关闭后返回 false
    bool enqueue(const void* pcm, std::size_t bytes);
    bool enqueue(AudioFrame frame);

    void pushSentinel();

    // 同一时刻只允许一个挂起的 asyncTake
    void asyncTake(TakeHandler handler);

    std::optional<AudioFrame> take(std::chrono::milliseconds timeout);

    bool isClosed() const;
    std::size_t size() const;
    std::uint64_t enqueuedCount() const { return m_enqueued.load(std::memory_order_relaxed); }
    std::uint64_t droppedCount() const { return m_dropped.load(std::memory_order_relaxed); }

private:
    bool push(AudioFrame frame, bool closeAfter);

    boost::asio::io_context& m_ioc;
    std::size_t m_maxQueued;

    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    std::deque<AudioFrame> m_queue;
    TakeHandler m_pendingTake;
    bool m_closed{false};

    std::atomic<std::uint64_t> m_enqueued{0};
    std::atomic<std::uint64_t> m_dropped{0};
};

} // namespace convmem::capture
