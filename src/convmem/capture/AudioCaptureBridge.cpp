#include "convmem/capture/AudioCaptureBridge.h"

#include <boost/asio/post.hpp>

#include <utility>

namespace convmem::capture {

AudioCaptureBridge::AudioCaptureBridge(boost::asio::io_context& ioc, std::size_t maxQueuedFrames)
    : m_ioc(ioc)
    , m_maxQueued(maxQueuedFrames)
{}

bool AudioCaptureBridge::enqueue(const void* pcm, std::size_t bytes) {
    if (pcm == nullptr || bytes == 0) {
        return false;
    }
    AudioFrame frame;
    const auto* p = static_cast<const std::uint8_t*>(pcm);
    frame.pcm.assign(p, p + bytes);
    return enqueue(std::move(frame));
}

bool AudioCaptureBridge::enqueue(AudioFrame frame) {
    frame.sentinel = false;
    return push(std::move(frame), false);
}

void AudioCaptureBridge::pushSentinel() {
    push(AudioFrame::makeSentinel(), true);
}

bool AudioCaptureBridge::push(AudioFrame frame, bool closeAfter) {
    TakeHandler handler;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_closed) {
            return false;
        }
        if (closeAfter) {
            m_closed = true;
        } else {
            m_enqueued.fetch_add(1, std::memory_order_relaxed);
        }

        if (m_pendingTake) {
            // 有挂起的消费者时队列必为空，直接交付
            handler = std::move(m_pendingTake);
            m_pendingTake = nullptr;
        } else {
            if (!frame.sentinel && m_maxQueued > 0 && m_queue.size() >= m_maxQueued) {
                m_queue.pop_front();
                m_dropped.fetch_add(1, std::memory_order_relaxed);
            }
            m_queue.push_back(std::move(frame));
        }
    }

    if (handler) {
        boost::asio::post(m_ioc, [h = std::move(handler), f = std::move(frame)]() mutable {
            h(std::move(f));
        });
    } else {
        m_cv.notify_one();
    }
    return true;
}

void AudioCaptureBridge::asyncTake(TakeHandler handler) {
    std::optional<AudioFrame> ready;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (!m_queue.empty()) {
            ready = std::move(m_queue.front());
            m_queue.pop_front();
        } else if (m_closed) {
            // sentinel 已被取走，后续 take 仍应观察到停机
            ready = AudioFrame::makeSentinel();
        } else {
            m_pendingTake = std::move(handler);
            return;
        }
    }
    boost::asio::post(m_ioc, [h = std::move(handler), f = std::move(*ready)]() mutable {
        h(std::move(f));
    });
}

std::optional<AudioFrame> AudioCaptureBridge::take(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_mu);
    if (!m_cv.wait_for(lk, timeout, [this]() { return !m_queue.empty(); })) {
        return std::nullopt;
    }
    AudioFrame frame = std::move(m_queue.front());
    m_queue.pop_front();
    return frame;
}

bool AudioCaptureBridge::isClosed() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_closed;
}

std::size_t AudioCaptureBridge::size() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_queue.size();
}

} // namespace convmem::capture
