#pragma once

#include "convmem/capture/AudioCaptureBridge.h"
#include "convmem/capture/ErrorHandler.h"
#include "convmem/capture/ErrorTypes.h"
#include "convmem/capture/NameDetector.h"
#include "convmem/capture/TranscriptBuffer.h"
#include "convmem/capture/audio/MicrophoneDevice.h"
#include "convmem/capture/gateways/AnalysisGateway.h"
#include "convmem/capture/gateways/PersistenceGateway.h"
#include "convmem/capture/gateways/TranscriptionGateway.h"
#include "convmem/capture/types/SessionTypes.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace convmem::capture {

/**
 * @brief 单个对话采集会话
 *
 * 生命周期：Created → Starting → Running → Stopping → Stopped，启动失败进入 Failed。
 *
 * 线程模型：
 * - run() 在会话专属线程上执行，驱动私有的 io_context（发送管线、接收管线、关闭超时都在其上）；
 * - 麦克风回调在音频驱动线程上，只经由 AudioCaptureBridge 入队；
 * - stop()/statistics()/recentTranscripts() 可在任意线程调用。
 *
 * 必须由 std::shared_ptr 持有（异步回调通过 shared_from_this 保活）。
 */
class ConversationSession : public std::enable_shared_from_this<ConversationSession> {
public:
    struct Identity {
        std::string sessionId;
        std::int64_t userId{0};
        std::int64_t partnerId{0};
        std::int64_t conversationId{0};
    };

    struct Options {
        gateways::TranscriptionOptions transcription;
        audio::MicrophoneConfig microphone;
        TranscriptBuffer::Config transcript;
        NameDetector::Config nameDetector;
        std::size_t maxQueuedFrames{1200};
        std::string sender{"user"};
        std::chrono::milliseconds closeTimeout{3000};
    };

    struct Dependencies {
        std::unique_ptr<gateways::PersistenceGateway> persistence;
        std::shared_ptr<gateways::TranscriptionGateway> transcription;
        std::shared_ptr<gateways::AnalysisGateway> analysis;
        std::unique_ptr<audio::MicrophoneDevice> microphone;
    };

    // 完整转写的来源
    enum class TranscriptSource {
        BufferedLines,     // 内存中保留的时间戳行
        PersistedMessages, // 内存为空时，回退到已持久化的消息
        Empty
    };

    struct CompiledTranscript {
        TranscriptSource source{TranscriptSource::Empty};
        std::string text;
    };

    ConversationSession(Identity identity, Options options, Dependencies deps, const ErrorHandler& logger);
    ~ConversationSession();

    ConversationSession(const ConversationSession&) = delete;
    ConversationSession& operator=(const ConversationSession&) = delete;

    /**
     * @brief 会话线程主体：打开麦克风、连接转写服务、运行事件循环直到两条管线结束
     *
     * 若 stop() 先于 run() 被调用，直接返回。
     */
    void run();

    /**
     * @brief 等待会话离开 Created/Starting
     * @return 超时返回 false
     */
    bool waitForStartup(std::chrono::milliseconds timeout) const;

    /**
     * @brief 停止会话并定稿对话记录（幂等）
     *
     * 顺序：置 is_running=false → 释放麦克风 → 推入 sentinel → 请求关闭转写流
     * → 编译完整转写并写回对话 → 触发分析（转写非空时）→ 释放持久化句柄 → Stopped。
     * 不等待会话线程退出，由调用方负责 join。
     */
    void stop();

    types::SessionState state() const { return m_state.load(std::memory_order_acquire); }
    bool isRunning() const { return m_isRunning.load(std::memory_order_acquire); }

    types::SessionStats statistics() const;
    std::vector<types::TranscriptEntry> recentTranscripts(std::size_t maxLines) const;
    std::size_t transcriptCount() const { return m_transcript.recentCount(); }
    std::optional<std::string> detectedPartnerName() const;

    // 最近一次导致 Failed 的错误
    std::optional<ErrorInfo> lastError() const;

    const std::string& sessionId() const { return m_identity.sessionId; }
    std::int64_t conversationId() const { return m_identity.conversationId; }
    const Identity& identity() const { return m_identity; }

    static const char* transcriptSourceToString(TranscriptSource source);

    // "{ISO 时间} [{发送方首字母大写}]: {内容}"，逐行连接
    static std::string compileFromMessages(const std::vector<types::MessageRecord>& messages);

private:
    // 启动
    bool openMicrophone(ErrorInfo* err);
    void startTranscription();
    void onConnected(const std::optional<ErrorInfo>& err);
    void driveLoop();

    // 发送管线
    void doTakeFrame();
    void onFrameTaken(AudioFrame frame);
    void onFrameSent(const std::optional<ErrorInfo>& err);

    // 接收管线
    void doRead();
    void onRead(const std::optional<ErrorInfo>& err, const std::string& message);
    void handleFragment(const gateways::TranscriptFragment& fragment);
    void saveMessage(const std::string& text, std::chrono::system_clock::time_point at);
    void detectPartnerName(const std::string& text);

    // 停机
    void fail(ErrorInfo err);
    void shutdownPipelines(bool loopStarted);
    void markEndedLocked();
    void closeStreamOnLoop();
    void releaseMicrophone();
    void finalizeConversation();
    CompiledTranscript compileFullTranscript();

    void onMicrophoneData(const void* pcm, std::size_t bytes);
    double elapsedSeconds() const;
    void setState(types::SessionState s);

    Identity m_identity;
    Options m_options;
    const ErrorHandler& m_logger;

    // 先于所有绑定到它的对象构造、后于它们析构
    boost::asio::io_context m_ioc;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_workGuard;
    boost::asio::steady_timer m_closeTimer;

    AudioCaptureBridge m_bridge;
    TranscriptBuffer m_transcript;
    NameDetector m_nameDetector;

    // 仅在事件循环线程访问
    std::shared_ptr<gateways::TranscriptionStream> m_stream;
    bool m_closeRequested{false};

    std::shared_ptr<gateways::TranscriptionGateway> m_transcription;
    std::shared_ptr<gateways::AnalysisGateway> m_analysis;

    std::mutex m_persistenceMu;
    std::unique_ptr<gateways::PersistenceGateway> m_persistence;

    std::mutex m_micMu;
    std::unique_ptr<audio::MicrophoneDevice> m_microphone;
    bool m_micOpen{false};

    mutable std::mutex m_stateMu;
    mutable std::condition_variable m_stateCv;
    std::atomic<types::SessionState> m_state{types::SessionState::Created};
    bool m_loopStarted{false};
    std::optional<ErrorInfo> m_lastError;

    std::atomic<bool> m_isRunning{false};
    std::atomic<bool> m_finalized{false};
    std::atomic<std::int64_t> m_startedAtNs{0};
    std::atomic<std::int64_t> m_endedAtNs{0};
    std::atomic<std::uint64_t> m_messageCount{0};
    std::atomic<std::uint64_t> m_audioSent{0};

    mutable std::mutex m_nameMu;
    std::optional<std::string> m_detectedName;
};

} // namespace convmem::capture
