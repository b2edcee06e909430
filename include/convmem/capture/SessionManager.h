#pragma once

#include "convmem/capture/ConfigManager.h"
#include "convmem/capture/ConversationSession.h"
#include "convmem/capture/ErrorHandler.h"
#include "convmem/capture/ErrorTypes.h"
#include "convmem/capture/audio/MicrophoneDevice.h"
#include "convmem/capture/gateways/AnalysisGateway.h"
#include "convmem/capture/gateways/PersistenceGateway.h"
#include "convmem/capture/gateways/TranscriptionGateway.h"
#include "convmem/capture/types/SessionTypes.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace convmem::capture {

/**
 * @brief 创建会话的请求参数
 */
struct SessionRequest {
    std::string sessionId;
    std::int64_t userId{0};
    std::int64_t partnerId{0};
    std::string credential; // 转写服务凭据；为空时使用配置中的 stt.api_key
};

/**
 * @brief 活动会话注册表与同步控制面
 *
 * 每个会话运行在独立线程（私有事件循环）上。注册表由单把互斥锁保护；
 * 创建等待"麦克风就绪"、停止等待线程退出，两者都有上限。
 * 对外只返回 SessionStats 等纯数据，不暴露内部句柄。
 */
class SessionManager {
public:
    struct Settings {
        gateways::TranscriptionOptions transcription;
        audio::MicrophoneConfig microphone;
        TranscriptBuffer::Config transcript;
        std::size_t maxQueuedFrames{1200};
        std::string sender{"user"};
        std::chrono::milliseconds startupTimeout{1000};
        std::chrono::milliseconds stopTimeout{5000};
        std::chrono::milliseconds closeTimeout{3000};

        static Settings fromConfig(const ConfigManager& cfg);
    };

    // 每个会话独占一个麦克风实例
    using MicrophoneFactory = std::function<std::unique_ptr<audio::MicrophoneDevice>()>;

    SessionManager(Settings settings,
                   gateways::PersistenceFactory persistenceFactory,
                   std::shared_ptr<gateways::TranscriptionGateway> transcription,
                   std::shared_ptr<gateways::AnalysisGateway> analysis,
                   MicrophoneFactory microphoneFactory,
                   std::shared_ptr<ErrorHandler> logger = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief 创建并启动会话
     *
     * 失败：
     * - DuplicateSession：session_id 已注册或正在创建
     * - ConfigurationError：没有可用的转写凭据
     * - PersistenceError：无法创建对话记录（此时不启动线程）
     * - DeviceError：麦克风无法打开（会话线程已回收）
     *
     * 注册项在有界等待结束后才对其他调用可见。
     */
    std::optional<types::SessionStats> createSession(const SessionRequest& req, ErrorInfo* err = nullptr);

    std::optional<types::SessionStats> getSession(const std::string& sessionId, ErrorInfo* err = nullptr) const;

    std::vector<types::SessionStats> listSessions() const;

    /**
     * @brief 停止会话并从注册表移除
     *
     * 无论线程是否在超时内退出都会移除；未注册（包括重复 stop）返回 false 且 err 为 NotFound。
     */
    bool stopSession(const std::string& sessionId, ErrorInfo* err = nullptr);

    // 逐个停止所有会话，单个失败不影响其余；返回成功停止的数量
    std::size_t stopAll();

    std::optional<types::RecentTranscripts> recentTranscripts(const std::string& sessionId,
                                                              std::size_t maxLines = 20,
                                                              ErrorInfo* err = nullptr) const;

    std::size_t sessionCount() const;
    bool hasSession(const std::string& sessionId) const;

    const Settings& settings() const { return m_settings; }
    const ErrorHandler& logger() const { return *m_logger; }

private:
    struct Entry {
        std::shared_ptr<ConversationSession> session;
        std::thread thread;
        std::shared_future<void> finished;
    };

    Entry launch(std::shared_ptr<ConversationSession> session);
    void joinBounded(Entry& entry, const std::string& sessionId);
    std::string resolveCredential(const std::string& requested) const;
    void releaseReservation(const std::string& sessionId);

    Settings m_settings;
    gateways::PersistenceFactory m_persistenceFactory;
    std::shared_ptr<gateways::TranscriptionGateway> m_transcription;
    std::shared_ptr<gateways::AnalysisGateway> m_analysis;
    MicrophoneFactory m_microphoneFactory;
    std::shared_ptr<ErrorHandler> m_logger;

    mutable std::mutex m_mu;
    std::map<std::string, Entry> m_sessions;
    std::set<std::string> m_pending; // 正在创建、尚未注册的 session_id
};

} // namespace convmem::capture
