#include "convmem/capture/SessionManager.h"

#include <exception>
#include <utility>

namespace convmem::capture {

using LogLevel = ErrorHandler::LogLevel;

// ========== Settings ==========

SessionManager::Settings SessionManager::Settings::fromConfig(const ConfigManager& cfg) {
    Settings s;

    s.transcription.url = cfg.getString("stt.url", s.transcription.url);
    s.transcription.apiKey = cfg.getString("stt.api_key", "");
    if (ConfigManager::isUnresolvedPlaceholder(s.transcription.apiKey)) {
        s.transcription.apiKey.clear();
    }
    s.transcription.sampleRate = static_cast<std::uint32_t>(cfg.getInt("stt.sample_rate", 16000));
    s.transcription.channels = static_cast<std::uint32_t>(cfg.getInt("stt.channels", 1));
    s.transcription.encoding = cfg.getString("stt.encoding", "linear16");
    s.transcription.punctuate = cfg.getBool("stt.punctuate", true);
    s.transcription.model = cfg.getString("stt.model", "");
    s.transcription.language = cfg.getString("stt.language", "");
    s.transcription.connectTimeoutMs = static_cast<int>(cfg.getInt("stt.connect_timeout_ms", 10000));

    // 采集格式与转写协议参数保持一致
    s.microphone.sampleRate = s.transcription.sampleRate;
    s.microphone.channels = s.transcription.channels;
    s.microphone.framesPerBuffer = static_cast<std::uint32_t>(cfg.getInt("audio.frames_per_buffer", 8000));
    s.microphone.deviceName = cfg.getString("audio.device_name", "");
    s.maxQueuedFrames = static_cast<std::size_t>(cfg.getInt("audio.max_queued_frames", 1200));

    s.transcript.maxChars = static_cast<std::size_t>(cfg.getInt("transcript.max_chars", 20000));
    s.transcript.minLines = static_cast<std::size_t>(cfg.getInt("transcript.min_lines", 50));
    s.transcript.recentCapacity = static_cast<std::size_t>(cfg.getInt("transcript.recent_capacity", 100));

    s.sender = cfg.getString("session.sender", "user");
    s.startupTimeout = std::chrono::milliseconds(cfg.getInt("session.startup_timeout_ms", 1000));
    s.stopTimeout = std::chrono::milliseconds(cfg.getInt("session.stop_timeout_ms", 5000));
    s.closeTimeout = std::chrono::milliseconds(cfg.getInt("session.close_timeout_ms", 3000));
    return s;
}

// ========== 构造/析构 ==========

SessionManager::SessionManager(Settings settings,
                               gateways::PersistenceFactory persistenceFactory,
                               std::shared_ptr<gateways::TranscriptionGateway> transcription,
                               std::shared_ptr<gateways::AnalysisGateway> analysis,
                               MicrophoneFactory microphoneFactory,
                               std::shared_ptr<ErrorHandler> logger)
    : m_settings(std::move(settings))
    , m_persistenceFactory(std::move(persistenceFactory))
    , m_transcription(std::move(transcription))
    , m_analysis(std::move(analysis))
    , m_microphoneFactory(std::move(microphoneFactory))
    , m_logger(logger ? std::move(logger) : std::make_shared<ErrorHandler>())
{}

SessionManager::~SessionManager() {
    stopAll();
}

// ========== 创建 ==========

std::string SessionManager::resolveCredential(const std::string& requested) const {
    if (!requested.empty() && !ConfigManager::isUnresolvedPlaceholder(requested)) {
        return requested;
    }
    const auto& fallback = m_settings.transcription.apiKey;
    if (!fallback.empty() && !ConfigManager::isUnresolvedPlaceholder(fallback)) {
        return fallback;
    }
    return {};
}

void SessionManager::releaseReservation(const std::string& sessionId) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_pending.erase(sessionId);
}

SessionManager::Entry SessionManager::launch(std::shared_ptr<ConversationSession> session) {
    auto done = std::make_shared<std::promise<void>>();
    Entry entry;
    entry.session = session;
    entry.finished = done->get_future().share();

    // 线程持有会话与日志器的引用计数，超时 detach 后仍然安全
    auto logger = m_logger;
    entry.thread = std::thread([session = std::move(session), logger, done]() {
        try {
            session->run();
        } catch (const std::exception& e) {
            logger->log(LogLevel::Error,
                        "Session thread terminated by exception",
                        ErrorInfo(ErrorType::UnknownError, e.what()));
        }
        done->set_value();
    });
    return entry;
}

void SessionManager::joinBounded(Entry& entry, const std::string& sessionId) {
    if (!entry.thread.joinable()) {
        return;
    }
    if (entry.finished.wait_for(m_settings.stopTimeout) == std::future_status::ready) {
        entry.thread.join();
        return;
    }
    m_logger->log(LogLevel::Warning,
                  "Session " + sessionId + " thread did not exit within "
                      + std::to_string(m_settings.stopTimeout.count()) + " ms, detaching");
    entry.thread.detach();
}

std::optional<types::SessionStats> SessionManager::createSession(const SessionRequest& req, ErrorInfo* err) {
    if (req.sessionId.empty()) {
        setError(err, ErrorType::InvalidRequest, "session_id must not be empty");
        return std::nullopt;
    }

    const std::string credential = resolveCredential(req.credential);
    if (credential.empty()) {
        setError(err, ErrorType::ConfigurationError, "No transcription credential available (stt.api_key)");
        m_logger->log(LogLevel::Error, "Cannot create session " + req.sessionId + ": missing transcription credential");
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_sessions.count(req.sessionId) > 0 || m_pending.count(req.sessionId) > 0) {
            setError(err, ErrorType::DuplicateSession, "Session " + req.sessionId + " already exists");
            m_logger->log(LogLevel::Warning, "Session " + req.sessionId + " already exists");
            return std::nullopt;
        }
        m_pending.insert(req.sessionId);
    }

    // 对话记录创建成功之前不启动任何线程
    ErrorInfo perr;
    std::unique_ptr<gateways::PersistenceGateway> persistence;
    if (m_persistenceFactory) {
        persistence = m_persistenceFactory(&perr);
    } else {
        perr = ErrorInfo(ErrorType::PersistenceError, "No persistence factory configured");
    }
    std::optional<std::int64_t> conversationId;
    if (persistence) {
        conversationId = persistence->createConversation(
            req.userId, req.partnerId, "Session " + req.sessionId, std::chrono::system_clock::now(), &perr);
    }
    if (!conversationId) {
        releaseReservation(req.sessionId);
        perr.errorType = ErrorType::PersistenceError;
        m_logger->log(LogLevel::Error, "Failed to create conversation for session " + req.sessionId, perr);
        if (err) *err = perr;
        return std::nullopt;
    }

    ConversationSession::Identity identity;
    identity.sessionId = req.sessionId;
    identity.userId = req.userId;
    identity.partnerId = req.partnerId;
    identity.conversationId = *conversationId;

    ConversationSession::Options options;
    options.transcription = m_settings.transcription;
    options.transcription.apiKey = credential;
    options.microphone = m_settings.microphone;
    options.transcript = m_settings.transcript;
    options.maxQueuedFrames = m_settings.maxQueuedFrames;
    options.sender = m_settings.sender;
    options.closeTimeout = m_settings.closeTimeout;

    ConversationSession::Dependencies deps;
    deps.persistence = std::move(persistence);
    deps.transcription = m_transcription;
    deps.analysis = m_analysis;
    deps.microphone = m_microphoneFactory ? m_microphoneFactory() : nullptr;

    auto session = std::make_shared<ConversationSession>(
        std::move(identity), std::move(options), std::move(deps), *m_logger);

    Entry entry = launch(session);

    if (!session->waitForStartup(m_settings.startupTimeout)) {
        m_logger->log(LogLevel::Warning,
                      "Session " + req.sessionId + " still starting after "
                          + std::to_string(m_settings.startupTimeout.count()) + " ms");
    }

    if (session->state() == types::SessionState::Failed) {
        const auto failure = session->lastError();
        if (failure && failure->errorType == ErrorType::DeviceError) {
            joinBounded(entry, req.sessionId);
            releaseReservation(req.sessionId);
            if (err) *err = *failure;
            return std::nullopt;
        }
    }

    auto stats = session->statistics();
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_pending.erase(req.sessionId);
        m_sessions.emplace(req.sessionId, std::move(entry));
    }
    m_logger->log(LogLevel::Info,
                  "Session " + req.sessionId + " created (conversation " + std::to_string(*conversationId) + ", state "
                      + types::sessionStateToString(stats.state) + ")");
    return stats;
}

// ========== 查询 ==========

std::optional<types::SessionStats> SessionManager::getSession(const std::string& sessionId, ErrorInfo* err) const {
    std::shared_ptr<ConversationSession> session;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        auto it = m_sessions.find(sessionId);
        if (it != m_sessions.end()) {
            session = it->second.session;
        }
    }
    if (!session) {
        setError(err, ErrorType::NotFound, "Session " + sessionId + " not found");
        return std::nullopt;
    }
    return session->statistics();
}

std::vector<types::SessionStats> SessionManager::listSessions() const {
    std::vector<std::shared_ptr<ConversationSession>> snapshot;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        snapshot.reserve(m_sessions.size());
        for (const auto& kv : m_sessions) {
            snapshot.push_back(kv.second.session);
        }
    }
    // 读统计时不持有注册表锁
    std::vector<types::SessionStats> out;
    out.reserve(snapshot.size());
    for (const auto& s : snapshot) {
        out.push_back(s->statistics());
    }
    return out;
}

std::optional<types::RecentTranscripts> SessionManager::recentTranscripts(const std::string& sessionId,
                                                                          std::size_t maxLines,
                                                                          ErrorInfo* err) const {
    std::shared_ptr<ConversationSession> session;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        auto it = m_sessions.find(sessionId);
        if (it != m_sessions.end()) {
            session = it->second.session;
        }
    }
    if (!session) {
        setError(err, ErrorType::NotFound, "Session " + sessionId + " not found");
        return std::nullopt;
    }

    types::RecentTranscripts r;
    r.sessionId = sessionId;
    r.entries = session->recentTranscripts(maxLines);
    r.totalCount = session->transcriptCount();
    r.detectedPartnerName = session->detectedPartnerName();
    return r;
}

std::size_t SessionManager::sessionCount() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_sessions.size();
}

bool SessionManager::hasSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_sessions.count(sessionId) > 0;
}

// ========== 停止 ==========

bool SessionManager::stopSession(const std::string& sessionId, ErrorInfo* err) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        auto it = m_sessions.find(sessionId);
        if (it == m_sessions.end()) {
            setError(err, ErrorType::NotFound, "Session " + sessionId + " not found");
            return false;
        }
        entry = std::move(it->second);
        m_sessions.erase(it);
    }

    // 已移出注册表，线程必须在此被 join 或 detach
    try {
        entry.session->stop();
    } catch (const std::exception& e) {
        m_logger->log(LogLevel::Error,
                      "Session " + sessionId + " stop raised an exception",
                      ErrorInfo(ErrorType::UnknownError, e.what()));
    }
    joinBounded(entry, sessionId);

    const auto stats = entry.session->statistics();
    m_logger->log(LogLevel::Info,
                  "Session " + sessionId + " removed (" + std::to_string(stats.messageCount) + " messages, "
                      + stats.elapsedFormatted + ")");
    return true;
}

std::size_t SessionManager::stopAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        for (const auto& kv : m_sessions) {
            ids.push_back(kv.first);
        }
    }

    std::size_t stopped = 0;
    for (const auto& id : ids) {
        try {
            ErrorInfo err;
            if (stopSession(id, &err)) {
                ++stopped;
            } else {
                m_logger->log(LogLevel::Warning, "Stop of session " + id + " skipped", err);
            }
        } catch (const std::exception& e) {
            m_logger->log(LogLevel::Error,
                          "Failed to stop session " + id,
                          ErrorInfo(ErrorType::UnknownError, e.what()));
        }
    }
    return stopped;
}

} // namespace convmem::capture
