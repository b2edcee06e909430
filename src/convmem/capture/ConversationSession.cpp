#include "convmem/capture/ConversationSession.h"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <map>
#include <utility>

namespace convmem::capture {

using LogLevel = ErrorHandler::LogLevel;
using types::SessionState;

namespace {

std::int64_t steadyNowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

std::string trimCopy(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string capitalizeSender(const std::string& sender) {
    std::string out = sender;
    for (size_t i = 0; i < out.size(); ++i) {
        const auto c = static_cast<unsigned char>(out[i]);
        out[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
    }
    return out;
}

} // namespace

ConversationSession::ConversationSession(Identity identity,
                                         Options options,
                                         Dependencies deps,
                                         const ErrorHandler& logger)
    : m_identity(std::move(identity))
    , m_options(std::move(options))
    , m_logger(logger)
    , m_closeTimer(m_ioc)
    , m_bridge(m_ioc, m_options.maxQueuedFrames)
    , m_transcript(m_options.transcript)
    , m_nameDetector(m_options.nameDetector)
    , m_transcription(std::move(deps.transcription))
    , m_analysis(std::move(deps.analysis))
    , m_persistence(std::move(deps.persistence))
    , m_microphone(std::move(deps.microphone))
{}

ConversationSession::~ConversationSession() {
    // 设备回调捕获了 this，析构前必须确保已停止
    releaseMicrophone();
}

// ========== 状态 ==========

void ConversationSession::setState(SessionState s) {
    {
        std::lock_guard<std::mutex> lk(m_stateMu);
        m_state.store(s, std::memory_order_release);
    }
    m_stateCv.notify_all();
}

bool ConversationSession::waitForStartup(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(m_stateMu);
    return m_stateCv.wait_for(lk, timeout, [this]() {
        const auto s = m_state.load(std::memory_order_acquire);
        return s != SessionState::Created && s != SessionState::Starting;
    });
}

std::optional<ErrorInfo> ConversationSession::lastError() const {
    std::lock_guard<std::mutex> lk(m_stateMu);
    return m_lastError;
}

std::optional<std::string> ConversationSession::detectedPartnerName() const {
    std::lock_guard<std::mutex> lk(m_nameMu);
    return m_detectedName;
}

double ConversationSession::elapsedSeconds() const {
    const auto started = m_startedAtNs.load(std::memory_order_acquire);
    if (started == 0) {
        return 0.0;
    }
    auto ended = m_endedAtNs.load(std::memory_order_acquire);
    if (ended == 0) {
        ended = steadyNowNs();
    }
    return static_cast<double>(ended - started) / 1e9;
}

types::SessionStats ConversationSession::statistics() const {
    types::SessionStats s;
    s.sessionId = m_identity.sessionId;
    s.userId = m_identity.userId;
    s.partnerId = m_identity.partnerId;
    s.conversationId = m_identity.conversationId;
    s.state = state();
    s.isRunning = isRunning();
    s.elapsedSeconds = elapsedSeconds();
    s.elapsedFormatted = types::formatElapsed(s.elapsedSeconds);
    s.messageCount = m_messageCount.load(std::memory_order_relaxed);
    s.transcriptCount = m_transcript.recentCount();
    s.audioChunksEnqueued = m_bridge.enqueuedCount();
    s.audioChunksSent = m_audioSent.load(std::memory_order_relaxed);
    s.audioChunksDropped = m_bridge.droppedCount();
    s.detectedPartnerName = detectedPartnerName();
    return s;
}

std::vector<types::TranscriptEntry> ConversationSession::recentTranscripts(std::size_t maxLines) const {
    return m_transcript.recent(maxLines);
}

// ========== 启动 ==========

void ConversationSession::run() {
    {
        std::lock_guard<std::mutex> lk(m_stateMu);
        if (m_state.load(std::memory_order_acquire) != SessionState::Created) {
            // stop() 先于线程启动
            return;
        }
        m_state.store(SessionState::Starting, std::memory_order_release);
        m_loopStarted = true;
    }
    m_stateCv.notify_all();

    m_startedAtNs.store(steadyNowNs(), std::memory_order_release);
    m_workGuard.emplace(boost::asio::make_work_guard(m_ioc));
    m_logger.log(LogLevel::Info, "Session " + m_identity.sessionId + " starting (conversation "
                                     + std::to_string(m_identity.conversationId) + ")");

    ErrorInfo micErr;
    if (openMicrophone(&micErr)) {
        m_logger.log(LogLevel::Info, "Microphone opened for session " + m_identity.sessionId);
        startTranscription();
    } else if (state() == SessionState::Starting) {
        micErr.errorType = ErrorType::DeviceError;
        fail(std::move(micErr));
    }

    driveLoop();
    m_logger.log(LogLevel::Debug, "Session " + m_identity.sessionId + " loop exited");
}

void ConversationSession::driveLoop() {
    for (;;) {
        try {
            m_ioc.run();
            break;
        } catch (const std::exception& e) {
            m_logger.log(LogLevel::Error,
                         "Unhandled exception in session loop",
                         ErrorInfo(ErrorType::UnknownError, e.what()));
        }
    }
}

bool ConversationSession::openMicrophone(ErrorInfo* err) {
    std::lock_guard<std::mutex> lk(m_micMu);
    if (state() != SessionState::Starting) {
        setError(err, ErrorType::InvalidRequest, "Session no longer starting");
        return false;
    }
    if (!m_microphone) {
        setError(err, ErrorType::DeviceError, "No microphone device available");
        return false;
    }

    // 连接建立前采集到的帧先在桥接队列中缓冲
    {
        std::lock_guard<std::mutex> stateLk(m_stateMu);
        if (m_state.load(std::memory_order_acquire) != SessionState::Starting) {
            setError(err, ErrorType::InvalidRequest, "Session no longer starting");
            return false;
        }
        m_isRunning.store(true, std::memory_order_release);
    }
    const bool ok = m_microphone->open(
        m_options.microphone,
        [this](const void* pcm, std::size_t bytes, std::uint32_t) { onMicrophoneData(pcm, bytes); },
        err);
    if (!ok) {
        m_isRunning.store(false, std::memory_order_release);
        return false;
    }
    m_micOpen = true;
    return true;
}

void ConversationSession::onMicrophoneData(const void* pcm, std::size_t bytes) {
    if (!m_isRunning.load(std::memory_order_acquire)) {
        return;
    }
    m_bridge.enqueue(pcm, bytes);
}

void ConversationSession::startTranscription() {
    if (state() != SessionState::Starting) {
        return;
    }
    if (m_transcription) {
        m_stream = m_transcription->openStream(m_ioc, m_options.transcription);
    }
    if (!m_stream) {
        fail(ErrorInfo(ErrorType::ConfigurationError, "Transcription stream could not be created"));
        return;
    }
    auto self = shared_from_this();
    m_stream->asyncConnect([self](const std::optional<ErrorInfo>& err) { self->onConnected(err); });
}

void ConversationSession::onConnected(const std::optional<ErrorInfo>& err) {
    if (err) {
        ErrorInfo e = *err;
        if (e.errorType == ErrorType::UnknownError) {
            e.errorType = ErrorType::NetworkError;
        }
        fail(std::move(e));
        return;
    }

    {
        std::lock_guard<std::mutex> lk(m_stateMu);
        if (m_state.load(std::memory_order_acquire) != SessionState::Starting) {
            // 连接期间已请求停止，关闭由 closeStreamOnLoop 负责
            return;
        }
        m_state.store(SessionState::Running, std::memory_order_release);
    }
    m_stateCv.notify_all();

    m_logger.log(LogLevel::Info, "Session " + m_identity.sessionId + " running");
    doTakeFrame();
    doRead();
}

// ========== 发送管线 ==========

void ConversationSession::doTakeFrame() {
    if (!isRunning()) {
        m_logger.log(LogLevel::Debug, "Audio sender finished for session " + m_identity.sessionId);
        return;
    }
    auto self = shared_from_this();
    m_bridge.asyncTake([self](AudioFrame frame) { self->onFrameTaken(std::move(frame)); });
}

void ConversationSession::onFrameTaken(AudioFrame frame) {
    if (frame.sentinel || !isRunning() || !m_stream) {
        m_logger.log(LogLevel::Debug, "Audio sender finished for session " + m_identity.sessionId);
        return;
    }
    auto payload = std::make_shared<const std::vector<std::uint8_t>>(std::move(frame.pcm));
    auto self = shared_from_this();
    m_stream->asyncSend(std::move(payload),
                        [self](const std::optional<ErrorInfo>& err) { self->onFrameSent(err); });
}

void ConversationSession::onFrameSent(const std::optional<ErrorInfo>& err) {
    if (err) {
        m_logger.log(LogLevel::Warning, "Audio send failed, sender stopped for session " + m_identity.sessionId, err);
        return;
    }
    m_audioSent.fetch_add(1, std::memory_order_relaxed);
    doTakeFrame();
}

// ========== 接收管线 ==========

void ConversationSession::doRead() {
    auto self = shared_from_this();
    m_stream->asyncRead([self](const std::optional<ErrorInfo>& err, std::string message) {
        self->onRead(err, message);
    });
}

void ConversationSession::onRead(const std::optional<ErrorInfo>& err, const std::string& message) {
    if (err) {
        const bool closed = err->details && err->details->value("closed", false);
        if (closed) {
            m_logger.log(LogLevel::Info, "Transcription stream closed for session " + m_identity.sessionId);
        } else {
            m_logger.log(LogLevel::Warning, "Transcription stream failed for session " + m_identity.sessionId, err);
        }
        // 连接中断后不再接收音频；已入队的帧留在队列中
        if (m_isRunning.exchange(false, std::memory_order_acq_rel)) {
            m_bridge.pushSentinel();
        }
        return;
    }

    if (auto fragment = gateways::parseTranscriptEvent(message)) {
        handleFragment(*fragment);
    }
    doRead();
}

void ConversationSession::handleFragment(const gateways::TranscriptFragment& fragment) {
    const auto now = std::chrono::system_clock::now();
    const auto entry = m_transcript.append(fragment.text, elapsedSeconds(), now);
    m_logger.log(LogLevel::Debug, "[" + entry.timestamp + "] " + entry.text);

    saveMessage(fragment.text, now);

    bool named = false;
    {
        std::lock_guard<std::mutex> lk(m_nameMu);
        named = m_detectedName.has_value();
    }
    if (!named) {
        detectPartnerName(fragment.text);
    }
}

void ConversationSession::saveMessage(const std::string& text, std::chrono::system_clock::time_point at) {
    std::lock_guard<std::mutex> lk(m_persistenceMu);
    if (!m_persistence) {
        m_logger.log(LogLevel::Debug, "Persistence released, fragment not saved");
        return;
    }
    ErrorInfo err;
    if (!m_persistence->appendMessage(m_identity.conversationId, m_options.sender, text, at, &err)) {
        m_logger.log(LogLevel::Warning, "Failed to save message, fragment skipped", err);
        return;
    }
    m_messageCount.fetch_add(1, std::memory_order_relaxed);
}

void ConversationSession::detectPartnerName(const std::string& text) {
    auto candidate = m_nameDetector.detect(text);
    if (!candidate) {
        return;
    }

    std::lock_guard<std::mutex> lk(m_persistenceMu);
    if (!m_persistence) {
        return;
    }

    ErrorInfo err;
    auto current = m_persistence->getPartnerName(m_identity.partnerId, &err);
    if (!current) {
        m_logger.log(LogLevel::Warning, "Cannot read partner " + std::to_string(m_identity.partnerId), err);
        return;
    }

    if (!equalsIgnoreCase(trimCopy(*current), *candidate)) {
        if (!m_persistence->updatePartnerName(m_identity.partnerId, *candidate, &err)) {
            m_logger.log(LogLevel::Warning, "Failed to update partner name", err);
            return;
        }
        m_logger.log(LogLevel::Info, "Partner " + std::to_string(m_identity.partnerId) + " renamed from '"
                                         + *current + "' to '" + *candidate + "'");
    }

    std::lock_guard<std::mutex> nameLk(m_nameMu);
    if (!m_detectedName) {
        m_detectedName = std::move(*candidate);
    }
}

// ========== 停机 ==========

void ConversationSession::stop() {
    bool loopStarted = false;
    {
        std::lock_guard<std::mutex> lk(m_stateMu);
        const auto s = m_state.load(std::memory_order_acquire);
        if (s == SessionState::Stopping || types::isTerminal(s)) {
            return;
        }
        markEndedLocked();
        m_state.store(SessionState::Stopping, std::memory_order_release);
        loopStarted = m_loopStarted;
    }
    m_stateCv.notify_all();
    m_logger.log(LogLevel::Info, "Stopping session " + m_identity.sessionId);

    shutdownPipelines(loopStarted);
    finalizeConversation();

    setState(SessionState::Stopped);
    m_logger.log(LogLevel::Info, "Session " + m_identity.sessionId + " stopped");
}

void ConversationSession::fail(ErrorInfo err) {
    bool loopStarted = false;
    {
        std::lock_guard<std::mutex> lk(m_stateMu);
        const auto s = m_state.load(std::memory_order_acquire);
        if (s != SessionState::Starting && s != SessionState::Running) {
            return;
        }
        if (!err.context) {
            err.context = std::map<std::string, std::string>{};
        }
        (*err.context)["session_id"] = m_identity.sessionId;
        m_lastError = err;
        markEndedLocked();
        m_state.store(SessionState::Failed, std::memory_order_release);
        loopStarted = m_loopStarted;
    }
    m_stateCv.notify_all();
    m_logger.log(LogLevel::Error, "Session " + m_identity.sessionId + " failed", err);

    shutdownPipelines(loopStarted);
    finalizeConversation();
}

void ConversationSession::markEndedLocked() {
    // 调用方持有 m_stateMu；先于状态发布，唤醒者看到的快照一致
    m_isRunning.store(false, std::memory_order_release);
    if (m_endedAtNs.load(std::memory_order_acquire) == 0) {
        m_endedAtNs.store(steadyNowNs(), std::memory_order_release);
    }
}

void ConversationSession::shutdownPipelines(bool loopStarted) {
    releaseMicrophone();
    m_bridge.pushSentinel();

    if (loopStarted) {
        auto self = shared_from_this();
        boost::asio::post(m_ioc, [self]() { self->closeStreamOnLoop(); });
    }
}

void ConversationSession::closeStreamOnLoop() {
    if (m_stream && !m_closeRequested) {
        m_closeRequested = true;
        auto self = shared_from_this();

        m_closeTimer.expires_after(m_options.closeTimeout);
        m_closeTimer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            self->m_logger.log(LogLevel::Warning,
                               "Transcription close timed out, forcing shutdown for session "
                                   + self->m_identity.sessionId);
            self->m_stream->cancel();
        });

        m_stream->asyncClose([self](const std::optional<ErrorInfo>& err) {
            if (err) {
                self->m_logger.log(LogLevel::Debug, "Transcription close completed with error", err);
            }
            self->m_closeTimer.cancel();
            self->m_stream->cancel();
        });
    }
    // 剩余的读写/关闭完成后 run() 返回
    m_workGuard.reset();
}

void ConversationSession::releaseMicrophone() {
    std::lock_guard<std::mutex> lk(m_micMu);
    if (!m_microphone || !m_micOpen) {
        return;
    }
    m_microphone->stop();
    m_microphone->close();
    m_micOpen = false;
    m_logger.log(LogLevel::Info, "Microphone released for session " + m_identity.sessionId);
}

const char* ConversationSession::transcriptSourceToString(TranscriptSource source) {
    switch (source) {
        case TranscriptSource::BufferedLines: return "buffered_lines";
        case TranscriptSource::PersistedMessages: return "persisted_messages";
        case TranscriptSource::Empty: return "empty";
    }
    return "empty";
}

std::string ConversationSession::compileFromMessages(const std::vector<types::MessageRecord>& messages) {
    std::string out;
    for (const auto& m : messages) {
        if (!out.empty()) {
            out += '\n';
        }
        out += types::formatIsoUtc(m.timestamp);
        out += " [";
        out += capitalizeSender(m.sender);
        out += "]: ";
        out += m.content;
    }
    return out;
}

ConversationSession::CompiledTranscript ConversationSession::compileFullTranscript() {
    CompiledTranscript result;
    if (!m_transcript.empty()) {
        result.source = TranscriptSource::BufferedLines;
        result.text = m_transcript.compile();
        return result;
    }
    if (!m_persistence) {
        return result;
    }

    ErrorInfo err;
    auto messages = m_persistence->listMessages(m_identity.conversationId, &err);
    if (!messages) {
        m_logger.log(LogLevel::Warning, "Cannot load messages for transcript fallback", err);
        return result;
    }
    if (!messages->empty()) {
        result.source = TranscriptSource::PersistedMessages;
        result.text = compileFromMessages(*messages);
    }
    return result;
}

void ConversationSession::finalizeConversation() {
    if (m_finalized.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    CompiledTranscript transcript;
    {
        std::lock_guard<std::mutex> lk(m_persistenceMu);
        transcript = compileFullTranscript();
        if (m_persistence) {
            ErrorInfo err;
            if (m_persistence->updateConversation(
                    m_identity.conversationId, std::chrono::system_clock::now(), transcript.text, &err)) {
                m_logger.log(LogLevel::Info,
                             "Conversation " + std::to_string(m_identity.conversationId) + " finalized ("
                                 + transcriptSourceToString(transcript.source) + ", "
                                 + std::to_string(transcript.text.size()) + " chars)");
            } else {
                m_logger.log(LogLevel::Warning, "Failed to finalize conversation", err);
            }
        }
    }

    if (m_analysis) {
        try {
            m_analysis->analyze(m_identity.conversationId);
        } catch (const std::exception& e) {
            m_logger.log(LogLevel::Warning,
                         "Analysis trigger failed",
                         ErrorInfo(ErrorType::UnknownError, e.what()));
        }
    }

    std::lock_guard<std::mutex> lk(m_persistenceMu);
    m_persistence.reset();
}

} // namespace convmem::capture
