#pragma once

// 会话/管理器测试用的进程内替身：麦克风、转写流、内存持久化、分析记录

#include "convmem/capture/ErrorTypes.h"
#include "convmem/capture/audio/MicrophoneDevice.h"
#include "convmem/capture/gateways/AnalysisGateway.h"
#include "convmem/capture/gateways/PersistenceGateway.h"
#include "convmem/capture/gateways/TranscriptionGateway.h"
#include "convmem/capture/types/SessionTypes.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace convmem::capture::fakes {

inline bool waitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

inline std::string finalEvent(const std::string& text) {
    return nlohmann::json{
        {"type", "Results"},
        {"is_final", true},
        {"channel", {{"alternatives", nlohmann::json::array({{{"transcript", text}, {"confidence", 0.98}}})}}},
    }.dump();
}

inline std::string interimEvent(const std::string& text) {
    return nlohmann::json{
        {"type", "Results"},
        {"is_final", false},
        {"channel", {{"alternatives", nlohmann::json::array({{{"transcript", text}}})}}},
    }.dump();
}

// ========== 麦克风 ==========

struct FakeMicrophoneState {
    std::mutex mu;
    audio::CaptureCallback callback;
    bool failOpen{false};
    int openCalls{0};
    int stopCalls{0};
    int closeCalls{0};
    bool active{false};

    // 模拟驱动线程交付一帧
    void emit(const std::vector<std::uint8_t>& pcm) {
        audio::CaptureCallback cb;
        {
            std::lock_guard<std::mutex> lk(mu);
            if (!active) return;
            cb = callback;
        }
        if (cb) cb(pcm.data(), pcm.size(), static_cast<std::uint32_t>(pcm.size() / 2));
    }
};

class FakeMicrophone : public audio::MicrophoneDevice {
public:
    explicit FakeMicrophone(std::shared_ptr<FakeMicrophoneState> st) : m_st(std::move(st)) {}

    bool open(const audio::MicrophoneConfig&, audio::CaptureCallback onData, ErrorInfo* err) override {
        std::lock_guard<std::mutex> lk(m_st->mu);
        m_st->openCalls++;
        if (m_st->failOpen) {
            setError(err, ErrorType::DeviceError, "No input device");
            return false;
        }
        m_st->callback = std::move(onData);
        m_st->active = true;
        return true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lk(m_st->mu);
        m_st->stopCalls++;
        m_st->active = false;
    }

    void close() override {
        std::lock_guard<std::mutex> lk(m_st->mu);
        m_st->closeCalls++;
        m_st->callback = nullptr;
    }

    bool isActive() const override {
        std::lock_guard<std::mutex> lk(m_st->mu);
        return m_st->active;
    }

private:
    std::shared_ptr<FakeMicrophoneState> m_st;
};

// ========== 转写流 ==========

struct FakeStreamState {
    std::mutex mu;
    std::vector<std::vector<std::uint8_t>> sent;
    std::optional<ErrorInfo> connectError;
    int failSendAt{-1}; // 第 N 次发送失败（从 0 计）
    int sendCalls{0};
    int closeCalls{0};
    int cancelCalls{0};
    bool connected{false};
    gateways::TranscriptionOptions options;

    std::size_t sentCount() {
        std::lock_guard<std::mutex> lk(mu);
        return sent.size();
    }
};

inline ErrorInfo closedError() {
    ErrorInfo e(ErrorType::NetworkError, "stream closed");
    e.details = nlohmann::json{{"category", "fake"}, {"closed", true}};
    return e;
}

class FakeTranscriptionStream : public gateways::TranscriptionStream,
                                public std::enable_shared_from_this<FakeTranscriptionStream> {
public:
    FakeTranscriptionStream(boost::asio::io_context& ioc, std::shared_ptr<FakeStreamState> st)
        : m_ioc(ioc), m_st(std::move(st)) {}

    void asyncConnect(CompletionHandler handler) override {
        auto self = shared_from_this();
        boost::asio::post(m_ioc, [self, handler]() {
            std::optional<ErrorInfo> err;
            {
                std::lock_guard<std::mutex> lk(self->m_st->mu);
                err = self->m_st->connectError;
                self->m_st->connected = !err.has_value();
            }
            handler(err);
        });
    }

    void asyncSend(Payload frame, CompletionHandler handler) override {
        auto self = shared_from_this();
        boost::asio::post(m_ioc, [self, frame, handler]() {
            std::optional<ErrorInfo> err;
            {
                std::lock_guard<std::mutex> lk(self->m_st->mu);
                const int idx = self->m_st->sendCalls++;
                if (self->m_closed) {
                    err = closedError();
                } else if (self->m_st->failSendAt >= 0 && idx >= self->m_st->failSendAt) {
                    err = ErrorInfo(ErrorType::NetworkError, "broken pipe");
                } else {
                    self->m_st->sent.push_back(*frame);
                }
            }
            handler(err);
        });
    }

    void asyncRead(ReadHandler handler) override {
        m_pendingRead = std::move(handler);
        drain();
    }

    void asyncClose(CompletionHandler handler) override {
        {
            std::lock_guard<std::mutex> lk(m_st->mu);
            m_st->closeCalls++;
        }
        m_closed = true;
        drain();
        boost::asio::post(m_ioc, [handler]() { handler(std::nullopt); });
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lk(m_st->mu);
            m_st->cancelCalls++;
        }
        m_closed = true;
        drain();
    }

    // 以下可在测试线程调用
    void pushEvent(const std::string& message) {
        auto self = shared_from_this();
        boost::asio::post(m_ioc, [self, message]() {
            self->m_inbox.push_back(message);
            self->drain();
        });
    }

    void dropConnection() {
        auto self = shared_from_this();
        boost::asio::post(m_ioc, [self]() {
            self->m_closed = true;
            self->drain();
        });
    }

private:
    void drain() {
        if (!m_pendingRead) return;
        if (!m_inbox.empty()) {
            auto h = std::move(m_pendingRead);
            m_pendingRead = nullptr;
            auto msg = std::move(m_inbox.front());
            m_inbox.pop_front();
            boost::asio::post(m_ioc, [h, msg]() { h(std::nullopt, msg); });
        } else if (m_closed) {
            auto h = std::move(m_pendingRead);
            m_pendingRead = nullptr;
            boost::asio::post(m_ioc, [h]() { h(closedError(), std::string()); });
        }
    }

    boost::asio::io_context& m_ioc;
    std::shared_ptr<FakeStreamState> m_st;
    ReadHandler m_pendingRead;
    std::deque<std::string> m_inbox;
    bool m_closed{false};
};

class FakeTranscriptionGateway : public gateways::TranscriptionGateway {
public:
    std::shared_ptr<gateways::TranscriptionStream> openStream(boost::asio::io_context& ioc,
                                                              const gateways::TranscriptionOptions& options) override {
        auto st = std::make_shared<FakeStreamState>();
        st->options = options;
        {
            std::lock_guard<std::mutex> lk(m_mu);
            st->connectError = m_connectError;
            st->failSendAt = m_failSendAt;
        }
        auto stream = std::make_shared<FakeTranscriptionStream>(ioc, st);
        std::lock_guard<std::mutex> lk(m_mu);
        m_streams.push_back(stream);
        m_states.push_back(st);
        return stream;
    }

    void failConnectWith(ErrorInfo err) {
        std::lock_guard<std::mutex> lk(m_mu);
        m_connectError = std::move(err);
    }

    void failSendAt(int idx) {
        std::lock_guard<std::mutex> lk(m_mu);
        m_failSendAt = idx;
    }

    std::size_t openedCount() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_streams.size();
    }

    std::shared_ptr<FakeTranscriptionStream> lastStream() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_streams.empty() ? nullptr : m_streams.back();
    }

    std::shared_ptr<FakeStreamState> lastState() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_states.empty() ? nullptr : m_states.back();
    }

private:
    mutable std::mutex m_mu;
    std::optional<ErrorInfo> m_connectError;
    int m_failSendAt{-1};
    std::vector<std::shared_ptr<FakeTranscriptionStream>> m_streams;
    std::vector<std::shared_ptr<FakeStreamState>> m_states;
};

// ========== 持久化 ==========

struct InMemoryStore {
    std::mutex mu;
    std::int64_t nextConversationId{1};
    std::int64_t nextMessageId{1};
    std::map<std::int64_t, types::ConversationRecord> conversations;
    std::vector<types::MessageRecord> messages;
    std::map<std::int64_t, std::string> partners;
    int partnerUpdates{0};
    int handlesOpened{0};
    bool failFactory{false};
    bool failCreate{false};
    bool failAppend{false};

    std::optional<types::ConversationRecord> conversation(std::int64_t id) {
        std::lock_guard<std::mutex> lk(mu);
        auto it = conversations.find(id);
        if (it == conversations.end()) return std::nullopt;
        return it->second;
    }

    std::size_t messageCount(std::int64_t conversationId) {
        std::lock_guard<std::mutex> lk(mu);
        return static_cast<std::size_t>(std::count_if(messages.begin(), messages.end(),
            [&](const types::MessageRecord& m) { return m.conversationId == conversationId; }));
    }

    std::string partnerName(std::int64_t partnerId) {
        std::lock_guard<std::mutex> lk(mu);
        return partners[partnerId];
    }
};

class InMemoryPersistence : public gateways::PersistenceGateway {
public:
    explicit InMemoryPersistence(std::shared_ptr<InMemoryStore> store) : m_store(std::move(store)) {}

    std::optional<std::int64_t> createConversation(std::int64_t userId, std::int64_t partnerId, const std::string& title,
                                                   TimePoint startedAt, ErrorInfo* err) override {
        std::lock_guard<std::mutex> lk(m_store->mu);
        if (m_store->failCreate) {
            setError(err, ErrorType::PersistenceError, "database is locked");
            return std::nullopt;
        }
        types::ConversationRecord c;
        c.id = m_store->nextConversationId++;
        c.userId = userId;
        c.partnerId = partnerId;
        c.title = title;
        c.startedAt = startedAt;
        m_store->conversations[c.id] = c;
        return c.id;
    }

    bool appendMessage(std::int64_t conversationId, const std::string& sender, const std::string& content,
                       TimePoint timestamp, ErrorInfo* err) override {
        std::lock_guard<std::mutex> lk(m_store->mu);
        if (m_store->failAppend) {
            setError(err, ErrorType::PersistenceError, "disk I/O error");
            return false;
        }
        types::MessageRecord m;
        m.id = m_store->nextMessageId++;
        m.conversationId = conversationId;
        m.sender = sender;
        m.content = content;
        m.timestamp = timestamp;
        m_store->messages.push_back(m);
        return true;
    }

    bool updateConversation(std::int64_t conversationId, TimePoint endedAt, const std::string& fullTranscript,
                            ErrorInfo* err) override {
        std::lock_guard<std::mutex> lk(m_store->mu);
        auto it = m_store->conversations.find(conversationId);
        if (it == m_store->conversations.end()) {
            setError(err, ErrorType::NotFound, "conversation not found");
            return false;
        }
        if (it->second.endedAt) {
            setError(err, ErrorType::PersistenceError, "conversation already finalized");
            return false;
        }
        it->second.endedAt = endedAt;
        it->second.fullTranscript = fullTranscript;
        return true;
    }

    std::optional<std::vector<types::MessageRecord>> listMessages(std::int64_t conversationId, ErrorInfo*) override {
        std::lock_guard<std::mutex> lk(m_store->mu);
        std::vector<types::MessageRecord> out;
        for (const auto& m : m_store->messages) {
            if (m.conversationId == conversationId) out.push_back(m);
        }
        std::stable_sort(out.begin(), out.end(), [](const types::MessageRecord& a, const types::MessageRecord& b) {
            return a.timestamp < b.timestamp;
        });
        return out;
    }

    std::optional<types::ConversationRecord> getConversation(std::int64_t conversationId, ErrorInfo* err) override {
        std::lock_guard<std::mutex> lk(m_store->mu);
        auto it = m_store->conversations.find(conversationId);
        if (it == m_store->conversations.end()) {
            setError(err, ErrorType::NotFound, "conversation not found");
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> getPartnerName(std::int64_t partnerId, ErrorInfo* err) override {
        std::lock_guard<std::mutex> lk(m_store->mu);
        auto it = m_store->partners.find(partnerId);
        if (it == m_store->partners.end()) {
            setError(err, ErrorType::NotFound, "partner not found");
            return std::nullopt;
        }
        return it->second;
    }

    bool updatePartnerName(std::int64_t partnerId, const std::string& name, ErrorInfo* err) override {
        std::lock_guard<std::mutex> lk(m_store->mu);
        auto it = m_store->partners.find(partnerId);
        if (it == m_store->partners.end()) {
            setError(err, ErrorType::NotFound, "partner not found");
            return false;
        }
        it->second = name;
        m_store->partnerUpdates++;
        return true;
    }

private:
    std::shared_ptr<InMemoryStore> m_store;
};

inline gateways::PersistenceFactory inMemoryFactory(std::shared_ptr<InMemoryStore> store) {
    return [store](ErrorInfo* err) -> std::unique_ptr<gateways::PersistenceGateway> {
        {
            std::lock_guard<std::mutex> lk(store->mu);
            if (store->failFactory) {
                setError(err, ErrorType::PersistenceError, "unable to open database");
                return nullptr;
            }
            store->handlesOpened++;
        }
        return std::make_unique<InMemoryPersistence>(store);
    };
}

// ========== 分析 ==========

class RecordingAnalysis : public gateways::AnalysisGateway {
public:
    void analyze(std::int64_t conversationId) override {
        std::lock_guard<std::mutex> lk(m_mu);
        m_ids.push_back(conversationId);
        if (m_throw) throw std::runtime_error("analysis service unavailable");
    }

    void throwOnAnalyze(bool v) {
        std::lock_guard<std::mutex> lk(m_mu);
        m_throw = v;
    }

    std::vector<std::int64_t> ids() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_ids;
    }

private:
    mutable std::mutex m_mu;
    std::vector<std::int64_t> m_ids;
    bool m_throw{false};
};

} // namespace convmem::capture::fakes
