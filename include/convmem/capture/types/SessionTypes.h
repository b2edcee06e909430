#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace convmem::capture::types {

/**
 * @brief 会话状态机
 *
 * Created → Starting → Running → Stopping → Stopped；Starting/Running 出现不可恢复错误时进入 Failed。
 * Stopped 与 Failed 为终态。
 */
enum class SessionState {
    Created,
    Starting,
    Running,
    Stopping,
    Stopped,
    Failed
};

inline const char* sessionStateToString(SessionState s) {
    switch (s) {
        case SessionState::Created: return "created";
        case SessionState::Starting: return "starting";
        case SessionState::Running: return "running";
        case SessionState::Stopping: return "stopping";
        case SessionState::Stopped: return "stopped";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

inline bool isTerminal(SessionState s) {
    return s == SessionState::Stopped || s == SessionState::Failed;
}

/**
 * @brief 会话的公开统计（只读快照）
 */
struct SessionStats {
    std::string sessionId;
    std::int64_t userId{0};
    std::int64_t partnerId{0};
    std::int64_t conversationId{0};
    SessionState state{SessionState::Created};
    bool isRunning{false};
    double elapsedSeconds{0.0};
    std::string elapsedFormatted{"00:00:00"};
    std::uint64_t messageCount{0};
    std::uint64_t transcriptCount{0};
    std::uint64_t audioChunksEnqueued{0};
    std::uint64_t audioChunksSent{0};
    std::uint64_t audioChunksDropped{0};
    std::optional<std::string> detectedPartnerName;

    nlohmann::json toJson() const {
        nlohmann::json j{
            {"session_id", sessionId},
            {"user_id", userId},
            {"partner_id", partnerId},
            {"conversation_id", conversationId},
            {"state", sessionStateToString(state)},
            {"is_running", isRunning},
            {"elapsed_seconds", elapsedSeconds},
            {"elapsed_formatted", elapsedFormatted},
            {"message_count", messageCount},
            {"transcript_count", transcriptCount},
            {"audio_chunks_enqueued", audioChunksEnqueued},
            {"audio_chunks_sent", audioChunksSent},
            {"audio_chunks_dropped", audioChunksDropped},
        };
        j["detected_partner_name"] = detectedPartnerName ? nlohmann::json(*detectedPartnerName) : nlohmann::json(nullptr);
        return j;
    }
};

/**
 * @brief "最近转写"环形缓冲中的一条原始记录
 */
struct TranscriptEntry {
    std::string timestamp;     // HH:MM:SS（相对会话开始）
    double elapsedSeconds{0.0};
    std::string text;
    std::string datetime;      // ISO-8601 UTC 墙钟时间

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"timestamp", timestamp},
            {"elapsed_seconds", elapsedSeconds},
            {"text", text},
            {"datetime", datetime},
        };
    }
};

/**
 * @brief recent transcripts 查询结果
 */
struct RecentTranscripts {
    std::string sessionId;
    std::vector<TranscriptEntry> entries;
    std::size_t totalCount{0};
    std::optional<std::string> detectedPartnerName;

    nlohmann::json toJson() const {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& e : entries) arr.push_back(e.toJson());
        nlohmann::json j{
            {"session_id", sessionId},
            {"transcripts", arr},
            {"total_count", totalCount},
        };
        j["detected_partner_name"] = detectedPartnerName ? nlohmann::json(*detectedPartnerName) : nlohmann::json(nullptr);
        return j;
    }
};

/**
 * @brief 持久化的消息记录
 */
struct MessageRecord {
    std::int64_t id{0};
    std::int64_t conversationId{0};
    std::string sender;
    std::string content;
    std::chrono::system_clock::time_point timestamp{};
};

/**
 * @brief 持久化的会话（conversation）记录
 */
struct ConversationRecord {
    std::int64_t id{0};
    std::int64_t userId{0};
    std::int64_t partnerId{0};
    std::string title;
    bool isAnalyzed{false};
    std::chrono::system_clock::time_point startedAt{};
    std::optional<std::chrono::system_clock::time_point> endedAt;
    std::optional<std::string> fullTranscript;
};

// 秒数 -> HH:MM:SS
inline std::string formatElapsed(double seconds) {
    const auto total = seconds > 0.0 ? static_cast<long long>(seconds) : 0LL;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", total / 3600, (total % 3600) / 60, total % 60);
    return buf;
}

// system_clock -> ISO-8601 UTC（毫秒精度，形如 2024-05-01T12:00:00.123Z）
inline std::string formatIsoUtc(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    long long frac = ms % 1000;
    if (frac < 0) {
        frac += 1000;
        secs -= 1;
    }
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &secs);
#else
    gmtime_r(&secs, &tm);
#endif
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return buf;
}

} // namespace convmem::capture::types
