#pragma once

#include "convmem/capture/ErrorTypes.h"
#include "convmem/capture/utils/HttpTypes.h"

#include <mutex>
#include <optional>
#include <string>

namespace convmem::capture {

/**
 * @brief 错误识别与结构化日志
 *
 * 由 SessionManager 持有一份，按引用共享给会话与各网关；log() 可并发调用，每条日志整行输出。
 */
class ErrorHandler {
public:
    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Info};
        bool enabled{true};
    };

    ErrorHandler() = default;
    explicit ErrorHandler(LoggerConfig cfg);

    void setLoggerConfig(LoggerConfig cfg);
    LoggerConfig getLoggerConfig() const;

    // ========== 识别/解析 ==========
    static ErrorType mapHttpStatusToErrorType(int statusCode, const std::string& transportError = "");

    // 从 HttpResponse 生成 ErrorInfo（会尝试解析 body 的 API 错误 JSON）
    static ErrorInfo fromHttpResponse(
        const utils::HttpResponse& resp,
        const std::optional<utils::HttpRequest>& req = std::nullopt);

    // 解析 {"error": {"message": ...}} 或 {"detail": "..."} 形式的错误体；非此形式返回 nullopt
    static std::optional<ErrorInfo> parseApiErrorJson(const nlohmann::json& root, int httpStatusCode = 0);

    // ========== 日志 ==========
    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    bool isEnabled(LogLevel level) const;

    static const char* logLevelToString(LogLevel level);

    // "error" / "warn" / "warning" / "info" / "debug"（不区分大小写）
    static std::optional<LogLevel> parseLogLevel(const std::string& text);

private:
    mutable std::mutex m_mu;
    LoggerConfig m_loggerCfg;
};

} // namespace convmem::capture
