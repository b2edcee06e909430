#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace convmem::capture {

/**
 * @brief 统一错误类型
 */
enum class ErrorType {
    ConfigurationError, // 缺少转写凭据等配置问题
    DeviceError,        // 麦克风不可用
    NetworkError,       // 连接/流式传输失败
    PersistenceError,   // 会话/消息写入失败
    DuplicateSession,   // 会话ID已注册
    NotFound,           // 会话不存在
    InvalidRequest,     // 请求错误（400/401/403等）
    RateLimitError,     // 限流错误（429）
    ServerError,        // 服务器错误（5xx）
    TimeoutError,       // 超时（408 或本地超时）
    UnknownError        // 未知错误
};

/**
 * @brief 结构化错误信息
 */
struct ErrorInfo {
    ErrorType errorType{ErrorType::UnknownError};
    int errorCode{0}; // HTTP status 或内部错误码（0 表示无/未知）
    std::string message;
    std::optional<nlohmann::json> details;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::optional<std::map<std::string, std::string>> context;

    ErrorInfo() = default;
    ErrorInfo(ErrorType type, std::string msg, int code = 0)
        : errorType(type), errorCode(code), message(std::move(msg)) {}

    static const char* errorTypeToString(ErrorType t) {
        switch (t) {
            case ErrorType::ConfigurationError: return "ConfigurationError";
            case ErrorType::DeviceError: return "DeviceError";
            case ErrorType::NetworkError: return "NetworkError";
            case ErrorType::PersistenceError: return "PersistenceError";
            case ErrorType::DuplicateSession: return "DuplicateSession";
            case ErrorType::NotFound: return "NotFound";
            case ErrorType::InvalidRequest: return "InvalidRequest";
            case ErrorType::RateLimitError: return "RateLimitError";
            case ErrorType::ServerError: return "ServerError";
            case ErrorType::TimeoutError: return "TimeoutError";
            default: return "UnknownError";
        }
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["error_type"] = errorTypeToString(errorType);
        j["error_code"] = errorCode;
        j["message"] = message;
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
        j["timestamp_ms"] = ms;
        if (details.has_value()) j["details"] = details.value();
        if (context.has_value()) j["context"] = context.value();
        return j;
    }

    std::string toString() const {
        return toJson().dump();
    }
};

/**
 * @brief 写入可选的错误输出参数（err 为空时忽略）
 */
inline void setError(ErrorInfo* err, ErrorType type, const std::string& message, int code = 0) {
    if (!err) return;
    err->errorType = type;
    err->errorCode = code;
    err->message = message;
    err->timestamp = std::chrono::system_clock::now();
}

} // namespace convmem::capture
