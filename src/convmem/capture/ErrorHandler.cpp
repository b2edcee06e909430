#include "convmem/capture/ErrorHandler.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <string>

namespace convmem::capture {

static uint64_t nowEpochMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static int levelRank(ErrorHandler::LogLevel lv) {
    switch (lv) {
        case ErrorHandler::LogLevel::Error: return 0;
        case ErrorHandler::LogLevel::Warning: return 1;
        case ErrorHandler::LogLevel::Info: return 2;
        default: return 3;
    }
}

ErrorHandler::ErrorHandler(LoggerConfig cfg)
    : m_loggerCfg(cfg)
{}

void ErrorHandler::setLoggerConfig(LoggerConfig cfg) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_loggerCfg = cfg;
}

ErrorHandler::LoggerConfig ErrorHandler::getLoggerConfig() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_loggerCfg;
}

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        default: return "DEBUG";
    }
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::parseLogLevel(const std::string& text) {
    const auto low = toLowerCopy(text);
    if (low == "error") return LogLevel::Error;
    if (low == "warn" || low == "warning") return LogLevel::Warning;
    if (low == "info") return LogLevel::Info;
    if (low == "debug") return LogLevel::Debug;
    return std::nullopt;
}

ErrorType ErrorHandler::mapHttpStatusToErrorType(int statusCode, const std::string& transportError) {
    if (statusCode == 0) {
        // statusCode==0 表示传输层失败；若文案含 timeout 则归为 Timeout
        if (toLowerCopy(transportError).find("timeout") != std::string::npos) return ErrorType::TimeoutError;
        return ErrorType::NetworkError;
    }
    if (statusCode == 408) return ErrorType::TimeoutError;
    if (statusCode == 429) return ErrorType::RateLimitError;
    if (statusCode == 404) return ErrorType::NotFound;
    if (statusCode >= 500 && statusCode < 600) return ErrorType::ServerError;
    if (statusCode >= 400 && statusCode < 500) return ErrorType::InvalidRequest;
    return ErrorType::UnknownError;
}

std::optional<ErrorInfo> ErrorHandler::parseApiErrorJson(const nlohmann::json& root, int httpStatusCode) {
    if (!root.is_object()) return std::nullopt;

    ErrorInfo info;
    info.errorCode = httpStatusCode;
    info.errorType = mapHttpStatusToErrorType(httpStatusCode);

    if (root.contains("error") && root.at("error").is_object()) {
        const auto& e = root.at("error");
        if (e.contains("message") && e.at("message").is_string()) {
            info.message = e.at("message").get<std::string>();
        }
        info.details = e;
        const auto typeStr = (e.contains("type") && e.at("type").is_string())
                                 ? toLowerCopy(e.at("type").get<std::string>())
                                 : std::string();
        if (typeStr.find("rate") != std::string::npos) info.errorType = ErrorType::RateLimitError;
        if (typeStr.find("timeout") != std::string::npos) info.errorType = ErrorType::TimeoutError;
    } else if (root.contains("error") && root.at("error").is_string()) {
        info.message = root.at("error").get<std::string>();
    } else if (root.contains("detail")) {
        // FastAPI 风格：{"detail": "..."} 或 {"detail": [...]}
        const auto& d = root.at("detail");
        info.message = d.is_string() ? d.get<std::string>() : d.dump();
        info.details = d;
    } else {
        return std::nullopt;
    }

    if (info.message.empty()) info.message = "API error";
    return info;
}

ErrorInfo ErrorHandler::fromHttpResponse(const utils::HttpResponse& resp,
                                         const std::optional<utils::HttpRequest>& req) {
    ErrorInfo info;
    info.errorCode = resp.statusCode;
    info.errorType = mapHttpStatusToErrorType(resp.statusCode, resp.error);

    std::optional<nlohmann::json> parsed;
    if (!resp.body.empty()) {
        parsed = resp.asJson();
        if (parsed.has_value()) {
            auto apiInfo = parseApiErrorJson(parsed.value(), resp.statusCode);
            if (apiInfo.has_value()) {
                info = apiInfo.value();
            }
        }
    }

    // message：优先 API 错误 -> 传输层错误 -> body 片段
    if (info.message.empty()) {
        if (!resp.error.empty()) {
            info.message = resp.error;
        } else if (!resp.body.empty()) {
            info.message = resp.body.substr(0, 256);
        } else {
            info.message = "HTTP request failed";
        }
    }

    if (!info.details.has_value()) {
        nlohmann::json d;
        d["http_status"] = resp.statusCode;
        if (!resp.error.empty()) d["transport_error"] = resp.error;
        if (parsed.has_value()) {
            d["body_json"] = parsed.value();
        } else if (!resp.body.empty()) {
            d["body_snippet"] = resp.body.substr(0, 1024);
        }
        info.details = d;
    }

    // 仅记录 method/url，不记录 Authorization
    if (req.has_value()) {
        std::map<std::string, std::string> ctx;
        ctx["url"] = req->url;
        ctx["method"] = req->method == utils::HttpMethod::POST ? "POST" : "GET";
        info.context = std::move(ctx);
    }

    return info;
}

bool ErrorHandler::isEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_loggerCfg.enabled && levelRank(level) <= levelRank(m_loggerCfg.minLevel);
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    if (!isEnabled(level)) return;

    // 结构化输出到 stderr：timestamp + level + message + optional error json
    std::ostringstream oss;
    oss << "[" << nowEpochMs() << "] "
        << logLevelToString(level) << " "
        << message;
    if (err.has_value()) {
        oss << " " << err->toString();
    }
    oss << "\n";
    const auto line = oss.str();

    std::lock_guard<std::mutex> lk(m_mu);
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace convmem::capture
