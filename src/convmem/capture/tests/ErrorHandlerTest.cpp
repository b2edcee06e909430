#include "convmem/capture/ErrorHandler.h"
#include "convmem/capture/ErrorTypes.h"
#include "convmem/capture/utils/HttpTypes.h"

#include "MiniTest.h"

#include <string>
#include <vector>

using namespace convmem::capture;
using namespace convmem::capture::utils;

static HttpResponse makeResp(int statusCode, const std::string& body = "", const std::string& err = "") {
    HttpResponse r;
    r.statusCode = statusCode;
    r.body = body;
    r.error = err;
    if (!body.empty()) {
        r.headers["content-type"] = "application/json";
    }
    return r;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"status_to_error_type", []() {
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(0, "Connection refused"), ErrorType::NetworkError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(0, "Read timeout"), ErrorType::TimeoutError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(408), ErrorType::TimeoutError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(429), ErrorType::RateLimitError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(404), ErrorType::NotFound);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(400), ErrorType::InvalidRequest);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(401), ErrorType::InvalidRequest);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(500), ErrorType::ServerError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(503), ErrorType::ServerError);
        CHECK_EQ(ErrorHandler::mapHttpStatusToErrorType(302), ErrorType::UnknownError);
    }});

    tests.push_back({"parse_api_error_object", []() {
        const auto j = nlohmann::json::parse(R"({"error":{"message":"bad","type":"invalid_request_error"}})");
        auto info = ErrorHandler::parseApiErrorJson(j, 400);
        CHECK_TRUE(info.has_value());
        CHECK_EQ(info->errorCode, 400);
        CHECK_EQ(info->errorType, ErrorType::InvalidRequest);
        CHECK_EQ(info->message, std::string("bad"));
        CHECK_TRUE(info->details.has_value());
    }});

    tests.push_back({"parse_api_error_detail_and_string", []() {
        auto detail = ErrorHandler::parseApiErrorJson(nlohmann::json::parse(R"({"detail":"Conversation not found"})"), 404);
        CHECK_TRUE(detail.has_value());
        CHECK_EQ(detail->errorType, ErrorType::NotFound);
        CHECK_EQ(detail->message, std::string("Conversation not found"));

        auto plain = ErrorHandler::parseApiErrorJson(nlohmann::json::parse(R"({"error":"boom"})"), 500);
        CHECK_TRUE(plain.has_value());
        CHECK_EQ(plain->errorType, ErrorType::ServerError);
        CHECK_EQ(plain->message, std::string("boom"));

        CHECK_FALSE(ErrorHandler::parseApiErrorJson(nlohmann::json::parse(R"({"ok":true})"), 200).has_value());
        CHECK_FALSE(ErrorHandler::parseApiErrorJson(nlohmann::json::parse("[1,2]"), 500).has_value());
    }});

    tests.push_back({"from_http_response_prefers_api_message", []() {
        auto resp = makeResp(429, R"({"error":{"message":"rate limited","type":"rate_limit"}})");
        auto info = ErrorHandler::fromHttpResponse(resp);
        CHECK_EQ(info.errorType, ErrorType::RateLimitError);
        CHECK_TRUE(info.message.find("rate limited") != std::string::npos);
    }});

    tests.push_back({"from_http_response_transport_error", []() {
        HttpRequest req;
        req.method = HttpMethod::POST;
        req.url = "http://127.0.0.1:1/api/conversations/1/analyze";
        req.setHeader("Authorization", "Bearer secret");

        auto info = ErrorHandler::fromHttpResponse(makeResp(0, "", "Connection"), req);
        CHECK_EQ(info.errorType, ErrorType::NetworkError);
        CHECK_EQ(info.message, std::string("Connection"));
        CHECK_TRUE(info.context.has_value());
        CHECK_EQ(info.context->at("url"), req.url);
        CHECK_EQ(info.context->at("method"), std::string("POST"));
        CHECK_TRUE(info.toString().find("secret") == std::string::npos);
    }});

    tests.push_back({"from_http_response_plain_body_snippet", []() {
        auto info = ErrorHandler::fromHttpResponse(makeResp(502, ""));
        CHECK_EQ(info.errorType, ErrorType::ServerError);
        CHECK_EQ(info.message, std::string("HTTP request failed"));
        CHECK_EQ(info.details->at("http_status").get<int>(), 502);
    }});

    tests.push_back({"log_level_filtering", []() {
        ErrorHandler::LoggerConfig cfg;
        cfg.minLevel = ErrorHandler::LogLevel::Warning;
        ErrorHandler h(cfg);
        CHECK_TRUE(h.isEnabled(ErrorHandler::LogLevel::Error));
        CHECK_TRUE(h.isEnabled(ErrorHandler::LogLevel::Warning));
        CHECK_FALSE(h.isEnabled(ErrorHandler::LogLevel::Info));
        CHECK_FALSE(h.isEnabled(ErrorHandler::LogLevel::Debug));

        cfg.enabled = false;
        h.setLoggerConfig(cfg);
        CHECK_FALSE(h.isEnabled(ErrorHandler::LogLevel::Error));
        // 关闭时 log 为空操作
        h.log(ErrorHandler::LogLevel::Error, "suppressed");
    }});

    tests.push_back({"parse_log_level", []() {
        CHECK_TRUE(ErrorHandler::parseLogLevel("DEBUG") == ErrorHandler::LogLevel::Debug);
        CHECK_TRUE(ErrorHandler::parseLogLevel("warn") == ErrorHandler::LogLevel::Warning);
        CHECK_TRUE(ErrorHandler::parseLogLevel("Warning") == ErrorHandler::LogLevel::Warning);
        CHECK_TRUE(ErrorHandler::parseLogLevel("error") == ErrorHandler::LogLevel::Error);
        CHECK_FALSE(ErrorHandler::parseLogLevel("verbose").has_value());
        CHECK_EQ(std::string(ErrorHandler::logLevelToString(ErrorHandler::LogLevel::Info)), std::string("INFO"));
    }});

    tests.push_back({"error_info_json_shape", []() {
        ErrorInfo e(ErrorType::PersistenceError, "disk full", 13);
        e.context = std::map<std::string, std::string>{{"session_id", "s-1"}};
        const auto j = e.toJson();
        CHECK_EQ(j.at("message").get<std::string>(), std::string("disk full"));
        CHECK_EQ(j.at("error_code").get<int>(), 13);
        CHECK_EQ(j.at("context").at("session_id").get<std::string>(), std::string("s-1"));
        CHECK_EQ(std::string(ErrorInfo::errorTypeToString(ErrorType::DuplicateSession)), std::string("DuplicateSession"));
    }});

    return mini_test::run(tests);
}
