#pragma once

#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace convmem::capture::utils {

/**
 * @brief HTTP请求方法
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * @brief HTTP请求
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeoutMs = 30000;

    void setHeader(const std::string& key, const std::string& value) {
        headers[key] = value;
    }

    std::optional<std::string> getHeader(const std::string& key) const {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }
};

/**
 * @brief HTTP响应；statusCode 为 0 表示传输层失败，原因在 error 中
 */
struct HttpResponse {
    int statusCode = 0;
    std::map<std::string, std::string> headers; // 键统一小写
    std::string body;
    std::string error;

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    std::optional<nlohmann::json> asJson(std::string* errMsg = nullptr) const {
        try {
            return nlohmann::json::parse(body);
        } catch (const nlohmann::json::exception& e) {
            if (errMsg) *errMsg = e.what();
            return std::nullopt;
        }
    }
};

} // namespace convmem::capture::utils
