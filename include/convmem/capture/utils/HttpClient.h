#pragma once

#include "HttpTypes.h"

#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// 前向声明，避免包含整个httplib.h头文件
namespace httplib {
    class Client;
}

namespace convmem::capture::utils {

/**
 * @brief 基于cpp-httplib的单次请求客户端
 *
 * 请求在内部工作线程上发送，不做重试。底层客户端按 scheme://host[:port] 缓存以复用连接。
 *
 * ```
 * HttpClient client("https://analysis.example.com");
 * client.setDefaultHeader("Authorization", "Bearer ...");
 * auto req = client.makeRequest(HttpMethod::POST, "/api/conversations/42/analyze");
 * req.body = R"({"conversation_id":42})";
 * auto fut = client.executeAsync(req, [](const HttpResponse& r) { ... });
 * ```
 */
class HttpClient {
public:
    explicit HttpClient(const std::string& baseUrl = "", size_t workerThreads = 1);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void setDefaultHeader(const std::string& key, const std::string& value);

    /**
     * @brief 设置读超时（毫秒）；已缓存的底层客户端作废
     */
    void setTimeout(int timeoutMs);

    const std::string& baseUrl() const { return m_baseUrl; }

    /**
     * @brief 构造请求：拼接 baseUrl，带上默认头与超时
     */
    HttpRequest makeRequest(HttpMethod method, const std::string& path) const;

    /**
     * @brief 在工作线程上发送；callback 也在该线程上调用
     *
     * 析构时会等待已提交的请求完成，返回的 future 总会就绪。
     */
    std::future<HttpResponse> executeAsync(const HttpRequest& request,
                                           std::function<void(const HttpResponse&)> callback = nullptr);

    friend class HttpClientTestAccessor;

private:
    std::shared_ptr<httplib::Client> clientFor(const std::string& url);
    HttpResponse send(const HttpRequest& request);
    std::string joinUrl(const std::string& path) const;
    std::map<std::string, std::string> withDefaultHeaders(
        const std::map<std::string, std::string>& requestHeaders) const;

    void workerLoop();

    std::string m_baseUrl;
    std::map<std::string, std::string> m_defaultHeaders;
    int m_timeoutMs{30000};
    int m_connectTimeoutMs{10000};

    mutable std::mutex m_clientMutex;
    std::map<std::string, std::shared_ptr<httplib::Client>> m_clients;

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    bool m_stopping{false};
};

} // namespace convmem::capture::utils
