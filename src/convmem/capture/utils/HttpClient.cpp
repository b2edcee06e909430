#include "convmem/capture/utils/HttpClient.h"

// 分析服务通常走 HTTPS；由构建系统定义 CPPHTTPLIB_OPENSSL_SUPPORT
#include "httplib.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace convmem::capture::utils {

namespace {

// scheme://host[:port] 与其后的路径（含 query）
std::pair<std::string, std::string> splitOrigin(const std::string& url) {
    const auto schemePos = url.find("://");
    const auto hostStart = (schemePos == std::string::npos) ? 0 : schemePos + 3;
    const auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, pathStart), url.substr(pathStart)};
}

bool hasControlChars(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return c < 0x20 || c == 0x7f; });
}

std::string lowerCase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

HttpClient::HttpClient(const std::string& baseUrl, size_t workerThreads)
    : m_baseUrl(baseUrl)
{
    m_defaultHeaders["User-Agent"] = "convmem-capture/1.0";
    const size_t count = std::max<size_t>(1, workerThreads);
    for (size_t i = 0; i < count; ++i) {
        m_workers.emplace_back([this]() { workerLoop(); });
    }
}

HttpClient::~HttpClient() {
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_stopping = true;
    }
    m_queueCv.notify_all();
    // 工作线程排空队列后退出
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void HttpClient::setDefaultHeader(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    m_defaultHeaders[key] = value;
}

void HttpClient::setTimeout(int timeoutMs) {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    m_timeoutMs = timeoutMs;
    m_clients.clear();
}

HttpRequest HttpClient::makeRequest(HttpMethod method, const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.url = joinUrl(path);
    request.headers = withDefaultHeaders({});
    std::lock_guard<std::mutex> lock(m_clientMutex);
    request.timeoutMs = m_timeoutMs;
    return request;
}

std::future<HttpResponse> HttpClient::executeAsync(const HttpRequest& request,
                                                   std::function<void(const HttpResponse&)> callback) {
    auto task = std::make_shared<std::packaged_task<HttpResponse()>>(
        [this, request, callback = std::move(callback)]() {
            HttpResponse resp = send(request);
            if (callback) callback(resp);
            return resp;
        });
    auto fut = task->get_future();

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (!m_stopping) {
            m_tasks.emplace([task]() { (*task)(); });
            m_queueCv.notify_one();
            return fut;
        }
    }
    (*task)();
    return fut;
}

std::shared_ptr<httplib::Client> HttpClient::clientFor(const std::string& url) {
    const auto origin = splitOrigin(url).first;

    std::lock_guard<std::mutex> lock(m_clientMutex);
    auto& slot = m_clients[origin];
    if (!slot) {
        slot = std::make_shared<httplib::Client>(origin);
        slot->set_connection_timeout(m_connectTimeoutMs / 1000, (m_connectTimeoutMs % 1000) * 1000);
        slot->set_read_timeout(m_timeoutMs / 1000, (m_timeoutMs % 1000) * 1000);
        slot->set_write_timeout(5, 0);
    }
    return slot;
}

HttpResponse HttpClient::send(const HttpRequest& request) {
    HttpResponse response;

    // 拒绝可注入额外头部的 CR/LF
    for (const auto& [key, value] : request.headers) {
        if (key.empty() || hasControlChars(key) || hasControlChars(value)) {
            response.statusCode = 400;
            response.error = "Invalid header: " + key;
            return response;
        }
    }

    try {
        auto client = clientFor(request.url);

        httplib::Headers headers;
        for (const auto& [key, value] : request.headers) {
            if (key != "Content-Type") {
                headers.emplace(key, value);
            }
        }
        const auto path = splitOrigin(request.url).second;

        httplib::Result result = request.method == HttpMethod::POST
            ? client->Post(path, headers, request.body,
                           request.getHeader("Content-Type").value_or("application/json"))
            : client->Get(path, headers);

        if (!result) {
            response.error = "Request failed: " + httplib::to_string(result.error());
            return response;
        }
        response.statusCode = result->status;
        response.body = result->body;
        for (const auto& [key, value] : result->headers) {
            response.headers.emplace(lowerCase(key), value);
        }
    } catch (const std::exception& e) {
        response.statusCode = 0;
        response.error = "Exception: " + std::string(e.what());
    }
    return response;
}

std::string HttpClient::joinUrl(const std::string& path) const {
    if (m_baseUrl.empty() || path.find("://") != std::string::npos) {
        return path;
    }
    if (path.empty()) {
        return m_baseUrl;
    }

    std::string url = m_baseUrl;
    const bool baseSlash = url.back() == '/';
    const bool pathSlash = path.front() == '/';
    if (baseSlash && pathSlash) {
        url.pop_back();
    } else if (!baseSlash && !pathSlash) {
        url += '/';
    }
    return url + path;
}

std::map<std::string, std::string> HttpClient::withDefaultHeaders(
    const std::map<std::string, std::string>& requestHeaders) const {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    std::map<std::string, std::string> merged = requestHeaders;
    merged.insert(m_defaultHeaders.begin(), m_defaultHeaders.end()); // 已有键不覆盖
    return merged;
}

void HttpClient::workerLoop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCv.wait(lock, [this]() { return m_stopping || !m_tasks.empty(); });
            if (m_tasks.empty()) {
                return;
            }
            job = std::move(m_tasks.front());
            m_tasks.pop();
        }
        // packaged_task 把异常存入 future
        job();
    }
}

} // namespace convmem::capture::utils
