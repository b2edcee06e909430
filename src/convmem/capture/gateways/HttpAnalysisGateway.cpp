#include "convmem/capture/gateways/HttpAnalysisGateway.h"

#include "convmem/capture/ConfigManager.h"

#include <algorithm>
#include <chrono>

namespace convmem::capture::gateways {

using LogLevel = ErrorHandler::LogLevel;

HttpAnalysisGateway::HttpAnalysisGateway(Options opts, const ErrorHandler& logger)
    : m_opts(std::move(opts))
    , m_logger(logger)
{
    if (!isConfigured()) {
        return;
    }
    m_client = std::make_unique<utils::HttpClient>(m_opts.baseUrl);
    // HttpClient 只发送一次，分析触发不重试
    m_client->setTimeout(m_opts.timeoutMs);

    if (!m_opts.apiKey.empty() && !ConfigManager::isUnresolvedPlaceholder(m_opts.apiKey)) {
        m_client->setDefaultHeader("Authorization", "Bearer " + m_opts.apiKey);
    }
}

HttpAnalysisGateway::~HttpAnalysisGateway() {
    waitIdle();
}

bool HttpAnalysisGateway::isConfigured() const {
    return m_opts.enabled && !m_opts.baseUrl.empty() && !ConfigManager::isUnresolvedPlaceholder(m_opts.baseUrl);
}

std::string HttpAnalysisGateway::buildPath(std::int64_t conversationId) const {
    std::string path = m_opts.path;
    const std::string token = "{id}";
    const auto pos = path.find(token);
    if (pos != std::string::npos) {
        path.replace(pos, token.size(), std::to_string(conversationId));
    }
    return path;
}

void HttpAnalysisGateway::analyze(std::int64_t conversationId) {
    if (!m_client) {
        m_logger.log(LogLevel::Warning,
                     "Analysis service not configured, skipping analysis for conversation " +
                         std::to_string(conversationId));
        return;
    }

    auto request = m_client->makeRequest(utils::HttpMethod::POST, buildPath(conversationId));
    request.body = nlohmann::json{{"conversation_id", conversationId}}.dump();
    request.setHeader("Content-Type", "application/json");

    m_logger.log(LogLevel::Info, "Triggering analysis for conversation " + std::to_string(conversationId));
    m_submitted.fetch_add(1);

    const ErrorHandler& logger = m_logger;
    auto* failed = &m_failed;
    auto fut = m_client->executeAsync(request, [conversationId, request, &logger, failed](const utils::HttpResponse& resp) {
        if (resp.isSuccess()) {
            logger.log(LogLevel::Info, "Analysis completed for conversation " + std::to_string(conversationId));
            return;
        }
        failed->fetch_add(1);
        logger.log(LogLevel::Warning,
                   "Analysis failed for conversation " + std::to_string(conversationId),
                   ErrorHandler::fromHttpResponse(resp, request));
    });

    std::lock_guard<std::mutex> lk(m_mu);
    // 清理已完成的请求
    m_inflight.erase(std::remove_if(m_inflight.begin(), m_inflight.end(),
                                    [](const std::future<utils::HttpResponse>& f) {
                                        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                    }),
                     m_inflight.end());
    m_inflight.push_back(std::move(fut));
}

void HttpAnalysisGateway::waitIdle() {
    std::vector<std::future<utils::HttpResponse>> pending;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        pending.swap(m_inflight);
    }
    for (auto& f : pending) {
        if (f.valid()) f.wait();
    }
}

} // namespace convmem::capture::gateways
