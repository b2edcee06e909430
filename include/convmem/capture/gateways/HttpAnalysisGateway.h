#pragma once

#include "convmem/capture/ErrorHandler.h"
#include "convmem/capture/gateways/AnalysisGateway.h"
#include "convmem/capture/utils/HttpClient.h"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace convmem::capture::gateways {

/**
 * @brief 通过 HTTP POST 触发分析服务
 *
 * 请求：POST {baseUrl}{path}，path 中的 {id} 替换为会话ID，body 为 {"conversation_id": id}。
 * 未启用或未配置 baseUrl 时只记录警告并跳过。
 */
class HttpAnalysisGateway : public AnalysisGateway {
public:
    struct Options {
        bool enabled{true};
        std::string baseUrl;
        std::string apiKey;
        std::string path{"/api/conversations/{id}/analyze"};
        int timeoutMs{60000};
    };

    HttpAnalysisGateway(Options opts, const ErrorHandler& logger);
    ~HttpAnalysisGateway() override;

    void analyze(std::int64_t conversationId) override;

    bool isConfigured() const;

    // 等待所有已提交的请求完成（用于进程退出前与测试）
    void waitIdle();

    std::uint64_t submittedCount() const { return m_submitted.load(); }
    std::uint64_t failedCount() const { return m_failed.load(); }

    std::string buildPath(std::int64_t conversationId) const;

private:
    Options m_opts;
    const ErrorHandler& m_logger;
    std::unique_ptr<utils::HttpClient> m_client;

    std::mutex m_mu;
    std::vector<std::future<utils::HttpResponse>> m_inflight;
    std::atomic<std::uint64_t> m_submitted{0};
    std::atomic<std::uint64_t> m_failed{0};
};

} // namespace convmem::capture::gateways
