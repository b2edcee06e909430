#pragma once

#include <cstdint>

namespace convmem::capture::gateways {

/**
 * @brief 会话结束后的分析（事实/话题/摘要提取）
 *
 * analyze() 不阻塞调用方、不重试，失败只记录日志。
 */
class AnalysisGateway {
public:
    virtual ~AnalysisGateway() = default;

    virtual void analyze(std::int64_t conversationId) = 0;
};

} // namespace convmem::capture::gateways
