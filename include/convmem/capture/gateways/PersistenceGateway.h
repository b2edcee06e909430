#pragma once

#include "convmem/capture/ErrorTypes.h"
#include "convmem/capture/types/SessionTypes.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace convmem::capture::gateways {

/**
 * @brief 会话/消息持久化接口
 *
 * 每个会话独占一个实例，实例本身不要求线程安全。
 * 失败时返回 false / nullopt，并以 ErrorType::PersistenceError（或 NotFound）填写 err。
 */
class PersistenceGateway {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~PersistenceGateway() = default;

    virtual std::optional<std::int64_t> createConversation(std::int64_t userId,
                                                           std::int64_t partnerId,
                                                           const std::string& title,
                                                           TimePoint startedAt,
                                                           ErrorInfo* err = nullptr) = 0;

    virtual bool appendMessage(std::int64_t conversationId,
                               const std::string& sender,
                               const std::string& content,
                               TimePoint timestamp,
                               ErrorInfo* err = nullptr) = 0;

    // ended_at 与 full_transcript 仅写一次
    virtual bool updateConversation(std::int64_t conversationId,
                                    TimePoint endedAt,
                                    const std::string& fullTranscript,
                                    ErrorInfo* err = nullptr) = 0;

    // 按 timestamp、id 升序
    virtual std::optional<std::vector<types::MessageRecord>> listMessages(std::int64_t conversationId,
                                                                          ErrorInfo* err = nullptr) = 0;

    virtual std::optional<types::ConversationRecord> getConversation(std::int64_t conversationId,
                                                                     ErrorInfo* err = nullptr) = 0;

    // 对方不存在时返回 nullopt 且 err 为 NotFound
    virtual std::optional<std::string> getPartnerName(std::int64_t partnerId, ErrorInfo* err = nullptr) = 0;

    virtual bool updatePartnerName(std::int64_t partnerId, const std::string& name, ErrorInfo* err = nullptr) = 0;
};

// 每次调用返回一个新的独立句柄
using PersistenceFactory = std::function<std::unique_ptr<PersistenceGateway>(ErrorInfo* err)>;

} // namespace convmem::capture::gateways
