#pragma once

#include "convmem/capture/gateways/PersistenceGateway.h"

#include <memory>
#include <string>

struct sqlite3;

namespace convmem::capture::gateways {

/**
 * @brief 基于 SQLite3 的持久化实现
 *
 * 每个实例持有一个独立连接；数据库以 WAL 模式打开，多个实例（多个会话）可同时读写同一文件。
 * 表结构：conversation_partners / conversations / messages，时间以 epoch 毫秒存储。
 */
class SqlitePersistenceGateway : public PersistenceGateway {
public:
    struct Options {
        std::string path;
        int busyTimeoutMs{5000};
    };

    // 打开数据库并确保表结构存在；失败返回 nullptr
    static std::unique_ptr<SqlitePersistenceGateway> open(const Options& opts, ErrorInfo* err = nullptr);

    // 生成一个按 opts 打开新连接的工厂
    static PersistenceFactory factory(Options opts);

    ~SqlitePersistenceGateway() override;

    SqlitePersistenceGateway(const SqlitePersistenceGateway&) = delete;
    SqlitePersistenceGateway& operator=(const SqlitePersistenceGateway&) = delete;

    std::optional<std::int64_t> createConversation(std::int64_t userId,
                                                   std::int64_t partnerId,
                                                   const std::string& title,
                                                   TimePoint startedAt,
                                                   ErrorInfo* err = nullptr) override;

    bool appendMessage(std::int64_t conversationId,
                       const std::string& sender,
                       const std::string& content,
                       TimePoint timestamp,
                       ErrorInfo* err = nullptr) override;

    bool updateConversation(std::int64_t conversationId,
                            TimePoint endedAt,
                            const std::string& fullTranscript,
                            ErrorInfo* err = nullptr) override;

    std::optional<std::vector<types::MessageRecord>> listMessages(std::int64_t conversationId,
                                                                  ErrorInfo* err = nullptr) override;

    std::optional<types::ConversationRecord> getConversation(std::int64_t conversationId,
                                                             ErrorInfo* err = nullptr) override;

    std::optional<std::string> getPartnerName(std::int64_t partnerId, ErrorInfo* err = nullptr) override;

    bool updatePartnerName(std::int64_t partnerId, const std::string& name, ErrorInfo* err = nullptr) override;

    const std::string& path() const { return m_path; }

private:
    SqlitePersistenceGateway(sqlite3* db, std::string path);

    void execSql(const std::string& sql);
    void ensureSchema();

    sqlite3* m_db{nullptr};
    std::string m_path;
};

} // namespace convmem::capture::gateways
