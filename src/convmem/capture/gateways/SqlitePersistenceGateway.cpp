#include "convmem/capture/gateways/SqlitePersistenceGateway.h"

#include <sqlite3.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace convmem::capture::gateways {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

std::int64_t toEpochMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMs(std::int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

// prepare/bind/step/finalize 的 RAII 封装；任何失败抛 std::runtime_error
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
        : m_db(db)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, std::int64_t v) {
        check(sqlite3_bind_int64(m_stmt, idx, v));
        return *this;
    }
    Statement& bind(int idx, const std::string& v) {
        check(sqlite3_bind_text(m_stmt, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT));
        return *this;
    }

    // true 表示有一行结果
    bool step() {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errmsg(m_db));
    }

    std::int64_t columnInt(int col) const { return sqlite3_column_int64(m_stmt, col); }
    bool columnIsNull(int col) const { return sqlite3_column_type(m_stmt, col) == SQLITE_NULL; }
    std::string columnText(int col) const {
        const auto* p = sqlite3_column_text(m_stmt, col);
        return p ? std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(sqlite3_column_bytes(m_stmt, col)))
                 : std::string();
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::string("SQLite bind failed: ") + sqlite3_errmsg(m_db));
        }
    }

    sqlite3* m_db;
    sqlite3_stmt* m_stmt{nullptr};
};

void fillError(ErrorInfo* err, const std::string& op, const std::exception& e) {
    if (!err) return;
    setError(err, ErrorType::PersistenceError, op + ": " + e.what());
}

} // namespace

SqlitePersistenceGateway::SqlitePersistenceGateway(sqlite3* db, std::string path)
    : m_db(db)
    , m_path(std::move(path))
{}

SqlitePersistenceGateway::~SqlitePersistenceGateway() {
    if (m_db) sqlite3_close(m_db);
}

std::unique_ptr<SqlitePersistenceGateway> SqlitePersistenceGateway::open(const Options& opts, ErrorInfo* err) {
    if (opts.path.empty()) {
        setError(err, ErrorType::ConfigurationError, "SQLite path is empty");
        return nullptr;
    }

    const std::filesystem::path p(opts.path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(opts.path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        const std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        setError(err, ErrorType::PersistenceError, "Cannot open SQLite DB at " + opts.path + ": " + msg);
        return nullptr;
    }
    sqlite3_busy_timeout(db, opts.busyTimeoutMs);

    std::unique_ptr<SqlitePersistenceGateway> gw(new SqlitePersistenceGateway(db, opts.path));
    try {
        gw->ensureSchema();
    } catch (const std::exception& e) {
        fillError(err, "ensureSchema", e);
        return nullptr;
    }
    return gw;
}

PersistenceFactory SqlitePersistenceGateway::factory(Options opts) {
    return [opts = std::move(opts)](ErrorInfo* err) -> std::unique_ptr<PersistenceGateway> {
        return open(opts, err);
    };
}

void SqlitePersistenceGateway::execSql(const std::string& sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

void SqlitePersistenceGateway::ensureSchema() {
    execSql(R"SQL(
    PRAGMA journal_mode=WAL;
    PRAGMA foreign_keys=ON;
    CREATE TABLE IF NOT EXISTS conversation_partners (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        user_id INTEGER NOT NULL,
        name TEXT
    );
    CREATE TABLE IF NOT EXISTS conversations (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        user_id INTEGER NOT NULL,
        partner_id INTEGER NOT NULL,
        title TEXT,
        summary TEXT,
        is_analyzed INTEGER NOT NULL DEFAULT 0,
        started_at_ms INTEGER NOT NULL,
        ended_at_ms INTEGER,
        full_transcript TEXT
    );
    CREATE TABLE IF NOT EXISTS messages (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        conversation_id INTEGER NOT NULL REFERENCES conversations(id),
        sender TEXT NOT NULL,
        content TEXT NOT NULL,
        timestamp_ms INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_messages_conversation ON messages(conversation_id, timestamp_ms);
    )SQL");
}

std::optional<std::int64_t> SqlitePersistenceGateway::createConversation(std::int64_t userId,
                                                                         std::int64_t partnerId,
                                                                         const std::string& title,
                                                                         TimePoint startedAt,
                                                                         ErrorInfo* err) {
    try {
        Statement st(m_db,
                     "INSERT INTO conversations (user_id, partner_id, title, is_analyzed, started_at_ms) "
                     "VALUES (?, ?, ?, 0, ?);");
        st.bind(1, userId).bind(2, partnerId).bind(3, title).bind(4, toEpochMs(startedAt));
        st.step();
        return sqlite3_last_insert_rowid(m_db);
    } catch (const std::exception& e) {
        fillError(err, "createConversation", e);
        return std::nullopt;
    }
}

bool SqlitePersistenceGateway::appendMessage(std::int64_t conversationId,
                                             const std::string& sender,
                                             const std::string& content,
                                             TimePoint timestamp,
                                             ErrorInfo* err) {
    try {
        Statement st(m_db,
                     "INSERT INTO messages (conversation_id, sender, content, timestamp_ms) VALUES (?, ?, ?, ?);");
        st.bind(1, conversationId).bind(2, sender).bind(3, content).bind(4, toEpochMs(timestamp));
        st.step();
        return true;
    } catch (const std::exception& e) {
        fillError(err, "appendMessage", e);
        return false;
    }
}

bool SqlitePersistenceGateway::updateConversation(std::int64_t conversationId,
                                                  TimePoint endedAt,
                                                  const std::string& fullTranscript,
                                                  ErrorInfo* err) {
    try {
        Statement st(m_db,
                     "UPDATE conversations SET ended_at_ms = ?, full_transcript = ? "
                     "WHERE id = ? AND ended_at_ms IS NULL;");
        st.bind(1, toEpochMs(endedAt)).bind(2, fullTranscript).bind(3, conversationId);
        st.step();
        if (sqlite3_changes(m_db) > 0) {
            return true;
        }
    } catch (const std::exception& e) {
        fillError(err, "updateConversation", e);
        return false;
    }

    ErrorInfo lookupErr;
    if (getConversation(conversationId, &lookupErr).has_value()) {
        setError(err, ErrorType::PersistenceError,
                 "Conversation " + std::to_string(conversationId) + " already finalized");
    } else if (err) {
        *err = lookupErr;
    }
    return false;
}

std::optional<std::vector<types::MessageRecord>> SqlitePersistenceGateway::listMessages(std::int64_t conversationId,
                                                                                        ErrorInfo* err) {
    try {
        Statement st(m_db,
                     "SELECT id, conversation_id, sender, content, timestamp_ms FROM messages "
                     "WHERE conversation_id = ? ORDER BY timestamp_ms ASC, id ASC;");
        st.bind(1, conversationId);
        std::vector<types::MessageRecord> out;
        while (st.step()) {
            types::MessageRecord m;
            m.id = st.columnInt(0);
            m.conversationId = st.columnInt(1);
            m.sender = st.columnText(2);
            m.content = st.columnText(3);
            m.timestamp = fromEpochMs(st.columnInt(4));
            out.push_back(std::move(m));
        }
        return out;
    } catch (const std::exception& e) {
        fillError(err, "listMessages", e);
        return std::nullopt;
    }
}

std::optional<types::ConversationRecord> SqlitePersistenceGateway::getConversation(std::int64_t conversationId,
                                                                                   ErrorInfo* err) {
    try {
        Statement st(m_db,
                     "SELECT id, user_id, partner_id, title, is_analyzed, started_at_ms, ended_at_ms, full_transcript "
                     "FROM conversations WHERE id = ?;");
        st.bind(1, conversationId);
        if (!st.step()) {
            setError(err, ErrorType::NotFound, "Conversation " + std::to_string(conversationId) + " not found");
            return std::nullopt;
        }
        types::ConversationRecord c;
        c.id = st.columnInt(0);
        c.userId = st.columnInt(1);
        c.partnerId = st.columnInt(2);
        c.title = st.columnText(3);
        c.isAnalyzed = st.columnInt(4) != 0;
        c.startedAt = fromEpochMs(st.columnInt(5));
        if (!st.columnIsNull(6)) c.endedAt = fromEpochMs(st.columnInt(6));
        if (!st.columnIsNull(7)) c.fullTranscript = st.columnText(7);
        return c;
    } catch (const std::exception& e) {
        fillError(err, "getConversation", e);
        return std::nullopt;
    }
}

std::optional<std::string> SqlitePersistenceGateway::getPartnerName(std::int64_t partnerId, ErrorInfo* err) {
    try {
        Statement st(m_db, "SELECT name FROM conversation_partners WHERE id = ?;");
        st.bind(1, partnerId);
        if (!st.step()) {
            setError(err, ErrorType::NotFound, "Partner " + std::to_string(partnerId) + " not found");
            return std::nullopt;
        }
        return st.columnText(0);
    } catch (const std::exception& e) {
        fillError(err, "getPartnerName", e);
        return std::nullopt;
    }
}

bool SqlitePersistenceGateway::updatePartnerName(std::int64_t partnerId, const std::string& name, ErrorInfo* err) {
    try {
        Statement st(m_db, "UPDATE conversation_partners SET name = ? WHERE id = ?;");
        st.bind(1, name).bind(2, partnerId);
        st.step();
        if (sqlite3_changes(m_db) == 0) {
            setError(err, ErrorType::NotFound, "Partner " + std::to_string(partnerId) + " not found");
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        fillError(err, "updatePartnerName", e);
        return false;
    }
}

} // namespace convmem::capture::gateways
