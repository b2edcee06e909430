#include "convmem/capture/gateways/SqlitePersistenceGateway.h"

#include <gtest/gtest.h>

#include <sqlite3.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

using namespace convmem::capture;
using namespace convmem::capture::gateways;

namespace {

using Clock = std::chrono::system_clock;

Clock::time_point atMs(std::int64_t ms) {
    return Clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

class SqlitePersistenceGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() / "convmem_sqlite_test";
        dbPath = (dir / (std::string(info->name()) + ".db")).string();
        cleanup();

        Options opts;
        opts.path = dbPath;
        ErrorInfo err;
        gw = SqlitePersistenceGateway::open(opts, &err);
        ASSERT_NE(gw, nullptr) << err.toString();

        // 伙伴表由上游系统维护，这里直接插入一行
        sqlite3* raw = nullptr;
        ASSERT_EQ(sqlite3_open(dbPath.c_str(), &raw), SQLITE_OK);
        ASSERT_EQ(sqlite3_exec(raw, "INSERT INTO conversation_partners (id, user_id, name) VALUES (7, 1, 'Unknown');",
                               nullptr, nullptr, nullptr),
                  SQLITE_OK);
        sqlite3_close(raw);
    }

    void TearDown() override {
        gw.reset();
        cleanup();
    }

    void cleanup() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(dbPath + suffix, ec);
        }
    }

    using Options = SqlitePersistenceGateway::Options;

    std::filesystem::path dir;
    std::string dbPath;
    std::unique_ptr<SqlitePersistenceGateway> gw;
};

TEST_F(SqlitePersistenceGatewayTest, CreateAndReadConversation) {
    ErrorInfo err;
    auto id = gw->createConversation(1, 7, "Session s-1", atMs(1700000000000), &err);
    ASSERT_TRUE(id.has_value()) << err.toString();

    auto c = gw->getConversation(*id, &err);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->userId, 1);
    EXPECT_EQ(c->partnerId, 7);
    EXPECT_EQ(c->title, "Session s-1");
    EXPECT_FALSE(c->isAnalyzed);
    EXPECT_EQ(c->startedAt, atMs(1700000000000));
    EXPECT_FALSE(c->endedAt.has_value());
    EXPECT_FALSE(c->fullTranscript.has_value());
}

TEST_F(SqlitePersistenceGatewayTest, MessagesListedInTimestampOrder) {
    auto id = gw->createConversation(1, 7, "t", atMs(1000));
    ASSERT_TRUE(id.has_value());

    ASSERT_TRUE(gw->appendMessage(*id, "user", "second", atMs(3000)));
    ASSERT_TRUE(gw->appendMessage(*id, "user", "first", atMs(2000)));
    ASSERT_TRUE(gw->appendMessage(*id, "user", "third", atMs(3000)));

    auto other = gw->createConversation(1, 7, "other", atMs(1000));
    ASSERT_TRUE(other.has_value());
    ASSERT_TRUE(gw->appendMessage(*other, "user", "elsewhere", atMs(2500)));

    ErrorInfo err;
    auto msgs = gw->listMessages(*id, &err);
    ASSERT_TRUE(msgs.has_value()) << err.toString();
    ASSERT_EQ(msgs->size(), 3u);
    EXPECT_EQ((*msgs)[0].content, "first");
    EXPECT_EQ((*msgs)[1].content, "second");
    // 同一时间戳按插入顺序
    EXPECT_EQ((*msgs)[2].content, "third");
    EXPECT_EQ((*msgs)[0].sender, "user");
    EXPECT_EQ((*msgs)[0].timestamp, atMs(2000));

    auto none = gw->listMessages(9999, &err);
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none->empty());
}

TEST_F(SqlitePersistenceGatewayTest, UpdateConversationOnlyOnce) {
    auto id = gw->createConversation(1, 7, "t", atMs(1000));
    ASSERT_TRUE(id.has_value());

    ErrorInfo err;
    EXPECT_TRUE(gw->updateConversation(*id, atMs(5000), "[00:00:01] hi", &err));
    auto c = gw->getConversation(*id);
    ASSERT_TRUE(c.has_value());
    ASSERT_TRUE(c->endedAt.has_value());
    EXPECT_EQ(*c->endedAt, atMs(5000));
    EXPECT_EQ(c->fullTranscript.value_or(""), "[00:00:01] hi");

    EXPECT_FALSE(gw->updateConversation(*id, atMs(9000), "overwrite", &err));
    EXPECT_EQ(err.errorType, ErrorType::PersistenceError);
    EXPECT_EQ(gw->getConversation(*id)->fullTranscript.value_or(""), "[00:00:01] hi");

    EXPECT_FALSE(gw->updateConversation(424242, atMs(9000), "x", &err));
    EXPECT_EQ(err.errorType, ErrorType::NotFound);
}

TEST_F(SqlitePersistenceGatewayTest, EmptyTranscriptIsStoredAsEmptyString) {
    auto id = gw->createConversation(1, 7, "t", atMs(1000));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(gw->updateConversation(*id, atMs(2000), ""));
    auto c = gw->getConversation(*id);
    ASSERT_TRUE(c.has_value());
    ASSERT_TRUE(c->fullTranscript.has_value());
    EXPECT_TRUE(c->fullTranscript->empty());
}

TEST_F(SqlitePersistenceGatewayTest, PartnerNameReadAndUpdate) {
    ErrorInfo err;
    auto name = gw->getPartnerName(7, &err);
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "Unknown");

    EXPECT_TRUE(gw->updatePartnerName(7, "Sarah", &err));
    EXPECT_EQ(gw->getPartnerName(7).value_or(""), "Sarah");

    EXPECT_FALSE(gw->getPartnerName(8, &err).has_value());
    EXPECT_EQ(err.errorType, ErrorType::NotFound);
    EXPECT_FALSE(gw->updatePartnerName(8, "Bob", &err));
    EXPECT_EQ(err.errorType, ErrorType::NotFound);
}

TEST_F(SqlitePersistenceGatewayTest, UnknownConversationIsNotFound) {
    ErrorInfo err;
    EXPECT_FALSE(gw->getConversation(31337, &err).has_value());
    EXPECT_EQ(err.errorType, ErrorType::NotFound);
}

TEST_F(SqlitePersistenceGatewayTest, FactoryOpensIndependentConnections) {
    Options opts;
    opts.path = dbPath;
    auto factory = SqlitePersistenceGateway::factory(opts);

    ErrorInfo err;
    auto a = factory(&err);
    auto b = factory(&err);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);

    auto id = a->createConversation(1, 7, "shared", atMs(1000));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(a->appendMessage(*id, "user", "hello", atMs(1500)));

    auto msgs = b->listMessages(*id);
    ASSERT_TRUE(msgs.has_value());
    ASSERT_EQ(msgs->size(), 1u);
    EXPECT_EQ(msgs->front().content, "hello");
}

TEST(SqlitePersistenceGatewayOpen, EmptyPathIsConfigurationError) {
    SqlitePersistenceGateway::Options opts;
    ErrorInfo err;
    EXPECT_EQ(SqlitePersistenceGateway::open(opts, &err), nullptr);
    EXPECT_EQ(err.errorType, ErrorType::ConfigurationError);
}
