#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Adapter.hpp"
#include "ErrorHandler.hpp"
#include "FakeDriver.hpp"
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>
#include <cstring>

using namespace sqladapter;
using namespace sqladapter::fake;
using ::testing::ElementsAre;

namespace {

const std::string kEncodingQuery = "SHOW VARIABLES WHERE Variable_name = 'character_set_client'";
const std::string kFindPost = "SELECT id, title FROM posts WHERE id = ?";

}  // namespace

class AdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<FakeServer>();
        server_->results[kFindPost] = {{"id", "title"}, {{"1", "Hello"}}};
        server_->results[kEncodingQuery] = {{"Variable_name", "Value"},
                                            {{"character_set_client", "utf8mb4"}}};
        connection_.database = "blog";
        pid_ = 500;
    }

    std::unique_ptr<Adapter> makeAdapter() {
        return std::make_unique<Adapter>(connection_, statements_,
                                         std::make_unique<FakeConnection>(server_),
                                         [this] { return pid_; });
    }

    std::shared_ptr<FakeServer> server_;
    ConnectionConfig connection_;
    StatementConfig statements_;
    ProcessId pid_;
};

// Construction
TEST_F(AdapterTest, ConnectsOnConstruction) {
    auto adapter = makeAdapter();

    EXPECT_TRUE(adapter->connectionManager().isConnected());
    EXPECT_EQ(server_->count("connect"), 1);
    EXPECT_EQ(server_->lastConnect.database, "blog");
}

TEST_F(AdapterTest, ConstructionFailsWhenConnectFails) {
    server_->connectError = ER_ACCESS_DENIED_ERROR;

    EXPECT_THROW(makeAdapter(), ConnectionFailure);
}

TEST_F(AdapterTest, StatementLimitFromConfig) {
    statements_.statement_limit = 25;
    auto adapter = makeAdapter();

    EXPECT_EQ(adapter->statementCache().capacity(), 25u);
}

TEST_F(AdapterTest, AdapterInformation) {
    auto adapter = makeAdapter();

    EXPECT_STREQ(adapter->adapterName(), "MySQL");
    EXPECT_TRUE(adapter->supportsStatementCache());
}

// Statements
TEST_F(AdapterTest, ExecuteWithBindsReusesStatement) {
    auto adapter = makeAdapter();

    Result first = adapter->execute(kFindPost, {{"id", int64_t{1}}}, "Post Load");
    Result second = adapter->execute(kFindPost, {{"id", int64_t{1}}}, "Post Load");

    EXPECT_EQ(server_->prepareCount[kFindPost], 1);
    EXPECT_EQ(first.rows(), second.rows());
    EXPECT_EQ(adapter->statementCache().size(), 1u);
}

TEST_F(AdapterTest, ExecuteMutation) {
    server_->affected["DELETE FROM posts WHERE id = ?"] = 1;
    auto adapter = makeAdapter();

    EXPECT_EQ(adapter->executeMutation("DELETE FROM posts WHERE id = ?", {{"id", int64_t{9}}}), 1u);
}

TEST_F(AdapterTest, ExecuteErrorLeavesNothingCached) {
    const std::string sql = "SELECT * FROM posts WHERE idd = ?";
    server_->failingExecute[sql] = ER_BAD_FIELD_ERROR;
    auto adapter = makeAdapter();

    EXPECT_THROW(adapter->execute(sql, {{"idd", int64_t{1}}}), StatementExecutionError);
    EXPECT_FALSE(adapter->statementCache().contains(sql));
    EXPECT_EQ(server_->closesFor(sql), 1);
}

TEST_F(AdapterTest, InsertReturnsGeneratedId) {
    server_->insertId = 101;
    auto adapter = makeAdapter();

    EXPECT_EQ(adapter->insert("INSERT INTO posts (title) VALUES ('x')"), 101u);
    EXPECT_EQ(adapter->insert("INSERT INTO posts (id, title) VALUES (5, 'y')", 5), 5u);
}

TEST_F(AdapterTest, SelectRowsDrainsPendingResults) {
    server_->results["CALL recent_posts()"] = {{"id"}, {{"3"}, {"2"}}};
    server_->pendingResults = 1;
    auto adapter = makeAdapter();

    auto rows = adapter->selectRows("CALL recent_posts()");

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][0], SqlValue("3"));
    EXPECT_EQ(server_->pendingResults, 0);
}

TEST_F(AdapterTest, SelectKeepsColumns) {
    server_->pendingResults = 1;
    auto adapter = makeAdapter();

    Result result = adapter->select(kFindPost, {{"id", int64_t{1}}});

    EXPECT_THAT(result.columns(), ElementsAre("id", "title"));
    EXPECT_EQ(server_->pendingResults, 0);
}

TEST_F(AdapterTest, BeginTransaction) {
    auto adapter = makeAdapter();

    EXPECT_EQ(adapter->beginTransaction(), BeginOutcome::Started);

    server_->failingQuery["BEGIN"] = ER_NOT_SUPPORTED_YET;
    EXPECT_EQ(adapter->beginTransaction(), BeginOutcome::UnsupportedByBackend);
}

// Connection management
TEST_F(AdapterTest, IsActiveReflectsConnection) {
    auto adapter = makeAdapter();

    EXPECT_TRUE(adapter->isActive());
    adapter->disconnect();
    EXPECT_FALSE(adapter->isActive());
    adapter->connect();
    EXPECT_TRUE(adapter->isActive());
}

TEST_F(AdapterTest, ReconnectDropsCachedStatements) {
    auto adapter = makeAdapter();
    adapter->execute(kFindPost, {{"id", int64_t{1}}});

    adapter->reconnect();

    EXPECT_EQ(adapter->statementCache().size(), 0u);
    EXPECT_EQ(server_->closesFor(kFindPost), 1);

    adapter->execute(kFindPost, {{"id", int64_t{1}}});
    EXPECT_EQ(server_->prepareCount[kFindPost], 2);
}

TEST_F(AdapterTest, ResetChangesUser) {
    connection_.username = "blogger";
    auto adapter = makeAdapter();

    adapter->reset();

    EXPECT_EQ(server_->count("changeUser:blogger"), 1);
}

TEST_F(AdapterTest, ResetPreparesStatementsAgain) {
    auto adapter = makeAdapter();
    adapter->execute(kFindPost, {{"id", int64_t{1}}});

    adapter->reset();

    EXPECT_FALSE(adapter->statementCache().contains(kFindPost));
    EXPECT_EQ(server_->closesFor(kFindPost), 1);

    auto result = adapter->execute(kFindPost, {{"id", int64_t{1}}});
    EXPECT_EQ(result.size(), 1u);
    EXPECT_EQ(server_->prepareCount[kFindPost], 2);
}

TEST_F(AdapterTest, DisconnectThenConnectPreparesStatementsAgain) {
    auto adapter = makeAdapter();
    adapter->execute(kFindPost, {{"id", int64_t{1}}});

    adapter->disconnect();
    EXPECT_EQ(adapter->statementCache().size(), 0u);
    EXPECT_EQ(server_->closesFor(kFindPost), 1);

    adapter->connect();
    auto result = adapter->execute(kFindPost, {{"id", int64_t{2}}});

    EXPECT_EQ(result.size(), 1u);
    EXPECT_EQ(server_->prepareCount[kFindPost], 2);
    EXPECT_EQ(server_->closesFor(kFindPost), 1);
}

TEST_F(AdapterTest, ConnectWhileConnectedPreparesStatementsAgain) {
    auto adapter = makeAdapter();
    adapter->execute(kFindPost, {{"id", int64_t{1}}});

    adapter->connect();
    EXPECT_EQ(adapter->statementCache().size(), 0u);

    adapter->execute(kFindPost, {{"id", int64_t{1}}});
    EXPECT_EQ(server_->prepareCount[kFindPost], 2);
    EXPECT_EQ(server_->count("connect"), 2);
}

TEST_F(AdapterTest, ClearStatementCache) {
    auto adapter = makeAdapter();
    adapter->execute(kFindPost, {{"id", int64_t{1}}});

    adapter->clearStatementCache();

    EXPECT_EQ(adapter->statementCache().size(), 0u);
    EXPECT_EQ(server_->closesFor(kFindPost), 1);
}

TEST_F(AdapterTest, DestructorClosesStatementsAndConnection) {
    {
        auto adapter = makeAdapter();
        adapter->execute(kFindPost, {{"id", int64_t{1}}});
    }

    EXPECT_EQ(server_->closesFor(kFindPost), 1);
    EXPECT_EQ(server_->count("close"), 1);
    EXPECT_FALSE(server_->open);
}

// Information
TEST_F(AdapterTest, ServerVersion) {
    server_->serverInfo = "8.4.2";
    auto adapter = makeAdapter();

    auto version = adapter->serverVersion();
    EXPECT_EQ(version.major, 8);
    EXPECT_EQ(version.minor, 4);
    EXPECT_EQ(version.patch, 2);
}

TEST_F(AdapterTest, ClientEncodingIsMemoized) {
    auto adapter = makeAdapter();

    EXPECT_EQ(adapter->clientEncoding(), "utf8mb4");
    EXPECT_EQ(adapter->clientEncoding(), "utf8mb4");
    EXPECT_EQ(server_->prepareCount[kEncodingQuery], 1);
}

TEST_F(AdapterTest, ReconnectForgetsClientEncoding) {
    auto adapter = makeAdapter();
    adapter->clientEncoding();

    server_->results[kEncodingQuery].rows = {{"character_set_client", "latin1"}};
    adapter->reconnect();

    EXPECT_EQ(adapter->clientEncoding(), "latin1");
}

TEST_F(AdapterTest, ClientEncodingEmptyWhenNotReported) {
    server_->results[kEncodingQuery].rows.clear();
    auto adapter = makeAdapter();

    EXPECT_EQ(adapter->clientEncoding(), "");
}

// Forked processes
TEST_F(AdapterTest, ForkedProcessPreparesItsOwnStatements) {
    auto adapter = makeAdapter();
    adapter->execute(kFindPost, {{"id", int64_t{1}}});

    pid_ = 501;
    Result result = adapter->execute(kFindPost, {{"id", int64_t{1}}});

    EXPECT_EQ(result.size(), 1u);
    EXPECT_EQ(server_->prepareCount[kFindPost], 2);
    EXPECT_EQ(adapter->statementCache().partitionCount(), 2u);
}

TEST_F(AdapterTest, ForkedProcessNeverClosesParentStatements) {
    int parentStatement = 0;
    {
        auto adapter = makeAdapter();
        adapter->execute(kFindPost, {{"id", int64_t{1}}});
        parentStatement = server_->nextId - 1;

        pid_ = 501;
        adapter->execute(kFindPost, {{"id", int64_t{2}}});
        adapter->clearStatementCache();
    }

    EXPECT_EQ(server_->closesOf(parentStatement), 0);
    EXPECT_EQ(server_->detachesOf(parentStatement), 1);
    EXPECT_EQ(server_->closesOf(parentStatement + 1), 1);
}
