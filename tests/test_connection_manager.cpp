#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ConnectionManager.hpp"
#include "ErrorHandler.hpp"
#include "FakeDriver.hpp"
#include <mysql/mysql.h>
#include <mysql/errmsg.h>
#include <stdexcept>

using namespace sqladapter;
using namespace sqladapter::fake;
using namespace std::chrono_literals;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Not;

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<FakeServer>();
        config_.host = "db.internal";
        config_.port = 3307;
        config_.username = "app";
        config_.password = "secret";
        config_.database = "shop";
    }

    std::unique_ptr<ConnectionManager> makeManager() {
        return std::make_unique<ConnectionManager>(
            config_, std::make_unique<FakeConnection>(server_), statements_);
    }

    std::shared_ptr<FakeServer> server_;
    ConnectionConfig config_;
    StatementCache statements_;
};

TEST_F(ConnectionManagerTest, RejectsNullDriver) {
    EXPECT_THROW(ConnectionManager(config_, nullptr, statements_), std::invalid_argument);
}

TEST_F(ConnectionManagerTest, RejectsMalformedEncoding) {
    config_.encoding = "utf8' COLLATE 'x";

    EXPECT_THROW(makeManager(), std::invalid_argument);
    EXPECT_TRUE(server_->events.empty());
    EXPECT_TRUE(server_->queries.empty());
}

// Connect
TEST_F(ConnectionManagerTest, ConnectPassesParameters) {
    auto manager = makeManager();
    manager->connect();

    EXPECT_TRUE(manager->isConnected());
    const auto& params = server_->lastConnect;
    EXPECT_EQ(params.host, "db.internal");
    EXPECT_EQ(params.port, 3307u);
    EXPECT_EQ(params.user, "app");
    EXPECT_EQ(params.password, "secret");
    EXPECT_EQ(params.database, "shop");
    EXPECT_TRUE(params.flags & CLIENT_MULTI_RESULTS);
    EXPECT_TRUE(params.flags & CLIENT_FOUND_ROWS);
}

TEST_F(ConnectionManagerTest, OptionsAppliedBeforeConnect) {
    config_.encoding = "utf8mb4";
    config_.connect_timeout = 5s;
    config_.read_timeout = 30s;
    config_.write_timeout = 60s;

    auto manager = makeManager();
    manager->connect();

    EXPECT_THAT(std::vector<std::string>(server_->events.begin(), server_->events.begin() + 6),
                ElementsAre("init", "charset:utf8mb4", "connect_timeout:5", "read_timeout:30",
                            "write_timeout:60", "connect"));
}

TEST_F(ConnectionManagerTest, UnsetTimeoutsAreNotApplied) {
    auto manager = makeManager();
    manager->connect();

    EXPECT_EQ(server_->indexOf("connect_timeout:0"), -1);
    EXPECT_EQ(server_->indexOf("init"), 0);
    EXPECT_EQ(server_->indexOf("connect"), 1);
}

TEST_F(ConnectionManagerTest, ReconnectFlagSetAfterConnect) {
    config_.reconnect = true;

    auto manager = makeManager();
    manager->connect();

    int connect = server_->indexOf("connect");
    int flag = server_->indexOf("reconnect:true");
    ASSERT_GE(flag, 0);
    EXPECT_GT(flag, connect);
}

TEST_F(ConnectionManagerTest, ReconnectFlagDisabledByDefault) {
    auto manager = makeManager();
    manager->connect();

    EXPECT_GT(server_->indexOf("reconnect:false"), server_->indexOf("connect"));
}

TEST_F(ConnectionManagerTest, ReconnectFlagSkippedWithoutCapability) {
    server_->caps.reconnectFlag = false;
    config_.reconnect = true;

    auto manager = makeManager();
    manager->connect();

    EXPECT_EQ(server_->indexOf("reconnect:true"), -1);
    EXPECT_EQ(server_->indexOf("reconnect:false"), -1);
}

TEST_F(ConnectionManagerTest, SessionConfiguredAfterConnect) {
    config_.encoding = "utf8mb4";

    auto manager = makeManager();
    manager->connect();

    EXPECT_THAT(server_->queries, ElementsAre("SET NAMES 'utf8mb4'", "SET SQL_AUTO_IS_NULL=0"));
}

TEST_F(ConnectionManagerTest, NoSetNamesWithoutEncoding) {
    auto manager = makeManager();
    manager->connect();

    EXPECT_THAT(server_->queries, ElementsAre("SET SQL_AUTO_IS_NULL=0"));
}

TEST_F(ConnectionManagerTest, CharsetFailureDoesNotAbortConnect) {
    config_.encoding = "klingon";
    server_->failCharset = true;

    auto manager = makeManager();
    EXPECT_NO_THROW(manager->connect());
    EXPECT_TRUE(manager->isConnected());
}

TEST_F(ConnectionManagerTest, SslAppliedWhenConfigured) {
    config_.sslca = "/etc/ssl/ca.pem";
    config_.sslcert = "/etc/ssl/client.pem";
    config_.sslkey = "/etc/ssl/client.key";
    config_.sslcipher = "ECDHE-RSA-AES256-GCM-SHA384";

    auto manager = makeManager();
    manager->connect();

    EXPECT_LT(server_->indexOf("ssl"), server_->indexOf("connect"));
    EXPECT_EQ(server_->ssl.ca, "/etc/ssl/ca.pem");
    EXPECT_EQ(server_->ssl.cert, "/etc/ssl/client.pem");
    EXPECT_EQ(server_->ssl.key, "/etc/ssl/client.key");
    EXPECT_EQ(server_->ssl.cipher, "ECDHE-RSA-AES256-GCM-SHA384");
}

TEST_F(ConnectionManagerTest, NoSslWithoutCaOrKey) {
    config_.sslcert = "/etc/ssl/client.pem";

    auto manager = makeManager();
    manager->connect();

    EXPECT_EQ(server_->indexOf("ssl"), -1);
}

TEST_F(ConnectionManagerTest, ConnectFailureThrows) {
    server_->connectError = CR_CONN_HOST_ERROR;

    auto manager = makeManager();
    try {
        manager->connect();
        FAIL() << "Expected ConnectionFailure";
    } catch (const ConnectionFailure& e) {
        EXPECT_EQ(e.errorCode(), static_cast<unsigned int>(CR_CONN_HOST_ERROR));
        EXPECT_TRUE(e.isConnectionError());
    }
    EXPECT_FALSE(manager->isConnected());
}

// Reconnect and disconnect
TEST_F(ConnectionManagerTest, ReconnectClearsStatementCache) {
    auto manager = makeManager();
    manager->connect();

    auto a = makeStatement(server_, "A");
    auto b = makeStatement(server_, "B");
    int idA = a->id();
    int idB = b->id();
    statements_.put("A", std::move(a));
    statements_.put("B", std::move(b));

    manager->reconnect();

    EXPECT_EQ(statements_.size(), 0u);
    EXPECT_EQ(server_->closesOf(idA), 1);
    EXPECT_EQ(server_->closesOf(idB), 1);
    EXPECT_EQ(server_->count("connect"), 2);
    EXPECT_EQ(server_->count("close"), 1);
    EXPECT_TRUE(manager->isConnected());
}

TEST_F(ConnectionManagerTest, ConnectWhileConnectedClosesFirst) {
    auto manager = makeManager();
    manager->connect();

    auto statement = makeStatement(server_, "A");
    int id = statement->id();
    statements_.put("A", std::move(statement));

    manager->connect();

    EXPECT_EQ(server_->count("close"), 1);
    EXPECT_EQ(server_->count("connect"), 2);
    EXPECT_EQ(statements_.size(), 0u);
    EXPECT_EQ(server_->closesOf(id), 1);
}

TEST_F(ConnectionManagerTest, DisconnectClosesCachedStatementsBeforeHandle) {
    auto manager = makeManager();
    manager->connect();

    auto statement = makeStatement(server_, "A");
    int id = statement->id();
    statements_.put("A", std::move(statement));

    manager->disconnect();

    EXPECT_EQ(statements_.size(), 0u);
    EXPECT_EQ(server_->closesOf(id), 1);
    EXPECT_LT(server_->indexOf("closeStatement:A"), server_->indexOf("close"));
}

TEST_F(ConnectionManagerTest, DisconnectThenConnectStartsWithEmptyCache) {
    auto manager = makeManager();
    manager->connect();

    auto statement = makeStatement(server_, "A");
    int id = statement->id();
    statements_.put("A", std::move(statement));

    manager->disconnect();
    manager->connect();

    EXPECT_TRUE(manager->isConnected());
    EXPECT_FALSE(statements_.contains("A"));
    EXPECT_EQ(server_->closesOf(id), 1);
}

TEST_F(ConnectionManagerTest, DisconnectKeepsOtherProcessStatements) {
    ProcessId pid = 100;
    StatementCache cache(10, [&pid] { return pid; });
    auto manager = std::make_unique<ConnectionManager>(
        config_, std::make_unique<FakeConnection>(server_), cache);
    manager->connect();

    auto statement = makeStatement(server_, "A");
    int parent = statement->id();
    cache.put("A", std::move(statement));

    pid = 200;
    manager->disconnect();

    EXPECT_EQ(server_->closesOf(parent), 0);
    pid = 100;
    EXPECT_TRUE(cache.contains("A"));
}

TEST_F(ConnectionManagerTest, DisconnectSwallowsCloseErrors) {
    auto manager = makeManager();
    manager->connect();
    server_->closeThrows = true;

    EXPECT_NO_THROW(manager->disconnect());
    EXPECT_FALSE(manager->isConnected());
}

TEST_F(ConnectionManagerTest, DisconnectWhenNotConnected) {
    auto manager = makeManager();

    EXPECT_NO_THROW(manager->disconnect());
    EXPECT_EQ(server_->count("close"), 0);
}

TEST_F(ConnectionManagerTest, DestructorCloses) {
    {
        auto manager = makeManager();
        manager->connect();
    }
    EXPECT_EQ(server_->count("close"), 1);
    EXPECT_FALSE(server_->open);
}

TEST_F(ConnectionManagerTest, HandleThrowsWhenNotConnected) {
    auto manager = makeManager();

    try {
        manager->handle();
        FAIL() << "Expected ConnectionFailure";
    } catch (const ConnectionFailure& e) {
        EXPECT_EQ(e.errorCode(), static_cast<unsigned int>(CR_SERVER_GONE_ERROR));
    }
}

// Liveness
TEST_F(ConnectionManagerTest, IsActiveFalseWhenNeverConnected) {
    auto manager = makeManager();
    EXPECT_FALSE(manager->isActive());
}

TEST_F(ConnectionManagerTest, IsActiveTrueWhenStatSucceeds) {
    auto manager = makeManager();
    manager->connect();

    EXPECT_TRUE(manager->isActive());
    EXPECT_EQ(server_->count("stat"), 1);
}

TEST_F(ConnectionManagerTest, IsActiveFalseWhenStatFails) {
    auto manager = makeManager();
    manager->connect();
    server_->statFails = true;

    bool active = true;
    EXPECT_NO_THROW(active = manager->isActive());
    EXPECT_FALSE(active);
}

TEST_F(ConnectionManagerTest, IsActiveChecksErrorNumber) {
    auto manager = makeManager();
    manager->connect();
    server_->errorNumber = CR_SERVER_LOST;

    EXPECT_FALSE(manager->isActive());
}

TEST_F(ConnectionManagerTest, IsActiveFallsBackToQuery) {
    server_->caps.stat = false;
    server_->caps.errorNumber = false;

    auto manager = makeManager();
    manager->connect();

    EXPECT_TRUE(manager->isActive());
    EXPECT_EQ(server_->count("stat"), 0);
    EXPECT_EQ(server_->queryCount("SELECT 1"), 1);
}

TEST_F(ConnectionManagerTest, IsActiveFalseAfterDisconnect) {
    auto manager = makeManager();
    manager->connect();
    manager->disconnect();

    EXPECT_FALSE(manager->isActive());
}

// Reset
TEST_F(ConnectionManagerTest, ResetChangesUserAndReconfigures) {
    config_.encoding = "utf8mb4";

    auto manager = makeManager();
    manager->connect();
    manager->reset();

    EXPECT_EQ(server_->count("changeUser:app"), 1);
    EXPECT_EQ(server_->queryCount("SET NAMES 'utf8mb4'"), 2);
    EXPECT_EQ(server_->queryCount("SET SQL_AUTO_IS_NULL=0"), 2);
}

TEST_F(ConnectionManagerTest, ResetClearsStatementCacheBeforeChangeUser) {
    auto manager = makeManager();
    manager->connect();

    auto statement = makeStatement(server_, "A");
    int id = statement->id();
    statements_.put("A", std::move(statement));

    manager->reset();

    EXPECT_EQ(statements_.size(), 0u);
    EXPECT_EQ(server_->closesOf(id), 1);
    EXPECT_LT(server_->indexOf("closeStatement:A"), server_->indexOf("changeUser:app"));
    EXPECT_TRUE(manager->isConnected());
}

TEST_F(ConnectionManagerTest, ResetIsNoOpWithoutCapability) {
    server_->caps.changeUser = false;

    auto manager = makeManager();
    manager->connect();
    manager->reset();

    EXPECT_THAT(server_->events, Not(Contains("changeUser:app")));
    EXPECT_EQ(server_->queryCount("SET SQL_AUTO_IS_NULL=0"), 1);
}

// Server information
TEST_F(ConnectionManagerTest, ParseServerVersion) {
    auto v = ConnectionManager::parseServerVersion("8.0.36-0ubuntu0.22.04.1");
    EXPECT_EQ(v.major, 8);
    EXPECT_EQ(v.minor, 0);
    EXPECT_EQ(v.patch, 36);

    v = ConnectionManager::parseServerVersion("5.7.44-log");
    EXPECT_EQ(v.major, 5);
    EXPECT_EQ(v.minor, 7);
    EXPECT_EQ(v.patch, 44);

    v = ConnectionManager::parseServerVersion("10.11.6-MariaDB-1:10.11.6+maria~ubu2204");
    EXPECT_EQ(v.major, 10);
    EXPECT_EQ(v.minor, 11);
    EXPECT_EQ(v.patch, 6);
}

TEST_F(ConnectionManagerTest, ParseServerVersionUnknownFormat) {
    auto v = ConnectionManager::parseServerVersion("unknown");
    EXPECT_EQ(v.major, 0);
    EXPECT_EQ(v.minor, 0);
    EXPECT_EQ(v.patch, 0);
}

TEST_F(ConnectionManagerTest, ServerVersionMemoizedPerSession) {
    auto manager = makeManager();
    manager->connect();

    EXPECT_EQ(manager->serverVersion().major, 8);
    server_->serverInfo = "9.1.0";
    EXPECT_EQ(manager->serverVersion().major, 8);

    manager->reconnect();
    EXPECT_EQ(manager->serverVersion().major, 9);
}

TEST_F(ConnectionManagerTest, DiscardPendingResults) {
    auto manager = makeManager();
    manager->connect();
    server_->pendingResults = 2;

    manager->discardPendingResults();

    EXPECT_EQ(server_->pendingResults, 0);
}
