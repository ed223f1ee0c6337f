#pragma once

/**
 * @file Adapter.hpp
 * @brief Entry point used by the data-access layer.
 *
 * Adapter wires the statement cache, connection manager, execution engine and
 * transaction guard around one physical connection.
 *
 * Usage:
 * @code
 *   auto adapter = Adapter::createMySQL(config);
 *   auto result = adapter->execute("SELECT * FROM users WHERE id = ?",
 *                                  {{"id", int64_t{42}}});
 *   for (const auto& row : result.rows()) {
 *       // ...
 *   }
 * @endcode
 */

#include "Config.hpp"
#include "ConnectionManager.hpp"
#include "Driver.hpp"
#include "ExecutionEngine.hpp"
#include "StatementCache.hpp"
#include "TransactionGuard.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqladapter {

/**
 * @class Adapter
 * @brief One connection plus its prepared statement cache.
 *
 * Connects on construction. On destruction the statement cache is cleared and
 * the connection closed.
 *
 * Thread Safety: none; use one adapter per thread.
 */
class Adapter {
public:
    static constexpr const char* ADAPTER_NAME = "MySQL";

    /**
     * @param connection Connection parameters.
     * @param statements Statement cache settings.
     * @param driver Connection handle (takes ownership).
     * @param identity Process identity source for the statement cache.
     * @throws ConnectionFailure if the initial connect fails.
     */
    Adapter(const ConnectionConfig& connection, const StatementConfig& statements,
            std::unique_ptr<DriverConnection> driver,
            IdentitySource identity = StatementCache::currentProcessId);

    ~Adapter();

    // Non-copyable
    Adapter(const Adapter&) = delete;
    Adapter& operator=(const Adapter&) = delete;

    /**
     * @brief Build an adapter on a libmysqlclient connection.
     */
    static std::unique_ptr<Adapter> createMySQL(const Config& config);

    // ----- Connection management -----

    void connect();
    void reconnect();
    void disconnect();
    void reset();
    bool isActive();

    // ----- Statements -----

    Result execute(const std::string& sql, const std::vector<Bind>& binds = {},
                   const std::string& name = "SQL");
    Result executeDirect(const std::string& sql, const std::string& name = "SQL");
    uint64_t executeMutation(const std::string& sql, const std::vector<Bind>& binds,
                             const std::string& name = "SQL");

    /**
     * @brief Run an INSERT and return the supplied id or the generated one.
     */
    uint64_t insert(const std::string& sql, std::optional<uint64_t> idValue = std::nullopt,
                    const std::string& name = "SQL");

    /**
     * @brief Rows of a direct query, draining any extra result sets afterwards.
     *
     * Stored procedure calls return an extra status result under
     * CLIENT_MULTI_RESULTS; it has to be consumed or the connection drops.
     */
    std::vector<Row> selectRows(const std::string& sql, const std::string& name = "SQL");

    // Prepared variant of selectRows() that keeps the column names
    Result select(const std::string& sql, const std::vector<Bind>& binds = {},
                  const std::string& name = "SQL");

    BeginOutcome beginTransaction();

    void clearStatementCache();

    // ----- Information -----

    bool supportsStatementCache() const { return true; }
    const char* adapterName() const { return ADAPTER_NAME; }
    ServerVersion serverVersion();

    // Value of character_set_client, memoized
    std::string clientEncoding();

    StatementCache& statementCache() { return m_statements; }
    ConnectionManager& connectionManager() { return m_connection; }

private:
    StatementCache m_statements;
    ConnectionManager m_connection;
    ExecutionEngine m_engine;
    TransactionGuard m_transactions;
    std::optional<std::string> m_clientEncoding;
};

}  // namespace sqladapter
