#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief DriverConnection implementation on libmysqlclient.
 *
 * Wraps a single MYSQL handle. The handle is allocated by init(), released by
 * close() and by the destructor.
 */

#include "Driver.hpp"
#include <mysql/mysql.h>
#include <string>
#include <cstdint>

namespace sqladapter {

/**
 * @class MySQLConnection
 * @brief RAII owner of one MYSQL handle.
 *
 * Thread Safety:
 * - Not thread-safe; a connection belongs to one adapter.
 *
 * Usage:
 * @code
 *   MySQLConnection conn;
 *   conn.init();
 *   conn.connect(params);
 *   auto result = conn.query("SHOW TABLES");
 * @endcode
 */
class MySQLConnection : public DriverConnection {
public:
    MySQLConnection();

    /**
     * @brief Destructor - closes the handle if still allocated.
     */
    ~MySQLConnection() override;

    /**
     * @brief Allocate a fresh MYSQL handle, closing any previous one.
     * @throws ConnectionFailure if mysql_init fails.
     */
    void init() override;

    /**
     * @brief Set a string option (MYSQL_SET_CHARSET_NAME).
     * @throws DatabaseError if the option is rejected.
     */
    void setOption(DriverOption option, const std::string& value) override;

    /**
     * @brief Set a timeout option in seconds.
     * @throws DatabaseError if the option is rejected.
     */
    void setOption(DriverOption option, unsigned int value) override;

    /**
     * @brief Configure SSL key, certificate, CA, CA path and cipher list.
     *
     * Empty fields are passed as NULL so libmysqlclient keeps its defaults.
     */
    void setSsl(const SslOptions& ssl) override;

    /**
     * @brief Connect with mysql_real_connect().
     * @throws ConnectionFailure with the driver's error number and message.
     */
    void connect(const ConnectParams& params) override;

    void close() override;
    bool isOpen() const override { return m_conn != nullptr && m_connected; }

    DriverCapabilities capabilities() const override;
    void setReconnect(bool enabled) override;

    /**
     * @brief Re-authenticate with mysql_change_user().
     * @throws ConnectionFailure on failure.
     */
    void changeUser(const std::string& user, const std::string& password,
                    const std::string& database) override;

    /**
     * @brief Prepare a statement with ? placeholders.
     * @throws StatementExecutionError if the server rejects the SQL.
     */
    std::unique_ptr<DriverStatement> prepare(const std::string& sql) override;

    /**
     * @brief Run SQL with mysql_real_query() and buffer the whole result.
     * @return MySQLResultSet, or nullptr for statements without a result set.
     * @throws StatementExecutionError on failure.
     */
    std::unique_ptr<DriverResult> query(const std::string& sql) override;

    bool nextResult() override;

    /**
     * @brief Server status string from mysql_stat().
     * @throws StatementExecutionError if the server does not answer.
     */
    std::string stat() override;

    unsigned int errorNumber() const override;
    std::string lastError() const override;
    uint64_t insertId() const override;
    std::string serverInfo() const override;

    /**
     * @brief Get the underlying MySQL connection handle.
     * @return Raw MYSQL* pointer (still owned by this object).
     */
    MYSQL* get() const { return m_conn; }

private:
    MYSQL* requireHandle() const;

    MYSQL* m_conn = nullptr;     ///< MySQL connection handle
    bool m_connected = false;    ///< Set after a successful mysql_real_connect
};

}  // namespace sqladapter
