#pragma once

/**
 * @file Driver.hpp
 * @brief Abstract handle operations the adapter needs from a database client library.
 *
 * The adapter core never calls libmysqlclient directly. It talks to a
 * DriverConnection, the DriverStatement objects it prepares and the DriverResult
 * objects returned by direct queries. The MySQL implementations live under
 * include/mysql/.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqladapter {

// A single value that can be null, in the driver's text representation
using SqlValue = std::optional<std::string>;

using Row = std::vector<SqlValue>;

// Value handed to the driver's native parameter binding
using BindValue = std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string>;

// A bind parameter together with the column it is compared against
struct Bind {
    std::string column;
    BindValue value;
};

enum class DriverOption {
    CharsetName,
    ConnectTimeout,
    ReadTimeout,
    WriteTimeout
};

struct SslOptions {
    std::string key;
    std::string cert;
    std::string ca;
    std::string capath;
    std::string cipher;
};

struct ConnectParams {
    std::string host;
    std::string user;
    std::string password;
    std::string database;
    unsigned int port = 0;
    std::string socket;
    unsigned long flags = 0;
};

/**
 * @brief Optional driver features, read once after a successful connect.
 */
struct DriverCapabilities {
    bool stat = false;           ///< Lightweight status call for liveness checks
    bool changeUser = false;     ///< Re-authentication without a full reconnect
    bool reconnectFlag = false;  ///< Auto-reconnect can be toggled
    bool errorNumber = false;    ///< Last error number can be queried
};

/**
 * @class DriverResult
 * @brief Fully buffered result of a direct (non-prepared) query.
 *
 * The underlying result handle is released when the object is destroyed.
 */
class DriverResult {
public:
    virtual ~DriverResult() = default;

    virtual std::vector<std::string> columnNames() const = 0;

    /**
     * @brief Fetch the next row.
     * @return false when there are no more rows.
     */
    virtual bool fetchRow(Row& row) = 0;

protected:
    DriverResult() = default;
};

/**
 * @class DriverStatement
 * @brief A server-side prepared statement bound to one SQL string and one connection.
 *
 * close() releases the server handle. It is idempotent: a second call, or a call
 * after the connection broke, does nothing.
 */
class DriverStatement {
public:
    virtual ~DriverStatement() = default;

    // Non-copyable
    DriverStatement(const DriverStatement&) = delete;
    DriverStatement& operator=(const DriverStatement&) = delete;

    /**
     * @brief Bind the parameters and execute.
     * @throws StatementExecutionError if the driver rejects the execution.
     */
    virtual void execute(const std::vector<BindValue>& params) = 0;

    // True if the last execution produced a result set
    virtual bool hasResultSet() const = 0;

    // Column names from the statement's result metadata
    virtual std::vector<std::string> columnNames() = 0;

    virtual bool fetchRow(Row& row) = 0;

    // Release the buffered result set of the last execution
    virtual void freeResult() noexcept = 0;

    virtual uint64_t affectedRows() const = 0;

    virtual void close() noexcept = 0;
    virtual bool isClosed() const = 0;

    // Forget the native handle without closing it on the server. Used for
    // statements inherited from another process's session.
    virtual void detach() noexcept = 0;

protected:
    DriverStatement() = default;
};

/**
 * @class DriverConnection
 * @brief One physical session handle.
 *
 * Lifecycle: init() → setOption()/setSsl() → connect() → ... → close().
 * A closed handle must be init()-ed again before the next connect().
 */
class DriverConnection {
public:
    virtual ~DriverConnection() = default;

    // Non-copyable
    DriverConnection(const DriverConnection&) = delete;
    DriverConnection& operator=(const DriverConnection&) = delete;

    virtual void init() = 0;
    virtual void setOption(DriverOption option, const std::string& value) = 0;
    virtual void setOption(DriverOption option, unsigned int value) = 0;
    virtual void setSsl(const SslOptions& ssl) = 0;

    /**
     * @throws ConnectionFailure if the session cannot be established.
     */
    virtual void connect(const ConnectParams& params) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual DriverCapabilities capabilities() const = 0;
    virtual void setReconnect(bool enabled) = 0;
    virtual void changeUser(const std::string& user, const std::string& password,
                            const std::string& database) = 0;

    virtual std::unique_ptr<DriverStatement> prepare(const std::string& sql) = 0;

    /**
     * @brief Run SQL with the text protocol.
     * @return The buffered result, or nullptr for statements without a result set.
     */
    virtual std::unique_ptr<DriverResult> query(const std::string& sql) = 0;

    /**
     * @brief Skip the next pending result set of a multi-result call.
     * @return false when no result sets are pending.
     */
    virtual bool nextResult() = 0;

    virtual std::string stat() = 0;
    virtual unsigned int errorNumber() const = 0;
    virtual std::string lastError() const = 0;
    virtual uint64_t insertId() const = 0;
    virtual std::string serverInfo() const = 0;

protected:
    DriverConnection() = default;
};

}  // namespace sqladapter
