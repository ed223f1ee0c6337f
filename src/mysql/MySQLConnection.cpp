/**
 * @file MySQLConnection.cpp
 * @brief libmysqlclient implementation of DriverConnection.
 */

#include "MySQLConnection.hpp"
#include "MySQLResultSet.hpp"
#include "MySQLStatement.hpp"
#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace sqladapter {

namespace {

const char* nullIfEmpty(const std::string& value) {
    return value.empty() ? nullptr : value.c_str();
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLConnection::MySQLConnection() {
    // Initialize MySQL library (thread-safe)
    static std::once_flag mysqlInitFlag;
    std::call_once(mysqlInitFlag, []() {
        mysql_library_init(0, nullptr, nullptr);
    });
}

MySQLConnection::~MySQLConnection() {
    close();
}

// ============================================================================
// Options and Connect
// ============================================================================

void MySQLConnection::init() {
    close();

    m_conn = mysql_init(nullptr);
    if (!m_conn) {
        throw ConnectionFailure(CR_OUT_OF_MEMORY, "Failed to initialize MySQL connection");
    }
}

void MySQLConnection::setOption(DriverOption option, const std::string& value) {
    MYSQL* conn = requireHandle();

    if (option != DriverOption::CharsetName) {
        throw DatabaseError(CR_INVALID_PARAMETER_NO, "Option does not take a string value");
    }
    if (mysql_options(conn, MYSQL_SET_CHARSET_NAME, value.c_str()) != 0) {
        throw DatabaseError(CR_INVALID_PARAMETER_NO, "Invalid character set: " + value);
    }
}

void MySQLConnection::setOption(DriverOption option, unsigned int value) {
    MYSQL* conn = requireHandle();

    mysql_option native;
    switch (option) {
        case DriverOption::ConnectTimeout: native = MYSQL_OPT_CONNECT_TIMEOUT; break;
        case DriverOption::ReadTimeout:    native = MYSQL_OPT_READ_TIMEOUT; break;
        case DriverOption::WriteTimeout:   native = MYSQL_OPT_WRITE_TIMEOUT; break;
        default:
            throw DatabaseError(CR_INVALID_PARAMETER_NO, "Option does not take a numeric value");
    }

    if (mysql_options(conn, native, &value) != 0) {
        throw DatabaseError(CR_INVALID_PARAMETER_NO, "Failed to set timeout option");
    }
}

void MySQLConnection::setSsl(const SslOptions& ssl) {
    MYSQL* conn = requireHandle();

    mysql_options(conn, MYSQL_OPT_SSL_KEY, nullIfEmpty(ssl.key));
    mysql_options(conn, MYSQL_OPT_SSL_CERT, nullIfEmpty(ssl.cert));
    mysql_options(conn, MYSQL_OPT_SSL_CA, nullIfEmpty(ssl.ca));
    mysql_options(conn, MYSQL_OPT_SSL_CAPATH, nullIfEmpty(ssl.capath));
    mysql_options(conn, MYSQL_OPT_SSL_CIPHER, nullIfEmpty(ssl.cipher));
}

void MySQLConnection::connect(const ConnectParams& params) {
    MYSQL* conn = requireHandle();

    if (!mysql_real_connect(conn,
                            nullIfEmpty(params.host),
                            params.user.c_str(),
                            params.password.c_str(),
                            nullIfEmpty(params.database),
                            params.port,
                            nullIfEmpty(params.socket),
                            params.flags)) {
        throw ConnectionFailure(conn);
    }

    m_connected = true;
    spdlog::debug("MySQL session established (server {})", mysql_get_server_info(conn));
}

void MySQLConnection::close() {
    if (m_conn) {
        // mysql_close() also detaches any statements still prepared on the handle
        mysql_close(m_conn);
        m_conn = nullptr;
    }
    m_connected = false;
}

DriverCapabilities MySQLConnection::capabilities() const {
    DriverCapabilities caps;
    caps.stat = true;
    caps.changeUser = true;
    caps.reconnectFlag = true;
    caps.errorNumber = true;
    return caps;
}

void MySQLConnection::setReconnect(bool enabled) {
    MYSQL* conn = requireHandle();
    bool reconnect = enabled;
    mysql_options(conn, MYSQL_OPT_RECONNECT, &reconnect);
}

void MySQLConnection::changeUser(const std::string& user, const std::string& password,
                                 const std::string& database) {
    MYSQL* conn = requireHandle();
    if (mysql_change_user(conn, user.c_str(), password.c_str(), nullIfEmpty(database)) != 0) {
        throw ConnectionFailure(conn);
    }
}

// ============================================================================
// Statements and Queries
// ============================================================================

std::unique_ptr<DriverStatement> MySQLConnection::prepare(const std::string& sql) {
    MYSQL* conn = requireHandle();

    MYSQL_STMT* stmt = mysql_stmt_init(conn);
    if (!stmt) {
        throw StatementExecutionError(conn);
    }

    if (mysql_stmt_prepare(stmt, sql.c_str(), sql.size()) != 0) {
        StatementExecutionError error(stmt);
        mysql_stmt_close(stmt);
        throw error;
    }

    return std::make_unique<MySQLStatement>(stmt);
}

std::unique_ptr<DriverResult> MySQLConnection::query(const std::string& sql) {
    MYSQL* conn = requireHandle();

    // mysql_real_query() is preferred over mysql_query() for binary safety
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        throw StatementExecutionError(conn);
    }

    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
        // No result set is only an error if the statement should have produced one
        if (mysql_field_count(conn) != 0) {
            throw StatementExecutionError(conn);
        }
        return nullptr;
    }

    return std::make_unique<MySQLResultSet>(res);
}

bool MySQLConnection::nextResult() {
    MYSQL* conn = requireHandle();

    if (!mysql_more_results(conn)) {
        return false;
    }

    int status = mysql_next_result(conn);
    if (status > 0) {
        throw StatementExecutionError(conn);
    }
    if (status < 0) {
        return false;
    }

    MySQLResultSet pending(mysql_store_result(conn));
    return true;
}

// ============================================================================
// Error and Status Information
// ============================================================================

std::string MySQLConnection::stat() {
    MYSQL* conn = requireHandle();
    const char* status = mysql_stat(conn);
    if (!status) {
        throw StatementExecutionError(conn);
    }
    return status;
}

unsigned int MySQLConnection::errorNumber() const {
    if (!m_conn) return 0;
    return mysql_errno(m_conn);
}

std::string MySQLConnection::lastError() const {
    if (!m_conn) return "No connection";
    return mysql_error(m_conn);
}

uint64_t MySQLConnection::insertId() const {
    if (!m_conn) return 0;
    return mysql_insert_id(m_conn);
}

std::string MySQLConnection::serverInfo() const {
    if (!m_conn) return "";
    const char* info = mysql_get_server_info(m_conn);
    return info ? info : "";
}

MYSQL* MySQLConnection::requireHandle() const {
    if (!m_conn) {
        throw ConnectionFailure(CR_CONNECTION_ERROR, "MySQL handle not initialized");
    }
    return m_conn;
}

}  // namespace sqladapter
