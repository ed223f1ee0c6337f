#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>

namespace sqladapter {

thread_local std::string ErrorContext::s_currentContext;

bool ErrorHandler::isRetryable(unsigned int mysql_error) {
    switch (mysql_error) {
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_SERVER_LOST_EXTENDED:
        case ER_LOCK_WAIT_TIMEOUT:
        case ER_LOCK_DEADLOCK:
        case ER_TOO_MANY_CONCURRENT_TRXS:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isConnectionError(unsigned int mysql_error) {
    switch (mysql_error) {
        case CR_CONNECTION_ERROR:
        case CR_CONN_HOST_ERROR:
        case CR_UNKNOWN_HOST:
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_SERVER_LOST_EXTENDED:
        case CR_COMMANDS_OUT_OF_SYNC:
        case CR_SOCKET_CREATE_ERROR:
        case CR_IPSOCK_ERROR:
        case ER_ACCESS_DENIED_ERROR:
        case ER_CON_COUNT_ERROR:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isUnsupportedFeature(unsigned int mysql_error) {
    switch (mysql_error) {
        case ER_NOT_SUPPORTED_YET:
        case ER_ILLEGAL_HA:
        case ER_CHECK_NOT_IMPLEMENTED:
        case ER_UNSUPPORTED_PS:
            return true;
        default:
            return false;
    }
}

std::string ErrorHandler::getErrorMessage(unsigned int mysql_error) {
    switch (mysql_error) {
        case 0:
            return "Success";
        case CR_CONNECTION_ERROR:
            return "Connection error";
        case CR_CONN_HOST_ERROR:
            return "Cannot connect to host";
        case CR_UNKNOWN_HOST:
            return "Unknown host";
        case CR_SERVER_GONE_ERROR:
            return "MySQL server has gone away";
        case CR_SERVER_LOST:
            return "Lost connection to MySQL server";
        case CR_COMMANDS_OUT_OF_SYNC:
            return "Commands out of sync";
        case ER_ACCESS_DENIED_ERROR:
            return "Access denied";
        case ER_BAD_DB_ERROR:
            return "Unknown database";
        case ER_NO_SUCH_TABLE:
            return "Table does not exist";
        case ER_DUP_ENTRY:
            return "Duplicate entry";
        case ER_PARSE_ERROR:
            return "SQL parse error";
        case ER_UNSUPPORTED_PS:
            return "Statement not supported by the prepared statement protocol";
        case ER_NOT_SUPPORTED_YET:
            return "Feature not supported";
        case ER_LOCK_WAIT_TIMEOUT:
            return "Lock wait timeout";
        case ER_LOCK_DEADLOCK:
            return "Deadlock detected";
        default:
            return "MySQL error " + std::to_string(mysql_error);
    }
}

std::string ErrorHandler::getErrorMessage(MYSQL* conn) {
    if (!conn) {
        return "No connection";
    }
    const char* err = mysql_error(conn);
    if (err && *err) {
        return std::string(err);
    }
    return getErrorMessage(mysql_errno(conn));
}

std::string ErrorHandler::getErrorMessage(MYSQL_STMT* stmt) {
    if (!stmt) {
        return "No statement";
    }
    const char* err = mysql_stmt_error(stmt);
    if (err && *err) {
        return std::string(err);
    }
    return getErrorMessage(mysql_stmt_errno(stmt));
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

DatabaseError::DatabaseError(unsigned int error_code, const std::string& message,
                             std::string sql_state)
    : std::runtime_error(message)
    , m_errorCode(error_code)
    , m_sqlState(std::move(sql_state)) {
}

ConnectionFailure::ConnectionFailure(MYSQL* conn)
    : DatabaseError(conn ? mysql_errno(conn) : CR_CONNECTION_ERROR,
                    ErrorHandler::getErrorMessage(conn),
                    conn ? mysql_sqlstate(conn) : "HY000") {
}

StatementExecutionError::StatementExecutionError(MYSQL* conn)
    : DatabaseError(conn ? mysql_errno(conn) : CR_UNKNOWN_ERROR,
                    ErrorHandler::getErrorMessage(conn),
                    conn ? mysql_sqlstate(conn) : "HY000") {
}

StatementExecutionError::StatementExecutionError(MYSQL_STMT* stmt)
    : DatabaseError(stmt ? mysql_stmt_errno(stmt) : CR_UNKNOWN_ERROR,
                    ErrorHandler::getErrorMessage(stmt),
                    stmt ? mysql_stmt_sqlstate(stmt) : "HY000") {
}

}  // namespace sqladapter
