#pragma once

#include <mysql/mysql.h>
#include <string>
#include <stdexcept>

namespace sqladapter {

// MySQL error classification
class ErrorHandler {
public:
    // Check if error is retryable by a layer above the adapter
    static bool isRetryable(unsigned int mysqlError);

    // Check if error indicates connection issue
    static bool isConnectionError(unsigned int mysqlError);

    // Check if the server rejected a feature it does not support
    static bool isUnsupportedFeature(unsigned int mysqlError);

    // Get human-readable error message
    static std::string getErrorMessage(unsigned int mysqlError);
    static std::string getErrorMessage(MYSQL* conn);
    static std::string getErrorMessage(MYSQL_STMT* stmt);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Base for every error reported by the driver; keeps the original code and SQLSTATE
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(unsigned int errorCode, const std::string& message,
                  std::string sqlState = "HY000");

    unsigned int errorCode() const { return m_errorCode; }
    const std::string& sqlState() const { return m_sqlState; }
    bool isConnectionError() const { return ErrorHandler::isConnectionError(m_errorCode); }

private:
    unsigned int m_errorCode;
    std::string m_sqlState;
};

// Connect, reconnect or re-authentication could not establish a session
class ConnectionFailure : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
    explicit ConnectionFailure(MYSQL* conn);
};

// Prepare, execute or query rejected by the driver
class StatementExecutionError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
    explicit StatementExecutionError(MYSQL* conn);
    explicit StatementExecutionError(MYSQL_STMT* stmt);
};

}  // namespace sqladapter
