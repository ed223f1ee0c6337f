/**
 * @file ConnectionManager.cpp
 * @brief Connect, reconnect, liveness check and reset of the adapter's connection.
 */

#include "ConnectionManager.hpp"
#include "ErrorHandler.hpp"
#include <mysql/mysql.h>
#include <mysql/errmsg.h>
#include <spdlog/spdlog.h>
#include <regex>
#include <stdexcept>

namespace sqladapter {

ConnectionManager::ConnectionManager(ConnectionConfig config,
                                     std::unique_ptr<DriverConnection> driver,
                                     StatementCache& statements)
    : m_config(std::move(config)), m_driver(std::move(driver)), m_statements(statements) {
    if (!m_driver) {
        throw std::invalid_argument("ConnectionManager requires a driver connection");
    }
    if (!m_config.hasValidEncoding()) {
        throw std::invalid_argument("Invalid character set name '" + m_config.encoding + "'");
    }
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

// ============================================================================
// Lifecycle
// ============================================================================

void ConnectionManager::connect() {
    ErrorContext context("connect");

    // Statements prepared on an earlier session are gone with it
    disconnect();

    m_driver->init();
    applyOptions();

    ConnectParams params;
    params.host = m_config.host;
    params.user = m_config.username;
    params.password = m_config.password;
    params.database = m_config.database;
    params.port = m_config.port;
    params.socket = m_config.socket;
    params.flags = CLIENT_MULTI_RESULTS | CLIENT_FOUND_ROWS;

    m_driver->connect(params);
    m_connected = true;
    m_capabilities = m_driver->capabilities();

    // Must follow the physical connect, which clears the flag
    if (m_capabilities.reconnectFlag) {
        m_driver->setReconnect(m_config.reconnect);
    }

    configureConnection();

    spdlog::info("Connected to {} as {} (database '{}')",
                 m_config.socket.empty() ? (m_config.host.empty() ? "localhost" : m_config.host)
                                         : m_config.socket,
                 m_config.username, m_config.database);
}

void ConnectionManager::reconnect() {
    spdlog::info("Reconnecting to database '{}'", m_config.database);
    disconnect();
    connect();
}

void ConnectionManager::disconnect() {
    // Close this process's statements while the session can still take them
    m_statements.clear();

    if (m_driver->isOpen()) {
        try {
            m_driver->close();
        } catch (const std::exception& e) {
            spdlog::debug("Ignoring error while closing connection: {}", e.what());
        }
        if (m_connected) {
            spdlog::info("Disconnected from database '{}'", m_config.database);
        }
    }
    m_connected = false;
    m_version.reset();
}

void ConnectionManager::reset() {
    if (!m_capabilities.changeUser) {
        spdlog::debug("Driver cannot change user, reset skipped");
        return;
    }

    ErrorContext context("reset");
    DriverConnection& connection = handle();

    // COM_CHANGE_USER deallocates every server-side prepared statement
    m_statements.clear();
    connection.changeUser(m_config.username, m_config.password, m_config.database);
    configureConnection();
}

bool ConnectionManager::isActive() {
    if (!m_connected) {
        return false;
    }

    try {
        if (m_capabilities.stat) {
            m_driver->stat();
        } else {
            m_driver->query("SELECT 1");
        }

        // Some drivers report a failed status call through the error number only
        if (m_capabilities.errorNumber) {
            return m_driver->errorNumber() == 0;
        }
        return true;
    } catch (const DatabaseError& e) {
        spdlog::debug("Liveness check failed ({}): {}", e.errorCode(), e.what());
        return false;
    }
}

DriverConnection& ConnectionManager::handle() {
    if (!m_connected) {
        throw ConnectionFailure(CR_SERVER_GONE_ERROR, "Connection is not open");
    }
    return *m_driver;
}

// ============================================================================
// Server Information
// ============================================================================

ServerVersion ConnectionManager::serverVersion() {
    if (!m_version) {
        m_version = parseServerVersion(handle().serverInfo());
    }
    return *m_version;
}

ServerVersion ConnectionManager::parseServerVersion(const std::string& info) {
    static const std::regex pattern(R"(^(\d+)\.(\d+)\.(\d+))");

    ServerVersion version;
    std::smatch match;
    if (std::regex_search(info, match, pattern)) {
        version.major = std::stoi(match[1].str());
        version.minor = std::stoi(match[2].str());
        version.patch = std::stoi(match[3].str());
    }
    return version;
}

void ConnectionManager::discardPendingResults() {
    if (!m_connected) return;

    size_t skipped = 0;
    while (m_driver->nextResult()) {
        ++skipped;
    }
    if (skipped > 0) {
        spdlog::debug("Discarded {} pending result sets", skipped);
    }
}

// ============================================================================
// Session Setup
// ============================================================================

void ConnectionManager::applyOptions() {
    if (!m_config.encoding.empty()) {
        try {
            m_driver->setOption(DriverOption::CharsetName, m_config.encoding);
        } catch (const DatabaseError& e) {
            spdlog::warn("[{}] Could not set character set '{}': {}",
                         ErrorContext::current(), m_config.encoding, e.what());
        }
    }

    if (m_config.useSsl()) {
        m_driver->setSsl(SslOptions{m_config.sslkey, m_config.sslcert, m_config.sslca,
                                    m_config.sslcapath, m_config.sslcipher});
    }

    if (m_config.connect_timeout) {
        m_driver->setOption(DriverOption::ConnectTimeout,
                            static_cast<unsigned int>(m_config.connect_timeout->count()));
    }
    if (m_config.read_timeout) {
        m_driver->setOption(DriverOption::ReadTimeout,
                            static_cast<unsigned int>(m_config.read_timeout->count()));
    }
    if (m_config.write_timeout) {
        m_driver->setOption(DriverOption::WriteTimeout,
                            static_cast<unsigned int>(m_config.write_timeout->count()));
    }
}

void ConnectionManager::configureConnection() {
    if (!m_config.encoding.empty()) {
        // Validated in the constructor, so it can be quoted as is
        runSessionStatement("SET NAMES '" + m_config.encoding + "'");
    }

    // By default 'WHERE id IS NULL' selects the last inserted id
    runSessionStatement("SET SQL_AUTO_IS_NULL=0");
}

void ConnectionManager::runSessionStatement(const std::string& sql) {
    spdlog::debug("[{}] {}", ErrorContext::current(), sql);
    handle().query(sql);
}

}  // namespace sqladapter
