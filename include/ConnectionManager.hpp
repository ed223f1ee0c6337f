#pragma once

/**
 * @file ConnectionManager.hpp
 * @brief Lifecycle of the adapter's single physical database connection.
 */

#include "Config.hpp"
#include "Driver.hpp"
#include "StatementCache.hpp"
#include <memory>
#include <optional>
#include <string>

namespace sqladapter {

struct ServerVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;
};

/**
 * @class ConnectionManager
 * @brief Owns one DriverConnection and establishes, tears down, checks and resets it.
 *
 * The statement cache is cleared whenever a session ends or is reset, so no
 * statement prepared on an old session survives.
 *
 * Thread Safety: none. Callers serialize access to the adapter.
 */
class ConnectionManager {
public:
    /**
     * @param config Connection parameters and post-connect settings.
     * @param driver Connection handle (takes ownership).
     * @param statements Cache of statements prepared on this connection.
     * @throws std::invalid_argument on a null driver or a malformed encoding name.
     */
    ConnectionManager(ConnectionConfig config, std::unique_ptr<DriverConnection> driver,
                      StatementCache& statements);

    /**
     * @brief Destructor - closes the connection if still open.
     */
    ~ConnectionManager();

    // Non-copyable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Apply options, connect, then configure the session.
     *
     * Any open session is disconnected first.
     * @throws ConnectionFailure if the session cannot be established.
     *
     * The auto-reconnect flag is set after the physical connect because the
     * connect resets it.
     */
    void connect();

    /**
     * @brief Disconnect, then connect.
     * @throws ConnectionFailure if the new session cannot be established.
     */
    void reconnect();

    /**
     * @brief Close this process's cached statements, then the handle.
     *
     * Never throws; errors are logged.
     */
    void disconnect();

    /**
     * @brief Re-authenticate as the configured user and re-run session configuration.
     *
     * The server drops its prepared statements on a user change, so the cache
     * is cleared first.
     * No-op when the driver cannot change users on a live session.
     */
    void reset();

    /**
     * @brief Liveness check.
     * @return true only if the check succeeded and no error number is set.
     */
    bool isActive();

    bool isConnected() const { return m_connected; }

    /**
     * @brief The live handle.
     * @throws ConnectionFailure if not connected.
     */
    DriverConnection& handle();

    const DriverCapabilities& capabilities() const { return m_capabilities; }
    const ConnectionConfig& config() const { return m_config; }

    /**
     * @brief Server version parsed from the server info string, memoized.
     */
    ServerVersion serverVersion();

    // Drop result sets left pending by multi-result calls
    void discardPendingResults();

    static ServerVersion parseServerVersion(const std::string& info);

private:
    void applyOptions();
    void configureConnection();
    void runSessionStatement(const std::string& sql);

    ConnectionConfig m_config;
    std::unique_ptr<DriverConnection> m_driver;
    StatementCache& m_statements;

    DriverCapabilities m_capabilities;
    bool m_connected = false;
    std::optional<ServerVersion> m_version;
};

}  // namespace sqladapter
