#include "Adapter.hpp"
#include "MySQLConnection.hpp"
#include <spdlog/spdlog.h>

namespace sqladapter {

Adapter::Adapter(const ConnectionConfig& connection, const StatementConfig& statements,
                 std::unique_ptr<DriverConnection> driver, IdentitySource identity)
    : m_statements(statements.statement_limit, std::move(identity))
    , m_connection(connection, std::move(driver), m_statements)
    , m_engine(m_connection, m_statements)
    , m_transactions(m_engine) {
    m_connection.connect();
}

Adapter::~Adapter() {
    // Closes this process's cached statements first
    m_connection.disconnect();
}

std::unique_ptr<Adapter> Adapter::createMySQL(const Config& config) {
    return std::make_unique<Adapter>(config.connection, config.statements,
                                     std::make_unique<MySQLConnection>());
}

// ============================================================================
// Connection Management
// ============================================================================

void Adapter::connect() {
    m_connection.connect();
}

void Adapter::reconnect() {
    m_clientEncoding.reset();
    m_connection.reconnect();
}

void Adapter::disconnect() {
    m_connection.disconnect();
}

void Adapter::reset() {
    m_connection.reset();
}

bool Adapter::isActive() {
    return m_connection.isActive();
}

// ============================================================================
// Statements
// ============================================================================

Result Adapter::execute(const std::string& sql, const std::vector<Bind>& binds,
                        const std::string& name) {
    return m_engine.execute(sql, name, binds);
}

Result Adapter::executeDirect(const std::string& sql, const std::string& name) {
    return m_engine.executeDirect(sql, name);
}

uint64_t Adapter::executeMutation(const std::string& sql, const std::vector<Bind>& binds,
                                  const std::string& name) {
    return m_engine.executeMutation(sql, name, binds);
}

uint64_t Adapter::insert(const std::string& sql, std::optional<uint64_t> idValue,
                         const std::string& name) {
    return m_engine.executeInsert(sql, name, idValue);
}

std::vector<Row> Adapter::selectRows(const std::string& sql, const std::string& name) {
    Result result = m_engine.executeDirect(sql, name);
    m_connection.discardPendingResults();
    return result.rows();
}

Result Adapter::select(const std::string& sql, const std::vector<Bind>& binds,
                       const std::string& name) {
    Result result = m_engine.execute(sql, name, binds);
    m_connection.discardPendingResults();
    return result;
}

BeginOutcome Adapter::beginTransaction() {
    return m_transactions.begin();
}

void Adapter::clearStatementCache() {
    m_statements.clear();
}

// ============================================================================
// Information
// ============================================================================

ServerVersion Adapter::serverVersion() {
    return m_connection.serverVersion();
}

std::string Adapter::clientEncoding() {
    if (m_clientEncoding) {
        return *m_clientEncoding;
    }

    Result result = m_engine.execute(
        "SHOW VARIABLES WHERE Variable_name = 'character_set_client'", "SCHEMA");

    std::string encoding;
    if (!result.empty() && !result.rows().back().empty() && result.rows().back().back()) {
        encoding = *result.rows().back().back();
    } else {
        spdlog::warn("Server did not report character_set_client");
    }

    m_clientEncoding = encoding;
    return encoding;
}

}  // namespace sqladapter
