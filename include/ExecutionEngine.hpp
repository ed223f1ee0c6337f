#pragma once

/**
 * @file ExecutionEngine.hpp
 * @brief Prepared statement execution pipeline of the adapter.
 */

#include "ConnectionManager.hpp"
#include "Driver.hpp"
#include "ResultAdapter.hpp"
#include "StatementCache.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqladapter {

/**
 * @class ExecutionEngine
 * @brief Runs one statement invocation: prepare-or-reuse, bind, execute, read, release.
 *
 * Statements with bind values are cached per SQL text; bind-less statements are
 * prepared, used and closed within the call. When the driver rejects an
 * execution the statement is closed and dropped from the cache before the
 * error is rethrown unchanged. No retry happens here.
 *
 * Every result set and metadata handle is released before a call returns, on
 * success and on error.
 */
class ExecutionEngine {
public:
    ExecutionEngine(ConnectionManager& connection, StatementCache& statements);

    /**
     * @brief Execute a statement and read its rows.
     * @param sql SQL with ? placeholders.
     * @param name Label used in the statement log.
     * @param binds Parameters in placeholder order.
     * @throws StatementExecutionError if prepare or execute fails.
     */
    Result execute(const std::string& sql, const std::string& name = "SQL",
                   const std::vector<Bind>& binds = {});

    /**
     * @brief Run SQL through the text protocol, bypassing prepared statements.
     *
     * For statements the prepared statement API cannot run, such as
     * SHOW CREATE TABLE. Nothing is cached.
     */
    Result executeDirect(const std::string& sql, const std::string& name = "SQL");

    /**
     * @brief Same pipeline as execute(), returning the affected row count.
     */
    uint64_t executeMutation(const std::string& sql, const std::string& name,
                             const std::vector<Bind>& binds);

    /**
     * @brief Run an INSERT and return its id.
     * @param idValue Id supplied by the caller; when unset the connection's
     *                last generated id is returned.
     */
    uint64_t executeInsert(const std::string& sql, const std::string& name = "SQL",
                           std::optional<uint64_t> idValue = std::nullopt);

    // Last id generated on the connection
    uint64_t lastInsertId();

    /**
     * @brief Convert a bind value for the driver: true → 1, false → 0, others unchanged.
     */
    static BindValue typeCast(const Bind& bind);

private:
    template<typename Func>
    auto withStatement(const std::string& sql, const std::vector<Bind>& binds, Func&& consume);

    ConnectionManager& m_connection;
    StatementCache& m_statements;
};

}  // namespace sqladapter
