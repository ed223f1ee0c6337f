/**
 * @file MySQLStatement.cpp
 * @brief Parameter binding, execution and row fetching for MYSQL_STMT handles.
 */

#include "MySQLStatement.hpp"
#include "MySQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <spdlog/spdlog.h>
#include <variant>

namespace sqladapter {

namespace {

constexpr size_t kInitialColumnBuffer = 256;

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLStatement::MySQLStatement(MYSQL_STMT* stmt) : m_stmt(stmt) {}

MySQLStatement::~MySQLStatement() {
    close();
}

// ============================================================================
// Execution
// ============================================================================

void MySQLStatement::execute(const std::vector<BindValue>& params) {
    if (!m_stmt) {
        throw StatementExecutionError(CR_NO_PREPARE_STMT, "Statement is closed");
    }

    unsigned long expected = mysql_stmt_param_count(m_stmt);
    if (params.size() != expected) {
        throw StatementExecutionError(CR_PARAMS_NOT_BOUND,
            "Statement expects " + std::to_string(expected) + " parameters, got " +
            std::to_string(params.size()));
    }

    // Drop whatever the previous execution left behind
    freeResult();

    if (!params.empty()) {
        bindParams(params);
        if (mysql_stmt_bind_param(m_stmt, m_params.data())) {
            throw StatementExecutionError(m_stmt);
        }
    }

    if (mysql_stmt_execute(m_stmt) != 0) {
        throw StatementExecutionError(m_stmt);
    }

    if (mysql_stmt_field_count(m_stmt) > 0) {
        m_hasResult = true;
        bindResult();
        if (mysql_stmt_store_result(m_stmt) != 0) {
            throw StatementExecutionError(m_stmt);
        }
    }
}

void MySQLStatement::bindParams(const std::vector<BindValue>& params) {
    m_paramData.assign(params.size(), ParamBuffer{});
    m_params.assign(params.size(), MYSQL_BIND{});

    for (size_t i = 0; i < params.size(); ++i) {
        MYSQL_BIND& bind = m_params[i];
        ParamBuffer& data = m_paramData[i];

        std::visit([&bind, &data](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                bind.buffer_type = MYSQL_TYPE_NULL;
            } else if constexpr (std::is_same_v<T, bool>) {
                data.integer = value ? 1 : 0;
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                bind.buffer = &data.integer;
            } else if constexpr (std::is_same_v<T, int64_t>) {
                data.integer = value;
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                bind.buffer = &data.integer;
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                data.unsignedInteger = value;
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                bind.buffer = &data.unsignedInteger;
                bind.is_unsigned = true;
            } else if constexpr (std::is_same_v<T, double>) {
                data.real = value;
                bind.buffer_type = MYSQL_TYPE_DOUBLE;
                bind.buffer = &data.real;
            } else {
                data.text = value;
                data.length = static_cast<unsigned long>(data.text.size());
                bind.buffer_type = MYSQL_TYPE_STRING;
                bind.buffer = data.text.data();
                bind.buffer_length = data.length;
                bind.length = &data.length;
            }
        }, params[i]);
    }
}

void MySQLStatement::bindResult() {
    unsigned int count = mysql_stmt_field_count(m_stmt);

    m_columns.assign(count, ColumnBuffer{});
    m_results.assign(count, MYSQL_BIND{});

    for (unsigned int i = 0; i < count; ++i) {
        ColumnBuffer& column = m_columns[i];
        column.data.resize(kInitialColumnBuffer);

        MYSQL_BIND& bind = m_results[i];
        bind.buffer_type = MYSQL_TYPE_STRING;
        bind.buffer = column.data.data();
        bind.buffer_length = static_cast<unsigned long>(column.data.size());
        bind.length = &column.length;
        bind.is_null = &column.isNull;
        bind.error = &column.error;
    }

    if (mysql_stmt_bind_result(m_stmt, m_results.data())) {
        throw StatementExecutionError(m_stmt);
    }
}

// ============================================================================
// Results
// ============================================================================

std::vector<std::string> MySQLStatement::columnNames() {
    if (!m_stmt) return {};

    // Metadata result is freed when the wrapper goes out of scope
    MySQLResultSet metadata(mysql_stmt_result_metadata(m_stmt));
    if (!metadata) {
        if (mysql_stmt_errno(m_stmt) != 0) {
            throw StatementExecutionError(m_stmt);
        }
        return {};
    }
    return metadata.getColumnNames();
}

bool MySQLStatement::fetchRow(Row& row) {
    if (!m_stmt || !m_hasResult) return false;

    int status = mysql_stmt_fetch(m_stmt);
    if (status == MYSQL_NO_DATA) {
        return false;
    }
    if (status == 1) {
        throw StatementExecutionError(m_stmt);
    }

    row.clear();
    row.reserve(m_columns.size());

    for (size_t i = 0; i < m_columns.size(); ++i) {
        const ColumnBuffer& column = m_columns[i];

        if (column.isNull) {
            row.emplace_back(std::nullopt);
            continue;
        }

        if (column.length <= column.data.size()) {
            row.emplace_back(std::string(column.data.data(), column.length));
            continue;
        }

        // Truncated (MYSQL_DATA_TRUNCATED): read the full value into its own buffer
        std::string value(column.length, '\0');
        unsigned long length = 0;
        MYSQL_BIND bind{};
        bind.buffer_type = MYSQL_TYPE_STRING;
        bind.buffer = value.data();
        bind.buffer_length = column.length;
        bind.length = &length;

        if (mysql_stmt_fetch_column(m_stmt, &bind, static_cast<unsigned int>(i), 0) != 0) {
            throw StatementExecutionError(m_stmt);
        }
        value.resize(length);
        row.emplace_back(std::move(value));
    }

    return true;
}

void MySQLStatement::freeResult() noexcept {
    if (m_stmt && m_hasResult) {
        if (mysql_stmt_free_result(m_stmt)) {
            spdlog::debug("mysql_stmt_free_result failed: {}", mysql_stmt_error(m_stmt));
        }
    }
    m_hasResult = false;
}

uint64_t MySQLStatement::affectedRows() const {
    if (!m_stmt) return 0;
    return mysql_stmt_affected_rows(m_stmt);
}

// ============================================================================
// Resource Management
// ============================================================================

void MySQLStatement::close() noexcept {
    if (!m_stmt) return;

    if (mysql_stmt_close(m_stmt)) {
        // The connection may already be gone; the handle is freed either way
        spdlog::debug("mysql_stmt_close reported an error");
    }
    m_stmt = nullptr;
    m_hasResult = false;
}

void MySQLStatement::detach() noexcept {
    // mysql_stmt_close would send COM_STMT_CLOSE on a session this process does not own
    m_stmt = nullptr;
    m_hasResult = false;
}

}  // namespace sqladapter
