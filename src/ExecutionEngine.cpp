#include "ExecutionEngine.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <sstream>
#include <type_traits>

namespace sqladapter {

namespace {

using Clock = std::chrono::steady_clock;

// Frees the result set on scope exit, and closes statements that are not cached
class StatementRelease {
public:
    StatementRelease(DriverStatement& statement, bool close)
        : m_statement(statement), m_close(close) {}

    ~StatementRelease() {
        m_statement.freeResult();
        if (m_close) {
            m_statement.close();
        }
    }

    StatementRelease(const StatementRelease&) = delete;
    StatementRelease& operator=(const StatementRelease&) = delete;

private:
    DriverStatement& m_statement;
    bool m_close;
};

std::string describeBinds(const std::vector<Bind>& binds) {
    std::ostringstream out;
    out << '[';
    for (size_t i = 0; i < binds.size(); ++i) {
        if (i > 0) out << ", ";
        out << binds[i].column << ": ";
        std::visit([&out](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                out << "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                out << (value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, std::string>) {
                out << '\'' << value << '\'';
            } else {
                out << value;
            }
        }, binds[i].value);
    }
    out << ']';
    return out.str();
}

void logStatement(const std::string& name, const std::string& sql,
                  const std::vector<Bind>& binds, Clock::time_point start) {
    if (!spdlog::should_log(spdlog::level::debug)) return;

    double ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    if (binds.empty()) {
        spdlog::debug("{} ({:.1f}ms) {}", name, ms, sql);
    } else {
        spdlog::debug("{} ({:.1f}ms) {} {}", name, ms, sql, describeBinds(binds));
    }
}

}  // namespace

ExecutionEngine::ExecutionEngine(ConnectionManager& connection, StatementCache& statements)
    : m_connection(connection), m_statements(statements) {
}

template<typename Func>
auto ExecutionEngine::withStatement(const std::string& sql, const std::vector<Bind>& binds,
                                    Func&& consume) {
    DriverConnection& connection = m_connection.handle();

    std::unique_ptr<DriverStatement> transient;
    CacheEntry* entry = nullptr;
    DriverStatement* statement = nullptr;

    if (binds.empty()) {
        transient = connection.prepare(sql);
        statement = transient.get();
    } else {
        entry = m_statements.get(sql);
        if (!entry) {
            entry = &m_statements.put(sql, connection.prepare(sql));
        }
        statement = entry->statement.get();
    }

    std::vector<BindValue> values;
    values.reserve(binds.size());
    for (const auto& bind : binds) {
        values.push_back(typeCast(bind));
    }

    try {
        statement->execute(values);
    } catch (const DatabaseError& e) {
        // Older servers leave the statement unusable after an error
        spdlog::debug("Dropping prepared statement after error {}: {}", e.errorCode(), e.what());
        statement->close();
        if (entry) {
            m_statements.remove(sql);
        }
        throw;
    }

    StatementRelease release(*statement, entry == nullptr);

    const std::vector<std::string>* columns = nullptr;
    std::vector<std::string> transientColumns;
    if (statement->hasResultSet()) {
        if (entry) {
            if (!entry->columns) {
                entry->columns = statement->columnNames();
            }
            columns = &*entry->columns;
        } else {
            transientColumns = statement->columnNames();
            columns = &transientColumns;
        }
    }

    return consume(columns, *statement);
}

Result ExecutionEngine::execute(const std::string& sql, const std::string& name,
                                const std::vector<Bind>& binds) {
    auto start = Clock::now();

    Result result = withStatement(sql, binds,
        [](const std::vector<std::string>* columns, DriverStatement& statement) {
            if (!columns) {
                return Result{};
            }
            return ResultAdapter::fromStatement(*columns, statement);
        });

    logStatement(name, sql, binds, start);
    return result;
}

Result ExecutionEngine::executeDirect(const std::string& sql, const std::string& name) {
    auto start = Clock::now();

    std::unique_ptr<DriverResult> raw = m_connection.handle().query(sql);
    Result result = raw ? ResultAdapter::fromResult(*raw) : Result{};
    raw.reset();

    logStatement(name, sql, {}, start);
    return result;
}

uint64_t ExecutionEngine::executeMutation(const std::string& sql, const std::string& name,
                                          const std::vector<Bind>& binds) {
    auto start = Clock::now();

    uint64_t affected = withStatement(sql, binds,
        [](const std::vector<std::string>*, DriverStatement& statement) {
            return statement.affectedRows();
        });

    logStatement(name, sql, binds, start);
    return affected;
}

uint64_t ExecutionEngine::executeInsert(const std::string& sql, const std::string& name,
                                        std::optional<uint64_t> idValue) {
    executeDirect(sql, name);
    return idValue ? *idValue : lastInsertId();
}

uint64_t ExecutionEngine::lastInsertId() {
    return m_connection.handle().insertId();
}

BindValue ExecutionEngine::typeCast(const Bind& bind) {
    if (const bool* flag = std::get_if<bool>(&bind.value)) {
        return int64_t{*flag ? 1 : 0};
    }
    return bind.value;
}

}  // namespace sqladapter
