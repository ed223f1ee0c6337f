#pragma once

/**
 * @file MySQLStatement.hpp
 * @brief DriverStatement implementation on the MySQL prepared statement API.
 */

#include "Driver.hpp"
#include <mysql/mysql.h>
#include <string>
#include <type_traits>
#include <vector>

namespace sqladapter {

/**
 * @class MySQLStatement
 * @brief RAII owner of one MYSQL_STMT handle.
 *
 * Parameters are bound with their native MySQL types. Result columns are
 * fetched in their text form; values longer than the initial column buffer are
 * re-read with mysql_stmt_fetch_column().
 *
 * The result set of each execution is buffered with mysql_stmt_store_result()
 * so other statements can run on the connection before it is freed.
 */
class MySQLStatement : public DriverStatement {
public:
    /**
     * @param stmt Prepared statement handle (takes ownership).
     */
    explicit MySQLStatement(MYSQL_STMT* stmt);

    /**
     * @brief Destructor - closes the handle unless already closed.
     */
    ~MySQLStatement() override;

    void execute(const std::vector<BindValue>& params) override;
    bool hasResultSet() const override { return m_hasResult; }
    std::vector<std::string> columnNames() override;
    bool fetchRow(Row& row) override;
    void freeResult() noexcept override;
    uint64_t affectedRows() const override;
    void close() noexcept override;
    bool isClosed() const override { return m_stmt == nullptr; }
    void detach() noexcept override;

    /**
     * @brief Get the underlying statement handle.
     * @return Raw MYSQL_STMT* pointer (still owned by this object), nullptr once closed.
     */
    MYSQL_STMT* get() const { return m_stmt; }

private:
    // bool on MySQL 8, my_bool on older client libraries
    using Flag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

    struct ParamBuffer {
        int64_t integer = 0;
        uint64_t unsignedInteger = 0;
        double real = 0.0;
        std::string text;
        unsigned long length = 0;
    };

    struct ColumnBuffer {
        std::vector<char> data;
        unsigned long length = 0;
        Flag isNull = 0;
        Flag error = 0;
    };

    void bindParams(const std::vector<BindValue>& params);
    void bindResult();

    MYSQL_STMT* m_stmt;                    ///< Statement handle, nullptr once closed
    std::vector<ParamBuffer> m_paramData;  ///< Storage referenced by m_params
    std::vector<MYSQL_BIND> m_params;
    std::vector<ColumnBuffer> m_columns;   ///< Storage referenced by m_results
    std::vector<MYSQL_BIND> m_results;
    bool m_hasResult = false;
};

}  // namespace sqladapter
