#pragma once

/**
 * @file MySQLResultSet.hpp
 * @brief RAII wrapper for MySQL result sets.
 *
 * Used for buffered direct query results and for the metadata result of
 * prepared statements. The MYSQL_RES handle is freed on destruction.
 */

#include "Driver.hpp"
#include <mysql/mysql.h>
#include <string>
#include <vector>

namespace sqladapter {

/**
 * @class MySQLResultSet
 * @brief RAII owner of a MYSQL_RES handle.
 *
 * Usage:
 * @code
 *   auto result = conn.query("SELECT id, name FROM employees");
 *   Row row;
 *   while (result && result->fetchRow(row)) {
 *       // row[0], row[1] ...
 *   }
 * @endcode
 */
class MySQLResultSet : public DriverResult {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res MYSQL_RES handle to manage (takes ownership), or nullptr.
     */
    explicit MySQLResultSet(MYSQL_RES* res = nullptr);

    /**
     * @brief Destructor - frees the MYSQL_RES handle if still owned.
     */
    ~MySQLResultSet() override;

    // Non-copyable
    MySQLResultSet(const MySQLResultSet&) = delete;
    MySQLResultSet& operator=(const MySQLResultSet&) = delete;

    /**
     * @brief Get the underlying MYSQL_RES handle.
     * @return Raw MYSQL_RES* pointer (still owned by this object).
     */
    MYSQL_RES* get() const { return m_res; }

    /**
     * @brief Boolean conversion - true if result set is valid.
     */
    explicit operator bool() const { return m_res != nullptr; }

    /**
     * @brief Fetch the next row.
     * @param row Receives one value per column; SQL NULL becomes std::nullopt.
     * @return false when all rows have been read.
     *
     * Values are copied with their reported lengths, so binary data survives.
     */
    bool fetchRow(Row& row) override;

    std::vector<std::string> columnNames() const override { return getColumnNames(); }

    /**
     * @brief Get all column names as a vector.
     * @return Vector of column names in order.
     */
    std::vector<std::string> getColumnNames() const;

private:
    MYSQL_RES* m_res;  ///< MySQL result set handle (owned)
};

}  // namespace sqladapter
