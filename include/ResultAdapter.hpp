#pragma once

#include "Driver.hpp"
#include <string>
#include <vector>

namespace sqladapter {

/**
 * @class Result
 * @brief Column names plus rows in fetch order. Immutable once built.
 */
class Result {
public:
    Result() = default;
    Result(std::vector<std::string> columns, std::vector<Row> rows);

    const std::vector<std::string>& columns() const { return m_columns; }
    const std::vector<Row>& rows() const { return m_rows; }

    size_t size() const { return m_rows.size(); }
    bool empty() const { return m_rows.empty(); }

private:
    std::vector<std::string> m_columns;
    std::vector<Row> m_rows;
};

// Normalizes driver results; values are passed through untouched
class ResultAdapter {
public:
    // Read every remaining row of an executed statement
    static Result fromStatement(const std::vector<std::string>& columns, DriverStatement& statement);

    // Read a direct query result
    static Result fromResult(DriverResult& result);
};

}  // namespace sqladapter
