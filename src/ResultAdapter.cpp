#include "ResultAdapter.hpp"

namespace sqladapter {

Result::Result(std::vector<std::string> columns, std::vector<Row> rows)
    : m_columns(std::move(columns)), m_rows(std::move(rows)) {
}

Result ResultAdapter::fromStatement(const std::vector<std::string>& columns,
                                    DriverStatement& statement) {
    std::vector<Row> rows;
    Row row;
    while (statement.fetchRow(row)) {
        rows.push_back(std::move(row));
        row.clear();
    }
    return Result(columns, std::move(rows));
}

Result ResultAdapter::fromResult(DriverResult& result) {
    std::vector<Row> rows;
    Row row;
    while (result.fetchRow(row)) {
        rows.push_back(std::move(row));
        row.clear();
    }
    return Result(result.columnNames(), std::move(rows));
}

}  // namespace sqladapter
