/**
 * @file MySQLResultSet.cpp
 * @brief Implementation of the RAII MySQL result set wrapper.
 */

#include "MySQLResultSet.hpp"

namespace sqladapter {

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLResultSet::MySQLResultSet(MYSQL_RES* res) : m_res(res) {}

MySQLResultSet::~MySQLResultSet() {
    if (m_res) {
        mysql_free_result(m_res);
    }
}

// ============================================================================
// Row and Field Access
// ============================================================================

bool MySQLResultSet::fetchRow(Row& row) {
    if (!m_res) return false;

    MYSQL_ROW values = mysql_fetch_row(m_res);
    if (!values) return false;

    unsigned int count = mysql_num_fields(m_res);
    unsigned long* lengths = mysql_fetch_lengths(m_res);

    row.clear();
    row.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
        if (values[i]) {
            row.emplace_back(std::string(values[i], lengths[i]));
        } else {
            row.emplace_back(std::nullopt);
        }
    }
    return true;
}

std::vector<std::string> MySQLResultSet::getColumnNames() const {
    std::vector<std::string> names;
    if (!m_res) return names;

    unsigned int numFields = mysql_num_fields(m_res);
    MYSQL_FIELD* fields = mysql_fetch_fields(m_res);

    names.reserve(numFields);
    for (unsigned int i = 0; i < numFields; ++i) {
        names.emplace_back(fields[i].name);
    }

    return names;
}

}  // namespace sqladapter
