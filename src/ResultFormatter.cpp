#include "ResultFormatter.hpp"
#include <algorithm>
#include <sstream>

namespace sqladapter {

std::string ResultFormatter::toCSV(const Result& result, const CSVOptions& options) {
    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        const auto& columns = result.columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(columns[i], options);
        }
        out << options.lineEnding;
    }

    // Rows
    for (const auto& row : result.rows()) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << options.delimiter;

            // NULL is written as an empty field
            if (row[i].has_value()) {
                out << escapeCSVField(row[i].value(), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

std::string ResultFormatter::toJSON(const Result& result, const JSONOptions& options) {
    json arr = json::array();

    for (const auto& row : result.rows()) {
        arr.push_back(rowToJSON(result.columns(), row, options));
    }

    if (options.arrayFormat) {
        return options.pretty ? arr.dump(options.indent) : arr.dump();
    }

    json wrapper = json::object();
    wrapper["columns"] = result.columns();
    wrapper["rows"] = std::move(arr);
    return options.pretty ? wrapper.dump(options.indent) : wrapper.dump();
}

json ResultFormatter::rowToJSON(const std::vector<std::string>& columns, const Row& row,
                                const JSONOptions& options) {
    json obj = json::object();

    for (size_t i = 0; i < std::min(columns.size(), row.size()); ++i) {
        if (row[i].has_value()) {
            obj[columns[i]] = row[i].value();
        } else if (options.includeNull) {
            obj[columns[i]] = nullptr;
        }
    }

    return obj;
}

std::string ResultFormatter::escapeCSVField(const std::string& field, const CSVOptions& options) {
    bool needsQuote = options.quoteAll ||
                      field.find(options.delimiter) != std::string::npos ||
                      field.find(options.quote) != std::string::npos ||
                      field.find('\n') != std::string::npos ||
                      field.find('\r') != std::string::npos;

    if (!needsQuote) {
        return field;
    }

    std::string escaped;
    escaped.reserve(field.size() + 2);
    escaped += options.quote;
    for (char c : field) {
        if (c == options.quote) {
            escaped += options.quote;
        }
        escaped += c;
    }
    escaped += options.quote;
    return escaped;
}

}  // namespace sqladapter
