#pragma once

#include "ResultAdapter.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace sqladapter {

using json = nlohmann::json;

struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
    bool arrayFormat = true;  // true = array of objects, false = object with columns and rows
};

// Renders results for the command-line tool
class ResultFormatter {
public:
    static std::string toCSV(const Result& result, const CSVOptions& options = CSVOptions{});

    static std::string toJSON(const Result& result, const JSONOptions& options = JSONOptions{});

    static json rowToJSON(const std::vector<std::string>& columns, const Row& row,
                          const JSONOptions& options = JSONOptions{});

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});
};

}  // namespace sqladapter
