#include "Adapter.hpp"
#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "ResultFormatter.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <vector>

using namespace sqladapter;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Results go to stdout, logs to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sql-adapter", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printResult(const Result& result, const std::string& format) {
    if (format == "json") {
        std::cout << ResultFormatter::toJSON(result) << std::endl;
    } else {
        std::cout << ResultFormatter::toCSV(result);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = Config::parseArgs(argc, argv);

    setupLogging(config.debug, config.log_file);

    if (!config.validate()) {
        return 1;
    }

    try {
        auto adapter = Adapter::createMySQL(config);

        auto version = adapter->serverVersion();
        spdlog::info("{} adapter connected, server {}.{}.{}", adapter->adapterName(),
                     version.major, version.minor, version.patch);

        bool inTransaction = false;
        if (config.begin) {
            inTransaction = adapter->beginTransaction() == BeginOutcome::Started;
            if (!inTransaction) {
                spdlog::warn("Running without a transaction");
            }
        }

        for (const auto& sql : config.sql) {
            if (config.mutation) {
                std::cout << adapter->executeMutation(sql, {}) << std::endl;
            } else if (config.direct) {
                printResult(adapter->executeDirect(sql), config.format);
            } else {
                printResult(adapter->execute(sql), config.format);
            }
        }

        if (inTransaction) {
            adapter->executeDirect("COMMIT", "TRANSACTION");
        }
    } catch (const DatabaseError& e) {
        spdlog::error("{} (error {}, SQLSTATE {})", e.what(), e.errorCode(), e.sqlState());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
