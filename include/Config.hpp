#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace sqladapter {

struct ConnectionConfig {
    std::string host;            // empty: driver default (localhost)
    uint16_t port = 0;           // 0: driver default (3306)
    std::string socket;
    std::string username = "root";
    std::string password;
    std::string database;

    // Sent as SET NAMES after connect when not empty
    std::string encoding;
    bool reconnect = false;

    // SSL material, applied when sslca or sslkey is set
    std::string sslca;
    std::string sslkey;
    std::string sslcert;
    std::string sslcapath;
    std::string sslcipher;

    // Driver timeouts, left at driver defaults when unset
    std::optional<std::chrono::seconds> connect_timeout;
    std::optional<std::chrono::seconds> read_timeout;
    std::optional<std::chrono::seconds> write_timeout;

    bool useSsl() const { return !sslca.empty() || !sslkey.empty(); }

    // Empty, or a bare charset identifier such as utf8mb4
    bool hasValidEncoding() const;
};

struct StatementConfig {
    size_t statement_limit = 1000;
};

struct Config {
    ConnectionConfig connection;
    StatementConfig statements;

    // Command-line tool
    std::vector<std::string> sql;
    std::string format = "csv";  // csv, json
    bool direct = false;
    bool mutation = false;
    bool begin = false;
    bool debug = false;
    std::string log_file;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();
};

}  // namespace sqladapter
