#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace sqladapter {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool parseBool(const std::string& value) {
    auto lower = toLower(value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

// Throws std::invalid_argument or std::out_of_range, reported by the caller
long long parseNonNegative(const std::string& value, long long max) {
    long long parsed = std::stoll(value);
    if (parsed < 0 || parsed > max) {
        throw std::out_of_range("value out of range: " + value);
    }
    return parsed;
}

std::optional<std::chrono::seconds> parseSeconds(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return std::chrono::seconds(parseNonNegative(value, std::numeric_limits<int>::max()));
}

// Copies a CLI value over the file value only when the flag was given
template<typename T>
void overrideIfSet(const CLI::Option* option, T& target, const T& value) {
    if (option && option->count() > 0) {
        target = value;
    }
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = toLower(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq_pos)));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "connection") {
                auto& c = config.connection;
                if (key == "host") c.host = value;
                else if (key == "port") c.port = static_cast<uint16_t>(
                    parseNonNegative(value, std::numeric_limits<uint16_t>::max()));
                else if (key == "socket") c.socket = value;
                else if (key == "username" || key == "user") c.username = value;
                else if (key == "password") c.password = value;
                else if (key == "database") c.database = value;
                else if (key == "encoding") c.encoding = value;
                else if (key == "reconnect") c.reconnect = parseBool(value);
                else if (key == "sslca") c.sslca = value;
                else if (key == "sslkey") c.sslkey = value;
                else if (key == "sslcert") c.sslcert = value;
                else if (key == "sslcapath") c.sslcapath = value;
                else if (key == "sslcipher") c.sslcipher = value;
                else if (key == "connect_timeout") c.connect_timeout = parseSeconds(value);
                else if (key == "read_timeout") c.read_timeout = parseSeconds(value);
                else if (key == "write_timeout") c.write_timeout = parseSeconds(value);
                else spdlog::warn("Unknown connection option '{}' at line {}", key, line_number);
            }
            else if (current_section == "statements") {
                if (key == "statement_limit" || key == "limit")
                    config.statements.statement_limit = static_cast<size_t>(
                        parseNonNegative(value, std::numeric_limits<long long>::max()));
            }
            else if (current_section == "logging") {
                if (key == "debug") config.debug = parseBool(value);
                else if (key == "file") config.log_file = value;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring invalid value for '{}' at line {}: {}", key, line_number, e.what());
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"sql-adapter - Run SQL statements through the prepared statement cache"};

    // Connection options
    auto* host = app.add_option("-H,--host", config.connection.host, "Database server host");
    auto* port = app.add_option("-P,--port", config.connection.port, "Database server port");
    auto* socket = app.add_option("-S,--socket", config.connection.socket, "Unix socket path");
    auto* user = app.add_option("-u,--user", config.connection.username, "Database username");
    auto* password = app.add_option("-p,--password", config.connection.password, "Database password");
    auto* database = app.add_option("-D,--database", config.connection.database, "Database name");
    auto* encoding = app.add_option("-e,--encoding", config.connection.encoding,
                                    "Client character set (SET NAMES)");
    auto* reconnect = app.add_flag("--reconnect", config.connection.reconnect,
                                   "Enable driver auto-reconnect");

    // SSL options
    auto* sslca = app.add_option("--ssl-ca", config.connection.sslca, "SSL CA certificate file");
    auto* sslkey = app.add_option("--ssl-key", config.connection.sslkey, "SSL client key file");
    auto* sslcert = app.add_option("--ssl-cert", config.connection.sslcert, "SSL client certificate file");
    auto* sslcapath = app.add_option("--ssl-capath", config.connection.sslcapath,
                                     "Directory of trusted SSL CA certificates");
    auto* sslcipher = app.add_option("--ssl-cipher", config.connection.sslcipher,
                                     "Permitted SSL ciphers");

    // Timeouts (seconds)
    int connect_timeout = 0;
    int read_timeout = 0;
    int write_timeout = 0;
    auto* connect_opt = app.add_option("--connect-timeout", connect_timeout, "Connect timeout in seconds"
        ->check(CLI::NonNegativeNumber);
    auto* read_opt = app.add_option("--read-timeout", read_timeout, "Read timeout in seconds"
        ->check(CLI::NonNegativeNumber);
    auto* write_opt = app.add_option("--write-timeout", write_timeout, "Write timeout in seconds"
        ->check(CLI::NonNegativeNumber);

    auto* limit = app.add_option("--statement-limit", config.statements.statement_limit,
                                 "Maximum number of cached prepared statements")
        ->default_val(1000)
        ->check(CLI::NonNegativeNumber);

    // Execution options
    app.add_option("-f,--format", config.format, "Output format (csv, json)")
        ->default_val("csv")
        ->check(CLI::IsMember({"csv", "json"}));
    app.add_flag("--direct", config.direct, "Run statements without the prepared statement API");
    app.add_flag("--mutation", config.mutation, "Print affected row counts instead of rows");
    app.add_flag("--begin", config.begin, "Issue BEGIN before running the statements");
    auto* debug = app.add_flag("-d,--debug", config.debug, "Enable debug output");
    auto* log_file = app.add_option("--log-file", config.log_file, "Write logs to this file");

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    app.add_option("sql", config.sql, "SQL statements to run")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (connect_opt->count() > 0) config.connection.connect_timeout = std::chrono::seconds(connect_timeout);
    if (read_opt->count() > 0) config.connection.read_timeout = std::chrono::seconds(read_timeout);
    if (write_opt->count() > 0) config.connection.write_timeout = std::chrono::seconds(write_timeout);

    // Command line args override file config
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            Config merged = *file_config;
            auto& to = merged.connection;
            const auto& from = config.connection;

            overrideIfSet(host, to.host, from.host);
            overrideIfSet(port, to.port, from.port);
            overrideIfSet(socket, to.socket, from.socket);
            overrideIfSet(user, to.username, from.username);
            overrideIfSet(password, to.password, from.password);
            overrideIfSet(database, to.database, from.database);
            overrideIfSet(encoding, to.encoding, from.encoding);
            overrideIfSet(reconnect, to.reconnect, from.reconnect);
            overrideIfSet(sslca, to.sslca, from.sslca);
            overrideIfSet(sslkey, to.sslkey, from.sslkey);
            overrideIfSet(sslcert, to.sslcert, from.sslcert);
            overrideIfSet(sslcapath, to.sslcapath, from.sslcapath);
            overrideIfSet(sslcipher, to.sslcipher, from.sslcipher);
            overrideIfSet(connect_opt, to.connect_timeout, from.connect_timeout);
            overrideIfSet(read_opt, to.read_timeout, from.read_timeout);
            overrideIfSet(write_opt, to.write_timeout, from.write_timeout);
            overrideIfSet(limit, merged.statements.statement_limit, config.statements.statement_limit);
            overrideIfSet(debug, merged.debug, config.debug);
            overrideIfSet(log_file, merged.log_file, config.log_file);

            merged.sql = std::move(config.sql);
            merged.format = config.format;
            merged.direct = config.direct;
            merged.mutation = config.mutation;
            merged.begin = config.begin;
            config = std::move(merged);
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Resolve password from environment if not set
    config.resolvePassword();

    return config;
}

bool ConnectionConfig::hasValidEncoding() const {
    return std::all_of(encoding.begin(), encoding.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

bool Config::validate() const {
    if (connection.database.empty()) {
        spdlog::error("Database name is required (use -D option)");
        return false;
    }

    if (!connection.hasValidEncoding()) {
        spdlog::error("Invalid character set name: {}", connection.encoding);
        return false;
    }

    if (statements.statement_limit == 0) {
        spdlog::error("statement_limit must be at least 1");
        return false;
    }

    if (direct && mutation) {
        spdlog::error("--direct and --mutation cannot be combined");
        return false;
    }

    if (connection.useSsl()) {
        if (!connection.sslca.empty() && !std::filesystem::exists(connection.sslca)) {
            spdlog::error("SSL CA file not found: {}", connection.sslca);
            return false;
        }
        if (!connection.sslcert.empty() && !std::filesystem::exists(connection.sslcert)) {
            spdlog::error("SSL certificate file not found: {}", connection.sslcert);
            return false;
        }
        if (!connection.sslkey.empty() && !std::filesystem::exists(connection.sslkey)) {
            spdlog::error("SSL key file not found: {}", connection.sslkey);
            return false;
        }
    }

    return true;
}

void Config::resolvePassword() {
    if (connection.password.empty()) {
        const char* env_pwd = std::getenv("MYSQL_PWD");
        if (env_pwd) {
            connection.password = env_pwd;
        }
    }
}

}  // namespace sqladapter
