// server/config.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct DatabaseConfig {
    std::string host{"localhost"};
    int port{5432};
    std::string name{"ems_db"};
    std::string user{"ems_user"};
    std::string password{"ems_password"};
    size_t pool_size{20};
    int acquire_timeout_ms{10000};
    int statement_timeout_ms{30000};
    int connect_retries{10};
    int connect_delay_ms{2000};
    // libpq keyword/value connection string; replaces the fields above when set.
    std::string dsn;

    std::string connection_string() const;
};

struct StorageConfig {
    int retention_days{90};
    int compression_after_days{7};
};

struct StreamConfig {
    bool enabled{false};
    std::string brokers{"localhost:9092"};
    std::string client_id{"meterstore"};
    std::string topic_prefix{"device-data-"};
};

struct QueryConfig {
    int64_t default_limit{1000};
    int64_t max_limit{10000};
};

struct ServerConfig {
    int port{8890};
    size_t threads{0};  // 0 = auto
    size_t publish_threads{2};
};

struct Config {
    ServerConfig server;
    DatabaseConfig database;
    StorageConfig storage;
    StreamConfig stream;
    QueryConfig query;
    bool enforce_permissions{false};
    bool quiet{false};
    bool verbose{false};

    // Throws ConfigError on wrong types or out-of-range values.
    static Config from_json(const nlohmann::json& j);
    static Config load_file(const std::string& path);

    void validate() const;
};

enum class CommandLineAction {
    Run,
    ShowHelp
};

// Applies `--flag value` overrides in place. A `--config FILE` argument is
// loaded first, so flags win over the file regardless of their position.
CommandLineAction parse_command_line(const std::vector<std::string>& args, Config& config);

std::string usage_text(const std::string& program_name);
