// server/config.cpp
#include "config.hpp"
#include "../common/errors.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

template <typename T>
void read_field(const json& section, const char* key, T& out, const std::string& path) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("Invalid value for " + path + "." + key + ": " + e.what());
    }
}

const json& section_of(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end()) return empty;
    if (!it->is_object()) {
        throw ConfigError(std::string("Config section '") + key + "' must be an object");
    }
    return *it;
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("Option " + flag + " expects an integer, got '" + value + "'");
    }
}

size_t parse_count(const std::string& flag, const std::string& value) {
    int v = parse_int(flag, value);
    if (v < 0) {
        throw ConfigError("Option " + flag + " must not be negative");
    }
    return static_cast<size_t>(v);
}

// libpq keyword/value syntax: single quotes, with ' and \ escaped
std::string conninfo_value(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += "'";
    return out;
}

} // namespace

std::string DatabaseConfig::connection_string() const {
    if (!dsn.empty()) {
        return dsn;
    }
    std::stringstream ss;
    ss << "host=" << conninfo_value(host)
       << " port=" << port
       << " dbname=" << conninfo_value(name)
       << " user=" << conninfo_value(user)
       << " password=" << conninfo_value(password)
       << " connect_timeout=10";
    return ss.str();
}

Config Config::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    Config c;

    const json& server = section_of(j, "server");
    read_field(server, "port", c.server.port, "server");
    read_field(server, "threads", c.server.threads, "server");
    read_field(server, "publish_threads", c.server.publish_threads, "server");

    const json& db = section_of(j, "database");
    read_field(db, "host", c.database.host, "database");
    read_field(db, "port", c.database.port, "database");
    read_field(db, "name", c.database.name, "database");
    read_field(db, "user", c.database.user, "database");
    read_field(db, "password", c.database.password, "database");
    read_field(db, "dsn", c.database.dsn, "database");
    read_field(db, "pool_size", c.database.pool_size, "database");
    read_field(db, "acquire_timeout_ms", c.database.acquire_timeout_ms, "database");
    read_field(db, "statement_timeout_ms", c.database.statement_timeout_ms, "database");
    read_field(db, "connect_retries", c.database.connect_retries, "database");
    read_field(db, "connect_delay_ms", c.database.connect_delay_ms, "database");

    const json& storage = section_of(j, "storage");
    read_field(storage, "retention_days", c.storage.retention_days, "storage");
    read_field(storage, "compression_after_days", c.storage.compression_after_days, "storage");

    const json& stream = section_of(j, "stream");
    read_field(stream, "enabled", c.stream.enabled, "stream");
    read_field(stream, "brokers", c.stream.brokers, "stream");
    read_field(stream, "client_id", c.stream.client_id, "stream");
    read_field(stream, "topic_prefix", c.stream.topic_prefix, "stream");

    const json& query = section_of(j, "query");
    read_field(query, "default_limit", c.query.default_limit, "query");
    read_field(query, "max_limit", c.query.max_limit, "query");

    const json& access = section_of(j, "access");
    read_field(access, "enforce_permissions", c.enforce_permissions, "access");

    const json& log = section_of(j, "log");
    read_field(log, "quiet", c.quiet, "log");
    read_field(log, "verbose", c.verbose, "log");

    c.validate();
    return c;
}

Config Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse config file " + path + ": " + e.what());
    }
    return from_json(j);
}

void Config::validate() const {
    if (server.port <= 0 || server.port > 65535) {
        throw ConfigError("server.port must be in 1..65535");
    }
    if (server.publish_threads == 0) {
        throw ConfigError("server.publish_threads must be positive");
    }
    if (database.pool_size == 0) {
        throw ConfigError("database.pool_size must be positive");
    }
    if (database.acquire_timeout_ms <= 0 || database.statement_timeout_ms < 0) {
        throw ConfigError("database timeouts must be positive");
    }
    if (database.connect_retries <= 0) {
        throw ConfigError("database.connect_retries must be positive");
    }
    if (storage.retention_days <= 0) {
        throw ConfigError("storage.retention_days must be positive");
    }
    if (storage.compression_after_days <= 0) {
        throw ConfigError("storage.compression_after_days must be positive");
    }
    if (query.default_limit <= 0 || query.max_limit < query.default_limit) {
        throw ConfigError("query.default_limit must be positive and not exceed query.max_limit");
    }
    if (stream.enabled && stream.brokers.empty()) {
        throw ConfigError("stream.brokers must be set when the stream is enabled");
    }
}

CommandLineAction parse_command_line(const std::vector<std::string>& args, Config& config) {
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw ConfigError("Option --config expects a file");
            config = Config::load_file(args[i + 1]);
        }
    }

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "-h" || arg == "--help") {
            return CommandLineAction::ShowHelp;
        } else if (arg == "--config" && has_value) {
            ++i;
        } else if ((arg == "-p" || arg == "--port") && has_value) {
            config.server.port = parse_int(arg, args[++i]);
        } else if (arg == "--threads" && has_value) {
            config.server.threads = parse_count(arg, args[++i]);
        } else if (arg == "--db-host" && has_value) {
            config.database.host = args[++i];
        } else if (arg == "--db-port" && has_value) {
            config.database.port = parse_int(arg, args[++i]);
        } else if (arg == "--db-name" && has_value) {
            config.database.name = args[++i];
        } else if (arg == "--db-user" && has_value) {
            config.database.user = args[++i];
        } else if (arg == "--db-password" && has_value) {
            config.database.password = args[++i];
        } else if (arg == "--pool-size" && has_value) {
            config.database.pool_size = parse_count(arg, args[++i]);
        } else if (arg == "--retention-days" && has_value) {
            config.storage.retention_days = parse_int(arg, args[++i]);
        } else if (arg == "--compression-days" && has_value) {
            config.storage.compression_after_days = parse_int(arg, args[++i]);
        } else if (arg == "--stream") {
            config.stream.enabled = true;
        } else if (arg == "--brokers" && has_value) {
            config.stream.brokers = args[++i];
        } else if (arg == "--page-size" && has_value) {
            config.query.default_limit = parse_int(arg, args[++i]);
        } else if (arg == "--enforce-permissions") {
            config.enforce_permissions = true;
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    config.validate();
    return CommandLineAction::Run;
}

std::string usage_text(const std::string& program_name) {
    std::stringstream ss;
    ss << "Usage: " << program_name << " [OPTIONS]\n"
       << "Options:\n"
       << "      --config FILE           JSON configuration file\n"
       << "  -p, --port PORT             Server port (default: 8890)\n"
       << "      --threads N             Use N worker threads (default: auto)\n"
       << "      --db-host HOST          PostgreSQL host (default: localhost)\n"
       << "      --db-port PORT          PostgreSQL port (default: 5432)\n"
       << "      --db-name NAME          Database name (default: ems_db)\n"
       << "      --db-user USER          Database user (default: ems_user)\n"
       << "      --db-password PASS      Database password\n"
       << "      --pool-size N           Connection pool size (default: 20)\n"
       << "      --retention-days N      Drop chunks older than N days (default: 90)\n"
       << "      --compression-days N    Compress chunks older than N days (default: 7)\n"
       << "      --stream                Republish readings on the Kafka bus\n"
       << "      --brokers LIST          Comma separated Kafka brokers (default: localhost:9092)\n"
       << "      --page-size N           Default range query limit (default: 1000)\n"
       << "      --enforce-permissions   Check user_device_permissions for non-admin callers\n"
       << "      --quiet                 Suppress informational logs\n"
       << "  -v, --verbose               Enable debug logs\n"
       << "  -h, --help                  Show this help\n";
    return ss.str();
}
