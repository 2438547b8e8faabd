// server/table_manager.cpp
#include "table_manager.hpp"
#include "relation_naming.hpp"
#include "logger.hpp"
#include "../common/errors.hpp"
#include "../common/measurement_fields.hpp"
#include <sstream>

const char* store_state_name(StoreState state) {
    switch (state) {
        case StoreState::Absent: return "absent";
        case StoreState::Created: return "created";
        case StoreState::Partitioned: return "partitioned";
        case StoreState::Indexed: return "indexed";
        case StoreState::Compressed: return "compressed";
    }
    return "unknown";
}

StoreState StoreInspection::state() const {
    if (!exists) return StoreState::Absent;
    if (!partitioned) return StoreState::Created;
    if (index_count < TableManager::kExpectedIndexes) return StoreState::Partitioned;
    if (!compression_enabled || !compression_policy) return StoreState::Indexed;
    return StoreState::Compressed;
}

TableManager::TableManager(SqlExecutor& executor, PolicyManager& policy_manager, int compress_after_days)
    : db(executor), policies(policy_manager), compression_after_days(compress_after_days) {}

std::string TableManager::create_table_sql(const std::string& table) {
    std::stringstream ss;
    ss << "CREATE TABLE IF NOT EXISTS " << table << " (\n"
       << "  id BIGSERIAL,\n"
       << "  timestamp TIMESTAMPTZ NOT NULL DEFAULT NOW(),\n";
    for (const auto& field : measurement_fields()) {
        ss << "  " << field.column << " " << field.sql_type << ",\n";
    }
    ss << "  PRIMARY KEY (id, timestamp)\n"
       << ")";
    return ss.str();
}

StoreInspection TableManager::inspect(const std::string& device_id) {
    const std::string table = relation_name(device_id);

    SqlResult r = db.execute(
        "SELECT EXISTS (SELECT 1 FROM pg_tables WHERE schemaname = 'public' AND tablename = $1) AS table_exists, "
        "EXISTS (SELECT 1 FROM timescaledb_information.hypertables "
        "WHERE hypertable_schema = 'public' AND hypertable_name = $1) AS partitioned, "
        "(SELECT count(*) FROM pg_indexes WHERE schemaname = 'public' AND tablename = $1 "
        "AND indexname IN ($1 || '_timestamp_idx', $1 || '_ptotal_idx', $1 || '_pfavg_idx')) AS index_count, "
        "COALESCE((SELECT compression_enabled FROM timescaledb_information.hypertables "
        "WHERE hypertable_schema = 'public' AND hypertable_name = $1), false) AS compression_enabled, "
        "EXISTS (SELECT 1 FROM timescaledb_information.jobs "
        "WHERE proc_name = 'policy_compression' AND hypertable_name = $1) AS compression_policy",
        {table});

    if (r.empty()) {
        throw StorageError("Catalogue inspection returned no row for " + table);
    }

    StoreInspection s;
    s.exists = r.text(0, "table_exists") == "t";
    s.partitioned = r.text(0, "partitioned") == "t";
    s.index_count = std::stoi(r.text(0, "index_count"));
    s.compression_enabled = r.text(0, "compression_enabled") == "t";
    s.compression_policy = r.text(0, "compression_policy") == "t";
    return s;
}

void TableManager::run_step(const std::string& table, const char* step, const std::string& sql) {
    try {
        db.execute(sql);
    } catch (const StorageError& e) {
        // A concurrent creation of the same store won the catalogue race
        if (e.sqlstate() == sqlstate::kDuplicateTable || e.sqlstate() == sqlstate::kUniqueViolation) {
            Logger::debug(std::string(step) + " for " + table + " done concurrently");
            return;
        }
        Logger::error("Error in step '" + std::string(step) + "' for " + table + ": " + e.what());
        throw;
    }
}

bool TableManager::enable_compression(const std::string& device_id, const std::string& table,
                                      const StoreInspection& current) {
    if (!current.compression_enabled) {
        try {
            db.execute("ALTER TABLE " + table + " SET (timescaledb.compress, "
                       "timescaledb.compress_orderby = 'timestamp DESC')");
        } catch (const StorageError& e) {
            Logger::warning("Could not enable compression for " + table + ": " + e.what());
            return false;
        }
    }
    if (!current.compression_policy &&
        !policies.set_compression(device_id, compression_after_days)) {
        return false;
    }
    Logger::info("Compression enabled for " + table + " (after " +
                 interval_days(compression_after_days) + ")");
    return true;
}

StoreState TableManager::create_device_store(const std::string& device_id) {
    validate_device_id(device_id);
    const std::string table = relation_name(device_id);

    StoreInspection current = inspect(device_id);
    StoreState state = current.state();
    if (state == StoreState::Compressed) {
        Logger::debug("Store " + table + " already configured");
        return state;
    }
    if (state != StoreState::Absent) {
        Logger::info("Resuming store " + table + " from state '" + store_state_name(state) + "'");
    }

    if (state == StoreState::Absent) {
        run_step(table, "create table", create_table_sql(table));
        state = StoreState::Created;
    }

    if (state == StoreState::Created) {
        try {
            db.execute("SELECT create_hypertable($1::regclass, 'timestamp', "
                       "chunk_time_interval => INTERVAL '1 day', if_not_exists => TRUE)",
                       {table});
        } catch (const StorageError& e) {
            if (std::string(e.what()).find("already a hypertable") == std::string::npos) {
                Logger::error("Error converting " + table + " to a hypertable: " + e.what());
                throw;
            }
        }
        Logger::info("Hypertable " + table + " created successfully");
        state = StoreState::Partitioned;
    }

    if (state == StoreState::Partitioned) {
        run_step(table, "timestamp index",
                 "CREATE INDEX IF NOT EXISTS " + table + "_timestamp_idx ON " + table +
                 " (timestamp DESC)");
        run_step(table, "power index",
                 "CREATE INDEX IF NOT EXISTS " + table + "_ptotal_idx ON " + table +
                 " (timestamp DESC, " + kTotalPowerColumn + ") WHERE " + kTotalPowerColumn +
                 " IS NOT NULL");
        run_step(table, "power factor index",
                 "CREATE INDEX IF NOT EXISTS " + table + "_pfavg_idx ON " + table +
                 " (timestamp DESC, " + kAvgPowerFactorColumn + ") WHERE " + kAvgPowerFactorColumn +
                 " IS NOT NULL");
        state = StoreState::Indexed;
    }

    if (enable_compression(device_id, table, current)) {
        state = StoreState::Compressed;
    }

    Logger::success("TimescaleDB hypertable " + table + " configured (" + store_state_name(state) + ")");
    return state;
}

void TableManager::delete_device_store(const std::string& device_id) {
    if (device_id.empty()) {
        throw ValidationError("Device identifier must not be empty");
    }
    const std::string table = relation_name(device_id);
    if (table.size() > kMaxRelationNameLength) {
        // Such an identifier never passed creation, so there is no store to drop
        Logger::debug("No store can exist for over-long identifier " + device_id);
        return;
    }

    try {
        db.execute("DROP TABLE IF EXISTS " + table + " CASCADE");
        Logger::info("Table " + table + " deleted successfully");
    } catch (const StorageError& e) {
        Logger::error("Error deleting table " + table + ": " + e.what());
        throw;
    }
}
