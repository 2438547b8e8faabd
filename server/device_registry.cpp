// server/device_registry.cpp
#include "device_registry.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "relation_naming.hpp"
#include "../common/errors.hpp"

namespace {

const char* kSchemaStatements[] = {
    "CREATE EXTENSION IF NOT EXISTS timescaledb",

    "CREATE TABLE IF NOT EXISTS users ("
    "  id SERIAL PRIMARY KEY,"
    "  email VARCHAR(255) UNIQUE NOT NULL,"
    "  password_hash VARCHAR(255) NOT NULL,"
    "  role VARCHAR(20) NOT NULL DEFAULT 'user',"
    "  created_at TIMESTAMPTZ DEFAULT NOW(),"
    "  updated_at TIMESTAMPTZ DEFAULT NOW())",

    "CREATE TABLE IF NOT EXISTS devices ("
    "  id VARCHAR(255) PRIMARY KEY,"
    "  name VARCHAR(255) NOT NULL,"
    "  type VARCHAR(100) NOT NULL,"
    "  ip_address VARCHAR(45) NOT NULL,"
    "  slave_address INTEGER DEFAULT 1,"
    "  status VARCHAR(20) DEFAULT 'offline',"
    "  include_in_total_summary BOOLEAN DEFAULT true,"
    "  register_map JSONB NOT NULL DEFAULT '[]'::jsonb,"
    "  created_at TIMESTAMPTZ DEFAULT NOW(),"
    "  updated_at TIMESTAMPTZ DEFAULT NOW())",

    // One device per relation, enforced by the database across processes
    "ALTER TABLE devices ADD COLUMN IF NOT EXISTS relation_name VARCHAR(63) UNIQUE",

    "CREATE TABLE IF NOT EXISTS user_device_permissions ("
    "  id SERIAL PRIMARY KEY,"
    "  user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    "  device_id VARCHAR(255) NOT NULL REFERENCES devices(id) ON DELETE CASCADE,"
    "  created_at TIMESTAMPTZ DEFAULT NOW(),"
    "  UNIQUE (user_id, device_id))",

    "CREATE INDEX IF NOT EXISTS idx_users_email ON users(email)",
    "CREATE INDEX IF NOT EXISTS idx_devices_status ON devices(status)",
    "CREATE INDEX IF NOT EXISTS idx_user_device_permissions_user ON user_device_permissions(user_id)",
    "CREATE INDEX IF NOT EXISTS idx_user_device_permissions_device ON user_device_permissions(device_id)"
};

} // namespace

DeviceRegistry::DeviceRegistry(SqlExecutor& executor, TableManager& table_manager,
                               PolicyManager& policy_manager, int default_retention_days)
    : db(executor), tables(table_manager), policies(policy_manager),
      retention_days(default_retention_days) {}

void DeviceRegistry::initialize_schema() {
    for (const char* sql : kSchemaStatements) {
        db.execute(sql);
    }
    Logger::success("Database schema initialized");
}

bool DeviceRegistry::exists(const std::string& device_id) {
    return !db.execute("SELECT 1 FROM devices WHERE id = $1", {device_id}).empty();
}

std::optional<Device> DeviceRegistry::find(const std::string& device_id) {
    SqlResult r = db.execute(
        "SELECT id, name, type, ip_address, slave_address, status, include_in_total_summary, "
        "register_map::text AS register_map FROM devices WHERE id = $1",
        {device_id});
    if (r.empty()) {
        return std::nullopt;
    }

    Device d;
    d.id = r.text(0, "id");
    d.name = r.text(0, "name");
    d.type = r.text(0, "type");
    d.ip_address = r.text(0, "ip_address");
    d.slave_address = r.get(0, "slave_address") ? std::stoi(*r.get(0, "slave_address")) : 1;
    d.status = r.get(0, "status").value_or("offline");
    d.include_in_total_summary = r.get(0, "include_in_total_summary").value_or("t") == "t";

    const SqlValue& map = r.get(0, "register_map");
    if (map) {
        try {
            d.register_map = register_map_from_json(json::parse(*map));
        } catch (const json::exception& e) {
            throw StorageError("Corrupt register map for device " + device_id + ": " + e.what());
        }
    }
    return d;
}

std::vector<std::string> DeviceRegistry::list_ids() {
    SqlResult r = db.execute("SELECT id FROM devices ORDER BY id");
    std::vector<std::string> ids;
    ids.reserve(r.size());
    for (size_t i = 0; i < r.size(); i++) {
        ids.push_back(r.text(i, "id"));
    }
    return ids;
}

void DeviceRegistry::reject_collision(const std::string& device_id) {
    if (auto other = find_collision(device_id, list_ids())) {
        throw ValidationError("Device id '" + device_id + "' maps to relation " +
                              relation_name(device_id) + ", already used by device '" +
                              *other + "'");
    }
}

void DeviceRegistry::upsert(const Device& device) {
    try {
        db.execute(
            "INSERT INTO devices (id, name, type, ip_address, slave_address, status, "
            "include_in_total_summary, register_map, relation_name) "
            "VALUES ($1, $2, $3, $4, $5::integer, $6, $7::boolean, $8::jsonb, $9) "
            "ON CONFLICT (id) DO UPDATE SET name = EXCLUDED.name, type = EXCLUDED.type, "
            "ip_address = EXCLUDED.ip_address, slave_address = EXCLUDED.slave_address, "
            "status = EXCLUDED.status, include_in_total_summary = EXCLUDED.include_in_total_summary, "
            "register_map = EXCLUDED.register_map, relation_name = EXCLUDED.relation_name, "
            "updated_at = NOW()",
            {device.id, device.name, device.type, device.ip_address,
             std::to_string(device.slave_address), device.status,
             std::string(device.include_in_total_summary ? "true" : "false"),
             register_map_to_json(device.register_map).dump(), relation_name(device.id)});
    } catch (const StorageError& e) {
        if (e.sqlstate() == sqlstate::kUniqueViolation) {
            throw ValidationError("Device id '" + device.id + "' maps to relation " +
                                  relation_name(device.id) + ", already used by another device");
        }
        throw;
    }
}

void DeviceRegistry::claim_relation(const std::string& device_id) {
    try {
        db.execute("UPDATE devices SET relation_name = $2 WHERE id = $1",
                   {device_id, relation_name(device_id)});
    } catch (const StorageError& e) {
        if (e.sqlstate() == sqlstate::kUniqueViolation) {
            throw ValidationError("Device id '" + device_id + "' maps to relation " +
                                  relation_name(device_id) + ", already used by another device");
        }
        throw;
    }
}

StoreOutcome DeviceRegistry::register_device(const Device& device) {
    validate_device_id(device.id);
    std::lock_guard<std::mutex> lock(registration_mutex);
    reject_collision(device.id);
    const bool existed = exists(device.id);

    StoreOutcome outcome{device.id, relation_name(device.id), tables.create_device_store(device.id)};

    try {
        upsert(device);
    } catch (const ValidationError& e) {
        Logger::warning("Device row for " + device.id + " rejected: " + e.what());
        throw;
    } catch (const MeterStoreError& e) {
        if (!existed) {
            Logger::warning("Device row for " + device.id + " failed, dropping its new store: " + e.what());
            try {
                tables.delete_device_store(device.id);
            } catch (const MeterStoreError& drop_error) {
                Logger::alert("Store " + outcome.relation + " left without a device row "
                              "(removed by the next orphan sweep): " + drop_error.what());
            }
        }
        throw;
    }

    policies.set_retention(device.id, retention_days);
    Logger::success("Device " + device.id + (existed ? " updated" : " registered") +
                    " (" + outcome.relation + ", " + store_state_name(outcome.state) + ")");
    return outcome;
}

void DeviceRegistry::remove_device(const std::string& device_id) {
    if (!exists(device_id)) {
        throw NotFoundError("Device not found: " + device_id);
    }
    tables.delete_device_store(device_id);

    SqlResult r = db.execute("DELETE FROM devices WHERE id = $1 RETURNING id", {device_id});
    if (r.empty()) {
        throw NotFoundError("Device not found: " + device_id);
    }
    Logger::info("Device " + device_id + " removed");
}

StoreOutcome DeviceRegistry::on_device_created(const std::string& device_id) {
    validate_device_id(device_id);
    std::lock_guard<std::mutex> lock(registration_mutex);
    if (!exists(device_id)) {
        throw NotFoundError("Device not found: " + device_id);
    }
    reject_collision(device_id);
    claim_relation(device_id);

    StoreOutcome outcome{device_id, relation_name(device_id), tables.create_device_store(device_id)};
    policies.set_retention(device_id, retention_days);
    return outcome;
}

void DeviceRegistry::on_device_deleted(const std::string& device_id) {
    tables.delete_device_store(device_id);
    if (exists(device_id)) {
        Logger::alert("Store for " + device_id + " dropped while its device row still exists");
    }
}

size_t DeviceRegistry::reconcile_stores() {
    size_t complete = 0;
    std::vector<std::string> ids = list_ids();
    for (const auto& id : ids) {
        try {
            if (tables.create_device_store(id) == StoreState::Compressed) {
                complete++;
            }
        } catch (const MeterStoreError& e) {
            Logger::warning("Could not reconcile store for device " + id + ": " + e.what());
        }
    }
    Logger::info("Reconciled " + std::to_string(complete) + "/" + std::to_string(ids.size()) +
                 " device store(s)");
    return complete;
}
