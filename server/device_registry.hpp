// server/device_registry.hpp
#pragma once
#include "database.hpp"
#include "policy_manager.hpp"
#include "table_manager.hpp"
#include "../common/protocol.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct StoreOutcome {
    std::string device_id;
    std::string relation;
    StoreState state{StoreState::Absent};
};

// Owns the `devices` table and keeps it in step with the per-device
// relations: a relation exists exactly when its device row does.
class DeviceRegistry {
private:
    SqlExecutor& db;
    TableManager& tables;
    PolicyManager& policies;
    int retention_days;
    // Serializes the collision check with the row write in this process
    std::mutex registration_mutex;

    void reject_collision(const std::string& device_id);
    // Both map a unique violation on relation_name to ValidationError.
    void upsert(const Device& device);
    void claim_relation(const std::string& device_id);

public:
    DeviceRegistry(SqlExecutor& executor, TableManager& table_manager,
                   PolicyManager& policy_manager, int default_retention_days);

    // Extension, users, devices and user_device_permissions; idempotent.
    void initialize_schema();

    bool exists(const std::string& device_id);
    std::optional<Device> find(const std::string& device_id);
    std::vector<std::string> list_ids();

    // Store first, then the row. A failed row write for a new device drops
    // the store again before the error propagates.
    StoreOutcome register_device(const Device& device);
    void remove_device(const std::string& device_id);

    // Hooks for rows written by an external registry.
    StoreOutcome on_device_created(const std::string& device_id);
    void on_device_deleted(const std::string& device_id);

    // Re-runs store creation for every registered device. Returns the
    // number of devices whose store is complete.
    size_t reconcile_stores();

    int default_retention_days() const { return retention_days; }
};
