// server/policy_manager.hpp
#pragma once
#include "database.hpp"
#include <string>
#include <vector>

// Retention and compression jobs inside TimescaleDB, keyed by relation name.
// Every operation is best-effort: failures are logged and reported as false,
// never thrown.
class PolicyManager {
private:
    SqlExecutor& db;

public:
    explicit PolicyManager(SqlExecutor& executor) : db(executor) {}

    bool set_retention(const std::string& device_id, int days);
    bool remove_retention(const std::string& device_id);
    bool set_compression(const std::string& device_id, int days);

    struct BulkResult {
        size_t applied{0};
        size_t failed{0};
    };
    BulkResult apply_retention_to_all(const std::vector<std::string>& device_ids, int days);
};

std::string interval_days(int days);
