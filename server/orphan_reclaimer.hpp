// server/orphan_reclaimer.hpp
#pragma once
#include "database.hpp"
#include "device_registry.hpp"
#include <string>
#include <vector>

struct ReclaimReport {
    size_t scanned{0};
    std::vector<std::string> dropped;
    std::vector<std::string> failed;
    size_t protected_skipped{0};
};

// Drops device_* relations that no registered device maps to.
class OrphanReclaimer {
private:
    SqlExecutor& db;
    DeviceRegistry& registry;

public:
    OrphanReclaimer(SqlExecutor& executor, DeviceRegistry& device_registry)
        : db(executor), registry(device_registry) {}

    // The device id set is read once, up front; a device registered while
    // the sweep runs may lose its store. Run it before accepting requests.
    ReclaimReport reclaim_orphans();

    static bool is_protected(const std::string& table_name);
};

// Double-quoted identifier, safe for any catalogue name.
std::string quote_identifier(const std::string& name);
