// server/policy_manager.cpp
#include "policy_manager.hpp"
#include "relation_naming.hpp"
#include "logger.hpp"
#include "../common/errors.hpp"

namespace {

bool already_exists(const StorageError& e) {
    return e.sqlstate() == sqlstate::kDuplicateObject ||
           std::string(e.what()).find("already exists") != std::string::npos;
}

} // namespace

std::string interval_days(int days) {
    return std::to_string(days) + (days == 1 ? " day" : " days");
}

bool PolicyManager::set_retention(const std::string& device_id, int days) {
    const std::string table = relation_name(device_id);
    try {
        db.execute("SELECT add_retention_policy($1::regclass, drop_after => $2::interval, "
                   "if_not_exists => TRUE)",
                   {table, interval_days(days)});
        Logger::info("Retention policy set for " + table + ": " + interval_days(days));
        return true;
    } catch (const StorageError& e) {
        if (already_exists(e)) {
            return true;
        }
        Logger::warning("Could not set retention policy for " + table + ": " + e.what());
        return false;
    }
}

bool PolicyManager::remove_retention(const std::string& device_id) {
    const std::string table = relation_name(device_id);
    try {
        SqlResult jobs = db.execute(
            "SELECT job_id FROM timescaledb_information.jobs "
            "WHERE proc_name = 'policy_retention' AND hypertable_name = $1",
            {table});

        for (size_t i = 0; i < jobs.size(); i++) {
            db.execute("SELECT delete_job($1::integer)", {jobs.text(i, "job_id")});
        }
        if (jobs.empty()) {
            Logger::debug("No retention policy to remove for " + table);
        } else {
            Logger::info("Retention policy removed for " + table);
        }
        return true;
    } catch (const MeterStoreError& e) {
        Logger::warning("Could not remove retention policy for " + table + ": " + e.what());
        return false;
    }
}

bool PolicyManager::set_compression(const std::string& device_id, int days) {
    const std::string table = relation_name(device_id);
    try {
        db.execute("SELECT add_compression_policy($1::regclass, compress_after => $2::interval, "
                   "if_not_exists => TRUE)",
                   {table, interval_days(days)});
        return true;
    } catch (const StorageError& e) {
        if (already_exists(e)) {
            return true;
        }
        Logger::warning("Could not add compression policy for " + table + ": " + e.what());
        return false;
    }
}

PolicyManager::BulkResult PolicyManager::apply_retention_to_all(
        const std::vector<std::string>& device_ids, int days) {
    BulkResult result;
    for (const auto& id : device_ids) {
        if (set_retention(id, days)) {
            result.applied++;
        } else {
            result.failed++;
        }
    }
    Logger::info("Retention policies configured for " + std::to_string(result.applied) +
                 " device(s): " + interval_days(days) +
                 (result.failed ? " (" + std::to_string(result.failed) + " failed)" : ""));
    return result;
}
