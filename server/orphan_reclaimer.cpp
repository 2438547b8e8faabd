// server/orphan_reclaimer.cpp
#include "orphan_reclaimer.hpp"
#include "logger.hpp"
#include "relation_naming.hpp"
#include "../common/errors.hpp"
#include <set>

std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

bool OrphanReclaimer::is_protected(const std::string& table_name) {
    static const std::set<std::string> kProtected = {"devices", "users", "user_device_permissions"};
    return kProtected.count(table_name) > 0;
}

ReclaimReport OrphanReclaimer::reclaim_orphans() {
    ReclaimReport report;

    std::set<std::string> expected;
    for (const auto& id : registry.list_ids()) {
        expected.insert(relation_name(id));
    }

    SqlResult tables = db.execute(
        "SELECT tablename FROM pg_tables "
        "WHERE schemaname = 'public' AND tablename LIKE 'device\\_%' ORDER BY tablename");

    for (size_t i = 0; i < tables.size(); i++) {
        const std::string& table = tables.text(i, "tablename");
        report.scanned++;

        if (is_protected(table) || !is_device_relation(table)) {
            report.protected_skipped++;
            continue;
        }
        if (expected.count(table)) {
            continue;
        }

        try {
            db.execute("DROP TABLE IF EXISTS " + quote_identifier(table) + " CASCADE");
            report.dropped.push_back(table);
            Logger::info("Dropped orphaned table " + table);
        } catch (const MeterStoreError& e) {
            report.failed.push_back(table);
            Logger::warning("Could not drop orphaned table " + table + ": " + e.what());
        }
    }

    if (report.dropped.empty() && report.failed.empty()) {
        Logger::info("No orphaned device tables found (" + std::to_string(report.scanned) + " scanned)");
    } else {
        Logger::success("Orphan sweep: " + std::to_string(report.dropped.size()) + " dropped, " +
                        std::to_string(report.failed.size()) + " failed");
    }
    return report;
}
