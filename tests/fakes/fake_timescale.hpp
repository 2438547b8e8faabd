// tests/fakes/fake_timescale.hpp
#pragma once
#include "fake_sql_executor.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <sstream>

// In-memory stand-in for the catalogue of a TimescaleDB database. It
// understands exactly the statements the storage components issue;
// scripted rules from FakeSqlExecutor still take precedence.
class FakeTimescale : public FakeSqlExecutor {
public:
    struct Table {
        bool hypertable{false};
        bool compression{false};
        std::set<std::string> indexes;
        std::vector<std::map<std::string, std::string>> rows;
        int64_t next_id{1};
    };

    struct Job {
        int id;
        std::string proc;
        std::string table;
    };

    struct DeviceRow {
        std::string name;
        std::string type;
        std::string ip_address;
        std::string register_map{"[]"};
        std::string relation;
    };

    // Row written by someone else (the external registry).
    void add_device(const std::string& id, const std::string& register_map = "[]") {
        std::lock_guard<std::mutex> lock(mutex);
        devices[id] = DeviceRow{id + " meter", "meter", "10.0.0.1", register_map};
    }

    void add_table(const std::string& name, bool hypertable = false) {
        std::lock_guard<std::mutex> lock(mutex);
        tables[name].hypertable = hypertable;
    }

    void add_index(const std::string& table, const std::string& index) {
        std::lock_guard<std::mutex> lock(mutex);
        tables[table].indexes.insert(index);
    }

    // Users must exist before their grants apply.
    void add_user(const std::string& email, const std::string& role = "user") {
        std::lock_guard<std::mutex> lock(mutex);
        users[email] = role;
    }

    void grant(const std::string& email, const std::string& device_id) {
        std::lock_guard<std::mutex> lock(mutex);
        users.insert({email, "user"});
        permissions.insert({email, device_id});
    }

    bool has_table(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        return tables.count(name) > 0;
    }

    bool has_device(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex);
        return devices.count(id) > 0;
    }

    Table table(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = tables.find(name);
        return it == tables.end() ? Table{} : it->second;
    }

    std::vector<std::string> table_names() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::string> names;
        for (const auto& t : tables) names.push_back(t.first);
        return names;
    }

    size_t job_count(const std::string& proc, const std::string& table) const {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<size_t>(std::count_if(jobs.begin(), jobs.end(), [&](const Job& j) {
            return j.proc == proc && j.table == table;
        }));
    }

    bool core_table(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        return core_tables.count(name) > 0;
    }

protected:
    SqlResult fallback(const std::string& sql, const SqlParams& params) override {
        std::lock_guard<std::mutex> lock(mutex);

        if (starts(sql, "CREATE EXTENSION")) return {};

        if (starts(sql, "CREATE TABLE IF NOT EXISTS ")) {
            std::string name = word_after(sql, "CREATE TABLE IF NOT EXISTS ");
            if (name.rfind("device_", 0) == 0) {
                tables[name];
            } else {
                core_tables.insert(name);
            }
            return {};
        }

        if (starts(sql, "CREATE INDEX IF NOT EXISTS ")) {
            std::string index = word_after(sql, "CREATE INDEX IF NOT EXISTS ");
            std::string table = word_after(sql, " ON ");
            if (table.find('(') != std::string::npos) table = table.substr(0, table.find('('));
            if (table.rfind("device_", 0) != 0) return {};
            require_table(table).indexes.insert(index);
            return {};
        }

        if (sql.find("AS table_exists") != std::string::npos) {
            const std::string& t = *params.at(0);
            auto it = tables.find(t);
            bool exists = it != tables.end();
            int index_count = 0;
            if (exists) {
                for (const char* suffix : {"_timestamp_idx", "_ptotal_idx", "_pfavg_idx"}) {
                    index_count += static_cast<int>(it->second.indexes.count(t + suffix));
                }
            }
            bool policy = std::any_of(jobs.begin(), jobs.end(), [&](const Job& j) {
                return j.proc == "policy_compression" && j.table == t;
            });
            return single_row(
                {"table_exists", "partitioned", "index_count", "compression_enabled", "compression_policy"},
                {flag(exists), flag(exists && it->second.hypertable), std::to_string(index_count),
                 flag(exists && it->second.compression), flag(policy)});
        }

        if (sql.find("create_hypertable") != std::string::npos) {
            require_table(*params.at(0)).hypertable = true;
            return single_row({"create_hypertable"}, {std::string("(1,public,") + *params.at(0) + ",t)"});
        }

        if (starts(sql, "ALTER TABLE devices ")) return {};

        if (starts(sql, "ALTER TABLE ")) {
            Table& t = require_table(word_after(sql, "ALTER TABLE "));
            if (!t.hypertable) throw StorageError("table is not a hypertable");
            t.compression = true;
            return {};
        }

        if (sql.find("add_compression_policy") != std::string::npos) {
            Table& t = require_table(*params.at(0));
            if (!t.compression) {
                throw StorageError("compression not enabled on hypertable \"" + *params.at(0) + "\"");
            }
            return add_job("policy_compression", *params.at(0));
        }

        if (sql.find("add_retention_policy") != std::string::npos) {
            Table& t = require_table(*params.at(0));
            if (!t.hypertable) throw StorageError("table \"" + *params.at(0) + "\" is not a hypertable");
            return add_job("policy_retention", *params.at(0));
        }

        if (sql.find("SELECT job_id FROM timescaledb_information.jobs") != std::string::npos) {
            std::vector<std::vector<SqlValue>> rows;
            for (const auto& j : jobs) {
                if (j.proc == "policy_retention" && j.table == *params.at(0)) {
                    rows.push_back({std::to_string(j.id)});
                }
            }
            return SqlResult({"job_id"}, rows);
        }

        if (sql.find("delete_job") != std::string::npos) {
            int id = std::stoi(*params.at(0));
            jobs.erase(std::remove_if(jobs.begin(), jobs.end(), [id](const Job& j) { return j.id == id; }),
                       jobs.end());
            return single_row({"delete_job"}, {std::string("")});
        }

        if (starts(sql, "DROP TABLE IF EXISTS ")) {
            std::string name = unquote(word_after(sql, "DROP TABLE IF EXISTS "));
            tables.erase(name);
            jobs.erase(std::remove_if(jobs.begin(), jobs.end(), [&](const Job& j) { return j.table == name; }),
                       jobs.end());
            return {};
        }

        if (sql.find("SELECT tablename FROM pg_tables") != std::string::npos) {
            std::vector<std::vector<SqlValue>> rows;
            for (const auto& t : tables) {
                if (t.first.rfind("device_", 0) == 0) rows.push_back({t.first});
            }
            return SqlResult({"tablename"}, rows);
        }

        if (starts(sql, "SELECT 1 FROM devices WHERE id")) {
            if (devices.count(*params.at(0))) return single_row({"?column?"}, {std::string("1")});
            return SqlResult({"?column?"}, {});
        }

        if (starts(sql, "SELECT id FROM devices")) {
            std::vector<std::vector<SqlValue>> rows;
            for (const auto& d : devices) rows.push_back({d.first});
            return SqlResult({"id"}, rows);
        }

        if (starts(sql, "SELECT id, name, type")) {
            auto it = devices.find(*params.at(0));
            std::vector<std::string> cols = {"id", "name", "type", "ip_address", "slave_address", "status",
                                             "include_in_total_summary", "register_map"};
            if (it == devices.end()) return SqlResult(cols, {});
            return single_row(cols, {it->first, it->second.name, it->second.type, it->second.ip_address,
                                     std::string("1"), std::string("offline"), std::string("t"),
                                     it->second.register_map});
        }

        if (starts(sql, "INSERT INTO devices")) {
            claim(*params.at(0), *params.at(8));
            devices[*params.at(0)] = DeviceRow{*params.at(1), *params.at(2), *params.at(3), *params.at(7),
                                               *params.at(8)};
            return {};
        }

        if (starts(sql, "UPDATE devices SET relation_name")) {
            auto it = devices.find(*params.at(0));
            if (it == devices.end()) return {};
            claim(it->first, *params.at(1));
            it->second.relation = *params.at(1);
            return {};
        }

        if (starts(sql, "DELETE FROM devices")) {
            if (devices.erase(*params.at(0))) return single_row({"id"}, {*params.at(0)});
            return SqlResult({"id"}, {});
        }

        if (starts(sql, "SELECT role FROM users")) {
            auto it = users.find(*params.at(0));
            if (it == users.end()) return SqlResult({"role"}, {});
            return single_row({"role"}, {it->second});
        }

        if (starts(sql, "SELECT 1 FROM user_device_permissions")) {
            if (permissions.count({*params.at(0), *params.at(1)})) {
                return single_row({"?column?"}, {std::string("1")});
            }
            return SqlResult({"?column?"}, {});
        }

        if (starts(sql, "INSERT INTO device_")) {
            return insert_row(sql, params);
        }

        return {};
    }

private:
    std::map<std::string, Table> tables;
    std::set<std::string> core_tables;
    std::vector<Job> jobs;
    int next_job{1000};
    std::map<std::string, DeviceRow> devices;
    std::map<std::string, std::string> users;
    std::set<std::pair<std::string, std::string>> permissions;

    static bool starts(const std::string& sql, const char* prefix) {
        return sql.rfind(prefix, 0) == 0;
    }

    static SqlValue flag(bool b) { return std::string(b ? "t" : "f"); }

    static std::string word_after(const std::string& sql, const std::string& marker) {
        size_t pos = sql.find(marker);
        if (pos == std::string::npos) return "";
        pos += marker.size();
        size_t end = sql.find_first_of(" \n(", pos);
        return sql.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    }

    static std::string unquote(const std::string& name) {
        if (name.size() < 2 || name.front() != '"') return name;
        std::string out;
        for (size_t i = 1; i + 1 < name.size(); i++) {
            out += name[i];
            if (name[i] == '"') i++;
        }
        return out;
    }

    Table& require_table(const std::string& name) {
        auto it = tables.find(name);
        if (it == tables.end()) {
            throw StorageError("relation \"" + name + "\" does not exist", sqlstate::kUndefinedTable);
        }
        return it->second;
    }

    // UNIQUE (relation_name) on devices
    void claim(const std::string& id, const std::string& relation) {
        for (const auto& d : devices) {
            if (d.first != id && d.second.relation == relation) {
                throw StorageError("duplicate key value violates unique constraint "
                                   "\"devices_relation_name_key\"",
                                   sqlstate::kUniqueViolation);
            }
        }
    }

    SqlResult add_job(const std::string& proc, const std::string& table) {
        for (const auto& j : jobs) {
            if (j.proc == proc && j.table == table) {
                return single_row({"policy"}, {std::to_string(j.id)});
            }
        }
        jobs.push_back({next_job, proc, table});
        return single_row({"policy"}, {std::to_string(next_job++)});
    }

    SqlResult insert_row(const std::string& sql, const SqlParams& params) {
        std::string table = word_after(sql, "INSERT INTO ");
        Table& t = require_table(table);

        size_t open = sql.find('(');
        size_t close = sql.find(')', open);
        std::stringstream cols(sql.substr(open + 1, close - open - 1));
        std::map<std::string, std::string> row;
        std::string col;
        size_t i = 0;
        while (std::getline(cols, col, ',')) {
            col.erase(0, col.find_first_not_of(' '));
            row[col] = *params.at(i++);
        }
        if (!row.count("timestamp")) {
            row["timestamp"] = "2026-10-19T08:00:00.000000Z";
        }
        int64_t id = t.next_id++;
        row["id"] = std::to_string(id);
        t.rows.push_back(row);
        return single_row({"id", "timestamp"}, {std::to_string(id), row["timestamp"]});
    }
};
