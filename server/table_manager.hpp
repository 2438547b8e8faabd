// server/table_manager.hpp
#pragma once
#include "database.hpp"
#include "policy_manager.hpp"
#include <string>

// Position of a device relation in its creation sequence. DDL is not
// transactional across the steps, so creation resumes from whatever
// state a previous (possibly interrupted) run left behind.
enum class StoreState {
    Absent,
    Created,
    Partitioned,
    Indexed,
    Compressed
};

const char* store_state_name(StoreState state);

struct StoreInspection {
    bool exists{false};
    bool partitioned{false};
    int index_count{0};
    bool compression_enabled{false};
    bool compression_policy{false};

    StoreState state() const;
};

class TableManager {
private:
    SqlExecutor& db;
    PolicyManager& policies;
    int compression_after_days;

    void run_step(const std::string& table, const char* step, const std::string& sql);
    bool enable_compression(const std::string& device_id, const std::string& table,
                            const StoreInspection& current);

public:
    static constexpr int kExpectedIndexes = 3;

    TableManager(SqlExecutor& executor, PolicyManager& policy_manager, int compress_after_days);

    // Idempotent. Returns the state reached: Compressed normally, Indexed when
    // the compression step failed (logged, not thrown). Any earlier failure
    // propagates as StorageError.
    StoreState create_device_store(const std::string& device_id);

    // Drops the relation; absence is not an error.
    void delete_device_store(const std::string& device_id);

    StoreInspection inspect(const std::string& device_id);
    StoreState store_state(const std::string& device_id) { return inspect(device_id).state(); }

    static std::string create_table_sql(const std::string& table);
};
