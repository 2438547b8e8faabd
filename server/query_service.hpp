// server/query_service.hpp
#pragma once
#include "access_policy.hpp"
#include "config.hpp"
#include "database.hpp"
#include "device_registry.hpp"
#include "../common/protocol.hpp"
#include <optional>
#include <string>

class QueryService {
private:
    SqlExecutor& db;
    DeviceRegistry& registry;
    AccessPolicy& access;
    QueryConfig limits;

    void authorize(const Principal& principal, const std::string& device_id);
    SqlResult run(const std::string& device_id, const std::string& sql, const SqlParams& params);

public:
    QueryService(SqlExecutor& executor, DeviceRegistry& device_registry,
                 AccessPolicy& access_policy, const QueryConfig& query_limits);

    // Newest first, start inclusive, end exclusive.
    RangeResult range(const Principal& principal, const std::string& device_id,
                      const RangeRequest& request);

    // nullopt when the device has no rows yet.
    std::optional<DataPoint> latest(const Principal& principal, const std::string& device_id);

    // Single aggregate statement over ptotal, pfavg and frequency.
    DeviceStats stats(const Principal& principal, const std::string& device_id,
                      const TimeWindow& window);

    // Appends the bound timestamps to `params` and returns the WHERE clause
    // (empty without bounds).
    static std::string window_clause(const TimeWindow& window, SqlParams& params);
    static std::string select_columns();
    static DataPoint row_to_point(const SqlResult& result, size_t row);
};
