// server/query_service.cpp
#include "query_service.hpp"
#include "logger.hpp"
#include "relation_naming.hpp"
#include "../common/errors.hpp"
#include "../common/measurement_fields.hpp"
#include <sstream>

namespace {

const char* kUtcTimestamp =
    "'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"'";

std::string utc_text(const std::string& expr) {
    return "to_char(" + expr + " AT TIME ZONE 'UTC', " + kUtcTimestamp + ")";
}

std::optional<double> number(const SqlValue& v) {
    if (!v) return std::nullopt;
    return std::stod(*v);
}

} // namespace

QueryService::QueryService(SqlExecutor& executor, DeviceRegistry& device_registry,
                           AccessPolicy& access_policy, const QueryConfig& query_limits)
    : db(executor), registry(device_registry), access(access_policy), limits(query_limits) {}

void QueryService::authorize(const Principal& principal, const std::string& device_id) {
    if (device_id.empty()) {
        throw ValidationError("Device identifier must not be empty");
    }
    if (!registry.exists(device_id)) {
        throw NotFoundError("Device not found: " + device_id);
    }
    if (!access.allowed(principal, device_id)) {
        throw PermissionError("Access denied to device " + device_id);
    }
}

SqlResult QueryService::run(const std::string& device_id, const std::string& sql, const SqlParams& params) {
    try {
        return db.execute(sql, params);
    } catch (const UnavailableError&) {
        throw;
    } catch (const StorageError& e) {
        if (e.sqlstate() == sqlstate::kUndefinedTable) {
            throw NotFoundError("No store for device " + device_id);
        }
        if (e.sqlstate() == sqlstate::kInvalidDatetimeFormat || e.sqlstate() == sqlstate::kDatetimeOverflow) {
            throw ValidationError(std::string("Invalid time bound: ") + e.what());
        }
        Logger::error("Query for device " + device_id + " failed: " + e.what());
        throw;
    }
}

std::string QueryService::window_clause(const TimeWindow& window, SqlParams& params) {
    std::string clause;
    if (window.start) {
        params.push_back(*window.start);
        clause += " WHERE timestamp >= $" + std::to_string(params.size()) + "::timestamptz";
    }
    if (window.end) {
        params.push_back(*window.end);
        clause += (clause.empty() ? " WHERE" : " AND");
        clause += " timestamp < $" + std::to_string(params.size()) + "::timestamptz";
    }
    return clause;
}

std::string QueryService::select_columns() {
    std::ostringstream ss;
    ss << "id, " << utc_text("timestamp") << " AS timestamp";
    for (const auto& field : measurement_fields()) {
        ss << ", " << field.column;
    }
    return ss.str();
}

DataPoint QueryService::row_to_point(const SqlResult& result, size_t row) {
    DataPoint p;
    p.id = std::stoll(result.text(row, "id"));
    p.timestamp = result.text(row, "timestamp");
    for (const auto& field : measurement_fields()) {
        p.values[field.name] = number(result.get(row, field.column));
    }
    return p;
}

RangeResult QueryService::range(const Principal& principal, const std::string& device_id,
                                const RangeRequest& request) {
    authorize(principal, device_id);

    const int64_t limit = request.limit.value_or(limits.default_limit);
    const int64_t offset = request.offset.value_or(0);
    if (limit < 1 || limit > limits.max_limit) {
        throw ValidationError("limit must be between 1 and " + std::to_string(limits.max_limit));
    }
    if (offset < 0) {
        throw ValidationError("offset must not be negative");
    }

    SqlParams params;
    std::string sql = "SELECT " + select_columns() + " FROM " + relation_name(device_id) +
                      window_clause(request.window, params);
    params.push_back(std::to_string(limit));
    sql += " ORDER BY timestamp DESC, id DESC LIMIT $" + std::to_string(params.size()) + "::bigint";
    params.push_back(std::to_string(offset));
    sql += " OFFSET $" + std::to_string(params.size()) + "::bigint";

    SqlResult r = run(device_id, sql, params);

    RangeResult result;
    result.device_id = device_id;
    result.data.reserve(r.size());
    for (size_t i = 0; i < r.size(); i++) {
        result.data.push_back(row_to_point(r, i));
    }
    return result;
}

std::optional<DataPoint> QueryService::latest(const Principal& principal, const std::string& device_id) {
    authorize(principal, device_id);

    SqlResult r = run(device_id,
                      "SELECT " + select_columns() + " FROM " + relation_name(device_id) +
                      " ORDER BY timestamp DESC, id DESC LIMIT 1",
                      {});
    if (r.empty()) {
        return std::nullopt;
    }
    return row_to_point(r, 0);
}

DeviceStats QueryService::stats(const Principal& principal, const std::string& device_id,
                                const TimeWindow& window) {
    authorize(principal, device_id);

    SqlParams params;
    std::ostringstream sql;
    sql << "SELECT COUNT(*) AS count, "
        << utc_text("MIN(timestamp)") << " AS first_timestamp, "
        << utc_text("MAX(timestamp)") << " AS last_timestamp, "
        << "AVG(" << kTotalPowerColumn << ") AS avg_power, "
        << "MAX(" << kTotalPowerColumn << ") AS max_power, "
        << "MIN(" << kTotalPowerColumn << ") AS min_power, "
        << "AVG(" << kAvgPowerFactorColumn << ") AS avg_power_factor, "
        << "AVG(" << kFrequencyColumn << ") AS avg_frequency "
        << "FROM " << relation_name(device_id)
        << window_clause(window, params);

    SqlResult r = run(device_id, sql.str(), params);
    if (r.empty()) {
        throw StorageError("Aggregate query returned no row");
    }

    DeviceStats s;
    s.count = std::stoll(r.text(0, "count"));
    s.first_timestamp = r.get(0, "first_timestamp");
    s.last_timestamp = r.get(0, "last_timestamp");
    s.avg_power = number(r.get(0, "avg_power"));
    s.max_power = number(r.get(0, "max_power"));
    s.min_power = number(r.get(0, "min_power"));
    s.avg_power_factor = number(r.get(0, "avg_power_factor"));
    s.avg_frequency = number(r.get(0, "avg_frequency"));
    return s;
}
