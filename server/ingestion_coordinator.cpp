// server/ingestion_coordinator.cpp
#include "ingestion_coordinator.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "relation_naming.hpp"
#include "../common/errors.hpp"
#include "../common/measurement_fields.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

std::string sql_number(double value) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return ss.str();
}

IngestionCoordinator::IngestionCoordinator(SqlExecutor& executor, DeviceRegistry& device_registry,
                                           AccessPolicy& access_policy, StreamPublisher& publisher,
                                           ThreadPool& publish_workers)
    : db(executor), registry(device_registry), access(access_policy), stream(publisher),
      publish_pool(publish_workers) {}

void IngestionCoordinator::validate_reading(const MeterReading& reading) {
    if (reading.values.empty()) {
        throw ValidationError("No data fields provided");
    }
    for (const auto& [name, value] : reading.values) {
        if (!find_measurement_field(name)) {
            throw ValidationError("Unknown field '" + name + "'");
        }
        if (!std::isfinite(value)) {
            throw ValidationError("Field '" + name + "' must be a finite number");
        }
    }
    if (reading.timestamp && !valid_iso8601(*reading.timestamp)) {
        throw ValidationError("Invalid timestamp '" + *reading.timestamp + "'");
    }
}

std::string IngestionCoordinator::insert_sql(const std::string& table,
                                             const std::vector<std::string>& columns,
                                             bool with_timestamp) {
    std::ostringstream cols, vals;
    int param = 1;
    if (with_timestamp) {
        cols << "timestamp";
        vals << "$" << param++ << "::timestamptz";
    }
    for (const auto& c : columns) {
        if (param > 1) {
            cols << ", ";
            vals << ", ";
        }
        cols << c;
        vals << "$" << param++ << "::numeric";
    }

    return "INSERT INTO " + table + " (" + cols.str() + ") VALUES (" + vals.str() + ") "
           "RETURNING id, to_char(timestamp AT TIME ZONE 'UTC', "
           "'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS timestamp";
}

void IngestionCoordinator::authorize(const Principal& principal, const std::string& device_id) {
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

InsertResult IngestionCoordinator::persist(const MeterReading& reading) {
    const std::string table = relation_name(reading.device_id);

    // Fixed column order keeps the statement text stable per field set
    std::vector<std::string> columns;
    SqlParams params;
    if (reading.timestamp) {
        params.push_back(*reading.timestamp);
    }
    for (const auto& field : measurement_fields()) {
        auto it = reading.values.find(field.name);
        if (it != reading.values.end()) {
            columns.push_back(field.column);
            params.push_back(sql_number(it->second));
        }
    }

    SqlResult r;
    try {
        r = db.execute(insert_sql(table, columns, reading.timestamp.has_value()), params);
    } catch (const UnavailableError&) {
        throw;
    } catch (const StorageError& e) {
        const std::string& state = e.sqlstate();
        if (state == sqlstate::kNumericOutOfRange) {
            throw ValidationError(std::string("Value out of range for its column: ") + e.what());
        }
        if (state == sqlstate::kInvalidDatetimeFormat || state == sqlstate::kDatetimeOverflow) {
            throw ValidationError("Invalid timestamp '" + reading.timestamp.value_or("") + "'");
        }
        if (state == sqlstate::kUndefinedTable) {
            throw NotFoundError("No store for device " + reading.device_id);
        }
        Logger::error("Error inserting data for device " + reading.device_id + ": " + e.what() +
                      (state.empty() ? "" : " [" + state + "]"));
        throw;
    }

    if (r.empty()) {
        throw StorageError("Insert into " + table + " returned no row");
    }
    InsertResult result;
    result.id = std::stoll(r.text(0, "id"));
    result.timestamp = r.text(0, "timestamp");
    stored++;
    return result;
}

void IngestionCoordinator::publish_async(const MeterReading& reading, const InsertResult& result) {
    if (!stream.enabled()) {
        return;
    }

    json message = reading_to_json(reading);
    message["deviceId"] = reading.device_id;
    message["id"] = result.id;
    message["timestamp"] = result.timestamp;

    bool queued = publish_pool.enqueue([this, device_id = reading.device_id, payload = message.dump()]() {
        if (!stream.publish(device_id, payload)) {
            publish_failures++;
        }
    });
    if (!queued) {
        publish_failures++;
        Logger::warning("Publish of reading " + std::to_string(result.id) + " for " +
                        reading.device_id + " dropped: publisher shutting down");
    }
}

InsertResult IngestionCoordinator::ingest(const Principal& principal, const std::string& device_id,
                                          const MeterReading& reading) {
    authorize(principal, device_id);

    MeterReading owned = reading;
    owned.device_id = device_id;
    validate_reading(owned);

    InsertResult result = persist(owned);
    Logger::debug("Stored reading " + std::to_string(result.id) + " for " + device_id +
                  " (" + std::to_string(owned.values.size()) + " fields)");
    publish_async(owned, result);
    return result;
}

MeterReading IngestionCoordinator::decode_frame(const Device& device, const RegisterFrame& frame) {
    MeterReading reading;
    reading.device_id = device.id;
    reading.timestamp = frame.timestamp;

    for (const auto& block : frame.blocks) {
        const RegisterMapping* mapping = nullptr;
        for (const auto& m : device.register_map) {
            if (m.address == block.address) {
                mapping = &m;
                break;
            }
        }
        if (!mapping) {
            throw ValidationError("No register mapping at address " + std::to_string(block.address) +
                                  " for device " + device.id);
        }

        if (mapping->data_type == RegisterType::Utf8) {
            if (find_measurement_field(mapping->parameter)) {
                throw ValidationError("Text register '" + mapping->parameter +
                                      "' cannot feed a numeric column");
            }
            // Text registers carry no measurement; decoding still checks the block
            size_t expected = mapping->register_count != 0 ? mapping->register_count
                                                           : register_count(RegisterType::Utf8);
            decode(RegisterType::Utf8, block.words, expected);
            continue;
        }

        if (!find_measurement_field(mapping->parameter)) {
            throw ValidationError("Register mapping targets unknown field '" + mapping->parameter + "'");
        }
        if (reading.values.count(mapping->parameter)) {
            throw ValidationError("Parameter '" + mapping->parameter + "' supplied twice");
        }
        reading.values[mapping->parameter] = decode_numeric(mapping->data_type, block.words);
    }
    return reading;
}

InsertResult IngestionCoordinator::ingest_registers(const Principal& principal, const RegisterFrame& frame) {
    if (frame.device_id.empty()) {
        throw ValidationError("Device identifier must not be empty");
    }
    std::optional<Device> device = registry.find(frame.device_id);
    if (!device) {
        throw NotFoundError("Device not found: " + frame.device_id);
    }
    if (!access.allowed(principal, frame.device_id)) {
        throw PermissionError("Access denied to device " + frame.device_id);
    }

    MeterReading reading = decode_frame(*device, frame);
    validate_reading(reading);

    InsertResult result = persist(reading);
    Logger::debug("Stored decoded frame " + std::to_string(result.id) + " for " + frame.device_id +
                  " (" + std::to_string(frame.blocks.size()) + " blocks)");
    publish_async(reading, result);
    return result;
}
