// server/ingestion_coordinator.hpp
#pragma once
#include "access_policy.hpp"
#include "database.hpp"
#include "device_registry.hpp"
#include "stream_publisher.hpp"
#include "thread_pool.hpp"
#include "../common/protocol.hpp"
#include <atomic>
#include <string>

class IngestionCoordinator {
private:
    SqlExecutor& db;
    DeviceRegistry& registry;
    AccessPolicy& access;
    StreamPublisher& stream;
    ThreadPool& publish_pool;

    std::atomic<uint64_t> stored{0};
    std::atomic<uint64_t> publish_failures{0};

    void authorize(const Principal& principal, const std::string& device_id);
    InsertResult persist(const MeterReading& reading);
    void publish_async(const MeterReading& reading, const InsertResult& result);

public:
    IngestionCoordinator(SqlExecutor& executor, DeviceRegistry& device_registry,
                         AccessPolicy& access_policy, StreamPublisher& publisher,
                         ThreadPool& publish_workers);

    // Device check, access check, field validation, one INSERT (committed
    // before return), then a background publish the caller never waits for.
    InsertResult ingest(const Principal& principal, const std::string& device_id,
                        const MeterReading& reading);

    // Decodes raw register blocks through the device's register map and
    // stores the result like ingest().
    InsertResult ingest_registers(const Principal& principal, const RegisterFrame& frame);

    // Throws ValidationError: no fields, unknown field, non-finite value,
    // malformed timestamp.
    static void validate_reading(const MeterReading& reading);

    // Numeric values for every mapped measurement in the frame.
    static MeterReading decode_frame(const Device& device, const RegisterFrame& frame);

    // INSERT for the given columns; parameter $1 is the timestamp when
    // `with_timestamp` is set.
    static std::string insert_sql(const std::string& table, const std::vector<std::string>& columns,
                                  bool with_timestamp);

    uint64_t stored_count() const { return stored.load(); }
    uint64_t publish_failure_count() const { return publish_failures.load(); }
};

// Shortest decimal text that reads back as the same double.
std::string sql_number(double value);
