// common/protocol.hpp
#pragma once
#include "register_decoder.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Caller identity handed to the delegated access check.
// role is as claimed by the caller; access checks read the stored role.
struct Principal {
    std::string user;
    std::string role;
};

// Partial reading: any subset of the known measurement fields.
struct MeterReading {
    std::string device_id;
    std::optional<std::string> timestamp;  // ISO-8601; server time when absent
    std::map<std::string, double> values;  // parameter name -> value
};

// One register block as fetched from the device.
struct RegisterBlock {
    uint32_t address;
    RegisterWords words;
};

struct RegisterFrame {
    std::string device_id;
    std::optional<std::string> timestamp;
    std::vector<RegisterBlock> blocks;
};

struct RegisterMapping {
    std::string parameter;
    uint32_t address{0};
    RegisterType data_type{RegisterType::Float32};
    std::string description;
    size_t register_count{0};  // 0 = default for the type
};

struct Device {
    std::string id;
    std::string name;
    std::string type;
    std::string ip_address;
    int slave_address{1};
    std::string status{"offline"};
    bool include_in_total_summary{true};
    std::vector<RegisterMapping> register_map;
};

struct InsertResult {
    int64_t id{0};
    std::string timestamp;
};

struct DataPoint {
    int64_t id{0};
    std::string timestamp;
    std::map<std::string, std::optional<double>> values;  // every known field, null when absent
};

struct TimeWindow {
    std::optional<std::string> start;  // inclusive
    std::optional<std::string> end;    // exclusive
};

struct RangeRequest {
    TimeWindow window;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
};

struct RangeResult {
    std::string device_id;
    std::vector<DataPoint> data;
};

struct DeviceStats {
    int64_t count{0};
    std::optional<std::string> first_timestamp;
    std::optional<std::string> last_timestamp;
    std::optional<double> avg_power;
    std::optional<double> max_power;
    std::optional<double> min_power;
    std::optional<double> avg_power_factor;
    std::optional<double> avg_frequency;
};
