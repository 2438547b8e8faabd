// server/json_codec.hpp
#pragma once
#include "../common/protocol.hpp"
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// All *_from_json functions throw ValidationError on malformed input.

bool valid_iso8601(const std::string& ts);

Principal principal_from_json(const json& body);

// `reading` holds optional "timestamp" plus known measurement fields only.
MeterReading reading_from_json(const std::string& device_id, const json& reading);
json reading_to_json(const MeterReading& reading);

RegisterFrame register_frame_from_json(const json& body);

std::vector<RegisterMapping> register_map_from_json(const json& map);
json register_map_to_json(const std::vector<RegisterMapping>& map);

Device device_from_json(const json& body);
json device_to_json(const Device& device);

TimeWindow window_from_json(const json& body);
RangeRequest range_request_from_json(const json& body);

json insert_result_to_json(const InsertResult& result);
json data_point_to_json(const DataPoint& point);
json range_result_to_json(const RangeResult& result);
json stats_to_json(const DeviceStats& stats);

// Required non-empty string member.
std::string require_string(const json& body, const char* key);
