// server/json_codec.cpp
#include "json_codec.hpp"
#include "../common/errors.hpp"
#include "../common/measurement_fields.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <set>

namespace {

bool digits(const std::string& s, size_t pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    out = 0;
    for (size_t i = pos; i < pos + n; i++) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

const json* member(const json& body, const char* key) {
    if (!body.is_object()) return nullptr;
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return nullptr;
    return &*it;
}

std::optional<std::string> optional_timestamp(const json& body, const char* key) {
    const json* v = member(body, key);
    if (!v) return std::nullopt;
    if (!v->is_string() || !valid_iso8601(v->get<std::string>())) {
        throw ValidationError(std::string("'") + key + "' must be an ISO-8601 timestamp");
    }
    return v->get<std::string>();
}

std::optional<int64_t> optional_integer(const json& body, const char* key) {
    const json* v = member(body, key);
    if (!v) return std::nullopt;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) {
        double d = v->get<double>();
        if (std::isfinite(d) && d == std::floor(d) &&
            std::fabs(d) < static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(d);
        }
    }
    throw ValidationError(std::string("'") + key + "' must be an integer");
}

uint32_t register_word(const json& v) {
    if (!v.is_number_integer() || v.get<int64_t>() < 0 ||
        v.get<int64_t>() > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw ValidationError("Register words must be non-negative integers");
    }
    return static_cast<uint32_t>(v.get<int64_t>());
}

json optional_number(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

json optional_text(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

} // namespace

bool valid_iso8601(const std::string& ts) {
    int year, month, day;
    if (!digits(ts, 0, 4, year) || ts.size() < 10 || ts[4] != '-' ||
        !digits(ts, 5, 2, month) || ts[7] != '-' || !digits(ts, 8, 2, day)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return false;
    if (ts.size() == 10) return true;

    if (ts[10] != 'T' && ts[10] != 't' && ts[10] != ' ') return false;
    int hour, minute, second = 0;
    if (!digits(ts, 11, 2, hour) || ts.size() < 16 || ts[13] != ':' || !digits(ts, 14, 2, minute)) {
        return false;
    }
    if (hour > 23 || minute > 59) return false;

    size_t pos = 16;
    if (pos < ts.size() && ts[pos] == ':') {
        if (!digits(ts, pos + 1, 2, second) || second > 60) return false;
        pos += 3;
        if (pos < ts.size() && ts[pos] == '.') {
            size_t start = ++pos;
            while (pos < ts.size() && std::isdigit(static_cast<unsigned char>(ts[pos]))) pos++;
            if (pos == start) return false;
        }
    }
    if (pos == ts.size()) return true;

    if (ts[pos] == 'Z' || ts[pos] == 'z') return pos + 1 == ts.size();
    if (ts[pos] != '+' && ts[pos] != '-') return false;
    int off_h, off_m = 0;
    if (!digits(ts, pos + 1, 2, off_h) || off_h > 23) return false;
    pos += 3;
    if (pos == ts.size()) return true;
    if (ts[pos] == ':') pos++;
    if (!digits(ts, pos, 2, off_m) || off_m > 59) return false;
    return pos + 2 == ts.size();
}

std::string require_string(const json& body, const char* key) {
    const json* v = member(body, key);
    if (!v || !v->is_string() || v->get<std::string>().empty()) {
        throw ValidationError(std::string("'") + key + "' is required");
    }
    return v->get<std::string>();
}

Principal principal_from_json(const json& body) {
    Principal p;
    const json* v = member(body, "principal");
    if (!v) return p;
    if (!v->is_object()) {
        throw ValidationError("'principal' must be an object");
    }
    p.user = v->value("user", "");
    p.role = v->value("role", "");
    return p;
}

MeterReading reading_from_json(const std::string& device_id, const json& reading) {
    if (!reading.is_object()) {
        throw ValidationError("Reading must be an object");
    }

    MeterReading r;
    r.device_id = device_id;
    for (auto it = reading.begin(); it != reading.end(); ++it) {
        if (it.key() == "timestamp") {
            continue;
        }
        if (!find_measurement_field(it.key())) {
            throw ValidationError("Unknown field '" + it.key() + "'");
        }
        if (it->is_null()) {
            continue;
        }
        if (!it->is_number() || !std::isfinite(it->get<double>())) {
            throw ValidationError("Field '" + it.key() + "' must be a finite number");
        }
        r.values[it.key()] = it->get<double>();
    }
    r.timestamp = optional_timestamp(reading, "timestamp");

    if (r.values.empty()) {
        throw ValidationError("No data fields provided");
    }
    return r;
}

json reading_to_json(const MeterReading& reading) {
    json j = json::object();
    if (reading.timestamp) {
        j["timestamp"] = *reading.timestamp;
    }
    for (const auto& [name, value] : reading.values) {
        j[name] = value;
    }
    return j;
}

RegisterFrame register_frame_from_json(const json& body) {
    RegisterFrame frame;
    frame.device_id = require_string(body, "deviceId");
    frame.timestamp = optional_timestamp(body, "timestamp");

    const json* regs = member(body, "registers");
    if (!regs || !regs->is_array() || regs->empty()) {
        throw ValidationError("'registers' must be a non-empty array");
    }
    for (const auto& block : *regs) {
        if (!block.is_object() || !block.contains("address") || !block.contains("words")) {
            throw ValidationError("Register block needs 'address' and 'words'");
        }
        RegisterBlock b;
        b.address = register_word(block["address"]);
        if (!block["words"].is_array() || block["words"].empty()) {
            throw ValidationError("'words' must be a non-empty array");
        }
        for (const auto& w : block["words"]) {
            b.words.push_back(register_word(w));
        }
        frame.blocks.push_back(std::move(b));
    }
    return frame;
}

std::vector<RegisterMapping> register_map_from_json(const json& map) {
    if (map.is_null()) return {};
    if (!map.is_array()) {
        throw ValidationError("'registerMap' must be an array");
    }

    std::vector<RegisterMapping> out;
    std::set<uint32_t> addresses;
    for (const auto& entry : map) {
        RegisterMapping m;
        m.parameter = require_string(entry, "parameter");
        if (!entry.contains("address")) {
            throw ValidationError("Register mapping '" + m.parameter + "' has no address");
        }
        m.address = register_word(entry["address"]);
        m.data_type = parse_register_type(require_string(entry, "dataType"));
        m.description = entry.value("description", "");
        if (auto count = optional_integer(entry, "registerCount")) {
            if (*count <= 0 || *count > 125) {
                throw ValidationError("registerCount of '" + m.parameter + "' out of range");
            }
            m.register_count = static_cast<size_t>(*count);
        }

        if (m.data_type != RegisterType::Utf8 && !find_measurement_field(m.parameter)) {
            throw ValidationError("Register mapping targets unknown field '" + m.parameter + "'");
        }
        if (!addresses.insert(m.address).second) {
            throw ValidationError("Duplicate register address " + std::to_string(m.address));
        }
        out.push_back(std::move(m));
    }
    return out;
}

json register_map_to_json(const std::vector<RegisterMapping>& map) {
    json arr = json::array();
    for (const auto& m : map) {
        json e = {
            {"parameter", m.parameter},
            {"address", m.address},
            {"dataType", register_type_name(m.data_type)},
            {"description", m.description}
        };
        if (m.register_count) {
            e["registerCount"] = m.register_count;
        }
        arr.push_back(std::move(e));
    }
    return arr;
}

Device device_from_json(const json& body) {
    if (!body.is_object()) {
        throw ValidationError("Device must be an object");
    }

    Device d;
    d.id = require_string(body, "id");
    d.name = require_string(body, "name");
    d.type = require_string(body, "type");
    d.ip_address = require_string(body, "ipAddress");

    if (auto slave = optional_integer(body, "slaveAddress")) {
        if (*slave < 1 || *slave > 247) {
            throw ValidationError("'slaveAddress' must be between 1 and 247");
        }
        d.slave_address = static_cast<int>(*slave);
    }
    if (const json* status = member(body, "status")) {
        static const std::set<std::string> kStatuses = {"online", "offline", "error"};
        if (!status->is_string() || !kStatuses.count(status->get<std::string>())) {
            throw ValidationError("'status' must be one of online, offline, error");
        }
        d.status = status->get<std::string>();
    }
    if (const json* include = member(body, "includeInTotalSummary")) {
        if (!include->is_boolean()) {
            throw ValidationError("'includeInTotalSummary' must be a boolean");
        }
        d.include_in_total_summary = include->get<bool>();
    }
    if (const json* map = member(body, "registerMap")) {
        d.register_map = register_map_from_json(*map);
    }
    return d;
}

json device_to_json(const Device& device) {
    return {
        {"id", device.id},
        {"name", device.name},
        {"type", device.type},
        {"ipAddress", device.ip_address},
        {"slaveAddress", device.slave_address},
        {"status", device.status},
        {"includeInTotalSummary", device.include_in_total_summary},
        {"registerMap", register_map_to_json(device.register_map)}
    };
}

TimeWindow window_from_json(const json& body) {
    TimeWindow w;
    w.start = optional_timestamp(body, "startTime");
    w.end = optional_timestamp(body, "endTime");
    return w;
}

RangeRequest range_request_from_json(const json& body) {
    RangeRequest r;
    r.window = window_from_json(body);
    r.limit = optional_integer(body, "limit");
    r.offset = optional_integer(body, "offset");
    return r;
}

json insert_result_to_json(const InsertResult& result) {
    return {{"id", result.id}, {"timestamp", result.timestamp}};
}

json data_point_to_json(const DataPoint& point) {
    json j = {{"id", point.id}, {"timestamp", point.timestamp}};
    for (const auto& [name, value] : point.values) {
        j[name] = optional_number(value);
    }
    return j;
}

json range_result_to_json(const RangeResult& result) {
    json data = json::array();
    for (const auto& p : result.data) {
        data.push_back(data_point_to_json(p));
    }
    return {
        {"deviceId", result.device_id},
        {"count", result.data.size()},
        {"data", std::move(data)}
    };
}

json stats_to_json(const DeviceStats& stats) {
    return {
        {"count", stats.count},
        {"first_timestamp", optional_text(stats.first_timestamp)},
        {"last_timestamp", optional_text(stats.last_timestamp)},
        {"avg_power", optional_number(stats.avg_power)},
        {"max_power", optional_number(stats.max_power)},
        {"min_power", optional_number(stats.min_power)},
        {"avg_power_factor", optional_number(stats.avg_power_factor)},
        {"avg_frequency", optional_number(stats.avg_frequency)}
    };
}
