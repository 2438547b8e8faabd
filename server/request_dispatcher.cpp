// server/request_dispatcher.cpp
#include "request_dispatcher.hpp"
#include "logger.hpp"
#include "relation_naming.hpp"
#include "../common/errors.hpp"

const char* readiness_name(Readiness state) {
    switch (state) {
        case Readiness::Starting: return "starting";
        case Readiness::Ready: return "ready";
        case Readiness::Stopping: return "stopping";
    }
    return "unknown";
}

namespace {

json outcome_to_json(const StoreOutcome& outcome) {
    return {
        {"id", outcome.device_id},
        {"relation", outcome.relation},
        {"state", store_state_name(outcome.state)}
    };
}

json report_to_json(const ReclaimReport& report) {
    return {
        {"scanned", report.scanned},
        {"dropped", report.dropped},
        {"failed", report.failed},
        {"protected_skipped", report.protected_skipped}
    };
}

} // namespace

RequestDispatcher::RequestDispatcher(ServiceSet service_set)
    : services(std::move(service_set)) {
    register_handlers();
}

Response RequestDispatcher::error_response(const char* status, const std::string& kind,
                                           const std::string& message, bool retryable) {
    return {status, {{"error", kind}, {"message", message}, {"retryable", retryable}}};
}

const char* RequestDispatcher::status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:
        case ErrorKind::Decode: return status::kInvalid;
        case ErrorKind::NotFound: return status::kNotFound;
        case ErrorKind::Permission: return status::kForbidden;
        case ErrorKind::Unavailable: return status::kUnavailable;
        case ErrorKind::Storage:
        case ErrorKind::Config: return status::kError;
    }
    return status::kError;
}

void RequestDispatcher::register_handlers() {
    handlers["INGEST"] = [this](const json& body) {
        std::string device_id = require_string(body, "deviceId");
        if (!body.contains("reading")) {
            throw ValidationError("'reading' is required");
        }
        MeterReading reading = reading_from_json(device_id, body["reading"]);
        InsertResult r = services.ingestion.ingest(principal_from_json(body), device_id, reading);
        return Response{status::kCreated, insert_result_to_json(r)};
    };

    handlers["INGEST_REGISTERS"] = [this](const json& body) {
        RegisterFrame frame = register_frame_from_json(body);
        InsertResult r = services.ingestion.ingest_registers(principal_from_json(body), frame);
        return Response{status::kCreated, insert_result_to_json(r)};
    };

    handlers["RANGE"] = [this](const json& body) {
        std::string device_id = require_string(body, "deviceId");
        RangeResult r = services.queries.range(principal_from_json(body), device_id,
                                               range_request_from_json(body));
        return Response{status::kOk, range_result_to_json(r)};
    };

    handlers["LATEST"] = [this](const json& body) {
        std::string device_id = require_string(body, "deviceId");
        auto point = services.queries.latest(principal_from_json(body), device_id);
        if (!point) {
            return error_response(status::kNotFound, "no_data", "No data points found");
        }
        return Response{status::kOk, data_point_to_json(*point)};
    };

    handlers["STATS"] = [this](const json& body) {
        std::string device_id = require_string(body, "deviceId");
        DeviceStats s = services.queries.stats(principal_from_json(body), device_id,
                                               window_from_json(body));
        return Response{status::kOk, stats_to_json(s)};
    };

    handlers["REGISTER_DEVICE"] = [this](const json& body) {
        Device device = device_from_json(body);
        return Response{status::kCreated, outcome_to_json(services.registry.register_device(device))};
    };

    handlers["REMOVE_DEVICE"] = [this](const json& body) {
        std::string device_id = require_string(body, "deviceId");
        services.registry.remove_device(device_id);
        return Response{status::kOk, {{"id", device_id}}};
    };

    handlers["DEVICE_CREATED"] = [this](const json& body) {
        std::string device_id = require_string(body, "deviceId");
        return Response{status::kOk, outcome_to_json(services.registry.on_device_created(device_id))};
    };

    handlers["DEVICE_DELETED"] = [this](const json& body) {
        std::string device_id = require_string(body, "deviceId");
        services.registry.on_device_deleted(device_id);
        return Response{status::kOk, {{"id", device_id}}};
    };

    handlers["RECLAIM"] = [this](const json&) {
        return Response{status::kOk, report_to_json(services.reclaimer.reclaim_orphans())};
    };

    handlers["SET_RETENTION"] = [this](const json& body) {
        std::string device_id = require_string(body, "deviceId");
        int days = services.registry.default_retention_days();
        if (body.contains("days")) {
            if (!body["days"].is_number_integer() || body["days"].get<int64_t>() < 1 ||
                body["days"].get<int64_t>() > 36500) {
                throw ValidationError("'days' must be a positive integer");
            }
            days = body["days"].get<int>();
        }
        if (!services.registry.exists(device_id)) {
            throw NotFoundError("Device not found: " + device_id);
        }
        return Response{status::kOk, {{"applied", services.policies.set_retention(device_id, days)}}};
    };

    handlers["REMOVE_RETENTION"] = [this](const json& body) {
        std::string device_id = require_string(body, "deviceId");
        if (!services.registry.exists(device_id)) {
            throw NotFoundError("Device not found: " + device_id);
        }
        return Response{status::kOk, {{"removed", services.policies.remove_retention(device_id)}}};
    };
}

Response RequestDispatcher::health() {
    bool db_up = false;
    try {
        db_up = services.database_alive && services.database_alive();
    } catch (const std::exception& e) {
        Logger::warning(std::string("Health probe failed: ") + e.what());
    }
    Readiness current = state.load();
    return {current == Readiness::Ready && db_up ? status::kOk : status::kUnavailable,
            {{"status", readiness_name(current)},
             {"database", db_up ? "up" : "down"},
             {"stream", services.stream.describe()}}};
}

Response RequestDispatcher::dispatch(const std::string& command, const std::string& body) {
    if (command == "HEALTH") {
        return health();
    }

    auto it = handlers.find(command);
    if (it == handlers.end()) {
        return error_response(status::kInvalid, "validation", "Unknown command '" + command + "'");
    }

    Readiness current = state.load();
    if (current != Readiness::Ready) {
        return error_response(status::kUnavailable, "unavailable",
                              std::string("Service is ") + readiness_name(current), true);
    }

    try {
        json parsed = body.empty() ? json::object() : json::parse(body);
        if (!parsed.is_object()) {
            throw ValidationError("Request body must be a JSON object");
        }
        return it->second(parsed);
    } catch (const json::exception& e) {
        return error_response(status::kInvalid, "validation", std::string("Malformed request: ") + e.what());
    } catch (const MeterStoreError& e) {
        if (e.kind() == ErrorKind::Storage || e.kind() == ErrorKind::Unavailable) {
            Logger::error(command + " failed: " + e.what());
        } else {
            Logger::debug(command + " rejected: " + e.what());
        }
        return error_response(status_for(e.kind()), error_kind_name(e.kind()), e.what(), e.retryable());
    } catch (const std::exception& e) {
        Logger::error(command + " failed unexpectedly: " + e.what());
        return error_response(status::kError, "internal", e.what());
    }
}
