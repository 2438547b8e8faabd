// server/request_dispatcher.hpp
#pragma once
#include "device_registry.hpp"
#include "ingestion_coordinator.hpp"
#include "orphan_reclaimer.hpp"
#include "policy_manager.hpp"
#include "query_service.hpp"
#include "stream_publisher.hpp"
#include "json_codec.hpp"
#include "../common/errors.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <string>

enum class Readiness {
    Starting,
    Ready,
    Stopping
};

const char* readiness_name(Readiness state);

namespace status {
constexpr const char* kOk = "OK";
constexpr const char* kCreated = "CREATED";
constexpr const char* kInvalid = "INVALID";
constexpr const char* kNotFound = "NOT_FOUND";
constexpr const char* kForbidden = "FORBIDDEN";
constexpr const char* kUnavailable = "UNAVAILABLE";
constexpr const char* kError = "ERROR";
}

struct Response {
    std::string status;
    json body;
};

// The services a request can reach. Held by reference; the owner keeps
// them alive for the dispatcher's lifetime.
struct ServiceSet {
    DeviceRegistry& registry;
    IngestionCoordinator& ingestion;
    QueryService& queries;
    OrphanReclaimer& reclaimer;
    PolicyManager& policies;
    StreamPublisher& stream;
    std::function<bool()> database_alive;
};

// Maps one framed command to a service call and every failure to a
// status. Never throws.
class RequestDispatcher {
private:
    using Handler = std::function<Response(const json&)>;

    ServiceSet services;
    std::map<std::string, Handler> handlers;
    std::atomic<Readiness> state{Readiness::Starting};

    void register_handlers();
    Response health();

public:
    explicit RequestDispatcher(ServiceSet service_set);

    Response dispatch(const std::string& command, const std::string& body);

    void set_readiness(Readiness next) { state.store(next); }
    Readiness readiness() const { return state.load(); }

    static Response error_response(const char* status, const std::string& kind,
                                   const std::string& message, bool retryable = false);
    static const char* status_for(ErrorKind kind);
};
