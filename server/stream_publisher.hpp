// server/stream_publisher.hpp
#pragma once
#include "config.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Fire-and-forget fan-out of stored readings to a message bus.
// publish() never throws; false means the message was not handed over.
class StreamPublisher {
public:
    virtual ~StreamPublisher() = default;

    virtual bool publish(const std::string& device_id, const std::string& payload) = 0;
    virtual bool enabled() const = 0;
    virtual std::string describe() const = 0;
    // Blocks until outstanding messages are delivered or the timeout passes.
    virtual void flush(int /*timeout_ms*/) {}
};

class DisabledPublisher : public StreamPublisher {
public:
    bool publish(const std::string&, const std::string&) override { return true; }
    bool enabled() const override { return false; }
    std::string describe() const override { return "disabled"; }
};

// Topic for a device: prefix + id, characters outside [A-Za-z0-9._-] as '_'.
std::string stream_topic(const std::string& prefix, const std::string& device_id);

// librdkafka producer properties for the stream. Leader-only acks with no
// retries and a single request in flight stand in for producer idempotence,
// which librdkafka only offers together with acks=all.
std::vector<std::pair<std::string, std::string>> kafka_producer_settings(const StreamConfig& config);

bool kafka_support_compiled();

// DisabledPublisher unless stream.enabled. Enabling the stream on a build
// without Kafka support is a ConfigError.
std::unique_ptr<StreamPublisher> make_stream_publisher(const StreamConfig& config);
