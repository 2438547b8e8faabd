// server/kafka_publisher.hpp
#pragma once
#include "stream_publisher.hpp"
#include <atomic>
#include <memory>
#include <librdkafka/rdkafkacpp.h>

// Per-device topics, keyed by device id so a device's messages stay in
// one partition and in order. Leader-only acks and no producer retries:
// a message is delivered at most once.
class KafkaPublisher : public StreamPublisher {
private:
    class DeliveryReport : public RdKafka::DeliveryReportCb {
    public:
        std::atomic<uint64_t> delivered{0};
        std::atomic<uint64_t> failed{0};
        void dr_cb(RdKafka::Message& message) override;
    };

    StreamConfig config;
    DeliveryReport reports;
    std::unique_ptr<RdKafka::Producer> producer;

public:
    // Throws ConfigError when the producer cannot be configured or created.
    explicit KafkaPublisher(const StreamConfig& cfg);
    ~KafkaPublisher() override;

    bool publish(const std::string& device_id, const std::string& payload) override;
    bool enabled() const override { return true; }
    std::string describe() const override;
    void flush(int timeout_ms) override;
};
