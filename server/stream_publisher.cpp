// server/stream_publisher.cpp
#include "stream_publisher.hpp"
#include "logger.hpp"
#include "../common/errors.hpp"
#ifdef METERSTORE_WITH_KAFKA
#include "kafka_publisher.hpp"
#endif

std::string stream_topic(const std::string& prefix, const std::string& device_id) {
    std::string topic = prefix;
    for (char c : device_id) {
        bool legal = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                     c == '.' || c == '_' || c == '-';
        topic += legal ? c : '_';
    }
    // Kafka caps topic names at 249 characters
    if (topic.size() > 249) {
        topic.resize(249);
    }
    return topic;
}

std::vector<std::pair<std::string, std::string>> kafka_producer_settings(const StreamConfig& config) {
    return {
        {"bootstrap.servers", config.brokers},
        {"client.id", config.client_id},
        {"acks", "1"},
        // At most once, never duplicated
        {"enable.idempotence", "false"},
        {"retries", "0"},
        {"max.in.flight.requests.per.connection", "1"},
        {"socket.timeout.ms", "30000"},
        {"message.timeout.ms", "30000"}
    };
}

bool kafka_support_compiled() {
#ifdef METERSTORE_WITH_KAFKA
    return true;
#else
    return false;
#endif
}

std::unique_ptr<StreamPublisher> make_stream_publisher(const StreamConfig& config) {
    if (!config.enabled) {
        Logger::info("Streaming is disabled");
        return std::make_unique<DisabledPublisher>();
    }
#ifdef METERSTORE_WITH_KAFKA
    return std::make_unique<KafkaPublisher>(config);
#else
    throw ConfigError("stream.enabled is set but this build has no Kafka support");
#endif
}
