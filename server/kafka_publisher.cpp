// server/kafka_publisher.cpp
#include "kafka_publisher.hpp"
#include "logger.hpp"
#include "../common/errors.hpp"

void KafkaPublisher::DeliveryReport::dr_cb(RdKafka::Message& message) {
    if (message.err() != RdKafka::ERR_NO_ERROR) {
        failed++;
        Logger::warning("Kafka delivery to " + message.topic_name() + " failed: " + message.errstr());
        return;
    }
    delivered++;
}

KafkaPublisher::KafkaPublisher(const StreamConfig& cfg) : config(cfg) {
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
    std::string err;

    // No producer idempotence: see kafka_producer_settings()
    for (const auto& [key, value] : kafka_producer_settings(config)) {
        if (conf->set(key, value, err) != RdKafka::Conf::CONF_OK) {
            throw ConfigError("Kafka setting " + key + ": " + err);
        }
    }
    if (conf->set("dr_cb", &reports, err) != RdKafka::Conf::CONF_OK) {
        throw ConfigError("Kafka delivery callback: " + err);
    }

    producer.reset(RdKafka::Producer::create(conf.get(), err));
    if (!producer) {
        throw ConfigError("Failed to create Kafka producer: " + err);
    }
    Logger::success("Kafka producer created (" + config.brokers + ")");
}

KafkaPublisher::~KafkaPublisher() {
    flush(10000);
    Logger::info("Kafka producer closed (" + std::to_string(reports.delivered.load()) + " delivered, " +
                 std::to_string(reports.failed.load()) + " failed)");
}

bool KafkaPublisher::publish(const std::string& device_id, const std::string& payload) {
    const std::string topic = stream_topic(config.topic_prefix, device_id);

    RdKafka::ErrorCode rc = producer->produce(
        topic, RdKafka::Topic::PARTITION_UA, RdKafka::Producer::RK_MSG_COPY,
        const_cast<char*>(payload.data()), payload.size(),
        device_id.data(), device_id.size(),
        0, nullptr);

    // Serve delivery callbacks of earlier messages
    producer->poll(0);

    if (rc != RdKafka::ERR_NO_ERROR) {
        Logger::warning("Error sending to Kafka topic " + topic + ": " + RdKafka::err2str(rc));
        return false;
    }
    return true;
}

std::string KafkaPublisher::describe() const {
    return "kafka " + config.brokers;
}

void KafkaPublisher::flush(int timeout_ms) {
    if (producer->flush(timeout_ms) != RdKafka::ERR_NO_ERROR) {
        Logger::warning(std::to_string(producer->outq_len()) + " Kafka message(s) not delivered before shutdown");
    }
}
