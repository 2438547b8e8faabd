#include <gtest/gtest.h>
#include "stream_publisher.hpp"
#include "common/errors.hpp"
#include <map>

TEST(StreamTopic, PrefixPlusSanitizedId) {
    EXPECT_EQ(stream_topic("device-data-", "meter1"), "device-data-meter1");
    EXPECT_EQ(stream_topic("device-data-", "Bay 3/Meter#1"), "device-data-Bay_3_Meter_1");
    EXPECT_EQ(stream_topic("", "a.b_c-D"), "a.b_c-D");
}

TEST(StreamTopic, CappedAtBrokerLimit) {
    std::string topic = stream_topic("device-data-", std::string(400, 'x'));
    EXPECT_EQ(topic.size(), 249u);
    EXPECT_EQ(topic.rfind("device-data-x", 0), 0u);
}

TEST(KafkaSettings, AtMostOnceWithoutDuplicates) {
    StreamConfig config;
    config.brokers = "kafka1:9092,kafka2:9092";
    std::map<std::string, std::string> settings;
    for (const auto& kv : kafka_producer_settings(config)) settings.insert(kv);

    EXPECT_EQ(settings.at("bootstrap.servers"), "kafka1:9092,kafka2:9092");
    EXPECT_EQ(settings.at("acks"), "1");
    EXPECT_EQ(settings.at("retries"), "0");
    EXPECT_EQ(settings.at("max.in.flight.requests.per.connection"), "1");
    EXPECT_EQ(settings.at("enable.idempotence"), "false");
}

TEST(StreamPublisherFactory, DisabledByDefault) {
    StreamConfig config;
    auto publisher = make_stream_publisher(config);
    ASSERT_TRUE(publisher);
    EXPECT_FALSE(publisher->enabled());
    EXPECT_EQ(publisher->describe(), "disabled");
    EXPECT_TRUE(publisher->publish("meter1", "{}"));
    publisher->flush(10);
}

TEST(StreamPublisherFactory, EnabledStreamNeedsKafkaBuild) {
    if (kafka_support_compiled()) {
        GTEST_SKIP() << "built with Kafka support";
    }
    StreamConfig config;
    config.enabled = true;
    EXPECT_THROW(make_stream_publisher(config), ConfigError);
}
