#include <gtest/gtest.h>
#include "fakes/fake_timescale.hpp"
#include "fakes/recording_publisher.hpp"
#include "access_policy.hpp"
#include "request_dispatcher.hpp"

class DispatcherTest : public ::testing::Test {
protected:
    FakeTimescale db;
    PolicyManager policies{db};
    TableManager tables{db, policies, 7};
    DeviceRegistry registry{db, tables, policies, 90};
    OrphanReclaimer reclaimer{db, registry};
    PermissionTableAccessPolicy access{db};
    DisabledPublisher stream;
    ThreadPool publish_pool{1, "publish"};
    IngestionCoordinator ingestion{db, registry, access, stream, publish_pool};
    QueryConfig limits;
    QueryService queries{db, registry, access, limits};
    bool db_up{true};
    RequestDispatcher dispatcher{ServiceSet{registry, ingestion, queries, reclaimer, policies, stream,
                                            [this] { return db_up; }}};

    void SetUp() override {
        db.add_device("meter1");
        db.add_user("root@plant", "admin");
        tables.create_device_store("meter1");
        dispatcher.set_readiness(Readiness::Ready);
    }

    void TearDown() override { publish_pool.shutdown(); }

    static std::string admin_ingest(const std::string& device, const std::string& reading) {
        return R"({"deviceId":")" + device + R"(","principal":{"user":"root@plant","role":"admin"},"reading":)" +
               reading + "}";
    }
};

TEST(DispatcherStatus, ErrorKindsMapToStatuses) {
    EXPECT_STREQ(RequestDispatcher::status_for(ErrorKind::Validation), "INVALID");
    EXPECT_STREQ(RequestDispatcher::status_for(ErrorKind::Decode), "INVALID");
    EXPECT_STREQ(RequestDispatcher::status_for(ErrorKind::NotFound), "NOT_FOUND");
    EXPECT_STREQ(RequestDispatcher::status_for(ErrorKind::Permission), "FORBIDDEN");
    EXPECT_STREQ(RequestDispatcher::status_for(ErrorKind::Unavailable), "UNAVAILABLE");
    EXPECT_STREQ(RequestDispatcher::status_for(ErrorKind::Storage), "ERROR");
}

TEST_F(DispatcherTest, IngestReturnsCreated) {
    Response r = dispatcher.dispatch("INGEST", admin_ingest("meter1", R"({"Ptotal": 1500.5, "PFavg": 0.93})"));
    EXPECT_EQ(r.status, "CREATED");
    EXPECT_EQ(r.body["id"], 1);
    EXPECT_EQ(r.body["timestamp"], "2026-10-19T08:00:00.000000Z");
}

TEST_F(DispatcherTest, FailuresCarryKindAndRetryFlag) {
    Response r = dispatcher.dispatch("INGEST", admin_ingest("meter1", R"({"Bogus": 1})"));
    EXPECT_EQ(r.status, "INVALID");
    EXPECT_EQ(r.body["error"], "validation");
    EXPECT_EQ(r.body["retryable"], false);

    r = dispatcher.dispatch("INGEST", admin_ingest("ghost", R"({"VR": 1})"));
    EXPECT_EQ(r.status, "NOT_FOUND");

    r = dispatcher.dispatch("INGEST", R"({"deviceId":"meter1","principal":{"user":"x@plant","role":"user"},)"
                                      R"("reading":{"VR":1}})");
    EXPECT_EQ(r.status, "FORBIDDEN");
    EXPECT_EQ(r.body["error"], "permission");

    db.add_user("x@plant");
    r = dispatcher.dispatch("INGEST", R"({"deviceId":"meter1","principal":{"user":"x@plant","role":"admin"},)"
                                      R"("reading":{"VR":1}})");
    EXPECT_EQ(r.status, "FORBIDDEN");

    db.fail_unavailable("INSERT INTO device_meter1");
    r = dispatcher.dispatch("INGEST", admin_ingest("meter1", R"({"VR": 1})"));
    EXPECT_EQ(r.status, "UNAVAILABLE");
    EXPECT_EQ(r.body["retryable"], true);

    db.fail("INSERT INTO device_meter1", "could not extend file", "53100");
    r = dispatcher.dispatch("INGEST", admin_ingest("meter1", R"({"VR": 1})"));
    EXPECT_EQ(r.status, "ERROR");
    EXPECT_EQ(r.body["error"], "storage");
}

TEST_F(DispatcherTest, MalformedBodiesAreInvalid) {
    EXPECT_EQ(dispatcher.dispatch("INGEST", "{not json").status, "INVALID");
    EXPECT_EQ(dispatcher.dispatch("INGEST", "[1,2]").status, "INVALID");
    EXPECT_EQ(dispatcher.dispatch("INGEST", R"({"deviceId":"meter1"})").status, "INVALID");
    EXPECT_EQ(dispatcher.dispatch("RANGE", "").status, "INVALID");
    EXPECT_EQ(dispatcher.dispatch("FROBNICATE", "{}").status, "INVALID");
    EXPECT_FALSE(db.ran("INSERT INTO device_"));
}

TEST_F(DispatcherTest, DecodeFailureIsInvalid) {
    db.add_device("meter2", R"([{"parameter":"Ptotal","address":3053,"dataType":"FLOAT32"}])");
    Response r = dispatcher.dispatch("INGEST_REGISTERS",
        R"({"deviceId":"meter2","principal":{"user":"root@plant"},"registers":[{"address":3053,"words":[1]}]})");
    EXPECT_EQ(r.status, "INVALID");
    EXPECT_EQ(r.body["error"], "decode");
}

TEST_F(DispatcherTest, RequestsWaitForReadiness) {
    dispatcher.set_readiness(Readiness::Starting);
    Response r = dispatcher.dispatch("INGEST", admin_ingest("meter1", R"({"VR": 1})"));
    EXPECT_EQ(r.status, "UNAVAILABLE");
    EXPECT_EQ(r.body["retryable"], true);
    EXPECT_FALSE(db.ran("INSERT INTO device_"));

    dispatcher.set_readiness(Readiness::Stopping);
    EXPECT_EQ(dispatcher.dispatch("LATEST", R"({"deviceId":"meter1"})").status, "UNAVAILABLE");
}

TEST_F(DispatcherTest, HealthReflectsReadinessAndDatabase) {
    Response r = dispatcher.dispatch("HEALTH", "");
    EXPECT_EQ(r.status, "OK");
    EXPECT_EQ(r.body["status"], "ready");
    EXPECT_EQ(r.body["database"], "up");
    EXPECT_EQ(r.body["stream"], "disabled");

    db_up = false;
    r = dispatcher.dispatch("HEALTH", "");
    EXPECT_EQ(r.status, "UNAVAILABLE");
    EXPECT_EQ(r.body["database"], "down");

    db_up = true;
    dispatcher.set_readiness(Readiness::Starting);
    r = dispatcher.dispatch("HEALTH", "");
    EXPECT_EQ(r.status, "UNAVAILABLE");
    EXPECT_EQ(r.body["status"], "starting");
}

TEST_F(DispatcherTest, LatestWithoutDataIsNotFound) {
    Response r = dispatcher.dispatch("LATEST", R"({"deviceId":"meter1","principal":{"user":"root@plant"}})");
    EXPECT_EQ(r.status, "NOT_FOUND");
    EXPECT_EQ(r.body["error"], "no_data");
}

TEST_F(DispatcherTest, RangeCarriesCountAndData) {
    Response r = dispatcher.dispatch("RANGE", R"({"deviceId":"meter1","principal":{"user":"root@plant"},"limit":5})");
    EXPECT_EQ(r.status, "OK");
    EXPECT_EQ(r.body["deviceId"], "meter1");
    EXPECT_EQ(r.body["count"], 0);
    EXPECT_TRUE(r.body["data"].is_array());

    r = dispatcher.dispatch("RANGE", R"({"deviceId":"meter1","principal":{"user":"root@plant"},"limit":0})");
    EXPECT_EQ(r.status, "INVALID");
}

TEST_F(DispatcherTest, DeviceLifecycleCommands) {
    Response r = dispatcher.dispatch("REGISTER_DEVICE",
        R"({"id":"meter7","name":"Feeder 7","type":"EM6400","ipAddress":"10.0.0.7","slaveAddress":3})");
    EXPECT_EQ(r.status, "CREATED");
    EXPECT_EQ(r.body["relation"], "device_meter7");
    EXPECT_EQ(r.body["state"], store_state_name(StoreState::Compressed));
    EXPECT_TRUE(db.has_table("device_meter7"));

    r = dispatcher.dispatch("REMOVE_DEVICE", R"({"deviceId":"meter7"})");
    EXPECT_EQ(r.status, "OK");
    EXPECT_FALSE(db.has_device("meter7"));

    r = dispatcher.dispatch("REMOVE_DEVICE", R"({"deviceId":"meter7"})");
    EXPECT_EQ(r.status, "NOT_FOUND");
}

TEST_F(DispatcherTest, RegistryEventsAndReclaim) {
    db.add_device("meter8");
    EXPECT_EQ(dispatcher.dispatch("DEVICE_CREATED", R"({"deviceId":"meter8"})").status, "OK");
    EXPECT_TRUE(db.has_table("device_meter8"));
    EXPECT_EQ(dispatcher.dispatch("DEVICE_CREATED", R"({"deviceId":"nobody"})").status, "NOT_FOUND");

    db.add_table("device_leftover", true);
    Response r = dispatcher.dispatch("RECLAIM", "{}");
    EXPECT_EQ(r.status, "OK");
    EXPECT_EQ(r.body["dropped"], json::array({"device_leftover"}));

    EXPECT_EQ(dispatcher.dispatch("DEVICE_DELETED", R"({"deviceId":"meter8"})").status, "OK");
    EXPECT_FALSE(db.has_table("device_meter8"));
}

TEST_F(DispatcherTest, RetentionCommands) {
    Response r = dispatcher.dispatch("SET_RETENTION", R"({"deviceId":"meter1","days":30})");
    EXPECT_EQ(r.status, "OK");
    EXPECT_EQ(r.body["applied"], true);
    EXPECT_EQ(*db.last("add_retention_policy").params.at(1), "30 days");

    EXPECT_EQ(dispatcher.dispatch("SET_RETENTION", R"({"deviceId":"meter1","days":0})").status, "INVALID");
    EXPECT_EQ(dispatcher.dispatch("SET_RETENTION", R"({"deviceId":"ghost"})").status, "NOT_FOUND");

    r = dispatcher.dispatch("REMOVE_RETENTION", R"({"deviceId":"meter1"})");
    EXPECT_EQ(r.status, "OK");
    EXPECT_EQ(db.job_count("policy_retention", "device_meter1"), 0u);
}
