#include <gtest/gtest.h>
#include "fakes/fake_timescale.hpp"
#include "device_registry.hpp"
#include "orphan_reclaimer.hpp"

class OrphanReclaimerTest : public ::testing::Test {
protected:
    FakeTimescale db;
    PolicyManager policies{db};
    TableManager tables{db, policies, 7};
    DeviceRegistry registry{db, tables, policies, 90};
    OrphanReclaimer reclaimer{db, registry};
};

TEST(QuoteIdentifier, DoublesEmbeddedQuotes) {
    EXPECT_EQ(quote_identifier("device_a"), "\"device_a\"");
    EXPECT_EQ(quote_identifier("device_\"x"), "\"device_\"\"x\"");
}

TEST_F(OrphanReclaimerTest, DropsOnlyRelationsWithoutDevice) {
    db.add_device("meter1");
    db.add_device("Meter-2");
    db.add_table("device_meter1", true);
    db.add_table("device_meter_2", true);
    db.add_table("device_gone", true);
    db.add_table("device_also_gone");

    ReclaimReport report = reclaimer.reclaim_orphans();

    EXPECT_EQ(report.scanned, 4u);
    EXPECT_EQ(report.dropped, (std::vector<std::string>{"device_also_gone", "device_gone"}));
    EXPECT_TRUE(report.failed.empty());
    EXPECT_TRUE(db.has_table("device_meter1"));
    EXPECT_TRUE(db.has_table("device_meter_2"));
    EXPECT_FALSE(db.has_table("device_gone"));
}

TEST_F(OrphanReclaimerTest, ContinuesAfterFailedDrop) {
    db.add_table("device_a");
    db.add_table("device_b");
    db.add_table("device_c");
    db.fail("DROP TABLE IF EXISTS \"device_b\"", "lock timeout", "55P03");

    ReclaimReport report = reclaimer.reclaim_orphans();

    EXPECT_EQ(report.dropped, (std::vector<std::string>{"device_a", "device_c"}));
    EXPECT_EQ(report.failed, (std::vector<std::string>{"device_b"}));
    EXPECT_TRUE(db.has_table("device_b"));
}

TEST_F(OrphanReclaimerTest, NeverTouchesCoreTables) {
    registry.initialize_schema();
    db.add_device("meter1");
    db.add_table("device_meter1", true);

    ReclaimReport report = reclaimer.reclaim_orphans();
    EXPECT_TRUE(report.dropped.empty());
    EXPECT_TRUE(db.core_table("devices"));
    EXPECT_TRUE(db.core_table("users"));
    EXPECT_TRUE(db.core_table("user_device_permissions"));
    EXPECT_FALSE(db.ran("CREATE TABLE IF NOT EXISTS device_"));
}

TEST_F(OrphanReclaimerTest, ProtectedNamesAreSkippedEvenIfListed) {
    db.on("SELECT tablename FROM pg_tables", SqlResult({"tablename"}, {{std::string("devices")},
                                                                      {std::string("device_x")}}));
    ReclaimReport report = reclaimer.reclaim_orphans();

    EXPECT_EQ(report.protected_skipped, 1u);
    EXPECT_EQ(report.dropped, (std::vector<std::string>{"device_x"}));
    EXPECT_EQ(db.count("DROP TABLE"), 1u);
}

TEST_F(OrphanReclaimerTest, UsesEscapedLikePattern) {
    reclaimer.reclaim_orphans();
    auto call = db.last("FROM pg_tables");
    EXPECT_NE(call.sql.find("LIKE 'device\\_%'"), std::string::npos);
    EXPECT_NE(call.sql.find("schemaname = 'public'"), std::string::npos);
}

TEST_F(OrphanReclaimerTest, ReadsDeviceSetOnce) {
    db.add_table("device_a");
    db.add_table("device_b");
    reclaimer.reclaim_orphans();
    EXPECT_EQ(db.count("SELECT id FROM devices"), 1u);
}

TEST_F(OrphanReclaimerTest, SweepRestoresInvariant) {
    db.add_device("meter1");
    db.add_device("meter2");
    db.add_table("device_stale", true);
    tables.create_device_store("meter1");

    reclaimer.reclaim_orphans();
    registry.reconcile_stores();

    std::vector<std::string> expected = {"device_meter1", "device_meter2"};
    EXPECT_EQ(db.table_names(), expected);
}
