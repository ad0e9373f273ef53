// ============================================================================
// HEALTH STATE UNIT TESTS
// ============================================================================
// Tests for the recording facade
// - Counter and measurement scenario
// - JSON dump layout
// - Flush/close lifecycle and graceful degradation
// ============================================================================

#include <gtest/gtest.h>
#include <healthstream/core/state/health_state.hpp>
#include <healthstream/core/storage/memory_backend.hpp>
#include "support/test_support.hpp"
#include <json/json.h>
#include <sstream>

using namespace HealthStream;
using namespace HealthStream::Testing;

// ============================================================================
// TEST CLASS
// ============================================================================
class HealthStateTest : public ::testing::Test {
protected:
    ManualClock clock{"20240315102310"};
    std::unique_ptr<HealthState> state;

    void SetUp() override {
        PersistenceConfig config;
        config.enabled = true;
        config.db_path = "";
        auto pm = std::make_unique<PersistenceManager>(std::make_unique<MemoryBackend>(), config,
                                                       clock.source());
        state = std::make_unique<HealthState>(std::chrono::seconds(60), std::move(pm), clock.source());
    }

    static Json::Value parse(const std::string& text) {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        std::istringstream in(text);
        EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errors)) << errors;
        return root;
    }
};

// ============================================================================
// RECORDING TESTS
// ============================================================================

TEST_F(HealthStateTest, CounterAndMeasurementScenario) {
    state->incrMetric("requests");
    state->incrMetric("requests");
    state->incrMetric("requests");
    state->addMetric("latency", 10);
    state->addMetric("latency", 20);
    state->addMetric("latency", 30);

    auto dump = parse(state->dump());
    const auto& global = dump["Metrics"]["Global"];
    EXPECT_EQ(global["requests"].asUInt64(), 3u);

    const auto& latency = global["latency"];
    ASSERT_TRUE(latency.isObject());
    EXPECT_EQ(latency["count"].asUInt64(), 3u);
    EXPECT_DOUBLE_EQ(latency["min"].asDouble(), 10.0);
    EXPECT_DOUBLE_EQ(latency["max"].asDouble(), 30.0);
    EXPECT_DOUBLE_EQ(latency["avg"].asDouble(), 20.0);
}

TEST_F(HealthStateTest, ComponentMetricsAreGrouped) {
    state->incrComponentMetric("webserver", "hits");
    state->addComponentMetric("database", "query_ms", 4.5);

    auto snap = state->snapshot();
    EXPECT_EQ(snap["webserver"]["hits"].count, 1u);
    EXPECT_DOUBLE_EQ(snap["database"]["query_ms"].avg, 4.5);
    EXPECT_EQ(snap.count(GLOBAL_COMPONENT), 0u);
}

TEST_F(HealthStateTest, EmptyNamesNeverAppearInDump) {
    state->incrMetric("");
    state->addMetric("   ", 5.0);
    state->incrComponentMetric("web", "");

    auto dump = parse(state->dump());
    EXPECT_TRUE(dump["Metrics"].isObject());
    EXPECT_EQ(dump["Metrics"].size(), 0u);
    EXPECT_EQ(state->collector().pendingValues(), 0u);
}

TEST_F(HealthStateTest, DumpShowsCurrentWindowOnly) {
    state->incrMetric("old");
    clock.advance(std::chrono::seconds(60));
    state->incrMetric("new");

    auto dump = parse(state->dump());
    EXPECT_FALSE(dump["Metrics"]["Global"].isMember("old"));
    EXPECT_EQ(dump["Metrics"]["Global"]["new"].asUInt64(), 1u);
}

// ============================================================================
// IDENTITY TESTS
// ============================================================================

TEST_F(HealthStateTest, InfoSetsIdentityAndStartTime) {
    state->info("node-7");
    auto dump = parse(state->dump());
    EXPECT_EQ(dump["Identity"].asString(), "node-7");
    EXPECT_EQ(dump["Started"].asInt64(),
              std::chrono::duration_cast<std::chrono::seconds>(clock.now().time_since_epoch()).count());
}

TEST_F(HealthStateTest, EmptyIdentityUsesDefault) {
    state->info("");
    EXPECT_EQ(state->identity(), "identity unset");
    EXPECT_EQ(parse(state->dump())["Identity"].asString(), "identity unset");
}

// ============================================================================
// LIFECYCLE TESTS
// ============================================================================

TEST_F(HealthStateTest, ForceFlushReachesBackend) {
    state->incrComponentMetric("web", "hits");
    state->addComponentMetric("web", "latency", 7.0);
    state->forceFlush();

    auto rows = state->persistence().readMetrics("web", rangeStart(), rangeEnd());
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].time_window_key, "20240315102300");
    EXPECT_TRUE(state->snapshot().empty());
}

TEST_F(HealthStateTest, CloseIsIdempotent) {
    state->incrMetric("requests");
    state->close();
    EXPECT_TRUE(state->isClosed());
    EXPECT_TRUE(state->persistence().isClosed());
    EXPECT_NO_THROW(state->close());
}

TEST(HealthStateStandalone, NullPersistenceRunsDisabled) {
    HealthState state(std::chrono::seconds(60), nullptr);
    state.incrMetric("requests");
    EXPECT_FALSE(state.persistence().isEnabled());
    EXPECT_NO_THROW(state.forceFlush());
    EXPECT_NO_THROW(state.dump());
}

TEST(HealthStateStandalone, UnwritableDatabaseStillCollects) {
    AppConfig::AppConfiguration config;
    config.identity = "degraded";
    config.persistence.enabled = true;
    config.persistence.db_path = "/nonexistent_healthstream_dir/sub/health.db";

    HealthState state(config);
    state.incrMetric("requests");
    state.addMetric("latency", 12.0);

    EXPECT_FALSE(state.persistence().isEnabled());
    EXPECT_NE(state.dump().find("\"requests\""), std::string::npos);
    try {
        state.persistence().readMetrics("", rangeStart(), rangeEnd());
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), StorageErrc::NOT_ENABLED);
    }
}

TEST(HealthStateStandalone, PersistenceConfigTakesWindowAndBackup) {
    AppConfig::AppConfiguration config;
    config.sample_rate_seconds = 300;
    config.backup.enabled = true;
    config.backup.retention_days = 3;

    auto pc = HealthState::persistenceConfigFrom(config);
    EXPECT_EQ(pc.window, std::chrono::seconds(300));
    EXPECT_TRUE(pc.backup.enabled);
    EXPECT_EQ(pc.backup.retention_days, 3);
}
