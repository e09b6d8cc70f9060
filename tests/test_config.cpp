#include <gtest/gtest.h>

#include <fstream>

#include "config.hpp"
#include "test_support.hpp"

using namespace harvest;
using json = nlohmann::json;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    auto cfg = EngineConfig::defaults();
    EXPECT_EQ(cfg.persistence.state_dir, "data/states");
    EXPECT_EQ(cfg.checkpoints.max_per_session, 1000);
    EXPECT_EQ(cfg.checkpoints.retention_buffer, 10);
    EXPECT_EQ(cfg.recovery.stale_checkpoint_seconds, 3600);
    EXPECT_DOUBLE_EQ(cfg.recovery.confidence.max_confidence, 0.95);
    EXPECT_EQ(cfg.orchestration.max_concurrent_venues, 3);
    EXPECT_EQ(cfg.orchestration.max_retry_attempts, 3);
    ASSERT_EQ(cfg.apis.size(), 1u);
    EXPECT_EQ(cfg.apis[0].name, "openalex");
}

TEST(ConfigTest, ParseOverridesNestedSections) {
    auto j = json::parse(R"({
        "log_level": "debug",
        "state_dir": "/var/lib/harvest",
        "checkpoints": {"max_per_session": 50, "retention_buffer": 5},
        "recovery": {"stale_checkpoint_seconds": 60, "confidence": {"checkpoint_boost": 0.05}},
        "orchestration": {"max_concurrent_venues": 6, "retry_delay_ms": 250},
        "apis": [{"name": "openalex", "requests_per_window": 10, "window_seconds": 1},
                 {"name": "crossref"}],
        "openalex": {"mailto": "ops@example.org", "dry_run": true},
        "venues": [{"name": "ICML", "years": [2023, 2024], "priority": 2}]
    })");
    auto cfg = EngineConfig::parse(j);

    EXPECT_EQ(cfg.log_level, LogLevel::DEBUG);
    EXPECT_EQ(cfg.persistence.state_dir, "/var/lib/harvest");
    EXPECT_EQ(cfg.checkpoints.max_per_session, 50);
    EXPECT_EQ(cfg.checkpoints.retention_buffer, 5);
    EXPECT_EQ(cfg.recovery.stale_checkpoint_seconds, 60);
    EXPECT_DOUBLE_EQ(cfg.recovery.confidence.checkpoint_boost, 0.05);
    EXPECT_DOUBLE_EQ(cfg.recovery.confidence.no_checkpoint_penalty, 0.2);
    EXPECT_EQ(cfg.orchestration.max_concurrent_venues, 6);
    EXPECT_EQ(cfg.orchestration.retry_delay_ms, 250);
    EXPECT_EQ(cfg.orchestration.max_retry_attempts, 3);

    ASSERT_EQ(cfg.apis.size(), 2u);
    EXPECT_EQ(cfg.apis[0].requests_per_window, 10);
    EXPECT_EQ(cfg.apis[1].name, "crossref");
    EXPECT_EQ(cfg.apis[1].requests_per_window, 100);
    EXPECT_EQ(cfg.api_names(), (std::vector<std::string>{"openalex", "crossref"}));

    EXPECT_EQ(cfg.openalex.mailto, "ops@example.org");
    EXPECT_TRUE(cfg.openalex.dry_run);
    ASSERT_EQ(cfg.venues.size(), 1u);
    EXPECT_EQ(cfg.venues[0].years, (std::vector<int>{2023, 2024}));
    EXPECT_EQ(cfg.venues[0].priority, 2);
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    g_log_level = LogLevel::ERROR;
    TempDir dir;
    auto cfg = EngineConfig::from_json((dir.path() / "absent.json").string());
    EXPECT_EQ(cfg.orchestration.max_concurrent_venues, 3);
}

TEST(ConfigTest, MalformedFileThrows) {
    TempDir dir;
    auto path = dir.path() / "bad.json";
    std::ofstream(path) << "{ \"state_dir\": ";
    EXPECT_THROW(EngineConfig::from_json(path.string()), json::parse_error);
}

TEST(ConfigTest, LogLevelNames) {
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("chatty"), LogLevel::INFO);
}
