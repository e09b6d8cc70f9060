#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>

#include "state/state_types.hpp"
#include "utils/logger.hpp"

namespace harvest {

// State directory layout and file handling
struct PersistenceConfig {
    std::string state_dir = "data/states";
    size_t compress_threshold_bytes = 10 * 1024;   // checkpoints above this are gzipped
};

struct CheckpointConfig {
    int64_t max_per_session = 1000;
    int64_t retention_buffer = 10;
};

struct ConfidenceConfig {
    double checkpoint_boost = 0.1;
    double no_checkpoint_penalty = 0.2;
    double damaged_checkpoint_penalty = 0.1;   // corrupted or missing
    double max_confidence = 0.95;
    double min_without_checkpoints = 0.3;
    double min_with_damage = 0.4;
};

struct RecoveryConfig {
    int64_t stale_checkpoint_seconds = 3600;
    double paper_count_tolerance = 0.10;
    double min_recovery_integrity = 0.7;
    int max_recovery_attempts = 3;
    ConfidenceConfig confidence;
};

// Soft timing budgets -- exceeding one logs a warning only
struct BudgetConfig {
    int64_t session_create_ms = 1000;
    int64_t checkpoint_save_ms = 2000;
    int64_t checkpoint_load_ms = 5000;
    int64_t analysis_ms = 120000;
    int64_t recovery_ms = 300000;
};

struct OrchestrationConfig {
    int max_concurrent_venues = 3;
    int min_concurrency = 1;
    int max_concurrency = 10;
    int max_retry_attempts = 3;
    int64_t retry_delay_ms = 1000;
    int64_t max_retry_delay_ms = 30000;
    int64_t checkpoint_interval_ms = 300000;
    int64_t health_check_interval_ms = 30000;
    int64_t resource_optimization_interval_ms = 60000;
    double slow_response_ms = 5000.0;
    double fast_response_ms = 1000.0;
    bool enable_adaptive_scaling = true;
    int64_t shutdown_grace_ms = 30000;
    // Slot wait polling backoff
    int64_t slot_poll_min_ms = 10;
    int64_t slot_poll_max_ms = 200;
};

// Per-API rolling-window limits for the rate limiter
struct ApiLimitConfig {
    std::string name;
    int requests_per_window = 100;
    int window_seconds = 300;
    double base_delay_seconds = 0.1;
    double max_delay_seconds = 60.0;
};

struct OpenAlexConfig {
    std::string base_url = "https://api.openalex.org";
    std::string mailto;          // polite pool, optional
    int per_page = 50;
    long timeout_seconds = 30;
    bool dry_run = false;
};

struct EngineConfig {
    LogLevel log_level = LogLevel::INFO;
    PersistenceConfig persistence;
    CheckpointConfig checkpoints;
    RecoveryConfig recovery;
    BudgetConfig budgets;
    OrchestrationConfig orchestration;
    std::vector<ApiLimitConfig> apis = {ApiLimitConfig{"openalex"}};
    OpenAlexConfig openalex;
    std::vector<VenueConfig> venues;

    static EngineConfig defaults() { return EngineConfig{}; }
    static EngineConfig from_json(const std::string& path);
    static EngineConfig parse(const nlohmann::json& j);

    std::vector<std::string> api_names() const {
        std::vector<std::string> names;
        for (const auto& a : apis) names.push_back(a.name);
        return names;
    }
};

inline EngineConfig EngineConfig::parse(const nlohmann::json& j) {
    EngineConfig cfg;
    cfg.log_level = parse_log_level(j.value("log_level", std::string(log_level_str(cfg.log_level))));
    cfg.persistence.state_dir = j.value("state_dir", cfg.persistence.state_dir);

    if (j.contains("persistence")) {
        const auto& p = j["persistence"];
        cfg.persistence.compress_threshold_bytes =
            p.value("compress_threshold_bytes", cfg.persistence.compress_threshold_bytes);
    }

    if (j.contains("checkpoints")) {
        const auto& c = j["checkpoints"];
        cfg.checkpoints.max_per_session = c.value("max_per_session", cfg.checkpoints.max_per_session);
        cfg.checkpoints.retention_buffer = c.value("retention_buffer", cfg.checkpoints.retention_buffer);
    }

    if (j.contains("recovery")) {
        const auto& r = j["recovery"];
        auto& rc = cfg.recovery;
        rc.stale_checkpoint_seconds = r.value("stale_checkpoint_seconds", rc.stale_checkpoint_seconds);
        rc.paper_count_tolerance = r.value("paper_count_tolerance", rc.paper_count_tolerance);
        rc.min_recovery_integrity = r.value("min_recovery_integrity", rc.min_recovery_integrity);
        rc.max_recovery_attempts = r.value("max_recovery_attempts", rc.max_recovery_attempts);
        if (r.contains("confidence")) {
            const auto& c = r["confidence"];
            auto& cc = rc.confidence;
            cc.checkpoint_boost = c.value("checkpoint_boost", cc.checkpoint_boost);
            cc.no_checkpoint_penalty = c.value("no_checkpoint_penalty", cc.no_checkpoint_penalty);
            cc.damaged_checkpoint_penalty =
                c.value("damaged_checkpoint_penalty", cc.damaged_checkpoint_penalty);
            cc.max_confidence = c.value("max_confidence", cc.max_confidence);
            cc.min_without_checkpoints = c.value("min_without_checkpoints", cc.min_without_checkpoints);
            cc.min_with_damage = c.value("min_with_damage", cc.min_with_damage);
        }
    }

    if (j.contains("budgets")) {
        const auto& b = j["budgets"];
        auto& bc = cfg.budgets;
        bc.session_create_ms = b.value("session_create_ms", bc.session_create_ms);
        bc.checkpoint_save_ms = b.value("checkpoint_save_ms", bc.checkpoint_save_ms);
        bc.checkpoint_load_ms = b.value("checkpoint_load_ms", bc.checkpoint_load_ms);
        bc.analysis_ms = b.value("analysis_ms", bc.analysis_ms);
        bc.recovery_ms = b.value("recovery_ms", bc.recovery_ms);
    }

    if (j.contains("orchestration")) {
        const auto& o = j["orchestration"];
        auto& oc = cfg.orchestration;
        oc.max_concurrent_venues = o.value("max_concurrent_venues", oc.max_concurrent_venues);
        oc.min_concurrency = o.value("min_concurrency", oc.min_concurrency);
        oc.max_concurrency = o.value("max_concurrency", oc.max_concurrency);
        oc.max_retry_attempts = o.value("max_retry_attempts", oc.max_retry_attempts);
        oc.retry_delay_ms = o.value("retry_delay_ms", oc.retry_delay_ms);
        oc.max_retry_delay_ms = o.value("max_retry_delay_ms", oc.max_retry_delay_ms);
        oc.checkpoint_interval_ms = o.value("checkpoint_interval_ms", oc.checkpoint_interval_ms);
        oc.health_check_interval_ms = o.value("health_check_interval_ms", oc.health_check_interval_ms);
        oc.resource_optimization_interval_ms =
            o.value("resource_optimization_interval_ms", oc.resource_optimization_interval_ms);
        oc.slow_response_ms = o.value("slow_response_ms", oc.slow_response_ms);
        oc.fast_response_ms = o.value("fast_response_ms", oc.fast_response_ms);
        oc.enable_adaptive_scaling = o.value("enable_adaptive_scaling", oc.enable_adaptive_scaling);
        oc.shutdown_grace_ms = o.value("shutdown_grace_ms", oc.shutdown_grace_ms);
    }

    if (j.contains("apis")) {
        cfg.apis.clear();
        for (const auto& a : j["apis"]) {
            ApiLimitConfig api;
            api.name = a.value("name", "openalex");
            api.requests_per_window = a.value("requests_per_window", api.requests_per_window);
            api.window_seconds = a.value("window_seconds", api.window_seconds);
            api.base_delay_seconds = a.value("base_delay_seconds", api.base_delay_seconds);
            api.max_delay_seconds = a.value("max_delay_seconds", api.max_delay_seconds);
            cfg.apis.push_back(api);
        }
    }

    if (j.contains("openalex")) {
        const auto& o = j["openalex"];
        cfg.openalex.base_url = o.value("base_url", cfg.openalex.base_url);
        cfg.openalex.mailto = o.value("mailto", cfg.openalex.mailto);
        cfg.openalex.per_page = o.value("per_page", cfg.openalex.per_page);
        cfg.openalex.timeout_seconds = o.value("timeout_seconds", cfg.openalex.timeout_seconds);
        cfg.openalex.dry_run = o.value("dry_run", cfg.openalex.dry_run);
    }

    if (j.contains("venues")) {
        for (const auto& v : j["venues"]) cfg.venues.push_back(VenueConfig::from_json(v));
    }

    return cfg;
}

inline EngineConfig EngineConfig::from_json(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("[config] Cannot open %s, using defaults", path.c_str());
        return defaults();
    }

    nlohmann::json j;
    f >> j;
    return parse(j);
}

} // namespace harvest
