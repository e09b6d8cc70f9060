// =============================================================================
// paper-harvest -- resumable multi-venue paper collection
//
// Drives long collection sessions (venue x year units) against the OpenAlex
// API. Every transition is checkpointed under <state-dir>/sessions/<id>/ so
// an interrupted run can be analyzed and resumed where it stopped.
//
// Logs go to stderr, command results to stdout as JSON.
// =============================================================================

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"
#include "utils/logger.hpp"
#include "state/session_lock_table.hpp"
#include "state/state_persistence.hpp"
#include "state/checkpoint_manager.hpp"
#include "state/session_manager.hpp"
#include "state/legacy_migration.hpp"
#include "recovery/recovery_engine.hpp"
#include "orchestration/collection_orchestrator.hpp"
#include "monitoring/api_health_monitor.hpp"
#include "monitoring/rate_limit_manager.hpp"
#include "monitoring/quality_monitor.hpp"
#include "sources/openalex_client.hpp"

using json = nlohmann::json;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s COMMAND [OPTIONS]\n"
        "\n"
        "Commands:\n"
        "  create              Create a session for --venues x --years (or config venues)\n"
        "  collect             Collect a session (creates one when --session is omitted)\n"
        "  status              Session state, checkpoint summary and file integrity\n"
        "  list                List sessions\n"
        "  checkpoints         Validate every checkpoint of --session\n"
        "  analyze             Interruption analysis of --session\n"
        "  plan                Analysis plus recovery plan (plan is persisted)\n"
        "  resume              Recover --session and continue collecting\n"
        "  cleanup             Delete finished sessions older than --max-age-days\n"
        "  migrate             Convert a flat legacy state directory (--legacy-dir)\n"
        "\n"
        "Options:\n"
        "  --config PATH       JSON config file (default: built-in defaults)\n"
        "  --state-dir PATH    State directory (default: data/states)\n"
        "  --session ID        Session id\n"
        "  --venues LIST       Comma-separated venue names\n"
        "  --years LIST        Comma-separated years\n"
        "  --max-age-days N    Retention for cleanup (default: 30)\n"
        "  --include-active    cleanup also removes active sessions\n"
        "  --legacy-dir PATH   Source directory for migrate\n"
        "  --dry-run           Synthetic papers, no network access\n"
        "  --verbose           Enable debug logging\n"
        "  --help              Show this help\n",
        prog);
}

static void on_signal(int) {
    harvest::process_stop_flag().store(true);
}

static std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

static std::vector<int> parse_years(const std::string& s) {
    std::vector<int> years;
    for (const auto& item : split_list(s)) years.push_back(std::stoi(item));
    return years;
}

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

struct Engine {
    harvest::EngineConfig cfg;
    harvest::SessionLockTable locks;
    harvest::StatePersistence persistence;
    harvest::CheckpointManager checkpoints;
    harvest::SessionManager sessions;
    harvest::RecoveryEngine recovery;

    explicit Engine(const harvest::EngineConfig& c)
        : cfg(c),
          persistence(cfg, locks),
          checkpoints(persistence, cfg.checkpoints),
          sessions(persistence, checkpoints, cfg),
          recovery(persistence, checkpoints, cfg) {}
};

static harvest::CollectionResults run_collection(Engine& engine, harvest::CollectionSession& session,
                                                 const std::vector<std::string>& venues,
                                                 const std::vector<int>& years) {
    harvest::ApiHealthMonitor health;
    harvest::RateLimitManager limiter(engine.cfg.apis, &health);
    harvest::BasicQualityMonitor quality;
    harvest::OpenAlexClient openalex(engine.cfg.openalex);

    harvest::Collaborators deps;
    deps.api = &openalex;
    deps.rate_limiter = &limiter;
    deps.health_monitor = &health;
    deps.quality_monitor = &quality;

    harvest::CollectionOrchestrator orchestrator(engine.checkpoints, engine.cfg.orchestration, deps);
    return orchestrator.coordinate_session(session, venues, years);
}

static harvest::CollectionSession require_session(Engine& engine, const std::string& id) {
    if (id.empty()) throw std::invalid_argument("--session is required");
    auto loaded = engine.sessions.get_session(id);
    if (!loaded.ok()) {
        throw std::runtime_error("session " + id + " unavailable (" +
                                 harvest::load_status_str(loaded.status) + "): " + loaded.error);
    }
    return *loaded.value;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }
    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    std::string config_path;
    std::string state_dir;
    std::string session_id;
    std::string venues_arg;
    std::string years_arg;
    std::string legacy_dir;
    int max_age_days = 30;
    bool include_active = false;
    bool dry_run = false;
    bool verbose = false;

    for (int i = 2; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--state-dir") == 0 && i + 1 < argc) {
            state_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            session_id = argv[++i];
        } else if (std::strcmp(argv[i], "--venues") == 0 && i + 1 < argc) {
            venues_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--years") == 0 && i + 1 < argc) {
            years_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--max-age-days") == 0 && i + 1 < argc) {
            max_age_days = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--include-active") == 0) {
            include_active = true;
        } else if (std::strcmp(argv[i], "--legacy-dir") == 0 && i + 1 < argc) {
            legacy_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return 2;
        }
    }

    harvest::EngineConfig cfg;
    try {
        cfg = config_path.empty() ? harvest::EngineConfig::defaults()
                                  : harvest::EngineConfig::from_json(config_path);
    } catch (const std::exception& e) {
        LOG_ERR("Cannot load config %s: %s", config_path.c_str(), e.what());
        return 2;
    }
    harvest::g_log_level = verbose ? harvest::LogLevel::DEBUG : cfg.log_level;
    if (!state_dir.empty()) cfg.persistence.state_dir = state_dir;
    if (dry_run) cfg.openalex.dry_run = true;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        harvest::CurlGlobal curl;
        Engine engine(cfg);
        std::vector<std::string> venue_filter = split_list(venues_arg);
        std::vector<int> year_filter = parse_years(years_arg);

        auto make_session = [&]() {
            std::vector<harvest::VenueConfig> venues;
            if (!venue_filter.empty()) {
                if (year_filter.empty()) throw std::invalid_argument("--venues needs --years");
                for (const auto& name : venue_filter) {
                    harvest::VenueConfig vc;
                    vc.name = name;
                    vc.years = year_filter;
                    venues.push_back(vc);
                }
            } else {
                venues = cfg.venues;
            }
            json collection_config = {
                {"source", "openalex"},
                {"dry_run", cfg.openalex.dry_run},
                {"max_concurrent_venues", cfg.orchestration.max_concurrent_venues}
            };
            std::optional<std::string> id;
            if (!session_id.empty()) id = session_id;
            return engine.sessions.create_session(venues, collection_config, id);
        };

        if (command == "create") {
            auto session = make_session();
            print_json(session.to_json());
            return 0;
        }

        if (command == "collect") {
            harvest::CollectionSession session;
            if (session_id.empty() || !engine.persistence.session_exists(session_id)) {
                session = make_session();
                venue_filter.clear();
                year_filter.clear();
            } else {
                session = require_session(engine, session_id);
            }
            auto results = run_collection(engine, session, venue_filter, year_filter);
            print_json(results.to_json());
            return results.final_status == harvest::SessionStatus::FAILED ? 1 : 0;
        }

        if (command == "status") {
            auto session = require_session(engine, session_id);
            json integrity = json::array();
            for (const auto& r : engine.persistence.check_data_integrity(session_id)) {
                integrity.push_back(r.to_json());
            }
            print_json({
                {"session", session.to_json()},
                {"checkpoints", engine.checkpoints.checkpoint_summary(session_id).to_json()},
                {"integrity", integrity}
            });
            return 0;
        }

        if (command == "list") {
            json out = json::array();
            for (const auto& s : engine.sessions.list_sessions()) {
                out.push_back({
                    {"session_id", s.session_id},
                    {"status", harvest::session_status_str(s.status)},
                    {"completed", s.venues_completed.size()},
                    {"failed", s.venues_failed.size()},
                    {"targets", s.targets().size()},
                    {"papers", s.total_papers_collected},
                    {"last_activity", harvest::format_iso(s.last_activity)}
                });
            }
            print_json(out);
            return 0;
        }

        if (command == "checkpoints") {
            if (!engine.persistence.session_exists(session_id)) {
                throw std::invalid_argument("unknown session '" + session_id + "'");
            }
            json out = json::array();
            for (const auto& r : engine.persistence.validate_checkpoints(session_id)) out.push_back(r.to_json());
            print_json(out);
            return 0;
        }

        if (command == "analyze") {
            print_json(engine.recovery.analyze_interruption(session_id).to_json());
            return 0;
        }

        if (command == "plan") {
            auto analysis = engine.recovery.analyze_interruption(session_id);
            auto plan = engine.recovery.create_recovery_plan(session_id, analysis);
            auto saved = engine.persistence.save_recovery_plan(plan);
            if (!saved.ok) LOG_WRN("Recovery plan not saved: %s", saved.error.c_str());
            print_json({{"analysis", analysis.to_json()}, {"plan", plan.to_json()}});
            return 0;
        }

        if (command == "resume") {
            auto resumed = engine.recovery.resume_interrupted_session(session_id);
            json out = {{"resume", resumed.to_json()}};
            if (resumed.ready_for_continuation) {
                auto session = require_session(engine, session_id);
                out["collection"] = run_collection(engine, session, venue_filter, year_filter).to_json();
            } else {
                LOG_ERR("Session %s is not ready for continuation", session_id.c_str());
            }
            print_json(out);
            return resumed.ready_for_continuation ? 0 : 1;
        }

        if (command == "cleanup") {
            auto deleted = engine.sessions.cleanup_old_sessions(max_age_days, include_active);
            print_json({{"deleted", deleted}});
            return 0;
        }

        if (command == "migrate") {
            if (legacy_dir.empty()) throw std::invalid_argument("--legacy-dir is required");
            auto report = harvest::migrate_legacy_layout(legacy_dir, engine.persistence);
            print_json({
                {"sessions_migrated", report.sessions_migrated},
                {"sessions_skipped", report.sessions_skipped},
                {"checkpoints_migrated", report.checkpoints_migrated},
                {"checkpoints_skipped", report.checkpoints_skipped},
                {"errors", report.errors}
            });
            return report.errors.empty() ? 0 : 1;
        }

        std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
        print_usage(argv[0]);
        return 2;
    } catch (const std::invalid_argument& e) {
        LOG_ERR("%s", e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERR("%s failed: %s", command.c_str(), e.what());
        return 1;
    }
}
