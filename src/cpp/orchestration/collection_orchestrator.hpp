#pragma once
// =============================================================================
// CollectionOrchestrator -- bounded-parallel collection of (venue, year) units
//
// Workflow: INITIALIZATION -> API_SETUP -> COLLECTION -> PROCESSING -> COMPLETION
//           any phase -> ERROR_RECOVERY on an exception the unit retry does
//           not contain (error_occurred checkpoint, status FAILED, rethrow)
//
// Threads:
//   - one std::thread per in-flight unit, at most concurrency() at once
//   - three background loops: health check, periodic checkpoint,
//     resource optimization (adaptive concurrency)
// All of them stop on the shared stop flag and are always joined.
//
// Workers never touch the session: every transition goes through the
// CheckpointManager, which applies it under the session lock.
// =============================================================================

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "../state/checkpoint_manager.hpp"
#include "../state/state_types.hpp"
#include "collaborators.hpp"

namespace harvest {

enum class WorkflowPhase {
    INITIALIZATION,
    API_SETUP,
    COLLECTION,
    PROCESSING,
    COMPLETION,
    ERROR_RECOVERY
};

const char* workflow_phase_str(WorkflowPhase p);

// Process-wide stop flag; the CLI's signal handler sets it
std::atomic<bool>& process_stop_flag();

struct Collaborators {
    CollectionApi* api = nullptr;
    RateLimiter* rate_limiter = nullptr;
    HealthMonitor* health_monitor = nullptr;
    QualityMonitor* quality_monitor = nullptr;
};

struct ComponentHealth {
    std::string name;
    bool healthy = true;
    std::string detail;
    TimePoint last_check{};

    nlohmann::json to_json() const;
};

struct CollectionResults {
    std::string session_id;
    SessionStatus final_status = SessionStatus::ACTIVE;
    VenueSet completed_venues;
    VenueSet failed_venues;
    VenueSet unfinished_venues;   // still in progress or never dispatched
    std::map<VenueKey, std::string> failure_messages;
    PaperCounts papers_by_venue;
    int64_t total_papers = 0;

    int units_submitted = 0;
    int retries = 0;
    int final_concurrency = 0;
    bool stopped = false;
    int64_t elapsed_ms = 0;
    std::vector<WorkflowPhase> phases;
    std::vector<ComponentHealth> components;

    nlohmann::json to_json() const;
};

class CollectionOrchestrator {
public:
    // Throws std::invalid_argument when a collaborator is missing.
    // `stop_flag` defaults to process_stop_flag().
    CollectionOrchestrator(CheckpointManager& checkpoints,
                           const OrchestrationConfig& config,
                           Collaborators collaborators,
                           std::atomic<bool>* stop_flag = nullptr);
    ~CollectionOrchestrator();

    CollectionOrchestrator(const CollectionOrchestrator&) = delete;
    CollectionOrchestrator& operator=(const CollectionOrchestrator&) = delete;

    // Collects every target of `session` not yet completed, restricted to
    // `venues` / `years` when those are non-empty. Venue failures are
    // recorded, not thrown. Throws std::invalid_argument when a filter names
    // nothing in the session's targets.
    CollectionResults coordinate_session(CollectionSession& session,
                                         const std::vector<std::string>& venues = {},
                                         const std::vector<int>& years = {});

    void request_stop();
    bool stop_requested() const { return stop_flag_->load(); }

    // One adaptive-concurrency step; returns the new limit
    int optimize_resource_allocation();

    int concurrency() const { return concurrency_.load(); }
    WorkflowPhase phase() const { return phase_.load(); }
    std::vector<ComponentHealth> component_health();
    ApiHealthMap latest_api_health();

private:
    enum class UnitOutcome { COMPLETED, FAILED, ABANDONED };

    std::vector<VenueKey> plan_units(const CollectionSession& session,
                                     const std::vector<std::string>& venues,
                                     const std::vector<int>& years) const;

    void set_phase(WorkflowPhase p, std::vector<WorkflowPhase>& history);
    void init_component_health();
    void run_collection(CollectionSession& session, const std::vector<VenueKey>& units,
                        CollectionResults& results);
    UnitOutcome run_unit(CollectionSession& session, const VenueKey& key);
    bool wait_for_slot();
    void wait_for_workers();

    void start_background_loops(CollectionSession& session, const std::string& session_id);
    void stop_background_loops();
    void background_loop(const char* name, int64_t interval_ms, const std::function<void()>& body);
    void health_check(const std::string& session_id);
    void periodic_checkpoint(CollectionSession& session);

    ApiHealthMap health_snapshot();
    RateLimitMap rate_limit_snapshot();
    bool halted() const;
    void sleep_unless_stopped(int64_t ms) const;
    void record_escalation(std::exception_ptr e);

    CheckpointManager& checkpoints_;
    OrchestrationConfig config_;
    Collaborators deps_;
    std::atomic<bool>* stop_flag_;

    std::atomic<int> concurrency_;
    std::atomic<int> active_units_{0};
    std::atomic<int> retries_{0};
    std::atomic<WorkflowPhase> phase_{WorkflowPhase::INITIALIZATION};

    std::vector<std::thread> workers_;
    std::atomic<bool> aborting_{false};
    std::atomic<bool> escalated_{false};
    std::mutex escalation_mutex_;
    std::exception_ptr escalation_;

    std::vector<std::thread> loops_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool loops_stop_ = false;

    std::mutex health_mutex_;
    std::map<std::string, ComponentHealth> components_;
    ApiHealthMap latest_api_health_;
};

} // namespace harvest
