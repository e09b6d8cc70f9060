#include "collection_orchestrator.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <initializer_list>
#include <stdexcept>

namespace harvest {

using json = nlohmann::json;

const char* workflow_phase_str(WorkflowPhase p) {
    switch (p) {
        case WorkflowPhase::INITIALIZATION: return "initialization";
        case WorkflowPhase::API_SETUP:      return "api_setup";
        case WorkflowPhase::COLLECTION:     return "collection";
        case WorkflowPhase::PROCESSING:     return "processing";
        case WorkflowPhase::COMPLETION:     return "completion";
        case WorkflowPhase::ERROR_RECOVERY: return "error_recovery";
    }
    return "unknown";
}

std::atomic<bool>& process_stop_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

json ComponentHealth::to_json() const {
    return {
        {"name", name},
        {"healthy", healthy},
        {"detail", detail},
        {"last_check", format_iso(last_check)}
    };
}

json CollectionResults::to_json() const {
    json failures = json::array();
    for (const auto& [key, msg] : failure_messages) {
        failures.push_back({{"venue", key.venue}, {"year", key.year}, {"error", msg}});
    }
    json phase_names = json::array();
    for (auto p : phases) phase_names.push_back(workflow_phase_str(p));
    json comps = json::array();
    for (const auto& c : components) comps.push_back(c.to_json());

    return {
        {"session_id", session_id},
        {"final_status", session_status_str(final_status)},
        {"completed_venues", venue_set_to_json(completed_venues)},
        {"failed_venues", venue_set_to_json(failed_venues)},
        {"unfinished_venues", venue_set_to_json(unfinished_venues)},
        {"failures", failures},
        {"papers_by_venue", paper_counts_to_json(papers_by_venue)},
        {"total_papers", total_papers},
        {"units_submitted", units_submitted},
        {"retries", retries},
        {"final_concurrency", final_concurrency},
        {"stopped", stopped},
        {"elapsed_ms", elapsed_ms},
        {"phases", phase_names},
        {"components", comps}
    };
}

CollectionOrchestrator::CollectionOrchestrator(CheckpointManager& checkpoints,
                                               const OrchestrationConfig& config,
                                               Collaborators collaborators,
                                               std::atomic<bool>* stop_flag)
    : checkpoints_(checkpoints), config_(config), deps_(collaborators),
      stop_flag_(stop_flag ? stop_flag : &process_stop_flag()),
      concurrency_(std::clamp(config.max_concurrent_venues, config.min_concurrency,
                              std::max(config.min_concurrency, config.max_concurrency))) {
    if (!deps_.api) throw std::invalid_argument("orchestrator needs a collection API");
    if (!deps_.rate_limiter) throw std::invalid_argument("orchestrator needs a rate limiter");
    if (!deps_.health_monitor) throw std::invalid_argument("orchestrator needs a health monitor");
    if (!deps_.quality_monitor) throw std::invalid_argument("orchestrator needs a quality monitor");
}

CollectionOrchestrator::~CollectionOrchestrator() {
    aborting_ = true;
    stop_background_loops();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

// =============================================================================
// Workflow
// =============================================================================

std::vector<VenueKey> CollectionOrchestrator::plan_units(const CollectionSession& session,
                                                         const std::vector<std::string>& venues,
                                                         const std::vector<int>& years) const {
    VenueSet targets = session.targets();
    for (const auto& v : venues) {
        bool known = std::any_of(targets.begin(), targets.end(),
                                 [&v](const VenueKey& k) { return k.venue == v; });
        if (!known) throw std::invalid_argument("venue " + v + " is not a target of " + session.session_id);
    }
    for (int y : years) {
        bool known = std::any_of(targets.begin(), targets.end(),
                                 [y](const VenueKey& k) { return k.year == y; });
        if (!known) {
            throw std::invalid_argument("year " + std::to_string(y) + " is not a target of " +
                                        session.session_id);
        }
    }

    std::map<std::string, int> priority;
    for (const auto& vc : session.venues) priority[vc.name] = vc.priority;

    std::vector<VenueKey> units;
    for (const auto& k : targets) {
        if (session.venues_completed.count(k)) continue;
        if (!venues.empty() && std::find(venues.begin(), venues.end(), k.venue) == venues.end()) continue;
        if (!years.empty() && std::find(years.begin(), years.end(), k.year) == years.end()) continue;
        units.push_back(k);
    }
    std::stable_sort(units.begin(), units.end(), [&priority](const VenueKey& a, const VenueKey& b) {
        int pa = priority[a.venue], pb = priority[b.venue];
        if (pa != pb) return pa < pb;
        return a < b;
    });
    return units;
}

void CollectionOrchestrator::set_phase(WorkflowPhase p, std::vector<WorkflowPhase>& history) {
    phase_ = p;
    history.push_back(p);
    LOG_INF("[orchestrator] Phase: %s", workflow_phase_str(p));
}

void CollectionOrchestrator::init_component_health() {
    std::lock_guard<std::mutex> guard(health_mutex_);
    components_.clear();
    for (const char* name : {"collection_api", "rate_limiter", "health_monitor", "quality_monitor",
                             "checkpoint_manager", "state_manager"}) {
        ComponentHealth c;
        c.name = name;
        c.detail = "initialized";
        c.last_check = now_utc();
        components_[name] = c;
    }
}

CollectionResults CollectionOrchestrator::coordinate_session(CollectionSession& session,
                                                             const std::vector<std::string>& venues,
                                                             const std::vector<int>& years) {
    Timer timer;
    // Workers commit progress under the session lock; the id never changes
    const std::string session_id = session.session_id;
    CollectionResults results;
    results.session_id = session_id;

    aborting_ = false;
    escalated_ = false;
    retries_ = 0;
    {
        std::lock_guard<std::mutex> guard(escalation_mutex_);
        escalation_ = nullptr;
    }

    set_phase(WorkflowPhase::INITIALIZATION, results.phases);
    init_component_health();
    auto units = plan_units(session, venues, years);
    LOG_INF("[orchestrator] Session %s: %zu units, concurrency %d", session_id.c_str(),
        units.size(), concurrency_.load());

    try {
        set_phase(WorkflowPhase::API_SETUP, results.phases);
        health_check(session_id);
        if (!deps_.rate_limiter->current_usage(deps_.api->api_name())) {
            LOG_WRN("[orchestrator] Rate limiter has no limits for %s", deps_.api->api_name().c_str());
        }

        auto initial = session.checkpoint_count == 0
            ? checkpoints_.create_session_started_checkpoint(session, health_snapshot(), rate_limit_snapshot())
            : checkpoints_.create_periodic_checkpoint(session, health_snapshot(), rate_limit_snapshot());
        if (!initial.ok()) throw std::runtime_error("initial checkpoint failed: " + initial.status.error);

        if (session.status != SessionStatus::ACTIVE) {
            auto st = checkpoints_.set_status(session, SessionStatus::ACTIVE);
            if (!st.ok) throw std::runtime_error("cannot activate session: " + st.error);
        }

        start_background_loops(session, session_id);

        set_phase(WorkflowPhase::COLLECTION, results.phases);
        run_collection(session, units, results);

        std::exception_ptr escalation;
        {
            std::lock_guard<std::mutex> guard(escalation_mutex_);
            escalation = escalation_;
        }
        if (escalation) std::rethrow_exception(escalation);

        set_phase(WorkflowPhase::PROCESSING, results.phases);
        auto final_cp = checkpoints_.create_periodic_checkpoint(session, health_snapshot(), rate_limit_snapshot());
        if (!final_cp.ok()) throw std::runtime_error("final checkpoint failed: " + final_cp.status.error);

        set_phase(WorkflowPhase::COMPLETION, results.phases);
        stop_background_loops();

        CollectionSession snap = checkpoints_.snapshot(session);
        results.stopped = stop_requested();
        bool all_failed = !units.empty() && std::all_of(units.begin(), units.end(),
            [&snap](const VenueKey& k) { return snap.venues_failed.count(k) > 0; });
        VenueSet targets = snap.targets();
        bool all_done = std::all_of(targets.begin(), targets.end(), [&snap](const VenueKey& k) {
            return snap.venues_completed.count(k) > 0 || snap.venues_failed.count(k) > 0;
        });

        SessionStatus final_status = SessionStatus::COMPLETED;
        if (results.stopped) {
            final_status = SessionStatus::INTERRUPTED;
        } else if (all_failed) {
            final_status = SessionStatus::FAILED;
        } else if (!all_done) {
            final_status = SessionStatus::PAUSED;
        }
        auto st = checkpoints_.set_status(session, final_status);
        if (!st.ok) throw std::runtime_error("cannot record final status: " + st.error);
        results.final_status = final_status;
    } catch (const std::exception& e) {
        WorkflowPhase failed_in = phase_.load();
        set_phase(WorkflowPhase::ERROR_RECOVERY, results.phases);
        LOG_ERR("[orchestrator] Workflow failed in %s: %s", workflow_phase_str(failed_in), e.what());

        aborting_ = true;
        wait_for_workers();
        stop_background_loops();

        ErrorContext ctx;
        ctx.error_type = "workflow_error";
        ctx.error_message = e.what();
        ctx.api_name = deps_.api->api_name();
        ctx.operation = workflow_phase_str(failed_in);
        ctx.retry_count = retries_.load();
        ctx.timestamp = now_utc();
        auto cp = checkpoints_.create_error_checkpoint(session, ctx, false, health_snapshot(),
                                                       rate_limit_snapshot());
        if (!cp.ok()) LOG_ERR("[orchestrator] Error checkpoint failed: %s", cp.status.error.c_str());
        auto st = checkpoints_.set_status(session, SessionStatus::FAILED);
        if (!st.ok) LOG_ERR("[orchestrator] Cannot mark session failed: %s", st.error.c_str());
        throw;
    }

    CollectionSession snap = checkpoints_.snapshot(session);
    results.completed_venues = snap.venues_completed;
    results.failed_venues = snap.venues_failed;
    results.failure_messages = snap.failure_messages;
    for (const auto& k : snap.targets()) {
        if (!snap.venues_completed.count(k) && !snap.venues_failed.count(k)) results.unfinished_venues.insert(k);
    }
    results.papers_by_venue = snap.papers_by_venue;
    results.total_papers = snap.total_papers_collected;
    results.retries = retries_.load();
    results.final_concurrency = concurrency_.load();
    results.components = component_health();
    results.elapsed_ms = timer.elapsed_ms();

    LOG_INF("[orchestrator] Session %s %s: %zu completed, %zu failed, %lld papers in %lld ms",
        session_id.c_str(), session_status_str(results.final_status),
        results.completed_venues.size(), results.failed_venues.size(),
        static_cast<long long>(results.total_papers), static_cast<long long>(results.elapsed_ms));
    return results;
}

// =============================================================================
// Collection units
// =============================================================================

bool CollectionOrchestrator::halted() const {
    return stop_flag_->load() || aborting_.load() || escalated_.load();
}

void CollectionOrchestrator::sleep_unless_stopped(int64_t ms) const {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (!halted()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return;
        auto step = std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(50));
        std::this_thread::sleep_for(step);
    }
}

bool CollectionOrchestrator::wait_for_slot() {
    int64_t delay = config_.slot_poll_min_ms;
    while (active_units_.load() >= concurrency_.load()) {
        if (halted()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        delay = std::min(delay * 2, config_.slot_poll_max_ms);
    }
    return !halted();
}

void CollectionOrchestrator::record_escalation(std::exception_ptr e) {
    std::lock_guard<std::mutex> guard(escalation_mutex_);
    if (!escalation_) escalation_ = e;
    escalated_ = true;
}

void CollectionOrchestrator::run_collection(CollectionSession& session, const std::vector<VenueKey>& units,
                                            CollectionResults& results) {
    for (const auto& key : units) {
        if (!wait_for_slot()) {
            LOG_WRN("[orchestrator] Dispatch halted before %s", key.label().c_str());
            break;
        }
        auto st = checkpoints_.mark_in_progress(session, key);
        if (!st.ok) throw std::runtime_error("cannot dispatch " + key.label() + ": " + st.error);

        ++active_units_;
        ++results.units_submitted;
        workers_.emplace_back([this, &session, key] {
            try {
                if (run_unit(session, key) == UnitOutcome::ABANDONED) {
                    LOG_WRN("[orchestrator] %s left in progress", key.label().c_str());
                }
            } catch (...) {
                // Not containable by the retry policy: hand it to the main thread
                record_escalation(std::current_exception());
            }
            --active_units_;
        });
    }
    wait_for_workers();
}

void CollectionOrchestrator::wait_for_workers() {
    if (halted()) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.shutdown_grace_ms);
        while (active_units_.load() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (active_units_.load() > 0) {
            LOG_WRN("[orchestrator] %d unit(s) still running after %lld ms grace, waiting for them",
                active_units_.load(), static_cast<long long>(config_.shutdown_grace_ms));
        }
    }
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

CollectionOrchestrator::UnitOutcome CollectionOrchestrator::run_unit(CollectionSession& session,
                                                                     const VenueKey& key) {
    const std::string api = deps_.api->api_name();
    const int attempts = 1 + std::max(0, config_.max_retry_attempts);
    std::string last_error;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            if (halted()) {
                LOG_WRN("[orchestrator] %s: stop requested, abandoning retries", key.label().c_str());
                return UnitOutcome::ABANDONED;
            }
            ++retries_;
            int64_t delay = config_.retry_delay_ms;
            for (int i = 1; i < attempt && delay < config_.max_retry_delay_ms; ++i) delay *= 2;
            delay = std::min(delay, config_.max_retry_delay_ms);
            LOG_WRN("[orchestrator] %s: retry %d/%d in %lld ms (%s)", key.label().c_str(),
                attempt, attempts - 1, static_cast<long long>(delay), last_error.c_str());
            sleep_unless_stopped(delay);
        }

        double wait = deps_.rate_limiter->wait_if_needed(api);
        if (wait > 0.0) sleep_unless_stopped(static_cast<int64_t>(wait * 1000.0));

        Timer call;
        std::vector<Paper> papers;
        try {
            papers = deps_.api->collect(key.venue, key.year);
        } catch (const std::exception& e) {
            deps_.rate_limiter->record_request(api, false, static_cast<double>(call.elapsed_ms()));
            last_error = *e.what() ? e.what() : "collection failed";
            LOG_WRN("[orchestrator] %s: attempt %d failed: %s", key.label().c_str(), attempt + 1,
                last_error.c_str());
            continue;
        }
        deps_.rate_limiter->record_request(api, true, static_cast<double>(call.elapsed_ms()));

        QualityReport quality;
        try {
            quality = deps_.quality_monitor->check_collection_quality(papers, key.venue, key.year);
        } catch (const std::exception& e) {
            last_error = std::string("quality check error: ") + e.what();
            continue;
        }
        if (!quality.passed) {
            last_error = "quality check failed: " + std::to_string(quality.issues.size()) + " issue(s)";
            if (!quality.issues.empty()) last_error += ", first: " + quality.issues.front();
            LOG_WRN("[orchestrator] %s: %s", key.label().c_str(), last_error.c_str());
            continue;
        }

        // Venue configs are fixed for the session's lifetime
        for (const auto& v : session.venues) {
            if (v.name != key.venue || v.max_papers_per_year <= 0) continue;
            if (papers.size() > static_cast<size_t>(v.max_papers_per_year)) {
                LOG_INF("[orchestrator] %s: capping %zu papers at %d", key.label().c_str(), papers.size(),
                    v.max_papers_per_year);
                papers.resize(static_cast<size_t>(v.max_papers_per_year));
            }
        }

        auto cp = checkpoints_.create_venue_completed_checkpoint(session, key, static_cast<int64_t>(papers.size()),
                                                                 health_snapshot(), rate_limit_snapshot());
        if (!cp.ok()) {
            throw std::runtime_error("venue_completed checkpoint for " + key.label() + " failed: " +
                                     cp.status.error);
        }
        LOG_INF("[orchestrator] %s: %zu papers", key.label().c_str(), papers.size());
        return UnitOutcome::COMPLETED;
    }

    ErrorContext ctx;
    ctx.error_type = "collection_failure";
    ctx.error_message = last_error;
    ctx.venue = key.venue;
    ctx.year = key.year;
    ctx.api_name = api;
    ctx.retry_count = attempts - 1;
    ctx.operation = "collect";
    ctx.timestamp = now_utc();
    auto cp = checkpoints_.create_error_checkpoint(session, ctx, true, health_snapshot(), rate_limit_snapshot());
    if (!cp.ok()) {
        throw std::runtime_error("error checkpoint for " + key.label() + " failed: " + cp.status.error);
    }
    LOG_ERR("[orchestrator] %s failed after %d attempts: %s", key.label().c_str(), attempts,
        last_error.c_str());
    return UnitOutcome::FAILED;
}

// =============================================================================
// Background loops
// =============================================================================

void CollectionOrchestrator::start_background_loops(CollectionSession& session, const std::string& session_id) {
    {
        std::lock_guard<std::mutex> guard(loop_mutex_);
        loops_stop_ = false;
    }
    loops_.emplace_back([this, session_id] {
        background_loop("health", config_.health_check_interval_ms,
                        [this, &session_id] { health_check(session_id); });
    });
    loops_.emplace_back([this, &session] {
        background_loop("checkpoint", config_.checkpoint_interval_ms,
                        [this, &session] { periodic_checkpoint(session); });
    });
    loops_.emplace_back([this] {
        background_loop("resources", config_.resource_optimization_interval_ms,
                        [this] { optimize_resource_allocation(); });
    });
}

void CollectionOrchestrator::stop_background_loops() {
    {
        std::lock_guard<std::mutex> guard(loop_mutex_);
        loops_stop_ = true;
    }
    loop_cv_.notify_all();
    for (auto& t : loops_) {
        if (t.joinable()) t.join();
    }
    loops_.clear();
}

void CollectionOrchestrator::background_loop(const char* name, int64_t interval_ms,
                                             const std::function<void()>& body) {
    LOG_DBG("[orchestrator] %s loop started (%lld ms)", name, static_cast<long long>(interval_ms));
    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (true) {
        bool stop = loop_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms),
                                      [this] { return loops_stop_ || stop_flag_->load(); });
        if (stop) break;
        lock.unlock();
        try {
            body();
        } catch (const std::exception& e) {
            LOG_ERR("[orchestrator] %s loop: %s", name, e.what());
        }
        lock.lock();
    }
    LOG_DBG("[orchestrator] %s loop stopped", name);
}

void CollectionOrchestrator::request_stop() {
    stop_flag_->store(true);
    loop_cv_.notify_all();
}

ApiHealthMap CollectionOrchestrator::health_snapshot() {
    ApiHealthMap out;
    std::string api = deps_.api->api_name();
    out[api] = deps_.health_monitor->get_health_status(api);
    return out;
}

RateLimitMap CollectionOrchestrator::rate_limit_snapshot() {
    RateLimitMap out;
    std::string api = deps_.api->api_name();
    auto usage = deps_.rate_limiter->current_usage(api);
    if (usage) out[api] = *usage;
    return out;
}

void CollectionOrchestrator::health_check(const std::string& session_id) {
    auto api_health = health_snapshot();
    auto rates = rate_limit_snapshot();
    bool state_ok = checkpoints_.persistence().session_exists(session_id);
    auto now = now_utc();

    std::lock_guard<std::mutex> guard(health_mutex_);
    latest_api_health_ = api_health;
    for (const auto& [name, h] : api_health) {
        auto& c = components_["collection_api"];
        c.healthy = h.status != ApiStatus::OFFLINE;
        char detail[96];
        std::snprintf(detail, sizeof(detail), "%s %s, success %.0f%%, %.0f ms avg", name.c_str(),
                      api_status_str(h.status), h.success_rate * 100.0, h.avg_response_ms);
        c.detail = detail;
        c.last_check = now;
        if (h.status == ApiStatus::CRITICAL || h.status == ApiStatus::OFFLINE) {
            LOG_WRN("[orchestrator] API %s is %s (%d consecutive errors)", name.c_str(),
                api_status_str(h.status), h.consecutive_errors);
        }
    }

    auto& limiter = components_["rate_limiter"];
    limiter.healthy = !rates.empty();
    limiter.detail = rates.empty() ? "no limits configured"
                                   : std::to_string(rates.begin()->second.requests_in_window) + "/" +
                                         std::to_string(rates.begin()->second.window_capacity) + " in window";
    limiter.last_check = now;

    components_["health_monitor"].last_check = now;
    components_["quality_monitor"].last_check = now;

    auto& state = components_["state_manager"];
    state.healthy = state_ok;
    state.detail = state_ok ? "session directory present" : "session directory missing";
    state.last_check = now;
}

void CollectionOrchestrator::periodic_checkpoint(CollectionSession& session) {
    auto cp = checkpoints_.create_periodic_checkpoint(session, health_snapshot(), rate_limit_snapshot());
    std::lock_guard<std::mutex> guard(health_mutex_);
    auto& c = components_["checkpoint_manager"];
    c.healthy = cp.ok();
    c.last_check = now_utc();
    if (cp.ok()) {
        c.detail = "last periodic checkpoint " + cp.checkpoint->checkpoint_id;
    } else {
        c.detail = cp.status.error;
        LOG_ERR("[orchestrator] Periodic checkpoint failed: %s", cp.status.error.c_str());
    }
}

int CollectionOrchestrator::optimize_resource_allocation() {
    int current = concurrency_.load();
    if (!config_.enable_adaptive_scaling) return current;

    double sum = 0.0;
    int n = 0;
    for (const auto& [name, h] : health_snapshot()) {
        if (h.avg_response_ms > 0.0) {
            sum += h.avg_response_ms;
            ++n;
        }
    }
    if (n == 0) return current;

    double avg = sum / n;
    int next = current;
    if (avg > config_.slow_response_ms) {
        next = std::max(config_.min_concurrency, current - 1);
    } else if (avg < config_.fast_response_ms) {
        next = std::min(config_.max_concurrency, current + 1);
    }
    if (next != current) {
        concurrency_ = next;
        LOG_INF("[orchestrator] Concurrency %d -> %d (avg response %.0f ms)", current, next, avg);
    }
    return next;
}

std::vector<ComponentHealth> CollectionOrchestrator::component_health() {
    std::lock_guard<std::mutex> guard(health_mutex_);
    std::vector<ComponentHealth> out;
    for (const auto& entry : components_) out.push_back(entry.second);
    return out;
}

ApiHealthMap CollectionOrchestrator::latest_api_health() {
    std::lock_guard<std::mutex> guard(health_mutex_);
    return latest_api_health_;
}

} // namespace harvest
