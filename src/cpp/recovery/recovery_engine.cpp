#include "recovery_engine.hpp"
#include "../utils/id_util.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <stdexcept>

namespace harvest {

static VenueSet set_union(const VenueSet& a, const VenueSet& b) {
    VenueSet out = a;
    out.insert(b.begin(), b.end());
    return out;
}

static VenueSet set_minus(const VenueSet& a, const VenueSet& b) {
    VenueSet out;
    for (const auto& k : a) {
        if (!b.count(k)) out.insert(k);
    }
    return out;
}

static VenueSet set_intersect(const VenueSet& a, const VenueSet& b) {
    VenueSet out;
    for (const auto& k : a) {
        if (b.count(k)) out.insert(k);
    }
    return out;
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool contains_any(const std::string& text, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (text.find(w) != std::string::npos) return true;
    }
    return false;
}

RecoveryEngine::RecoveryEngine(StatePersistence& persistence, CheckpointManager& checkpoints,
                               const EngineConfig& config)
    : persistence_(persistence), checkpoints_(checkpoints),
      config_(config.recovery), budgets_(config.budgets) {}

// A damaged session_status.json still leaves the targets in session_config.json
CollectionSession RecoveryEngine::load_or_reconstruct(const std::string& session_id) {
    if (!persistence_.session_exists(session_id)) {
        throw std::invalid_argument("unknown session " + session_id);
    }

    auto loaded = persistence_.load_session(session_id);
    if (loaded.ok()) return *loaded.value;

    LOG_WRN("[recovery] Session status of %s unusable (%s), rebuilding from config",
        session_id.c_str(), load_status_str(loaded.status));

    auto cfg = persistence_.load_session_config(session_id);
    if (!cfg.ok()) {
        throw std::runtime_error("session " + session_id + " has neither a readable status nor config");
    }

    CollectionSession s;
    s.session_id = session_id;
    s.status = SessionStatus::INTERRUPTED;
    try {
        for (const auto& v : cfg.value->at("venues")) s.venues.push_back(VenueConfig::from_json(v));
        s.collection_config = cfg.value->value("collection_config", nlohmann::json::object());
        auto created = parse_iso(cfg.value->value("created_at", ""));
        if (created) {
            s.created_at = *created;
            s.last_activity = *created;
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("session_config.json of " + session_id + " is malformed: " + e.what());
    }
    return s;
}

// =============================================================================
// Analysis
// =============================================================================

InterruptionCause RecoveryEngine::detect_interruption_cause(const std::optional<CheckpointData>& latest,
                                                            std::optional<TimePoint> last_activity,
                                                            TimePoint now) const {
    InterruptionCause cause;

    if (latest && latest->error_context) {
        const auto& err = *latest->error_context;
        std::string text = lowercase(err.error_type + " " + err.error_message);
        if (contains_any(text, {"api", "timeout", "rate"})) {
            cause.type = InterruptionType::API_FAILURE;
        } else if (contains_any(text, {"network", "connection"})) {
            cause.type = InterruptionType::NETWORK_FAILURE;
        } else if (contains_any(text, {"disk", "space"})) {
            cause.type = InterruptionType::DISK_FULL;
        } else if (contains_any(text, {"memory", "alloc"})) {
            cause.type = InterruptionType::MEMORY_ERROR;
        } else {
            cause.type = InterruptionType::SYSTEM_CRASH;
        }
        cause.confidence = 0.8;
        cause.evidence.push_back("last checkpoint recorded error " + err.error_type + ": " +
                                 err.error_message);
        if (!err.venue.empty()) {
            cause.evidence.push_back("while collecting " + err.venue + "/" + std::to_string(err.year));
        }
        return cause;
    }

    if (last_activity) {
        double gap = seconds_between(*last_activity, now);
        if (gap > 3600.0) {
            cause.type = InterruptionType::PROCESS_KILLED;
            cause.confidence = 0.6;
            cause.evidence.push_back("no activity for " + std::to_string(static_cast<long long>(gap / 60)) +
                                     " minutes");
            return cause;
        }
        if (gap > 600.0) {
            cause.type = InterruptionType::SYSTEM_CRASH;
            cause.confidence = 0.6;
            cause.evidence.push_back("activity stopped " +
                                     std::to_string(static_cast<long long>(gap / 60)) +
                                     " minutes ago without an error checkpoint");
            return cause;
        }
    }

    cause.type = InterruptionType::UNKNOWN;
    cause.confidence = 0.3;
    cause.evidence.push_back("no error context and recent activity");
    return cause;
}

InterruptionAnalysis RecoveryEngine::analyze_interruption(const std::string& session_id) {
    BudgetGuard budget("analyze_interruption " + session_id, budgets_.analysis_ms);
    auto lock = persistence_.locks().acquire(session_id);

    CollectionSession session = load_or_reconstruct(session_id);
    InterruptionAnalysis a;
    a.session_id = session_id;
    a.analyzed_at = now_utc();
    a.last_activity = session.last_activity;

    // Load everything once, oldest first
    auto ids = persistence_.list_checkpoints_for_session(session_id);
    std::vector<LoadResult<CheckpointData>> loaded;
    loaded.reserve(ids.size());
    std::optional<size_t> reference;
    for (size_t i = 0; i < ids.size(); ++i) {
        auto v = persistence_.validate_checkpoint(session_id, ids[i]);
        loaded.push_back(persistence_.load_checkpoint(session_id, ids[i]));
        if (loaded.back().status == LoadStatus::CORRUPTED) {
            a.corrupted_checkpoints.push_back(ids[i]);
        } else if (v.can_be_used_for_recovery) {
            a.valid_checkpoints.push_back(ids[i]);
            reference = i;
        }
    }
    if (!ids.empty()) a.last_checkpoint_id = ids.back();

    if (!session.last_checkpoint_id.empty() &&
        std::find(ids.begin(), ids.end(), session.last_checkpoint_id) == ids.end()) {
        a.missing_checkpoints.push_back(session.last_checkpoint_id);
    }

    // Complexity
    if (!reference) {
        a.recovery_complexity = RecoveryComplexity::PROBLEMATIC;
    } else if (*reference != ids.size() - 1 || !a.missing_checkpoints.empty()) {
        a.recovery_complexity = RecoveryComplexity::COMPLEX;
    } else {
        double age = seconds_between(loaded[*reference].value->timestamp, a.analyzed_at);
        a.recovery_complexity = age <= static_cast<double>(config_.stale_checkpoint_seconds)
                                    ? RecoveryComplexity::TRIVIAL
                                    : RecoveryComplexity::SIMPLE;
    }

    // Venue buckets
    VenueSet targets = session.targets();
    VenueSet claimed = set_union(set_union(session.venues_completed, session.venues_in_progress),
                                 session.venues_failed);
    VenueSet ref_failed;
    if (reference) {
        const auto& ref = *loaded[*reference].value;
        a.reference_checkpoint_id = ref.checkpoint_id;
        a.venues_definitely_completed = set_intersect(ref.venues_completed, targets);
        a.venues_possibly_incomplete =
            set_minus(set_intersect(ref.venues_in_progress, targets), a.venues_definitely_completed);
        ref_failed = ref.venues_failed;
        a.estimated_papers_collected = ref.papers_collected;

        // Progress claimed only by damaged checkpoints written after the reference
        for (size_t i = *reference + 1; i < loaded.size(); ++i) {
            if (!loaded[i].has_value()) continue;
            claimed = set_union(claimed, loaded[i].value->venues_completed);
            claimed = set_union(claimed, loaded[i].value->venues_in_progress);
        }
    } else {
        for (const auto& l : loaded) {
            if (!l.has_value()) continue;
            claimed = set_union(claimed, l.value->venues_completed);
            claimed = set_union(claimed, l.value->venues_in_progress);
        }
    }

    a.venues_unknown_status = set_minus(
        set_minus(set_minus(set_intersect(claimed, targets), a.venues_definitely_completed),
                  a.venues_possibly_incomplete),
        ref_failed);
    a.venues_not_started = set_minus(
        set_minus(set_minus(targets, a.venues_definitely_completed), a.venues_possibly_incomplete),
        a.venues_unknown_status);

    a.estimated_papers_lost =
        std::max<int64_t>(0, session.total_papers_collected - a.estimated_papers_collected);

    std::optional<CheckpointData> latest;
    if (!loaded.empty() && loaded.back().has_value()) latest = loaded.back().value;
    a.cause = detect_interruption_cause(latest, a.last_activity, a.analyzed_at);

    LOG_INF("[recovery] %s: %s, %zu completed / %zu incomplete / %zu unknown / %zu not started, "
            "cause %s (%.1f)",
        session_id.c_str(), recovery_complexity_str(a.recovery_complexity),
        a.venues_definitely_completed.size(), a.venues_possibly_incomplete.size(),
        a.venues_unknown_status.size(), a.venues_not_started.size(),
        interruption_type_str(a.cause.type), a.cause.confidence);
    return a;
}

// =============================================================================
// Planning
// =============================================================================

RecoveryPlan RecoveryEngine::create_recovery_plan(const std::string& session_id,
                                                  const InterruptionAnalysis& analysis) {
    const auto& cc = config_.confidence;
    RecoveryPlan plan;
    plan.session_id = session_id;
    plan.created_at = now_utc();
    plan.plan_id = "recovery_" + session_id + "_" + compact_stamp(plan.created_at) + "_" + random_hex(8);
    plan.complexity = analysis.recovery_complexity;

    switch (analysis.recovery_complexity) {
        case RecoveryComplexity::TRIVIAL:
            plan.resumption_strategy = ResumptionStrategy::FROM_LAST_CHECKPOINT;
            plan.estimated_recovery_minutes = 1.0;
            break;
        case RecoveryComplexity::SIMPLE:
            plan.resumption_strategy = ResumptionStrategy::FROM_LAST_CHECKPOINT;
            plan.estimated_recovery_minutes = 2.0;
            break;
        case RecoveryComplexity::COMPLEX:
            plan.resumption_strategy = ResumptionStrategy::PARTIAL_RESTART;
            plan.estimated_recovery_minutes = 4.0;
            break;
        case RecoveryComplexity::PROBLEMATIC:
            plan.resumption_strategy = ResumptionStrategy::FULL_RESTART;
            plan.estimated_recovery_minutes = 5.0;
            break;
    }

    // Baseline, then adjust for what the checkpoint scan found
    double confidence = analysis.reference_checkpoint_id ? 0.9 : 0.6;
    if (!analysis.valid_checkpoints.empty()) {
        confidence = std::min(confidence + cc.checkpoint_boost, cc.max_confidence);
    } else if (confidence > cc.min_without_checkpoints) {
        confidence = std::max(confidence - cc.no_checkpoint_penalty, cc.min_without_checkpoints);
    }
    if (!analysis.corrupted_checkpoints.empty() || !analysis.missing_checkpoints.empty()) {
        if (confidence > cc.min_with_damage) {
            confidence = std::max(confidence - cc.damaged_checkpoint_penalty, cc.min_with_damage);
        }
    }
    plan.confidence_score = confidence;

    if (plan.resumption_strategy == ResumptionStrategy::FULL_RESTART) {
        plan.venues_to_restart = set_union(set_union(analysis.venues_definitely_completed,
                                                     analysis.venues_possibly_incomplete),
                                           analysis.venues_unknown_status);
        plan.venues_to_resume = set_union(plan.venues_to_restart, analysis.venues_not_started);
        plan.risks.push_back("No valid checkpoint; all progress will be collected again");
    } else {
        plan.optimal_checkpoint_id = analysis.reference_checkpoint_id;
        plan.venues_to_skip = analysis.venues_definitely_completed;
        plan.venues_to_validate = analysis.venues_possibly_incomplete;
        plan.venues_to_restart = analysis.venues_unknown_status;
        plan.venues_to_resume = set_union(analysis.venues_possibly_incomplete, analysis.venues_not_started);
    }

    if (!analysis.corrupted_checkpoints.empty()) {
        plan.corrupted_data_to_discard = analysis.corrupted_checkpoints;
        plan.risks.push_back("Corrupted checkpoints detected (" +
                             std::to_string(analysis.corrupted_checkpoints.size()) + ")");
    }
    if (!analysis.missing_checkpoints.empty()) {
        plan.risks.push_back("Missing checkpoints: " + std::to_string(analysis.missing_checkpoints.size()));
    }
    if (!analysis.venues_unknown_status.empty()) {
        plan.risks.push_back(std::to_string(analysis.venues_unknown_status.size()) +
                             " venue(s) with unknown status will be restarted");
    }
    if (analysis.estimated_papers_lost > 0) {
        plan.risks.push_back("About " + std::to_string(analysis.estimated_papers_lost) +
                             " papers since the last valid checkpoint must be recollected");
    }
    plan.estimated_papers_to_recover = analysis.estimated_papers_lost;

    LOG_INF("[recovery] Plan %s: %s, confidence %.2f, %.0f min", plan.plan_id.c_str(),
        resumption_strategy_str(plan.resumption_strategy), plan.confidence_score,
        plan.estimated_recovery_minutes);
    return plan;
}

// =============================================================================
// Resume
// =============================================================================

std::vector<ValidationResult> RecoveryEngine::validate_session_state(const CollectionSession& session) const {
    std::vector<ValidationResult> out;
    VenueSet targets = session.targets();

    ValidationResult venues;
    venues.check = "venue_consistency";
    VenueSet touched = set_union(set_union(session.venues_completed, session.venues_in_progress),
                                 session.venues_failed);
    for (const auto& k : touched) {
        if (!targets.count(k)) venues.errors.push_back(k.label() + " is not a configured target");
    }
    venues.passed = venues.errors.empty();
    venues.confidence = venues.passed ? 1.0 : 0.0;
    if (!venues.passed) venues.recommendations.push_back("Discard progress for unknown venues");
    out.push_back(venues);

    ValidationResult partition;
    partition.check = "progress_partition";
    std::string why;
    partition.passed = session.partition_valid(&why);
    if (!partition.passed) partition.errors.push_back(why);
    partition.confidence = partition.passed ? 1.0 : 0.0;
    out.push_back(partition);

    ValidationResult papers;
    papers.check = "paper_count_consistency";
    int64_t counted = total_papers(session.papers_by_venue);
    int64_t recorded = session.total_papers_collected;
    double diff = std::fabs(static_cast<double>(counted - recorded));
    double allowed = config_.paper_count_tolerance * static_cast<double>(std::max<int64_t>(recorded, 0));
    papers.passed = diff <= allowed;
    if (papers.passed) {
        papers.confidence = 0.9;
    } else {
        papers.confidence = 0.3;
        papers.errors.push_back("per-venue counts sum to " + std::to_string(counted) +
                                ", session records " + std::to_string(recorded));
        papers.recommendations.push_back("Recalculate paper counts");
    }
    out.push_back(papers);
    return out;
}

ProgressSnapshot RecoveryEngine::restored_progress(const CheckpointData& cp, const RecoveryPlan& plan) const {
    ProgressSnapshot p;
    p.completed = cp.venues_completed;
    p.in_progress = cp.venues_in_progress;
    p.failed = cp.venues_failed;
    p.failure_messages = cp.failure_messages;
    p.papers_by_venue = cp.papers_by_venue;

    auto drop = [&p](const VenueKey& k) {
        p.completed.erase(k);
        p.in_progress.erase(k);
        p.failed.erase(k);
        p.failure_messages.erase(k);
        auto it = p.papers_by_venue.find(k.venue);
        if (it != p.papers_by_venue.end()) {
            it->second.erase(k.year);
            if (it->second.empty()) p.papers_by_venue.erase(it);
        }
    };

    switch (plan.resumption_strategy) {
        case ResumptionStrategy::FROM_LAST_CHECKPOINT:
        case ResumptionStrategy::PARTIAL_RESTART:
            break;
        case ResumptionStrategy::FROM_VENUE_START: {
            VenueSet restart = p.in_progress;
            for (const auto& k : restart) drop(k);
            break;
        }
        case ResumptionStrategy::FULL_RESTART:
            return ProgressSnapshot{};
    }
    for (const auto& k : plan.venues_to_restart) drop(k);
    return p;
}

SessionResumeResult RecoveryEngine::resume_session(const std::string& session_id, const RecoveryPlan& plan) {
    BudgetGuard budget("resume_session " + session_id, budgets_.recovery_ms);
    SessionResumeResult result;
    result.session_id = session_id;
    result.strategy = plan.resumption_strategy;

    {
        std::lock_guard<std::mutex> guard(guard_mutex_);
        if (active_recoveries_.count(session_id)) {
            result.errors.push_back("recovery of " + session_id + " already in progress");
            return result;
        }
        if (++attempts_[session_id] > config_.max_recovery_attempts) {
            result.errors.push_back("recovery attempt limit reached for " + session_id);
            return result;
        }
        active_recoveries_.insert(session_id);
    }
    struct Release {
        RecoveryEngine* self;
        std::string id;
        ~Release() {
            std::lock_guard<std::mutex> guard(self->guard_mutex_);
            self->active_recoveries_.erase(id);
        }
    } release{this, session_id};

    auto lock = persistence_.locks().acquire(session_id);
    CollectionSession session = load_or_reconstruct(session_id);

    ProgressSnapshot progress;
    int64_t recorded_papers = 0;
    if (plan.optimal_checkpoint_id && plan.resumption_strategy != ResumptionStrategy::FULL_RESTART) {
        auto cp = persistence_.load_checkpoint(session_id, *plan.optimal_checkpoint_id);
        if (!cp.ok()) {
            result.errors.push_back("checkpoint " + *plan.optimal_checkpoint_id + " unusable: " + cp.error);
            result.elapsed_ms = budget.elapsed_ms();
            return result;
        }
        progress = restored_progress(*cp.value, plan);
        recorded_papers = cp.value->papers_collected;
        if (progress.papers_by_venue != cp.value->papers_by_venue) {
            recorded_papers = total_papers(progress.papers_by_venue);
        }
        result.restored_checkpoint_id = plan.optimal_checkpoint_id;
    } else if (plan.resumption_strategy != ResumptionStrategy::FULL_RESTART) {
        result.warnings.push_back("plan names no checkpoint; restarting from scratch");
    }

    // Validate the restored state before anything is written
    CollectionSession candidate = session;
    candidate.venues_completed = progress.completed;
    candidate.venues_in_progress = progress.in_progress;
    candidate.venues_failed = progress.failed;
    candidate.failure_messages = progress.failure_messages;
    candidate.papers_by_venue = progress.papers_by_venue;
    candidate.total_papers_collected = recorded_papers;
    result.validation_results = validate_session_state(candidate);

    bool hard_ok = true;
    for (const auto& v : result.validation_results) {
        if (v.passed) continue;
        if (v.check == "paper_count_consistency") {
            for (const auto& e : v.errors) result.warnings.push_back(e);
        } else {
            hard_ok = false;
            for (const auto& e : v.errors) result.errors.push_back(e);
        }
    }

    if (hard_ok) {
        std::string op = std::string("resumed (") + resumption_strategy_str(plan.resumption_strategy) + ")";
        if (plan.optimal_checkpoint_id) op += " from " + *plan.optimal_checkpoint_id;

        auto st = checkpoints_.set_status(session, SessionStatus::ACTIVE);
        if (!st.ok) result.errors.push_back("cannot reactivate session: " + st.error);

        if (st.ok) {
            auto cp = checkpoints_.create_checkpoint(session, CheckpointType::BATCH_COMPLETED, progress,
                                                     {}, {}, op);
            if (!cp.ok()) result.errors.push_back("cannot record restored state: " + cp.status.error);
        }
    }

    result.venues_completed = session.venues_completed;
    result.venues_in_progress = session.venues_in_progress;
    result.venues_failed = session.venues_failed;
    result.venues_not_started = session.not_started();
    result.papers_collected = session.total_papers_collected;
    result.success = result.errors.empty();
    result.ready_for_continuation = result.success && hard_ok;
    result.elapsed_ms = budget.elapsed_ms();

    if (result.success) {
        LOG_INF("[recovery] Resumed %s: %zu completed, %zu to collect", session_id.c_str(),
            result.venues_completed.size(),
            result.venues_in_progress.size() + result.venues_not_started.size());
    } else {
        LOG_ERR("[recovery] Resume of %s failed: %s", session_id.c_str(), result.errors.front().c_str());
    }
    return result;
}

SessionResumeResult RecoveryEngine::resume_interrupted_session(const std::string& session_id) {
    auto analysis = analyze_interruption(session_id);
    auto plan = create_recovery_plan(session_id, analysis);
    auto saved = persistence_.save_recovery_plan(plan);
    if (!saved.ok) {
        LOG_WRN("[recovery] Plan %s not persisted: %s", plan.plan_id.c_str(), saved.error.c_str());
    }
    return resume_session(session_id, plan);
}

} // namespace harvest
