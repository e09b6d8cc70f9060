#include "checkpoint_manager.hpp"
#include "../utils/logger.hpp"

#include <algorithm>

namespace harvest {

using json = nlohmann::json;

json CheckpointSummary::to_json() const {
    return {
        {"session_id", session_id},
        {"total", total},
        {"valid", valid},
        {"corrupted", corrupted},
        {"usable_for_recovery", usable_for_recovery},
        {"by_type", by_type},
        {"average_integrity", average_integrity},
        {"has_recovery_options", has_recovery_options},
        {"latest_checkpoint_id", latest_checkpoint_id ? json(*latest_checkpoint_id) : json(nullptr)}
    };
}

namespace {

// Copies the mutable progress fields. Identity and targets are never
// reassigned so unlocked readers of session_id stay valid.
void commit_progress(CollectionSession& dst, const CollectionSession& src) {
    dst.status = src.status;
    dst.venues_completed = src.venues_completed;
    dst.venues_in_progress = src.venues_in_progress;
    dst.venues_failed = src.venues_failed;
    dst.failure_messages = src.failure_messages;
    dst.papers_by_venue = src.papers_by_venue;
    dst.total_papers_collected = src.total_papers_collected;
    dst.last_successful_operation = src.last_successful_operation;
    dst.last_checkpoint_id = src.last_checkpoint_id;
    dst.checkpoint_count = src.checkpoint_count;
    dst.error_count = src.error_count;
    dst.last_activity = src.last_activity;
}

} // namespace

CheckpointManager::CheckpointManager(StatePersistence& persistence, const CheckpointConfig& config)
    : persistence_(persistence), config_(config) {}

TimePoint CheckpointManager::next_timestamp(const std::string& session_id) {
    std::lock_guard<std::mutex> guard(ts_mutex_);
    auto it = last_timestamp_.find(session_id);
    if (it == last_timestamp_.end()) {
        // First checkpoint from this process: continue after what is on disk
        TimePoint last{};
        auto ids = persistence_.list_checkpoints_for_session(session_id);
        if (!ids.empty()) {
            auto latest = persistence_.load_checkpoint(session_id, ids.back());
            if (latest.has_value()) last = latest.value->timestamp;
        }
        it = last_timestamp_.emplace(session_id, last).first;
    }

    TimePoint ts = now_utc();
    if (ts <= it->second) ts = it->second + std::chrono::microseconds(1);
    it->second = ts;
    return ts;
}

ProgressSnapshot CheckpointManager::progress_of(const CollectionSession& session) {
    ProgressSnapshot p;
    p.completed = session.venues_completed;
    p.in_progress = session.venues_in_progress;
    p.failed = session.venues_failed;
    p.failure_messages = session.failure_messages;
    p.papers_by_venue = session.papers_by_venue;
    return p;
}

CollectionSession CheckpointManager::snapshot(const CollectionSession& session) {
    auto lock = persistence_.locks().acquire(session.session_id);
    return session;
}

CheckpointOutcome CheckpointManager::create_checkpoint(CollectionSession& session,
                                                       CheckpointType type,
                                                       const ProgressSnapshot& progress,
                                                       const ApiHealthMap& api_health,
                                                       const RateLimitMap& rate_limits,
                                                       const std::string& last_operation,
                                                       const std::optional<ErrorContext>& error) {
    auto lock = persistence_.locks().acquire(session.session_id);
    CheckpointOutcome out;

    // Stage the transition on a copy; `session` changes only on success
    CollectionSession candidate = session;
    candidate.venues_completed = progress.completed;
    candidate.venues_in_progress = progress.in_progress;
    candidate.venues_failed = progress.failed;
    candidate.failure_messages = progress.failure_messages;
    candidate.papers_by_venue = progress.papers_by_venue;
    candidate.total_papers_collected = total_papers(progress.papers_by_venue);

    std::string why;
    if (!candidate.partition_valid(&why)) {
        LOG_ERR("[checkpoint] Rejected %s checkpoint for %s: %s",
            checkpoint_type_str(type), session.session_id.c_str(), why.c_str());
        out.status = OpStatus::failure("invalid progress: " + why);
        return out;
    }

    CheckpointData cp;
    cp.session_id = session.session_id;
    cp.checkpoint_type = type;
    cp.timestamp = next_timestamp(session.session_id);
    cp.checkpoint_id = make_checkpoint_id(session.session_id, type, cp.timestamp);
    cp.venues_completed = candidate.venues_completed;
    cp.venues_in_progress = candidate.venues_in_progress;
    cp.venues_failed = candidate.venues_failed;
    cp.venues_not_started = candidate.not_started();
    cp.failure_messages = candidate.failure_messages;
    cp.papers_by_venue = candidate.papers_by_venue;
    cp.papers_collected = candidate.total_papers_collected;
    cp.last_successful_operation = last_operation;
    cp.api_health = api_health;
    cp.rate_limits = rate_limits;
    cp.error_context = error;
    cp.seal();

    auto saved = persistence_.save_checkpoint(cp);
    if (!saved.ok) {
        out.status = saved;
        return out;
    }

    candidate.last_checkpoint_id = cp.checkpoint_id;
    candidate.checkpoint_count += 1;
    if (error) {
        candidate.error_count += 1;
    } else {
        candidate.last_successful_operation = last_operation;
    }

    auto status = persistence_.save_session(candidate);
    if (!status.ok) {
        LOG_ERR("[checkpoint] Checkpoint %s written but session status was not: %s",
            cp.checkpoint_id.c_str(), status.error.c_str());
        out.status = status;
        return out;
    }

    commit_progress(session, candidate);
    LOG_DBG("[checkpoint] %s %s (%lld papers)", checkpoint_type_str(type),
        cp.checkpoint_id.c_str(), static_cast<long long>(cp.papers_collected));

    if (session.checkpoint_count > config_.max_per_session) {
        prune_checkpoints(session.session_id, config_.retention_buffer);
    }

    out.status = OpStatus::success();
    out.checkpoint = std::move(cp);
    return out;
}

CheckpointOutcome CheckpointManager::create_session_started_checkpoint(CollectionSession& session,
                                                                       const ApiHealthMap& api_health,
                                                                       const RateLimitMap& rate_limits) {
    return create_checkpoint(session, CheckpointType::SESSION_STARTED, ProgressSnapshot{},
                             api_health, rate_limits, "session started");
}

CheckpointOutcome CheckpointManager::create_venue_completed_checkpoint(CollectionSession& session,
                                                                       const VenueKey& key,
                                                                       int64_t papers,
                                                                       const ApiHealthMap& api_health,
                                                                       const RateLimitMap& rate_limits) {
    auto lock = persistence_.locks().acquire(session.session_id);
    ProgressSnapshot p = progress_of(session);
    p.in_progress.erase(key);
    p.failed.erase(key);
    p.failure_messages.erase(key);
    p.completed.insert(key);
    p.papers_by_venue[key.venue][key.year] = papers;
    return create_checkpoint(session, CheckpointType::VENUE_COMPLETED, p, api_health, rate_limits,
                             "collected " + key.label() + " (" + std::to_string(papers) + " papers)");
}

CheckpointOutcome CheckpointManager::create_error_checkpoint(CollectionSession& session,
                                                             const ErrorContext& error,
                                                             bool mark_failed,
                                                             const ApiHealthMap& api_health,
                                                             const RateLimitMap& rate_limits) {
    auto lock = persistence_.locks().acquire(session.session_id);
    ProgressSnapshot p = progress_of(session);
    VenueKey key{error.venue, error.year};
    if (mark_failed && !error.venue.empty() && session.targets().count(key)) {
        p.in_progress.erase(key);
        p.completed.erase(key);
        p.failed.insert(key);
        p.failure_messages[key] = error.error_message;
    }
    return create_checkpoint(session, CheckpointType::ERROR_OCCURRED, p, api_health, rate_limits,
                             session.last_successful_operation, error);
}

CheckpointOutcome CheckpointManager::create_periodic_checkpoint(CollectionSession& session,
                                                                const ApiHealthMap& api_health,
                                                                const RateLimitMap& rate_limits) {
    auto lock = persistence_.locks().acquire(session.session_id);
    return create_checkpoint(session, CheckpointType::BATCH_COMPLETED, progress_of(session),
                             api_health, rate_limits, "periodic checkpoint");
}

OpStatus CheckpointManager::mark_in_progress(CollectionSession& session, const VenueKey& key) {
    auto lock = persistence_.locks().acquire(session.session_id);
    if (!session.targets().count(key)) {
        return OpStatus::failure(key.label() + " is not a target of " + session.session_id);
    }
    CollectionSession candidate = session;
    candidate.venues_completed.erase(key);
    candidate.venues_failed.erase(key);
    candidate.failure_messages.erase(key);
    candidate.venues_in_progress.insert(key);

    auto saved = persistence_.save_session(candidate);
    if (!saved.ok) return saved;
    commit_progress(session, candidate);
    return OpStatus::success();
}

OpStatus CheckpointManager::set_status(CollectionSession& session, SessionStatus status) {
    auto lock = persistence_.locks().acquire(session.session_id);
    CollectionSession candidate = session;
    candidate.status = status;
    auto saved = persistence_.save_session(candidate);
    if (!saved.ok) return saved;
    commit_progress(session, candidate);
    LOG_INF("[checkpoint] Session %s -> %s", session.session_id.c_str(), session_status_str(status));
    return OpStatus::success();
}

LoadResult<CheckpointData> CheckpointManager::load_latest_checkpoint(const std::string& session_id) {
    auto ids = persistence_.list_checkpoints_for_session(session_id);
    if (ids.empty()) {
        LoadResult<CheckpointData> none;
        none.status = LoadStatus::NOT_FOUND;
        none.error = "no checkpoints for " + session_id;
        return none;
    }
    return persistence_.load_checkpoint(session_id, ids.back());
}

std::optional<CheckpointData> CheckpointManager::find_best_recovery_checkpoint(const std::string& session_id) {
    auto lock = persistence_.locks().acquire(session_id);
    auto results = persistence_.validate_checkpoints(session_id);

    const CheckpointValidationResult* best = nullptr;
    for (const auto& r : results) {
        if (!r.can_be_used_for_recovery) continue;
        // Results are oldest first, so >= lets newer ones win ties
        if (!best || r.integrity_score >= best->integrity_score) best = &r;
    }
    if (!best) {
        LOG_WRN("[checkpoint] No usable recovery checkpoint for %s", session_id.c_str());
        return std::nullopt;
    }

    auto loaded = persistence_.load_checkpoint(session_id, best->checkpoint_id);
    if (!loaded.ok() || !loaded.value->validate_integrity()) {
        LOG_WRN("[checkpoint] Recovery candidate %s failed re-validation: %s",
            best->checkpoint_id.c_str(), loaded.error.c_str());
        return std::nullopt;
    }
    LOG_INF("[checkpoint] Best recovery checkpoint for %s: %s (integrity %.2f)",
        session_id.c_str(), best->checkpoint_id.c_str(), best->integrity_score);
    return loaded.value;
}

CheckpointSummary CheckpointManager::checkpoint_summary(const std::string& session_id) {
    auto lock = persistence_.locks().acquire(session_id);
    CheckpointSummary s;
    s.session_id = session_id;

    auto results = persistence_.validate_checkpoints(session_id);
    double score_sum = 0.0;
    for (const auto& r : results) {
        ++s.total;
        score_sum += r.integrity_score;
        if (r.is_valid) ++s.valid;
        if (r.can_be_used_for_recovery) ++s.usable_for_recovery;

        auto loaded = persistence_.load_checkpoint(session_id, r.checkpoint_id);
        if (loaded.status == LoadStatus::CORRUPTED) ++s.corrupted;
        if (loaded.has_value()) ++s.by_type[checkpoint_type_str(loaded.value->checkpoint_type)];
    }
    if (s.total > 0) {
        s.average_integrity = score_sum / s.total;
        s.latest_checkpoint_id = results.back().checkpoint_id;
    }
    s.has_recovery_options = s.usable_for_recovery > 0;
    return s;
}

int CheckpointManager::prune_checkpoints(const std::string& session_id, int64_t keep) {
    auto lock = persistence_.locks().acquire(session_id);
    auto ids = persistence_.list_checkpoints_for_session(session_id);
    if (keep < 0) keep = 0;
    if (static_cast<int64_t>(ids.size()) <= keep) return 0;

    // Files that no longer parse go first and never count toward `keep`
    std::vector<std::string> doomed;
    std::vector<std::string> readable;
    for (const auto& id : ids) {
        if (persistence_.load_checkpoint(session_id, id).has_value()) {
            readable.push_back(id);
        } else {
            doomed.push_back(id);
        }
    }
    if (static_cast<int64_t>(readable.size()) > keep) {
        doomed.insert(doomed.end(), readable.begin(), readable.end() - keep);
    }

    int removed = 0;
    for (const auto& id : doomed) {
        auto st = persistence_.delete_checkpoint(session_id, id);
        if (st.ok) {
            ++removed;
        } else {
            LOG_WRN("[checkpoint] Prune of %s failed: %s", id.c_str(), st.error.c_str());
        }
    }
    LOG_INF("[checkpoint] Pruned %d checkpoints of %s (kept %lld)",
        removed, session_id.c_str(), static_cast<long long>(keep));
    return removed;
}

} // namespace harvest
