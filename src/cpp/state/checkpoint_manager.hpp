#pragma once
// =============================================================================
// CheckpointManager -- the only writer of CollectionSession progress
//
// Every transition (venue started, completed, failed, periodic snapshot) is
// applied under the session's lock: the checkpoint is persisted first, then
// session_status.json, and only then is the caller's in-memory session
// updated. A failed write leaves the session object untouched.
//
// Checkpoint timestamps are strictly increasing per session.
// =============================================================================

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "state_persistence.hpp"
#include "state_types.hpp"

namespace harvest {

struct CheckpointOutcome {
    OpStatus status;
    std::optional<CheckpointData> checkpoint;

    bool ok() const { return status.ok && checkpoint.has_value(); }
};

struct CheckpointSummary {
    std::string session_id;
    int total = 0;
    int valid = 0;
    int corrupted = 0;
    int usable_for_recovery = 0;
    std::map<std::string, int> by_type;
    double average_integrity = 0.0;
    bool has_recovery_options = false;
    std::optional<std::string> latest_checkpoint_id;

    nlohmann::json to_json() const;
};

class CheckpointManager {
public:
    CheckpointManager(StatePersistence& persistence, const CheckpointConfig& config);

    // Builds, seals and persists a checkpoint for `progress`, then commits
    // the progress to `session`. Rejects progress that breaks the partition
    // of the session's targets.
    CheckpointOutcome create_checkpoint(CollectionSession& session,
                                        CheckpointType type,
                                        const ProgressSnapshot& progress,
                                        const ApiHealthMap& api_health,
                                        const RateLimitMap& rate_limits,
                                        const std::string& last_operation,
                                        const std::optional<ErrorContext>& error = std::nullopt);

    // All targets not started
    CheckpointOutcome create_session_started_checkpoint(CollectionSession& session,
                                                        const ApiHealthMap& api_health = {},
                                                        const RateLimitMap& rate_limits = {});

    // Moves `key` from in-progress (or not-started) to completed and records
    // its paper count
    CheckpointOutcome create_venue_completed_checkpoint(CollectionSession& session,
                                                        const VenueKey& key,
                                                        int64_t papers,
                                                        const ApiHealthMap& api_health = {},
                                                        const RateLimitMap& rate_limits = {});

    // Attaches `error`. When the error names a venue/year target and
    // mark_failed is set, that pair moves to the failed set.
    CheckpointOutcome create_error_checkpoint(CollectionSession& session,
                                              const ErrorContext& error,
                                              bool mark_failed,
                                              const ApiHealthMap& api_health = {},
                                              const RateLimitMap& rate_limits = {});

    // Snapshot of current progress, no transition
    CheckpointOutcome create_periodic_checkpoint(CollectionSession& session,
                                                 const ApiHealthMap& api_health = {},
                                                 const RateLimitMap& rate_limits = {});

    // Venue dispatch: session_status.json only, no checkpoint
    OpStatus mark_in_progress(CollectionSession& session, const VenueKey& key);
    OpStatus set_status(CollectionSession& session, SessionStatus status);

    // Consistent copy of a session shared with worker threads
    CollectionSession snapshot(const CollectionSession& session);
    static ProgressSnapshot progress_of(const CollectionSession& session);

    // Newest by timestamp; may come back CORRUPTED
    LoadResult<CheckpointData> load_latest_checkpoint(const std::string& session_id);

    // Highest integrity among the usable checkpoints (newest wins ties),
    // re-validated on load. Never returns an unverified checkpoint.
    std::optional<CheckpointData> find_best_recovery_checkpoint(const std::string& session_id);

    CheckpointSummary checkpoint_summary(const std::string& session_id);

    // Deletes unreadable checkpoints, then the oldest readable ones until
    // `keep` remain; returns how many went
    int prune_checkpoints(const std::string& session_id, int64_t keep);

    StatePersistence& persistence() { return persistence_; }

private:
    TimePoint next_timestamp(const std::string& session_id);

    StatePersistence& persistence_;
    CheckpointConfig config_;

    std::mutex ts_mutex_;
    std::map<std::string, TimePoint> last_timestamp_;
};

} // namespace harvest
