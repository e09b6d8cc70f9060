#pragma once
// =============================================================================
// RecoveryEngine -- reconstructs an interrupted session and resumes it
//
//   analyze_interruption   scan + validate every checkpoint, bucket the
//                          targets, classify complexity and cause
//   create_recovery_plan   strategy, confidence, venue lists, risks
//   resume_session         restore progress from the plan's checkpoint,
//                          validate consistency, reactivate
//
// Complexity -> strategy:
//   trivial / simple -> from_last_checkpoint (1 / 2 min)
//   complex          -> partial_restart      (4 min)
//   problematic      -> full_restart         (5 min)
// =============================================================================

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../state/checkpoint_manager.hpp"
#include "../state/state_persistence.hpp"
#include "../state/state_types.hpp"

namespace harvest {

class RecoveryEngine {
public:
    RecoveryEngine(StatePersistence& persistence, CheckpointManager& checkpoints,
                   const EngineConfig& config);

    // Throws std::invalid_argument for an unknown session and
    // std::runtime_error when neither the status nor the config file can
    // tell which targets the session had.
    InterruptionAnalysis analyze_interruption(const std::string& session_id);

    RecoveryPlan create_recovery_plan(const std::string& session_id,
                                      const InterruptionAnalysis& analysis);

    // Calling twice with the same plan restores the same progress
    SessionResumeResult resume_session(const std::string& session_id, const RecoveryPlan& plan);

    // analyze -> plan -> persist plan -> resume
    SessionResumeResult resume_interrupted_session(const std::string& session_id);

    // venue_consistency (hard), progress_partition (hard), paper_count_consistency (soft)
    std::vector<ValidationResult> validate_session_state(const CollectionSession& session) const;

    InterruptionCause detect_interruption_cause(const std::optional<CheckpointData>& latest,
                                                std::optional<TimePoint> last_activity,
                                                TimePoint now) const;

private:
    CollectionSession load_or_reconstruct(const std::string& session_id);
    ProgressSnapshot restored_progress(const CheckpointData& cp, const RecoveryPlan& plan) const;

    StatePersistence& persistence_;
    CheckpointManager& checkpoints_;
    RecoveryConfig config_;
    BudgetConfig budgets_;

    std::mutex guard_mutex_;
    std::set<std::string> active_recoveries_;
    std::map<std::string, int> attempts_;
};

} // namespace harvest
