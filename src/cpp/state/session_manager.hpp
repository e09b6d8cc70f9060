#pragma once
// =============================================================================
// SessionManager -- entry points for creating and inspecting sessions
//
// Creation writes the directory layout, the immutable session_config.json,
// session_status.json and the session_started checkpoint. Deletion happens
// only through cleanup_old_sessions.
// =============================================================================

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "checkpoint_manager.hpp"
#include "state_persistence.hpp"
#include "state_types.hpp"

namespace harvest {

class SessionManager {
public:
    SessionManager(StatePersistence& persistence, CheckpointManager& checkpoints,
                   const EngineConfig& config);

    // Throws std::invalid_argument for a duplicate or malformed id, an empty
    // target set or a venue without years. Throws std::runtime_error when the
    // new session cannot be written.
    CollectionSession create_session(const std::vector<VenueConfig>& venues,
                                     const nlohmann::json& collection_config = nlohmann::json::object(),
                                     const std::optional<std::string>& session_id = std::nullopt);

    LoadResult<CollectionSession> get_session(const std::string& session_id) const;

    // Sessions whose status file loads; damaged ones are logged and skipped
    std::vector<CollectionSession> list_sessions() const;

    CheckpointOutcome save_checkpoint(CollectionSession& session,
                                      CheckpointType type,
                                      const ProgressSnapshot& progress,
                                      const std::string& last_operation,
                                      const std::optional<ErrorContext>& error = std::nullopt);

    LoadResult<CheckpointData> load_latest_checkpoint(const std::string& session_id);

    // Deletes finished sessions idle for more than max_age_days. Active
    // sessions are kept unless include_active is set. Returns deleted ids.
    std::vector<std::string> cleanup_old_sessions(int max_age_days, bool include_active = false);

    static bool valid_session_id(const std::string& id);

private:
    StatePersistence& persistence_;
    CheckpointManager& checkpoints_;
    BudgetConfig budgets_;
};

} // namespace harvest
