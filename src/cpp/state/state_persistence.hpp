#pragma once
// =============================================================================
// StatePersistence -- durable session and checkpoint storage
//
// Layout under <state_dir>:
//   sessions/<session_id>/
//     session_config.json          immutable, written once at creation
//     session_status.json          current CollectionSession
//     checkpoints/<id>.json[.gz]   .gz when the payload exceeds the threshold
//     venues/  recovery/
//
// Every write goes through write_file_atomic, so readers never take a lock.
// Writers and multi-file scans hold the session's lock from SessionLockTable.
// Expected conditions (missing, corrupted) come back as values; only a
// state directory that cannot be created throws.
// =============================================================================

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "session_lock_table.hpp"
#include "state_types.hpp"

namespace harvest {

class StatePersistence {
public:
    StatePersistence(const EngineConfig& config, SessionLockTable& locks);

    [[nodiscard]] const std::filesystem::path& base_dir() const { return base_dir_; }
    [[nodiscard]] std::filesystem::path sessions_root() const { return base_dir_ / "sessions"; }
    [[nodiscard]] std::filesystem::path session_dir(const std::string& session_id) const;
    [[nodiscard]] std::filesystem::path checkpoint_dir(const std::string& session_id) const;
    [[nodiscard]] SessionLockTable& locks() { return locks_; }

    // --- Sessions ---
    OpStatus init_session_layout(const std::string& session_id);
    OpStatus save_session_config(const CollectionSession& session);
    LoadResult<nlohmann::json> load_session_config(const std::string& session_id) const;

    // Stamps last_activity on the passed session, then writes it
    OpStatus save_session(CollectionSession& session);
    LoadResult<CollectionSession> load_session(const std::string& session_id) const;
    bool session_exists(const std::string& session_id) const;
    std::vector<std::string> list_sessions() const;
    OpStatus delete_session(const std::string& session_id);

    // --- Checkpoints ---
    // Rejects checkpoints failing validate_integrity() and existing ids
    OpStatus save_checkpoint(const CheckpointData& checkpoint);

    // Checksum is recomputed: a mismatch returns CORRUPTED with the value
    // present and validation_status = CORRUPTED. Unparsable files return
    // CORRUPTED without a value.
    LoadResult<CheckpointData> load_checkpoint(const std::string& session_id,
                                               const std::string& checkpoint_id) const;
    // Looks the id up across every session directory
    LoadResult<CheckpointData> load_checkpoint(const std::string& checkpoint_id) const;

    // Oldest first, by the timestamp inside each file. Files whose
    // timestamp cannot be read come last, ordered by modification time.
    std::vector<std::string> list_checkpoints_for_session(const std::string& session_id) const;
    OpStatus delete_checkpoint(const std::string& session_id, const std::string& checkpoint_id);

    std::vector<CheckpointValidationResult> validate_checkpoints(const std::string& session_id) const;
    CheckpointValidationResult validate_checkpoint(const std::string& session_id,
                                                   const std::string& checkpoint_id) const;
    std::vector<IntegrityCheckResult> check_data_integrity(const std::string& session_id) const;

    // --- Recovery artifacts ---
    OpStatus save_recovery_plan(const RecoveryPlan& plan);
    LoadResult<RecoveryPlan> load_recovery_plan(const std::string& session_id,
                                                const std::string& plan_id) const;

private:
    struct CheckpointFile {
        std::string id;
        std::filesystem::path path;
        std::optional<TimePoint> timestamp;
        std::filesystem::file_time_type mtime;
    };

    std::vector<CheckpointFile> scan_checkpoint_files(const std::string& session_id) const;
    std::optional<std::filesystem::path> find_checkpoint_file(const std::string& session_id,
                                                              const std::string& checkpoint_id) const;
    IntegrityCheckResult check_json_file(const std::filesystem::path& path,
                                         const std::string& relative,
                                         const char* corrupted_action) const;

    std::filesystem::path base_dir_;
    SessionLockTable& locks_;
    size_t compress_threshold_;
    double min_recovery_integrity_;
    BudgetConfig budgets_;
};

} // namespace harvest
