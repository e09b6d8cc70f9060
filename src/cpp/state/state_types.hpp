#pragma once
// =============================================================================
// Collection session state model
//
// CollectionSession   -- root aggregate of one collection run
// CheckpointData      -- immutable, checksummed progress snapshot
// InterruptionAnalysis / RecoveryPlan -- derived on demand by the recovery engine
//
// Progress is tracked per (venue, year) pair. A session's target set is split
// into four disjoint buckets: completed, in progress, failed, not started.
// =============================================================================

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../utils/time_util.hpp"

namespace harvest {

// --- Closed enumerations ------------------------------------------------------

enum class SessionStatus { ACTIVE, PAUSED, COMPLETED, FAILED, INTERRUPTED };

enum class CheckpointType {
    SESSION_STARTED,
    VENUE_COMPLETED,
    BATCH_COMPLETED,
    API_CALL_COMPLETED,
    ERROR_OCCURRED
};

enum class ValidationStatus { VALID, CORRUPTED, INCOMPLETE };

enum class RecoveryComplexity { TRIVIAL, SIMPLE, COMPLEX, PROBLEMATIC };

enum class ResumptionStrategy {
    FROM_LAST_CHECKPOINT,
    FROM_VENUE_START,
    PARTIAL_RESTART,
    FULL_RESTART
};

enum class InterruptionType {
    PROCESS_KILLED,
    SYSTEM_CRASH,
    NETWORK_FAILURE,
    API_FAILURE,
    DISK_FULL,
    MEMORY_ERROR,
    UNKNOWN
};

enum class FileIntegrity { VALID, CORRUPTED, MISSING, PARTIAL };

enum class ApiStatus { HEALTHY, DEGRADED, CRITICAL, OFFLINE };

const char* session_status_str(SessionStatus s);
const char* checkpoint_type_str(CheckpointType t);
const char* validation_status_str(ValidationStatus v);
const char* recovery_complexity_str(RecoveryComplexity c);
const char* resumption_strategy_str(ResumptionStrategy s);
const char* interruption_type_str(InterruptionType t);
const char* file_integrity_str(FileIntegrity f);
const char* api_status_str(ApiStatus s);

std::optional<SessionStatus> parse_session_status(const std::string& s);
std::optional<CheckpointType> parse_checkpoint_type(const std::string& s);
std::optional<ValidationStatus> parse_validation_status(const std::string& s);
std::optional<RecoveryComplexity> parse_recovery_complexity(const std::string& s);
std::optional<ResumptionStrategy> parse_resumption_strategy(const std::string& s);
std::optional<InterruptionType> parse_interruption_type(const std::string& s);
std::optional<ApiStatus> parse_api_status(const std::string& s);

// --- Venue/year keys ----------------------------------------------------------

struct VenueKey {
    std::string venue;
    int year = 0;

    bool operator<(const VenueKey& o) const {
        return venue != o.venue ? venue < o.venue : year < o.year;
    }
    bool operator==(const VenueKey& o) const { return venue == o.venue && year == o.year; }
    bool operator!=(const VenueKey& o) const { return !(*this == o); }

    std::string label() const { return venue + "/" + std::to_string(year); }
};

using VenueSet = std::set<VenueKey>;

// venue -> year -> paper count
using PaperCounts = std::map<std::string, std::map<int, int64_t>>;

int64_t total_papers(const PaperCounts& counts);

// Sorted [[venue, year], ...]
nlohmann::json venue_set_to_json(const VenueSet& set);
VenueSet venue_set_from_json(const nlohmann::json& j);

nlohmann::json paper_counts_to_json(const PaperCounts& counts);
PaperCounts paper_counts_from_json(const nlohmann::json& j);

// --- Configuration ------------------------------------------------------------

struct VenueConfig {
    std::string name;
    std::vector<int> years;
    int max_papers_per_year = 0;   // per-year truncation; 0 = no cap
    int priority = 1;              // lower = collected first

    nlohmann::json to_json() const;
    static VenueConfig from_json(const nlohmann::json& j);
};

// --- Error and external-API snapshots -----------------------------------------

struct ErrorContext {
    std::string error_type;
    std::string error_message;
    std::string venue;            // empty when not tied to a venue
    int year = 0;
    std::string api_name;
    int retry_count = 0;
    std::string operation;
    TimePoint timestamp{};

    nlohmann::json to_json() const;
    static ErrorContext from_json(const nlohmann::json& j);
};

struct ApiHealthSnapshot {
    std::string api_name;
    ApiStatus status = ApiStatus::HEALTHY;
    double success_rate = 1.0;
    double avg_response_ms = 0.0;
    int consecutive_errors = 0;

    nlohmann::json to_json() const;
    static ApiHealthSnapshot from_json(const nlohmann::json& j);
};

struct RateLimitSnapshot {
    std::string api_name;
    int requests_in_window = 0;
    int window_capacity = 0;
    double current_delay_seconds = 0.0;
    double health_multiplier = 1.0;

    nlohmann::json to_json() const;
    static RateLimitSnapshot from_json(const nlohmann::json& j);
};

using ApiHealthMap = std::map<std::string, ApiHealthSnapshot>;
using RateLimitMap = std::map<std::string, RateLimitSnapshot>;

// --- Session ------------------------------------------------------------------

struct CollectionSession {
    std::string session_id;
    SessionStatus status = SessionStatus::ACTIVE;
    std::vector<VenueConfig> venues;
    nlohmann::json collection_config = nlohmann::json::object();

    VenueSet venues_completed;
    VenueSet venues_in_progress;
    VenueSet venues_failed;
    std::map<VenueKey, std::string> failure_messages;
    PaperCounts papers_by_venue;
    int64_t total_papers_collected = 0;
    std::string last_successful_operation;

    std::string last_checkpoint_id;
    int64_t checkpoint_count = 0;
    int64_t error_count = 0;
    TimePoint created_at{};
    TimePoint last_activity{};

    // Every (venue, year) pair named by the venue configs
    VenueSet targets() const;
    VenueSet not_started() const;

    // Disjointness of the progress sets and containment in targets().
    // On failure fills *why when given.
    bool partition_valid(std::string* why = nullptr) const;

    nlohmann::json to_json() const;
    static CollectionSession from_json(const nlohmann::json& j);
};

std::string make_session_id(TimePoint at);

// --- Checkpoint ---------------------------------------------------------------

// Progress handed to the checkpoint manager. Workers never edit the session
// directly, they describe the transition and the manager applies it.
struct ProgressSnapshot {
    VenueSet completed;
    VenueSet in_progress;
    VenueSet failed;
    std::map<VenueKey, std::string> failure_messages;
    PaperCounts papers_by_venue;
};

struct CheckpointData {
    std::string checkpoint_id;
    std::string session_id;
    CheckpointType checkpoint_type = CheckpointType::SESSION_STARTED;
    TimePoint timestamp{};

    VenueSet venues_completed;
    VenueSet venues_in_progress;
    VenueSet venues_failed;
    VenueSet venues_not_started;
    std::map<VenueKey, std::string> failure_messages;
    PaperCounts papers_by_venue;
    int64_t papers_collected = 0;
    std::string last_successful_operation;

    ApiHealthMap api_health;
    RateLimitMap rate_limits;
    std::optional<ErrorContext> error_context;

    std::string checksum;
    ValidationStatus validation_status = ValidationStatus::VALID;

    // Compact JSON of the checksummed subset, keys sorted:
    // last_successful_operation, papers_by_venue, papers_collected,
    // session_id, timestamp, venues_completed, venues_in_progress
    std::string canonical_payload() const;
    std::string compute_checksum() const;
    bool validate_integrity() const { return !checksum.empty() && compute_checksum() == checksum; }
    void seal() { checksum = compute_checksum(); }

    nlohmann::json to_json() const;
    // Throws nlohmann::json::exception / std::invalid_argument on malformed input
    static CheckpointData from_json(const nlohmann::json& j);
};

std::string make_checkpoint_id(const std::string& session_id, CheckpointType type, TimePoint at);

// --- Load/save outcomes ---------------------------------------------------------

enum class LoadStatus { OK, NOT_FOUND, CORRUPTED, IO_ERROR };

const char* load_status_str(LoadStatus s);

template <typename T>
struct LoadResult {
    LoadStatus status = LoadStatus::NOT_FOUND;
    std::optional<T> value;
    std::string error;

    bool ok() const { return status == LoadStatus::OK; }
    bool has_value() const { return value.has_value(); }
};

struct OpStatus {
    bool ok = true;
    std::string error;

    static OpStatus success() { return {}; }
    static OpStatus failure(std::string msg) { return {false, std::move(msg)}; }
};

// --- Validation -----------------------------------------------------------------

struct CheckpointValidationResult {
    std::string checkpoint_id;
    double integrity_score = 0.0;
    bool is_valid = false;
    bool can_be_used_for_recovery = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::optional<TimePoint> timestamp;

    nlohmann::json to_json() const;
};

struct IntegrityCheckResult {
    std::string file;             // relative to the session directory
    FileIntegrity status = FileIntegrity::VALID;
    std::string detail;
    std::string recovery_action;  // empty when valid

    nlohmann::json to_json() const;
};

// Outcome of one state-consistency check run during resume
struct ValidationResult {
    std::string check;
    bool passed = false;
    double confidence = 0.0;
    std::vector<std::string> errors;
    std::vector<std::string> recommendations;

    nlohmann::json to_json() const;
};

// --- Recovery ---------------------------------------------------------------------

struct InterruptionCause {
    InterruptionType type = InterruptionType::UNKNOWN;
    double confidence = 0.0;
    std::vector<std::string> evidence;

    nlohmann::json to_json() const;
};

struct InterruptionAnalysis {
    std::string session_id;
    TimePoint analyzed_at{};
    std::optional<std::string> last_checkpoint_id;     // newest on disk, valid or not
    std::optional<std::string> reference_checkpoint_id; // newest valid
    std::optional<TimePoint> last_activity;

    VenueSet venues_definitely_completed;
    VenueSet venues_possibly_incomplete;
    VenueSet venues_unknown_status;
    VenueSet venues_not_started;

    std::vector<std::string> valid_checkpoints;
    std::vector<std::string> corrupted_checkpoints;
    std::vector<std::string> missing_checkpoints;

    int64_t estimated_papers_collected = 0;
    int64_t estimated_papers_lost = 0;
    RecoveryComplexity recovery_complexity = RecoveryComplexity::PROBLEMATIC;
    InterruptionCause cause;

    nlohmann::json to_json() const;
};

struct RecoveryPlan {
    std::string plan_id;
    std::string session_id;
    TimePoint created_at{};
    RecoveryComplexity complexity = RecoveryComplexity::PROBLEMATIC;
    ResumptionStrategy resumption_strategy = ResumptionStrategy::FULL_RESTART;
    std::optional<std::string> optimal_checkpoint_id;

    VenueSet venues_to_skip;
    VenueSet venues_to_resume;
    VenueSet venues_to_restart;
    VenueSet venues_to_validate;
    std::vector<std::string> corrupted_data_to_discard;

    double estimated_recovery_minutes = 0.0;
    int64_t estimated_papers_to_recover = 0;
    double confidence_score = 0.0;
    std::vector<std::string> risks;

    nlohmann::json to_json() const;
    static RecoveryPlan from_json(const nlohmann::json& j);
};

struct SessionResumeResult {
    std::string session_id;
    bool success = false;
    std::optional<std::string> restored_checkpoint_id;
    ResumptionStrategy strategy = ResumptionStrategy::FULL_RESTART;

    VenueSet venues_completed;
    VenueSet venues_in_progress;
    VenueSet venues_failed;
    VenueSet venues_not_started;
    int64_t papers_collected = 0;

    std::vector<ValidationResult> validation_results;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    bool ready_for_continuation = false;
    int64_t elapsed_ms = 0;

    nlohmann::json to_json() const;
};

} // namespace harvest
