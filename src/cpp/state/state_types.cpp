#include "state_types.hpp"
#include "../utils/id_util.hpp"
#include "../utils/sha256.hpp"

#include <stdexcept>

namespace harvest {

using json = nlohmann::json;

// =============================================================================
// Enum <-> string
// =============================================================================

const char* session_status_str(SessionStatus s) {
    switch (s) {
        case SessionStatus::ACTIVE:      return "active";
        case SessionStatus::PAUSED:      return "paused";
        case SessionStatus::COMPLETED:   return "completed";
        case SessionStatus::FAILED:      return "failed";
        case SessionStatus::INTERRUPTED: return "interrupted";
    }
    return "??";
}

const char* checkpoint_type_str(CheckpointType t) {
    switch (t) {
        case CheckpointType::SESSION_STARTED:    return "session_started";
        case CheckpointType::VENUE_COMPLETED:    return "venue_completed";
        case CheckpointType::BATCH_COMPLETED:    return "batch_completed";
        case CheckpointType::API_CALL_COMPLETED: return "api_call_completed";
        case CheckpointType::ERROR_OCCURRED:     return "error_occurred";
    }
    return "??";
}

const char* validation_status_str(ValidationStatus v) {
    switch (v) {
        case ValidationStatus::VALID:      return "valid";
        case ValidationStatus::CORRUPTED:  return "corrupted";
        case ValidationStatus::INCOMPLETE: return "incomplete";
    }
    return "??";
}

const char* recovery_complexity_str(RecoveryComplexity c) {
    switch (c) {
        case RecoveryComplexity::TRIVIAL:     return "trivial";
        case RecoveryComplexity::SIMPLE:      return "simple";
        case RecoveryComplexity::COMPLEX:     return "complex";
        case RecoveryComplexity::PROBLEMATIC: return "problematic";
    }
    return "??";
}

const char* resumption_strategy_str(ResumptionStrategy s) {
    switch (s) {
        case ResumptionStrategy::FROM_LAST_CHECKPOINT: return "from_last_checkpoint";
        case ResumptionStrategy::FROM_VENUE_START:     return "from_venue_start";
        case ResumptionStrategy::PARTIAL_RESTART:      return "partial_restart";
        case ResumptionStrategy::FULL_RESTART:         return "full_restart";
    }
    return "??";
}

const char* interruption_type_str(InterruptionType t) {
    switch (t) {
        case InterruptionType::PROCESS_KILLED:  return "process_killed";
        case InterruptionType::SYSTEM_CRASH:    return "system_crash";
        case InterruptionType::NETWORK_FAILURE: return "network_failure";
        case InterruptionType::API_FAILURE:     return "api_failure";
        case InterruptionType::DISK_FULL:       return "disk_full";
        case InterruptionType::MEMORY_ERROR:    return "memory_error";
        case InterruptionType::UNKNOWN:         return "unknown";
    }
    return "??";
}

const char* file_integrity_str(FileIntegrity f) {
    switch (f) {
        case FileIntegrity::VALID:     return "valid";
        case FileIntegrity::CORRUPTED: return "corrupted";
        case FileIntegrity::MISSING:   return "missing";
        case FileIntegrity::PARTIAL:   return "partial";
    }
    return "??";
}

const char* api_status_str(ApiStatus s) {
    switch (s) {
        case ApiStatus::HEALTHY:  return "healthy";
        case ApiStatus::DEGRADED: return "degraded";
        case ApiStatus::CRITICAL: return "critical";
        case ApiStatus::OFFLINE:  return "offline";
    }
    return "??";
}

const char* load_status_str(LoadStatus s) {
    switch (s) {
        case LoadStatus::OK:        return "ok";
        case LoadStatus::NOT_FOUND: return "not_found";
        case LoadStatus::CORRUPTED: return "corrupted";
        case LoadStatus::IO_ERROR:  return "io_error";
    }
    return "??";
}

std::optional<SessionStatus> parse_session_status(const std::string& s) {
    if (s == "active")      return SessionStatus::ACTIVE;
    if (s == "paused")      return SessionStatus::PAUSED;
    if (s == "completed")   return SessionStatus::COMPLETED;
    if (s == "failed")      return SessionStatus::FAILED;
    if (s == "interrupted") return SessionStatus::INTERRUPTED;
    return std::nullopt;
}

std::optional<CheckpointType> parse_checkpoint_type(const std::string& s) {
    if (s == "session_started")    return CheckpointType::SESSION_STARTED;
    if (s == "venue_completed")    return CheckpointType::VENUE_COMPLETED;
    if (s == "batch_completed")    return CheckpointType::BATCH_COMPLETED;
    if (s == "api_call_completed") return CheckpointType::API_CALL_COMPLETED;
    if (s == "error_occurred")     return CheckpointType::ERROR_OCCURRED;
    return std::nullopt;
}

std::optional<ValidationStatus> parse_validation_status(const std::string& s) {
    if (s == "valid")      return ValidationStatus::VALID;
    if (s == "corrupted")  return ValidationStatus::CORRUPTED;
    if (s == "incomplete") return ValidationStatus::INCOMPLETE;
    return std::nullopt;
}

std::optional<RecoveryComplexity> parse_recovery_complexity(const std::string& s) {
    if (s == "trivial")     return RecoveryComplexity::TRIVIAL;
    if (s == "simple")      return RecoveryComplexity::SIMPLE;
    if (s == "complex")     return RecoveryComplexity::COMPLEX;
    if (s == "problematic") return RecoveryComplexity::PROBLEMATIC;
    return std::nullopt;
}

std::optional<ResumptionStrategy> parse_resumption_strategy(const std::string& s) {
    if (s == "from_last_checkpoint") return ResumptionStrategy::FROM_LAST_CHECKPOINT;
    if (s == "from_venue_start")     return ResumptionStrategy::FROM_VENUE_START;
    if (s == "partial_restart")      return ResumptionStrategy::PARTIAL_RESTART;
    if (s == "full_restart")         return ResumptionStrategy::FULL_RESTART;
    return std::nullopt;
}

std::optional<InterruptionType> parse_interruption_type(const std::string& s) {
    if (s == "process_killed")  return InterruptionType::PROCESS_KILLED;
    if (s == "system_crash")    return InterruptionType::SYSTEM_CRASH;
    if (s == "network_failure") return InterruptionType::NETWORK_FAILURE;
    if (s == "api_failure")     return InterruptionType::API_FAILURE;
    if (s == "disk_full")       return InterruptionType::DISK_FULL;
    if (s == "memory_error")    return InterruptionType::MEMORY_ERROR;
    if (s == "unknown")         return InterruptionType::UNKNOWN;
    return std::nullopt;
}

std::optional<ApiStatus> parse_api_status(const std::string& s) {
    if (s == "healthy")  return ApiStatus::HEALTHY;
    if (s == "degraded") return ApiStatus::DEGRADED;
    if (s == "critical") return ApiStatus::CRITICAL;
    if (s == "offline")  return ApiStatus::OFFLINE;
    return std::nullopt;
}

// Parses an enum field or throws, so a bad value marks the file corrupted
template <typename E, typename Parser>
static E require_enum(const json& j, const char* key, Parser parse) {
    auto text = j.at(key).get<std::string>();
    auto v = parse(text);
    if (!v) throw std::invalid_argument(std::string("unknown ") + key + ": " + text);
    return *v;
}

static TimePoint require_time(const json& j, const char* key) {
    auto text = j.at(key).get<std::string>();
    auto tp = parse_iso(text);
    if (!tp) throw std::invalid_argument(std::string("bad timestamp ") + key + ": " + text);
    return *tp;
}

// =============================================================================
// Venue sets and paper counts
// =============================================================================

int64_t total_papers(const PaperCounts& counts) {
    int64_t total = 0;
    for (const auto& [venue, years] : counts) {
        for (const auto& [year, n] : years) total += n;
    }
    return total;
}

json venue_set_to_json(const VenueSet& set) {
    json arr = json::array();
    for (const auto& k : set) arr.push_back(json::array({k.venue, k.year}));
    return arr;
}

VenueSet venue_set_from_json(const json& j) {
    VenueSet out;
    for (const auto& e : j) {
        if (!e.is_array() || e.size() != 2) {
            throw std::invalid_argument("venue entry must be [venue, year]");
        }
        out.insert({e[0].get<std::string>(), e[1].get<int>()});
    }
    return out;
}

json paper_counts_to_json(const PaperCounts& counts) {
    json j = json::object();
    for (const auto& [venue, years] : counts) {
        json y = json::object();
        for (const auto& [year, n] : years) y[std::to_string(year)] = n;
        j[venue] = y;
    }
    return j;
}

PaperCounts paper_counts_from_json(const json& j) {
    PaperCounts out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto& years = out[it.key()];
        for (auto yt = it.value().begin(); yt != it.value().end(); ++yt) {
            years[std::stoi(yt.key())] = yt.value().get<int64_t>();
        }
    }
    return out;
}

static json failures_to_json(const std::map<VenueKey, std::string>& failures) {
    json arr = json::array();
    for (const auto& [k, msg] : failures) {
        arr.push_back({{"venue", k.venue}, {"year", k.year}, {"error", msg}});
    }
    return arr;
}

static std::map<VenueKey, std::string> failures_from_json(const json& j) {
    std::map<VenueKey, std::string> out;
    for (const auto& e : j) {
        out[{e.at("venue").get<std::string>(), e.at("year").get<int>()}] =
            e.value("error", "");
    }
    return out;
}

// =============================================================================
// VenueConfig / ErrorContext / API snapshots
// =============================================================================

json VenueConfig::to_json() const {
    return {
        {"name", name},
        {"years", years},
        {"max_papers_per_year", max_papers_per_year},
        {"priority", priority}
    };
}

VenueConfig VenueConfig::from_json(const json& j) {
    VenueConfig v;
    v.name = j.at("name").get<std::string>();
    v.years = j.at("years").get<std::vector<int>>();
    v.max_papers_per_year = j.value("max_papers_per_year", 0);
    v.priority = j.value("priority", 1);
    return v;
}

json ErrorContext::to_json() const {
    return {
        {"error_type", error_type},
        {"error_message", error_message},
        {"venue", venue},
        {"year", year},
        {"api_name", api_name},
        {"retry_count", retry_count},
        {"operation", operation},
        {"timestamp", format_iso(timestamp)}
    };
}

ErrorContext ErrorContext::from_json(const json& j) {
    ErrorContext e;
    e.error_type = j.at("error_type").get<std::string>();
    e.error_message = j.value("error_message", "");
    e.venue = j.value("venue", "");
    e.year = j.value("year", 0);
    e.api_name = j.value("api_name", "");
    e.retry_count = j.value("retry_count", 0);
    e.operation = j.value("operation", "");
    e.timestamp = require_time(j, "timestamp");
    return e;
}

json ApiHealthSnapshot::to_json() const {
    return {
        {"api_name", api_name},
        {"status", api_status_str(status)},
        {"success_rate", success_rate},
        {"avg_response_ms", avg_response_ms},
        {"consecutive_errors", consecutive_errors}
    };
}

ApiHealthSnapshot ApiHealthSnapshot::from_json(const json& j) {
    ApiHealthSnapshot h;
    h.api_name = j.at("api_name").get<std::string>();
    h.status = require_enum<ApiStatus>(j, "status", parse_api_status);
    h.success_rate = j.value("success_rate", 1.0);
    h.avg_response_ms = j.value("avg_response_ms", 0.0);
    h.consecutive_errors = j.value("consecutive_errors", 0);
    return h;
}

json RateLimitSnapshot::to_json() const {
    return {
        {"api_name", api_name},
        {"requests_in_window", requests_in_window},
        {"window_capacity", window_capacity},
        {"current_delay_seconds", current_delay_seconds},
        {"health_multiplier", health_multiplier}
    };
}

RateLimitSnapshot RateLimitSnapshot::from_json(const json& j) {
    RateLimitSnapshot r;
    r.api_name = j.at("api_name").get<std::string>();
    r.requests_in_window = j.value("requests_in_window", 0);
    r.window_capacity = j.value("window_capacity", 0);
    r.current_delay_seconds = j.value("current_delay_seconds", 0.0);
    r.health_multiplier = j.value("health_multiplier", 1.0);
    return r;
}

// =============================================================================
// CollectionSession
// =============================================================================

VenueSet CollectionSession::targets() const {
    VenueSet out;
    for (const auto& v : venues) {
        for (int y : v.years) out.insert({v.name, y});
    }
    return out;
}

VenueSet CollectionSession::not_started() const {
    VenueSet out;
    for (const auto& k : targets()) {
        if (!venues_completed.count(k) && !venues_in_progress.count(k) && !venues_failed.count(k)) {
            out.insert(k);
        }
    }
    return out;
}

bool CollectionSession::partition_valid(std::string* why) const {
    auto fail = [why](const std::string& msg) {
        if (why) *why = msg;
        return false;
    };
    VenueSet all = targets();
    for (const auto& k : venues_completed) {
        if (venues_in_progress.count(k)) return fail(k.label() + " both completed and in progress");
        if (venues_failed.count(k)) return fail(k.label() + " both completed and failed");
        if (!all.count(k)) return fail(k.label() + " completed but not a target");
    }
    for (const auto& k : venues_in_progress) {
        if (venues_failed.count(k)) return fail(k.label() + " both in progress and failed");
        if (!all.count(k)) return fail(k.label() + " in progress but not a target");
    }
    for (const auto& k : venues_failed) {
        if (!all.count(k)) return fail(k.label() + " failed but not a target");
    }
    return true;
}

json CollectionSession::to_json() const {
    json vs = json::array();
    for (const auto& v : venues) vs.push_back(v.to_json());
    return {
        {"session_id", session_id},
        {"status", session_status_str(status)},
        {"venues", vs},
        {"collection_config", collection_config},
        {"venues_completed", venue_set_to_json(venues_completed)},
        {"venues_in_progress", venue_set_to_json(venues_in_progress)},
        {"venues_failed", venue_set_to_json(venues_failed)},
        {"failure_messages", failures_to_json(failure_messages)},
        {"papers_by_venue", paper_counts_to_json(papers_by_venue)},
        {"total_papers_collected", total_papers_collected},
        {"last_successful_operation", last_successful_operation},
        {"last_checkpoint_id", last_checkpoint_id},
        {"checkpoint_count", checkpoint_count},
        {"error_count", error_count},
        {"created_at", format_iso(created_at)},
        {"last_activity", format_iso(last_activity)}
    };
}

CollectionSession CollectionSession::from_json(const json& j) {
    CollectionSession s;
    s.session_id = j.at("session_id").get<std::string>();
    s.status = require_enum<SessionStatus>(j, "status", parse_session_status);
    for (const auto& v : j.at("venues")) s.venues.push_back(VenueConfig::from_json(v));
    s.collection_config = j.value("collection_config", json::object());
    s.venues_completed = venue_set_from_json(j.value("venues_completed", json::array()));
    s.venues_in_progress = venue_set_from_json(j.value("venues_in_progress", json::array()));
    s.venues_failed = venue_set_from_json(j.value("venues_failed", json::array()));
    s.failure_messages = failures_from_json(j.value("failure_messages", json::array()));
    s.papers_by_venue = paper_counts_from_json(j.value("papers_by_venue", json::object()));
    s.total_papers_collected = j.value("total_papers_collected", int64_t{0});
    s.last_successful_operation = j.value("last_successful_operation", "");
    s.last_checkpoint_id = j.value("last_checkpoint_id", "");
    s.checkpoint_count = j.value("checkpoint_count", int64_t{0});
    s.error_count = j.value("error_count", int64_t{0});
    s.created_at = require_time(j, "created_at");
    s.last_activity = require_time(j, "last_activity");
    return s;
}

std::string make_session_id(TimePoint at) {
    return "session_" + compact_stamp(at) + "_" + random_hex(8);
}

// =============================================================================
// CheckpointData
// =============================================================================

std::string CheckpointData::canonical_payload() const {
    json j = json::object();
    j["last_successful_operation"] = last_successful_operation;
    j["papers_by_venue"] = paper_counts_to_json(papers_by_venue);
    j["papers_collected"] = papers_collected;
    j["session_id"] = session_id;
    j["timestamp"] = format_iso(timestamp);
    j["venues_completed"] = venue_set_to_json(venues_completed);
    j["venues_in_progress"] = venue_set_to_json(venues_in_progress);
    return j.dump();
}

std::string CheckpointData::compute_checksum() const {
    return sha256_hex(canonical_payload());
}

json CheckpointData::to_json() const {
    json health = json::object();
    for (const auto& [name, h] : api_health) health[name] = h.to_json();
    json limits = json::object();
    for (const auto& [name, r] : rate_limits) limits[name] = r.to_json();

    return {
        {"checkpoint_id", checkpoint_id},
        {"session_id", session_id},
        {"checkpoint_type", checkpoint_type_str(checkpoint_type)},
        {"timestamp", format_iso(timestamp)},
        {"venues_completed", venue_set_to_json(venues_completed)},
        {"venues_in_progress", venue_set_to_json(venues_in_progress)},
        {"venues_failed", venue_set_to_json(venues_failed)},
        {"venues_not_started", venue_set_to_json(venues_not_started)},
        {"failure_messages", failures_to_json(failure_messages)},
        {"papers_by_venue", paper_counts_to_json(papers_by_venue)},
        {"papers_collected", papers_collected},
        {"last_successful_operation", last_successful_operation},
        {"api_health", health},
        {"rate_limits", limits},
        {"error_context", error_context ? error_context->to_json() : json(nullptr)},
        {"checksum", checksum},
        {"validation_status", validation_status_str(validation_status)}
    };
}

CheckpointData CheckpointData::from_json(const json& j) {
    CheckpointData c;
    c.checkpoint_id = j.at("checkpoint_id").get<std::string>();
    c.session_id = j.at("session_id").get<std::string>();
    c.checkpoint_type = require_enum<CheckpointType>(j, "checkpoint_type", parse_checkpoint_type);
    c.timestamp = require_time(j, "timestamp");
    c.venues_completed = venue_set_from_json(j.at("venues_completed"));
    c.venues_in_progress = venue_set_from_json(j.at("venues_in_progress"));
    c.venues_failed = venue_set_from_json(j.value("venues_failed", json::array()));
    c.venues_not_started = venue_set_from_json(j.value("venues_not_started", json::array()));
    c.failure_messages = failures_from_json(j.value("failure_messages", json::array()));
    c.papers_by_venue = paper_counts_from_json(j.at("papers_by_venue"));
    c.papers_collected = j.at("papers_collected").get<int64_t>();
    c.last_successful_operation = j.value("last_successful_operation", "");

    if (j.contains("api_health")) {
        for (auto it = j["api_health"].begin(); it != j["api_health"].end(); ++it) {
            c.api_health[it.key()] = ApiHealthSnapshot::from_json(it.value());
        }
    }
    if (j.contains("rate_limits")) {
        for (auto it = j["rate_limits"].begin(); it != j["rate_limits"].end(); ++it) {
            c.rate_limits[it.key()] = RateLimitSnapshot::from_json(it.value());
        }
    }
    if (j.contains("error_context") && !j["error_context"].is_null()) {
        c.error_context = ErrorContext::from_json(j["error_context"]);
    }
    c.checksum = j.value("checksum", "");
    // Stored status is advisory; loaders recompute it from the checksum
    c.validation_status = ValidationStatus::VALID;
    return c;
}

std::string make_checkpoint_id(const std::string& session_id, CheckpointType type, TimePoint at) {
    return session_id + "_" + checkpoint_type_str(type) + "_" + compact_stamp(at) + "_" +
           random_hex(8);
}

// =============================================================================
// Validation and recovery records
// =============================================================================

json CheckpointValidationResult::to_json() const {
    return {
        {"checkpoint_id", checkpoint_id},
        {"integrity_score", integrity_score},
        {"is_valid", is_valid},
        {"can_be_used_for_recovery", can_be_used_for_recovery},
        {"errors", errors},
        {"warnings", warnings},
        {"timestamp", timestamp ? json(format_iso(*timestamp)) : json(nullptr)}
    };
}

json IntegrityCheckResult::to_json() const {
    return {
        {"file", file},
        {"status", file_integrity_str(status)},
        {"detail", detail},
        {"recovery_action", recovery_action}
    };
}

json ValidationResult::to_json() const {
    return {
        {"check", check},
        {"passed", passed},
        {"confidence", confidence},
        {"errors", errors},
        {"recommendations", recommendations}
    };
}

json InterruptionCause::to_json() const {
    return {
        {"type", interruption_type_str(type)},
        {"confidence", confidence},
        {"evidence", evidence}
    };
}

static json opt_string(const std::optional<std::string>& s) {
    return s ? json(*s) : json(nullptr);
}

json InterruptionAnalysis::to_json() const {
    return {
        {"session_id", session_id},
        {"analyzed_at", format_iso(analyzed_at)},
        {"last_checkpoint_id", opt_string(last_checkpoint_id)},
        {"reference_checkpoint_id", opt_string(reference_checkpoint_id)},
        {"last_activity", last_activity ? json(format_iso(*last_activity)) : json(nullptr)},
        {"venues_definitely_completed", venue_set_to_json(venues_definitely_completed)},
        {"venues_possibly_incomplete", venue_set_to_json(venues_possibly_incomplete)},
        {"venues_unknown_status", venue_set_to_json(venues_unknown_status)},
        {"venues_not_started", venue_set_to_json(venues_not_started)},
        {"valid_checkpoints", valid_checkpoints},
        {"corrupted_checkpoints", corrupted_checkpoints},
        {"missing_checkpoints", missing_checkpoints},
        {"estimated_papers_collected", estimated_papers_collected},
        {"estimated_papers_lost", estimated_papers_lost},
        {"recovery_complexity", recovery_complexity_str(recovery_complexity)},
        {"interruption_cause", cause.to_json()}
    };
}

json RecoveryPlan::to_json() const {
    return {
        {"plan_id", plan_id},
        {"session_id", session_id},
        {"created_at", format_iso(created_at)},
        {"complexity", recovery_complexity_str(complexity)},
        {"resumption_strategy", resumption_strategy_str(resumption_strategy)},
        {"optimal_checkpoint_id", opt_string(optimal_checkpoint_id)},
        {"venues_to_skip", venue_set_to_json(venues_to_skip)},
        {"venues_to_resume", venue_set_to_json(venues_to_resume)},
        {"venues_to_restart", venue_set_to_json(venues_to_restart)},
        {"venues_to_validate", venue_set_to_json(venues_to_validate)},
        {"corrupted_data_to_discard", corrupted_data_to_discard},
        {"estimated_recovery_minutes", estimated_recovery_minutes},
        {"estimated_papers_to_recover", estimated_papers_to_recover},
        {"confidence_score", confidence_score},
        {"risks", risks}
    };
}

RecoveryPlan RecoveryPlan::from_json(const json& j) {
    RecoveryPlan p;
    p.plan_id = j.at("plan_id").get<std::string>();
    p.session_id = j.at("session_id").get<std::string>();
    p.created_at = require_time(j, "created_at");
    p.complexity = require_enum<RecoveryComplexity>(j, "complexity", parse_recovery_complexity);
    p.resumption_strategy =
        require_enum<ResumptionStrategy>(j, "resumption_strategy", parse_resumption_strategy);
    if (j.contains("optimal_checkpoint_id") && !j["optimal_checkpoint_id"].is_null()) {
        p.optimal_checkpoint_id = j["optimal_checkpoint_id"].get<std::string>();
    }
    p.venues_to_skip = venue_set_from_json(j.value("venues_to_skip", json::array()));
    p.venues_to_resume = venue_set_from_json(j.value("venues_to_resume", json::array()));
    p.venues_to_restart = venue_set_from_json(j.value("venues_to_restart", json::array()));
    p.venues_to_validate = venue_set_from_json(j.value("venues_to_validate", json::array()));
    p.corrupted_data_to_discard =
        j.value("corrupted_data_to_discard", std::vector<std::string>{});
    p.estimated_recovery_minutes = j.value("estimated_recovery_minutes", 0.0);
    p.estimated_papers_to_recover = j.value("estimated_papers_to_recover", int64_t{0});
    p.confidence_score = j.value("confidence_score", 0.0);
    p.risks = j.value("risks", std::vector<std::string>{});
    return p;
}

json SessionResumeResult::to_json() const {
    json checks = json::array();
    for (const auto& v : validation_results) checks.push_back(v.to_json());
    return {
        {"session_id", session_id},
        {"success", success},
        {"restored_checkpoint_id", opt_string(restored_checkpoint_id)},
        {"strategy", resumption_strategy_str(strategy)},
        {"venues_completed", venue_set_to_json(venues_completed)},
        {"venues_in_progress", venue_set_to_json(venues_in_progress)},
        {"venues_failed", venue_set_to_json(venues_failed)},
        {"venues_not_started", venue_set_to_json(venues_not_started)},
        {"papers_collected", papers_collected},
        {"validation_results", checks},
        {"errors", errors},
        {"warnings", warnings},
        {"ready_for_continuation", ready_for_continuation},
        {"elapsed_ms", elapsed_ms}
    };
}

} // namespace harvest
