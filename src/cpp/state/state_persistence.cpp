#include "state_persistence.hpp"
#include "../utils/atomic_file.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace harvest {

namespace fs = std::filesystem;
using json = nlohmann::json;

static constexpr const char* CONFIG_FILE = "session_config.json";
static constexpr const char* STATUS_FILE = "session_status.json";
static constexpr const char* JSON_EXT = ".json";
static constexpr const char* GZ_EXT = ".json.gz";

// Clock skew tolerated before a checkpoint counts as "from the future"
static constexpr auto FUTURE_TOLERANCE = std::chrono::seconds(60);

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "<id>.json" / "<id>.json.gz" -> id; anything else -> nullopt
static std::optional<std::string> checkpoint_id_from_filename(const std::string& name) {
    if (ends_with(name, GZ_EXT)) return name.substr(0, name.size() - std::strlen(GZ_EXT));
    if (ends_with(name, JSON_EXT)) return name.substr(0, name.size() - std::strlen(JSON_EXT));
    return std::nullopt;
}

StatePersistence::StatePersistence(const EngineConfig& config, SessionLockTable& locks)
    : base_dir_(config.persistence.state_dir),
      locks_(locks),
      compress_threshold_(config.persistence.compress_threshold_bytes),
      min_recovery_integrity_(config.recovery.min_recovery_integrity),
      budgets_(config.budgets) {
    std::error_code ec;
    fs::create_directories(sessions_root(), ec);
    if (ec) {
        throw std::runtime_error("cannot create state directory " + sessions_root().string() +
                                 ": " + ec.message());
    }
    LOG_DBG("[persistence] State directory: %s", base_dir_.c_str());
}

fs::path StatePersistence::session_dir(const std::string& session_id) const {
    return sessions_root() / session_id;
}

fs::path StatePersistence::checkpoint_dir(const std::string& session_id) const {
    return session_dir(session_id) / "checkpoints";
}

// =============================================================================
// Sessions
// =============================================================================

OpStatus StatePersistence::init_session_layout(const std::string& session_id) {
    auto lock = locks_.acquire(session_id);
    std::error_code ec;
    for (const char* sub : {"checkpoints", "venues", "recovery"}) {
        fs::create_directories(session_dir(session_id) / sub, ec);
        if (ec) {
            return OpStatus::failure("create " + (session_dir(session_id) / sub).string() +
                                     ": " + ec.message());
        }
    }
    return OpStatus::success();
}

OpStatus StatePersistence::save_session_config(const CollectionSession& session) {
    auto lock = locks_.acquire(session.session_id);
    auto path = session_dir(session.session_id) / CONFIG_FILE;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return OpStatus::failure("session_config.json already written for " + session.session_id);
    }

    json vs = json::array();
    for (const auto& v : session.venues) vs.push_back(v.to_json());
    json j = {
        {"session_id", session.session_id},
        {"venues", vs},
        {"collection_config", session.collection_config},
        {"created_at", format_iso(session.created_at)}
    };

    auto res = write_file_atomic(path, j.dump(2));
    if (!res.ok) {
        LOG_ERR("[persistence] %s", res.error.c_str());
        return OpStatus::failure(res.error);
    }
    return OpStatus::success();
}

LoadResult<json> StatePersistence::load_session_config(const std::string& session_id) const {
    LoadResult<json> out;
    std::string content;
    auto res = read_file(session_dir(session_id) / CONFIG_FILE, content);
    if (!res.ok) {
        out.status = res.not_found ? LoadStatus::NOT_FOUND : LoadStatus::IO_ERROR;
        out.error = res.error;
        return out;
    }
    try {
        out.value = json::parse(content);
        out.status = LoadStatus::OK;
    } catch (const json::exception& e) {
        out.status = LoadStatus::CORRUPTED;
        out.error = e.what();
    }
    return out;
}

OpStatus StatePersistence::save_session(CollectionSession& session) {
    auto lock = locks_.acquire(session.session_id);
    session.last_activity = now_utc();

    auto res = write_file_atomic(session_dir(session.session_id) / STATUS_FILE,
                                 session.to_json().dump(2));
    if (!res.ok) {
        LOG_ERR("[persistence] Failed to save session %s: %s",
            session.session_id.c_str(), res.error.c_str());
        return OpStatus::failure(res.error);
    }
    LOG_DBG("[persistence] Saved session %s (%s)", session.session_id.c_str(),
        session_status_str(session.status));
    return OpStatus::success();
}

LoadResult<CollectionSession> StatePersistence::load_session(const std::string& session_id) const {
    LoadResult<CollectionSession> out;
    std::string content;
    auto res = read_file(session_dir(session_id) / STATUS_FILE, content);
    if (!res.ok) {
        out.status = res.not_found ? LoadStatus::NOT_FOUND : LoadStatus::IO_ERROR;
        out.error = res.error;
        return out;
    }

    try {
        out.value = CollectionSession::from_json(json::parse(content));
        out.status = LoadStatus::OK;
    } catch (const json::exception& e) {
        out.status = LoadStatus::CORRUPTED;
        out.error = e.what();
    } catch (const std::invalid_argument& e) {
        out.status = LoadStatus::CORRUPTED;
        out.error = e.what();
    }
    if (out.status == LoadStatus::CORRUPTED) {
        LOG_WRN("[persistence] session_status.json of %s is corrupted: %s",
            session_id.c_str(), out.error.c_str());
    }
    return out;
}

bool StatePersistence::session_exists(const std::string& session_id) const {
    std::error_code ec;
    return fs::is_directory(session_dir(session_id), ec);
}

std::vector<std::string> StatePersistence::list_sessions() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(sessions_root(), ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory()) continue;
        const auto& dir = it->path();
        if (fs::exists(dir / STATUS_FILE) || fs::exists(dir / CONFIG_FILE)) {
            ids.push_back(dir.filename().string());
        }
    }
    if (ec) {
        LOG_WRN("[persistence] Listing %s: %s", sessions_root().c_str(), ec.message().c_str());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

OpStatus StatePersistence::delete_session(const std::string& session_id) {
    auto lock = locks_.acquire(session_id);
    std::error_code ec;
    fs::remove_all(session_dir(session_id), ec);
    if (ec) return OpStatus::failure("remove " + session_dir(session_id).string() + ": " + ec.message());
    LOG_INF("[persistence] Deleted session %s", session_id.c_str());
    return OpStatus::success();
}

// =============================================================================
// Checkpoints
// =============================================================================

std::optional<fs::path> StatePersistence::find_checkpoint_file(const std::string& session_id,
                                                                const std::string& checkpoint_id) const {
    std::error_code ec;
    auto dir = checkpoint_dir(session_id);
    for (const char* ext : {JSON_EXT, GZ_EXT}) {
        auto p = dir / (checkpoint_id + ext);
        if (fs::exists(p, ec)) return p;
    }
    return std::nullopt;
}

OpStatus StatePersistence::save_checkpoint(const CheckpointData& checkpoint) {
    BudgetGuard budget("save_checkpoint " + checkpoint.checkpoint_id, budgets_.checkpoint_save_ms);

    if (!checkpoint.validate_integrity()) {
        LOG_ERR("[persistence] Refusing checkpoint %s: integrity check failed",
            checkpoint.checkpoint_id.c_str());
        return OpStatus::failure("integrity check failed for " + checkpoint.checkpoint_id);
    }

    auto lock = locks_.acquire(checkpoint.session_id);
    if (find_checkpoint_file(checkpoint.session_id, checkpoint.checkpoint_id)) {
        return OpStatus::failure("checkpoint " + checkpoint.checkpoint_id + " already exists");
    }

    std::string payload = checkpoint.to_json().dump(2);
    bool compress = payload.size() > compress_threshold_;
    auto path = checkpoint_dir(checkpoint.session_id) /
                (checkpoint.checkpoint_id + (compress ? GZ_EXT : JSON_EXT));

    auto res = write_file_atomic(path, payload);
    if (!res.ok) {
        LOG_ERR("[persistence] Failed to save checkpoint %s: %s",
            checkpoint.checkpoint_id.c_str(), res.error.c_str());
        return OpStatus::failure(res.error);
    }
    LOG_DBG("[persistence] Saved checkpoint %s (%zu bytes%s)", checkpoint.checkpoint_id.c_str(),
        payload.size(), compress ? ", gzip" : "");
    return OpStatus::success();
}

LoadResult<CheckpointData> StatePersistence::load_checkpoint(const std::string& session_id,
                                                             const std::string& checkpoint_id) const {
    BudgetGuard budget("load_checkpoint " + checkpoint_id, budgets_.checkpoint_load_ms);
    LoadResult<CheckpointData> out;

    auto path = find_checkpoint_file(session_id, checkpoint_id);
    if (!path) {
        out.status = LoadStatus::NOT_FOUND;
        out.error = "checkpoint " + checkpoint_id + " not found";
        return out;
    }

    std::string content;
    auto res = read_file(*path, content);
    if (!res.ok) {
        if (res.not_found) {
            out.status = LoadStatus::NOT_FOUND;
        } else {
            // An undecodable .gz is damage, not an I/O fault
            out.status = path->extension() == ".gz" ? LoadStatus::CORRUPTED : LoadStatus::IO_ERROR;
        }
        out.error = res.error;
        return out;
    }

    try {
        auto cp = CheckpointData::from_json(json::parse(content));
        if (cp.checkpoint_id != checkpoint_id || cp.session_id != session_id) {
            out.status = LoadStatus::CORRUPTED;
            out.error = "checkpoint identity does not match its file name";
            cp.validation_status = ValidationStatus::CORRUPTED;
        } else if (!cp.validate_integrity()) {
            out.status = LoadStatus::CORRUPTED;
            out.error = "checksum mismatch";
            cp.validation_status = ValidationStatus::CORRUPTED;
        } else {
            out.status = LoadStatus::OK;
            cp.validation_status = ValidationStatus::VALID;
        }
        out.value = std::move(cp);
    } catch (const json::exception& e) {
        out.status = LoadStatus::CORRUPTED;
        out.error = std::string("unparsable checkpoint: ") + e.what();
    } catch (const std::invalid_argument& e) {
        out.status = LoadStatus::CORRUPTED;
        out.error = std::string("malformed checkpoint: ") + e.what();
    }

    if (out.status == LoadStatus::CORRUPTED) {
        LOG_WRN("[persistence] Checkpoint %s is corrupted: %s",
            checkpoint_id.c_str(), out.error.c_str());
    }
    return out;
}

LoadResult<CheckpointData> StatePersistence::load_checkpoint(const std::string& checkpoint_id) const {
    for (const auto& sid : list_sessions()) {
        // Ids are prefixed with their session id
        if (checkpoint_id.compare(0, sid.size(), sid) != 0) continue;
        if (find_checkpoint_file(sid, checkpoint_id)) return load_checkpoint(sid, checkpoint_id);
    }
    LoadResult<CheckpointData> out;
    out.status = LoadStatus::NOT_FOUND;
    out.error = "checkpoint " + checkpoint_id + " not found";
    return out;
}

std::vector<StatePersistence::CheckpointFile>
StatePersistence::scan_checkpoint_files(const std::string& session_id) const {
    std::vector<CheckpointFile> files;
    std::error_code ec;
    auto dir = checkpoint_dir(session_id);
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        auto id = checkpoint_id_from_filename(it->path().filename().string());
        if (!id) continue;

        CheckpointFile f;
        f.id = *id;
        f.path = it->path();
        std::error_code mec;
        f.mtime = fs::last_write_time(f.path, mec);

        std::string content;
        if (read_file(f.path, content).ok) {
            // Only the timestamp matters here; damage is reported elsewhere
            auto j = json::parse(content, nullptr, false);
            if (!j.is_discarded() && j.is_object() && j.contains("timestamp") &&
                j["timestamp"].is_string()) {
                f.timestamp = parse_iso(j["timestamp"].get<std::string>());
            }
        }
        files.push_back(std::move(f));
    }

    std::sort(files.begin(), files.end(), [](const CheckpointFile& a, const CheckpointFile& b) {
        if (a.timestamp.has_value() != b.timestamp.has_value()) return a.timestamp.has_value();
        if (a.timestamp && *a.timestamp != *b.timestamp) return *a.timestamp < *b.timestamp;
        if (!a.timestamp && a.mtime != b.mtime) return a.mtime < b.mtime;
        return a.id < b.id;
    });
    return files;
}

std::vector<std::string> StatePersistence::list_checkpoints_for_session(const std::string& session_id) const {
    std::vector<std::string> ids;
    for (auto& f : scan_checkpoint_files(session_id)) ids.push_back(std::move(f.id));
    return ids;
}

OpStatus StatePersistence::delete_checkpoint(const std::string& session_id,
                                             const std::string& checkpoint_id) {
    auto lock = locks_.acquire(session_id);
    auto path = find_checkpoint_file(session_id, checkpoint_id);
    if (!path) return OpStatus::failure("checkpoint " + checkpoint_id + " not found");
    std::error_code ec;
    fs::remove(*path, ec);
    if (ec) return OpStatus::failure("remove " + path->string() + ": " + ec.message());
    return OpStatus::success();
}

CheckpointValidationResult StatePersistence::validate_checkpoint(const std::string& session_id,
                                                                 const std::string& checkpoint_id) const {
    CheckpointValidationResult r;
    r.checkpoint_id = checkpoint_id;
    r.integrity_score = 1.0;

    auto loaded = load_checkpoint(session_id, checkpoint_id);
    if (!loaded.has_value()) {
        r.integrity_score = 0.0;
        r.errors.push_back(loaded.status == LoadStatus::NOT_FOUND
                               ? "checkpoint file missing"
                               : "checkpoint unreadable: " + loaded.error);
        return r;
    }

    const auto& cp = *loaded.value;
    r.timestamp = cp.timestamp;

    if (cp.validation_status == ValidationStatus::CORRUPTED) {
        r.integrity_score -= 0.5;
        r.errors.push_back("integrity check failed: " + loaded.error);
    }
    if (cp.papers_collected < 0) {
        r.integrity_score -= 0.2;
        r.errors.push_back("negative paper count");
    }
    for (const auto& k : cp.venues_completed) {
        if (cp.venues_in_progress.count(k) || cp.venues_failed.count(k)) {
            r.integrity_score -= 0.2;
            r.errors.push_back("overlapping progress sets at " + k.label());
            break;
        }
    }
    if (cp.venues_completed.empty() && cp.venues_in_progress.empty()) {
        r.integrity_score -= 0.1;
        r.warnings.push_back("no venue progress recorded");
    }
    if (cp.timestamp > now_utc() + FUTURE_TOLERANCE) {
        r.integrity_score -= 0.3;
        r.errors.push_back("timestamp is in the future");
    }

    r.integrity_score = std::clamp(r.integrity_score, 0.0, 1.0);
    r.is_valid = r.errors.empty();
    r.can_be_used_for_recovery =
        cp.validation_status == ValidationStatus::VALID &&
        r.integrity_score >= min_recovery_integrity_;
    return r;
}

std::vector<CheckpointValidationResult> StatePersistence::validate_checkpoints(const std::string& session_id) const {
    auto lock = locks_.acquire(session_id);
    std::vector<CheckpointValidationResult> results;
    for (const auto& id : list_checkpoints_for_session(session_id)) {
        results.push_back(validate_checkpoint(session_id, id));
    }
    return results;
}

// =============================================================================
// Data integrity
// =============================================================================

IntegrityCheckResult StatePersistence::check_json_file(const fs::path& path,
                                                       const std::string& relative,
                                                       const char* corrupted_action) const {
    IntegrityCheckResult r;
    r.file = relative;

    std::string content;
    auto res = read_file(path, content);
    if (!res.ok) {
        if (res.not_found) {
            r.status = FileIntegrity::MISSING;
            r.detail = "file not found";
            r.recovery_action = "recreate_from_backup";
        } else {
            r.status = FileIntegrity::CORRUPTED;
            r.detail = res.error;
            r.recovery_action = corrupted_action;
        }
        return r;
    }

    try {
        auto j = json::parse(content);
        (void)j;
        r.status = FileIntegrity::VALID;
    } catch (const json::parse_error& e) {
        // Input ending mid-document is a torn write, not random damage
        if (e.byte >= content.size()) {
            r.status = FileIntegrity::PARTIAL;
            r.recovery_action = "manual_inspection";
        } else {
            r.status = FileIntegrity::CORRUPTED;
            r.recovery_action = corrupted_action;
        }
        r.detail = e.what();
    }
    return r;
}

std::vector<IntegrityCheckResult> StatePersistence::check_data_integrity(const std::string& session_id) const {
    auto lock = locks_.acquire(session_id);
    std::vector<IntegrityCheckResult> results;

    auto dir = session_dir(session_id);
    if (!session_exists(session_id)) {
        IntegrityCheckResult r;
        r.file = ".";
        r.status = FileIntegrity::MISSING;
        r.detail = "session directory not found";
        r.recovery_action = "recreate_from_backup";
        results.push_back(r);
        return results;
    }

    results.push_back(check_json_file(dir / CONFIG_FILE, CONFIG_FILE, "recreate_from_backup"));
    results.push_back(check_json_file(dir / STATUS_FILE, STATUS_FILE, "restore_from_checkpoint"));

    for (const auto& f : scan_checkpoint_files(session_id)) {
        auto rel = "checkpoints/" + f.path.filename().string();
        auto r = check_json_file(f.path, rel, "discard_checkpoint");
        if (r.status == FileIntegrity::VALID) {
            auto loaded = load_checkpoint(session_id, f.id);
            if (loaded.status == LoadStatus::CORRUPTED) {
                r.status = FileIntegrity::CORRUPTED;
                r.detail = loaded.error;
                r.recovery_action = "discard_checkpoint";
            }
        }
        results.push_back(r);
    }

    // Leftovers of writers killed between write and rename
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file() || !is_temp_file(it->path())) continue;
        IntegrityCheckResult r;
        r.file = fs::relative(it->path(), dir).string();
        r.status = FileIntegrity::PARTIAL;
        r.detail = "interrupted write";
        r.recovery_action = "discard_temp_file";
        results.push_back(r);
    }
    return results;
}

// =============================================================================
// Recovery plans
// =============================================================================

OpStatus StatePersistence::save_recovery_plan(const RecoveryPlan& plan) {
    auto lock = locks_.acquire(plan.session_id);
    auto path = session_dir(plan.session_id) / "recovery" / (plan.plan_id + JSON_EXT);
    auto res = write_file_atomic(path, plan.to_json().dump(2));
    if (!res.ok) {
        LOG_ERR("[persistence] Failed to save recovery plan %s: %s",
            plan.plan_id.c_str(), res.error.c_str());
        return OpStatus::failure(res.error);
    }
    return OpStatus::success();
}

LoadResult<RecoveryPlan> StatePersistence::load_recovery_plan(const std::string& session_id,
                                                              const std::string& plan_id) const {
    LoadResult<RecoveryPlan> out;
    std::string content;
    auto res = read_file(session_dir(session_id) / "recovery" / (plan_id + JSON_EXT), content);
    if (!res.ok) {
        out.status = res.not_found ? LoadStatus::NOT_FOUND : LoadStatus::IO_ERROR;
        out.error = res.error;
        return out;
    }
    try {
        out.value = RecoveryPlan::from_json(json::parse(content));
        out.status = LoadStatus::OK;
    } catch (const json::exception& e) {
        out.status = LoadStatus::CORRUPTED;
        out.error = e.what();
    } catch (const std::invalid_argument& e) {
        out.status = LoadStatus::CORRUPTED;
        out.error = e.what();
    }
    return out;
}

} // namespace harvest
