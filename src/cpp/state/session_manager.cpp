#include "session_manager.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <stdexcept>

namespace harvest {

SessionManager::SessionManager(StatePersistence& persistence, CheckpointManager& checkpoints,
                               const EngineConfig& config)
    : persistence_(persistence), checkpoints_(checkpoints), budgets_(config.budgets) {}

bool SessionManager::valid_session_id(const std::string& id) {
    if (id.empty() || id.size() > 200 || id == "." || id == "..") return false;
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

CollectionSession SessionManager::create_session(const std::vector<VenueConfig>& venues,
                                                 const nlohmann::json& collection_config,
                                                 const std::optional<std::string>& session_id) {
    BudgetGuard budget("create_session", budgets_.session_create_ms);

    CollectionSession session;
    session.created_at = now_utc();
    session.session_id = session_id ? *session_id : make_session_id(session.created_at);
    session.venues = venues;
    session.collection_config = collection_config.is_null() ? nlohmann::json::object()
                                                            : collection_config;
    session.status = SessionStatus::ACTIVE;

    if (!valid_session_id(session.session_id)) {
        throw std::invalid_argument("invalid session id: '" + session.session_id + "'");
    }
    for (const auto& v : venues) {
        if (v.name.empty()) throw std::invalid_argument("venue with empty name");
        if (v.years.empty()) throw std::invalid_argument("venue " + v.name + " has no target years");
    }
    if (session.targets().empty()) {
        throw std::invalid_argument("session needs at least one (venue, year) target");
    }

    auto lock = persistence_.locks().acquire(session.session_id);
    if (persistence_.session_exists(session.session_id)) {
        throw std::invalid_argument("session " + session.session_id + " already exists");
    }

    auto st = persistence_.init_session_layout(session.session_id);
    if (st.ok) st = persistence_.save_session_config(session);
    if (st.ok) st = persistence_.save_session(session);
    if (!st.ok) {
        throw std::runtime_error("cannot create session " + session.session_id + ": " + st.error);
    }

    auto started = checkpoints_.create_session_started_checkpoint(session);
    if (!started.ok()) {
        throw std::runtime_error("cannot write initial checkpoint for " + session.session_id +
                                 ": " + started.status.error);
    }

    LOG_INF("[session] Created %s with %zu targets", session.session_id.c_str(),
        session.targets().size());
    return session;
}

LoadResult<CollectionSession> SessionManager::get_session(const std::string& session_id) const {
    return persistence_.load_session(session_id);
}

std::vector<CollectionSession> SessionManager::list_sessions() const {
    std::vector<CollectionSession> out;
    for (const auto& id : persistence_.list_sessions()) {
        auto loaded = persistence_.load_session(id);
        if (loaded.ok()) {
            out.push_back(std::move(*loaded.value));
        } else {
            LOG_WRN("[session] Skipping %s: %s (%s)", id.c_str(),
                load_status_str(loaded.status), loaded.error.c_str());
        }
    }
    return out;
}

CheckpointOutcome SessionManager::save_checkpoint(CollectionSession& session,
                                                  CheckpointType type,
                                                  const ProgressSnapshot& progress,
                                                  const std::string& last_operation,
                                                  const std::optional<ErrorContext>& error) {
    return checkpoints_.create_checkpoint(session, type, progress, {}, {}, last_operation, error);
}

LoadResult<CheckpointData> SessionManager::load_latest_checkpoint(const std::string& session_id) {
    return checkpoints_.load_latest_checkpoint(session_id);
}

std::vector<std::string> SessionManager::cleanup_old_sessions(int max_age_days, bool include_active) {
    std::vector<std::string> deleted;
    auto cutoff = now_utc() - std::chrono::hours(24) * max_age_days;

    for (const auto& id : persistence_.list_sessions()) {
        auto loaded = persistence_.load_session(id);
        if (!loaded.ok()) {
            LOG_WRN("[session] Cleanup skips unreadable session %s", id.c_str());
            continue;
        }
        const auto& s = *loaded.value;
        if (s.last_activity >= cutoff) continue;
        if (s.status == SessionStatus::ACTIVE && !include_active) continue;

        auto st = persistence_.delete_session(id);
        if (st.ok) {
            deleted.push_back(id);
        } else {
            LOG_ERR("[session] Cleanup of %s failed: %s", id.c_str(), st.error.c_str());
        }
    }
    LOG_INF("[session] Cleanup removed %zu sessions older than %d days", deleted.size(), max_age_days);
    return deleted;
}

} // namespace harvest
