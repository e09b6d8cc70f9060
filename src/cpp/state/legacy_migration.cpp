#include "legacy_migration.hpp"
#include "../utils/atomic_file.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace harvest {

namespace fs = std::filesystem;
using json = nlohmann::json;

static std::vector<fs::path> json_files(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".json") out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

MigrationReport migrate_legacy_layout(const fs::path& legacy_root, StatePersistence& persistence) {
    MigrationReport report;
    std::set<std::string> known;

    for (const auto& path : json_files(legacy_root / "sessions")) {
        std::string content;
        auto rd = read_file(path, content);
        if (!rd.ok) {
            report.errors.push_back(rd.error);
            ++report.sessions_skipped;
            continue;
        }
        CollectionSession session;
        try {
            session = CollectionSession::from_json(json::parse(content));
        } catch (const json::exception& e) {
            report.errors.push_back(path.string() + ": " + e.what());
            ++report.sessions_skipped;
            continue;
        } catch (const std::invalid_argument& e) {
            report.errors.push_back(path.string() + ": " + e.what());
            ++report.sessions_skipped;
            continue;
        }

        known.insert(session.session_id);
        if (persistence.session_exists(session.session_id)) {
            ++report.sessions_skipped;
            continue;
        }

        auto st = persistence.init_session_layout(session.session_id);
        if (st.ok) st = persistence.save_session_config(session);
        if (st.ok) st = persistence.save_session(session);
        if (!st.ok) {
            report.errors.push_back(session.session_id + ": " + st.error);
            ++report.sessions_skipped;
            continue;
        }
        ++report.sessions_migrated;
    }

    for (const auto& path : json_files(legacy_root / "checkpoints")) {
        std::string content;
        CheckpointData cp;
        auto rd = read_file(path, content);
        if (!rd.ok) {
            report.errors.push_back(rd.error);
            ++report.checkpoints_skipped;
            continue;
        }
        try {
            cp = CheckpointData::from_json(json::parse(content));
        } catch (const json::exception& e) {
            report.errors.push_back(path.string() + ": " + e.what());
            ++report.checkpoints_skipped;
            continue;
        } catch (const std::invalid_argument& e) {
            report.errors.push_back(path.string() + ": " + e.what());
            ++report.checkpoints_skipped;
            continue;
        }

        if (!known.count(cp.session_id) && !persistence.session_exists(cp.session_id)) {
            report.errors.push_back(cp.checkpoint_id + ": unknown session " + cp.session_id);
            ++report.checkpoints_skipped;
            continue;
        }
        // save_checkpoint refuses corrupted and already-migrated checkpoints
        auto st = persistence.save_checkpoint(cp);
        if (!st.ok) {
            report.errors.push_back(cp.checkpoint_id + ": " + st.error);
            ++report.checkpoints_skipped;
            continue;
        }
        ++report.checkpoints_migrated;
    }

    LOG_INF("[migration] %d sessions, %d checkpoints migrated (%d / %d skipped)",
        report.sessions_migrated, report.checkpoints_migrated,
        report.sessions_skipped, report.checkpoints_skipped);
    return report;
}

} // namespace harvest
