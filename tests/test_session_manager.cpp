#include <gtest/gtest.h>

#include <fstream>

#include "state/session_manager.hpp"
#include "test_support.hpp"

using namespace harvest;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

class SessionManagerTest : public EngineTest {
protected:
    // Rewrites the status file with an old last_activity; save_session would
    // stamp the current time
    void age_session(const std::string& id, SessionStatus status, int days) {
        auto path = persistence_->session_dir(id) / "session_status.json";
        std::string content;
        ASSERT_TRUE(read_file(path, content).ok);
        auto j = json::parse(content);
        j["status"] = session_status_str(status);
        j["last_activity"] = format_iso(now_utc() - std::chrono::hours(24) * days);
        ASSERT_TRUE(write_file_atomic(path, j.dump(2)).ok);
    }
};

} // namespace

TEST_F(SessionManagerTest, CreateWritesLayout) {
    auto s = make_session("session_layout");
    auto dir = persistence_->session_dir("session_layout");
    EXPECT_TRUE(fs::exists(dir / "session_config.json"));
    EXPECT_TRUE(fs::exists(dir / "session_status.json"));
    EXPECT_TRUE(fs::is_directory(dir / "checkpoints"));
    EXPECT_TRUE(fs::is_directory(dir / "venues"));
    EXPECT_TRUE(fs::is_directory(dir / "recovery"));
    EXPECT_EQ(s.status, SessionStatus::ACTIVE);
    EXPECT_EQ(s.not_started().size(), 3u);
}

TEST_F(SessionManagerTest, GeneratedIdsAreUnique) {
    auto a = sessions_->create_session({venue("ICML", {2023})});
    auto b = sessions_->create_session({venue("ICML", {2023})});
    EXPECT_NE(a.session_id, b.session_id);
    EXPECT_EQ(a.session_id.rfind("session_", 0), 0u);
}

TEST_F(SessionManagerTest, DuplicateIdIsRejected) {
    make_session("session_dup");
    EXPECT_THROW(make_session("session_dup"), std::invalid_argument);
}

TEST_F(SessionManagerTest, RejectsMalformedInput) {
    EXPECT_THROW(sessions_->create_session({venue("ICML", {2023})}, json::object(), "../escape"),
                 std::invalid_argument);
    EXPECT_THROW(sessions_->create_session({venue("ICML", {})}), std::invalid_argument);
    EXPECT_THROW(sessions_->create_session({}), std::invalid_argument);
    EXPECT_THROW(sessions_->create_session({venue("", {2023})}), std::invalid_argument);
    EXPECT_TRUE(persistence_->list_sessions().empty());
}

TEST_F(SessionManagerTest, GetAndListSessions) {
    make_session("session_one");
    make_session("session_two");
    std::ofstream(persistence_->session_dir("session_two") / "session_status.json") << "garbage";

    EXPECT_TRUE(sessions_->get_session("session_one").ok());
    EXPECT_EQ(sessions_->get_session("session_two").status, LoadStatus::CORRUPTED);

    auto listed = sessions_->list_sessions();
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].session_id, "session_one");
}

TEST_F(SessionManagerTest, SaveCheckpointPassesThrough) {
    auto s = make_session();
    ProgressSnapshot p;
    p.in_progress.insert({"ICML", 2024});
    auto out = sessions_->save_checkpoint(s, CheckpointType::API_CALL_COMPLETED, p, "page 1 of ICML/2024");
    ASSERT_TRUE(out.ok()) << out.status.error;
    EXPECT_TRUE(s.venues_in_progress.count({"ICML", 2024}));

    auto latest = sessions_->load_latest_checkpoint(s.session_id);
    ASSERT_TRUE(latest.ok());
    EXPECT_EQ(latest.value->checkpoint_type, CheckpointType::API_CALL_COMPLETED);
    EXPECT_EQ(latest.value->last_successful_operation, "page 1 of ICML/2024");
}

TEST_F(SessionManagerTest, CleanupRemovesOnlyOldFinishedSessions) {
    make_session("session_old_done");
    make_session("session_old_active");
    make_session("session_recent_done");
    age_session("session_old_done", SessionStatus::COMPLETED, 45);
    age_session("session_old_active", SessionStatus::ACTIVE, 45);
    age_session("session_recent_done", SessionStatus::COMPLETED, 2);

    auto deleted = sessions_->cleanup_old_sessions(30);
    EXPECT_EQ(deleted, (std::vector<std::string>{"session_old_done"}));
    EXPECT_FALSE(persistence_->session_exists("session_old_done"));
    EXPECT_TRUE(persistence_->session_exists("session_old_active"));
    EXPECT_TRUE(persistence_->session_exists("session_recent_done"));

    deleted = sessions_->cleanup_old_sessions(30, true);
    EXPECT_EQ(deleted, (std::vector<std::string>{"session_old_active"}));
}
