#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <fstream>
#include <thread>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "state/state_persistence.hpp"
#include "test_support.hpp"

using namespace harvest;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

class PersistenceTest : public EngineTest {
protected:
    // Session written straight through persistence, no checkpoints
    CollectionSession bare_session(const std::string& id) {
        CollectionSession s;
        s.session_id = id;
        s.venues = {venue("ICML", {2023, 2024})};
        s.created_at = now_utc();
        EXPECT_TRUE(persistence_->init_session_layout(id).ok);
        EXPECT_TRUE(persistence_->save_session_config(s).ok);
        EXPECT_TRUE(persistence_->save_session(s).ok);
        return s;
    }

    CheckpointData sealed_checkpoint(const std::string& session_id, const std::string& id,
                                     TimePoint ts) {
        CheckpointData cp;
        cp.checkpoint_id = id;
        cp.session_id = session_id;
        cp.checkpoint_type = CheckpointType::VENUE_COMPLETED;
        cp.timestamp = ts;
        cp.venues_completed = {{"ICML", 2023}};
        cp.venues_not_started = {{"ICML", 2024}};
        cp.papers_by_venue["ICML"][2023] = 7;
        cp.papers_collected = 7;
        cp.seal();
        return cp;
    }
};

class CompressingPersistenceTest : public PersistenceTest {
protected:
    void configure(EngineConfig& cfg) override { cfg.persistence.compress_threshold_bytes = 0; }
};

} // namespace

TEST_F(PersistenceTest, SessionRoundTrip) {
    auto s = bare_session("session_a");
    auto loaded = persistence_->load_session("session_a");
    ASSERT_TRUE(loaded.ok()) << loaded.error;
    EXPECT_EQ(loaded.value->session_id, "session_a");
    EXPECT_EQ(loaded.value->targets(), s.targets());
    EXPECT_TRUE(persistence_->session_exists("session_a"));

    auto config = persistence_->load_session_config("session_a");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value->at("session_id").get<std::string>(), "session_a");
}

TEST_F(PersistenceTest, UnknownSessionIsNotFound) {
    auto loaded = persistence_->load_session("nope");
    EXPECT_EQ(loaded.status, LoadStatus::NOT_FOUND);
    EXPECT_FALSE(persistence_->session_exists("nope"));
}

TEST_F(PersistenceTest, GarbageStatusFileIsCorrupted) {
    bare_session("session_b");
    std::ofstream(persistence_->session_dir("session_b") / "session_status.json") << "{{{";
    auto loaded = persistence_->load_session("session_b");
    EXPECT_EQ(loaded.status, LoadStatus::CORRUPTED);
    EXPECT_FALSE(loaded.has_value());
}

TEST_F(PersistenceTest, SessionConfigIsWrittenOnce) {
    auto s = bare_session("session_c");
    auto again = persistence_->save_session_config(s);
    EXPECT_FALSE(again.ok);
    EXPECT_NE(again.error.find("already written"), std::string::npos);
}

TEST_F(PersistenceTest, ListSessionsIsSorted) {
    bare_session("session_z");
    bare_session("session_m");
    EXPECT_EQ(persistence_->list_sessions(), (std::vector<std::string>{"session_m", "session_z"}));
}

TEST_F(PersistenceTest, CheckpointRoundTrip) {
    bare_session("session_d");
    auto cp = sealed_checkpoint("session_d", "session_d_cp1", now_utc());
    ASSERT_TRUE(persistence_->save_checkpoint(cp).ok);
    EXPECT_TRUE(fs::exists(persistence_->checkpoint_dir("session_d") / "session_d_cp1.json"));

    auto loaded = persistence_->load_checkpoint("session_d", "session_d_cp1");
    ASSERT_TRUE(loaded.ok()) << loaded.error;
    EXPECT_EQ(loaded.value->validation_status, ValidationStatus::VALID);
    EXPECT_EQ(loaded.value->papers_collected, 7);

    // Lookup by id alone
    auto by_id = persistence_->load_checkpoint("session_d_cp1");
    EXPECT_TRUE(by_id.ok());
}

TEST_F(PersistenceTest, RefusesUnsealedAndDuplicateCheckpoints) {
    bare_session("session_e");
    auto cp = sealed_checkpoint("session_e", "session_e_cp1", now_utc());
    auto unsealed = cp;
    unsealed.checksum.clear();
    EXPECT_FALSE(persistence_->save_checkpoint(unsealed).ok);

    ASSERT_TRUE(persistence_->save_checkpoint(cp).ok);
    EXPECT_FALSE(persistence_->save_checkpoint(cp).ok);
}

TEST_F(PersistenceTest, TamperedCheckpointLoadsAsCorrupted) {
    bare_session("session_f");
    ASSERT_TRUE(persistence_->save_checkpoint(sealed_checkpoint("session_f", "session_f_cp1", now_utc())).ok);
    tamper_checkpoint(*persistence_, "session_f", "session_f_cp1");

    auto loaded = persistence_->load_checkpoint("session_f", "session_f_cp1");
    EXPECT_EQ(loaded.status, LoadStatus::CORRUPTED);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value->validation_status, ValidationStatus::CORRUPTED);

    auto v = persistence_->validate_checkpoint("session_f", "session_f_cp1");
    EXPECT_FALSE(v.is_valid);
    EXPECT_FALSE(v.can_be_used_for_recovery);
}

TEST_F(PersistenceTest, ListsCheckpointsByTimestampNotName) {
    bare_session("session_g");
    auto t0 = now_utc();
    ASSERT_TRUE(persistence_->save_checkpoint(sealed_checkpoint("session_g", "session_g_zzz", t0)).ok);
    ASSERT_TRUE(persistence_->save_checkpoint(
        sealed_checkpoint("session_g", "session_g_aaa", t0 + std::chrono::seconds(1))).ok);

    EXPECT_EQ(persistence_->list_checkpoints_for_session("session_g"),
              (std::vector<std::string>{"session_g_zzz", "session_g_aaa"}));
}

TEST_F(PersistenceTest, ValidationFlagsMissingAndFutureCheckpoints) {
    bare_session("session_h");
    auto missing = persistence_->validate_checkpoint("session_h", "session_h_gone");
    EXPECT_DOUBLE_EQ(missing.integrity_score, 0.0);
    EXPECT_FALSE(missing.can_be_used_for_recovery);

    auto future = sealed_checkpoint("session_h", "session_h_future", now_utc() + std::chrono::hours(2));
    ASSERT_TRUE(persistence_->save_checkpoint(future).ok);
    auto v = persistence_->validate_checkpoint("session_h", "session_h_future");
    EXPECT_FALSE(v.is_valid);
    EXPECT_LT(v.integrity_score, 1.0);
}

TEST_F(PersistenceTest, IntegrityCheckReportsLeftovers) {
    bare_session("session_i");
    ASSERT_TRUE(persistence_->save_checkpoint(sealed_checkpoint("session_i", "session_i_cp1", now_utc())).ok);
    std::ofstream(persistence_->checkpoint_dir("session_i") / "session_i_cp2.json.0badc0de.tmp") << "{\"half";
    std::ofstream(persistence_->session_dir("session_i") / "session_status.json") << "{\"session_id\": ";

    auto results = persistence_->check_data_integrity("session_i");
    bool saw_temp = false, saw_partial_status = false, saw_valid_cp = false;
    for (const auto& r : results) {
        if (r.recovery_action == "discard_temp_file") {
            saw_temp = true;
            EXPECT_EQ(r.status, FileIntegrity::PARTIAL);
        }
        if (r.file == "session_status.json") {
            saw_partial_status = r.status == FileIntegrity::PARTIAL;
        }
        if (r.file == "checkpoints/session_i_cp1.json") saw_valid_cp = r.status == FileIntegrity::VALID;
    }
    EXPECT_TRUE(saw_temp);
    EXPECT_TRUE(saw_partial_status);
    EXPECT_TRUE(saw_valid_cp);
}

TEST_F(PersistenceTest, HalfWrittenStatusTempLeavesPriorVersion) {
    auto s = bare_session("session_torn");
    s.venues_completed = {{"ICML", 2023}};
    s.papers_by_venue["ICML"][2023] = 5;
    s.total_papers_collected = 5;
    ASSERT_TRUE(persistence_->save_session(s).ok);

    // A writer died between writing the temp file and renaming it
    auto dir = persistence_->session_dir("session_torn");
    std::ofstream(dir / "session_status.json.5eed1e55.tmp") << "{\"session_id\": \"session_torn\", \"venues_comp";

    auto loaded = persistence_->load_session("session_torn");
    ASSERT_EQ(loaded.status, LoadStatus::OK) << loaded.error;
    EXPECT_EQ(loaded.value->total_papers_collected, 5);
    EXPECT_EQ(loaded.value->venues_completed, s.venues_completed);
}

TEST_F(PersistenceTest, KilledWriterNeverTearsSessionStatus) {
    auto s = bare_session("session_killed");
    s.total_papers_collected = 5;
    ASSERT_TRUE(persistence_->save_session(s).ok);

    pid_t pid = fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        for (int64_t i = 0; i < 1000000; ++i) {
            s.total_papers_collected = 1000 + i;
            s.papers_by_venue["ICML"][2023] = s.total_papers_collected;
            if (!persistence_->save_session(s).ok) _exit(1);
        }
        _exit(0);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    kill(pid, SIGKILL);
    int wstatus = 0;
    ASSERT_EQ(waitpid(pid, &wstatus, 0), pid);

    auto loaded = persistence_->load_session("session_killed");
    ASSERT_EQ(loaded.status, LoadStatus::OK) << loaded.error;
    auto total = loaded.value->total_papers_collected;
    if (total != 5) {
        EXPECT_GE(total, 1000);
        EXPECT_EQ(loaded.value->papers_by_venue.at("ICML").at(2023), total);
    }
}

TEST_F(PersistenceTest, IntegrityCheckOfUnknownSession) {
    auto results = persistence_->check_data_integrity("ghost");
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, FileIntegrity::MISSING);
}

TEST_F(PersistenceTest, RecoveryPlanRoundTrip) {
    bare_session("session_j");
    RecoveryPlan plan;
    plan.plan_id = "recovery_session_j_1";
    plan.session_id = "session_j";
    plan.created_at = now_utc();
    plan.complexity = RecoveryComplexity::COMPLEX;
    plan.resumption_strategy = ResumptionStrategy::PARTIAL_RESTART;
    plan.optimal_checkpoint_id = "session_j_cp1";
    plan.venues_to_restart = {{"ICML", 2024}};
    plan.confidence_score = 0.85;
    plan.risks = {"Corrupted checkpoints detected (1)"};
    ASSERT_TRUE(persistence_->save_recovery_plan(plan).ok);

    auto loaded = persistence_->load_recovery_plan("session_j", plan.plan_id);
    ASSERT_TRUE(loaded.ok()) << loaded.error;
    EXPECT_EQ(loaded.value->resumption_strategy, ResumptionStrategy::PARTIAL_RESTART);
    EXPECT_EQ(loaded.value->optimal_checkpoint_id, plan.optimal_checkpoint_id);
    EXPECT_EQ(loaded.value->venues_to_restart, plan.venues_to_restart);
    EXPECT_EQ(loaded.value->risks, plan.risks);
}

TEST_F(CompressingPersistenceTest, LargeCheckpointsAreGzipped) {
    bare_session("session_k");
    ASSERT_TRUE(persistence_->save_checkpoint(sealed_checkpoint("session_k", "session_k_cp1", now_utc())).ok);
    EXPECT_TRUE(fs::exists(persistence_->checkpoint_dir("session_k") / "session_k_cp1.json.gz"));

    auto loaded = persistence_->load_checkpoint("session_k", "session_k_cp1");
    EXPECT_TRUE(loaded.ok()) << loaded.error;
    EXPECT_EQ(persistence_->list_checkpoints_for_session("session_k").size(), 1u);
}
