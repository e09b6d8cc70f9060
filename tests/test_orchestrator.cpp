#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

#include "orchestration/collection_orchestrator.hpp"
#include "test_support.hpp"

using namespace harvest;

namespace {

std::vector<Paper> papers_for(const std::string& venue, int year, int n) {
    std::vector<Paper> out;
    for (int i = 0; i < n; ++i) {
        Paper p;
        p.id = venue + "-" + std::to_string(year) + "-" + std::to_string(i);
        p.title = "Paper " + std::to_string(i);
        p.venue = venue;
        p.year = year;
        out.push_back(p);
    }
    return out;
}

class FakeApi : public CollectionApi {
public:
    using Behavior = std::function<std::vector<Paper>(const std::string&, int)>;

    explicit FakeApi(Behavior behavior, int delay_ms = 5)
        : behavior_(std::move(behavior)), delay_ms_(delay_ms) {}

    std::vector<Paper> collect(const std::string& venue, int year) override {
        struct InFlight {
            std::atomic<int>& n;
            ~InFlight() { --n; }
        } in_flight{in_flight_};
        int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {}
        {
            std::lock_guard<std::mutex> guard(mutex_);
            calls_[{venue, year}] += 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        return behavior_(venue, year);
    }

    std::string api_name() const override { return "fake"; }

    int calls(const VenueKey& key) {
        std::lock_guard<std::mutex> guard(mutex_);
        return calls_[key];
    }
    int max_in_flight() const { return max_in_flight_.load(); }

private:
    Behavior behavior_;
    int delay_ms_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
    std::mutex mutex_;
    std::map<VenueKey, int> calls_;
};

class FakeRateLimiter : public RateLimiter {
public:
    bool can_make_request(const std::string&) override { return true; }

    double wait_if_needed(const std::string&) override {
        if (fail_on_wait) throw std::runtime_error("rate limiter state lost");
        return 0.0;
    }

    void record_request(const std::string&, bool success, double) override {
        (success ? successes : failures) += 1;
    }

    std::optional<RateLimitSnapshot> current_usage(const std::string& api_name) override {
        RateLimitSnapshot s;
        s.api_name = api_name;
        s.window_capacity = 100;
        return s;
    }

    std::atomic<bool> fail_on_wait{false};
    std::atomic<int> successes{0};
    std::atomic<int> failures{0};
};

class FakeHealthMonitor : public HealthMonitor {
public:
    ApiHealthSnapshot get_health_status(const std::string& api_name) override {
        std::lock_guard<std::mutex> guard(mutex_);
        ApiHealthSnapshot s = status_;
        s.api_name = api_name;
        return s;
    }

    void set_avg_response(double ms) {
        std::lock_guard<std::mutex> guard(mutex_);
        status_.avg_response_ms = ms;
    }

private:
    std::mutex mutex_;
    ApiHealthSnapshot status_;
};

class FakeQualityMonitor : public QualityMonitor {
public:
    QualityReport check_collection_quality(const std::vector<Paper>&, const std::string& venue,
                                           int) override {
        QualityReport r;
        if (rejected_venues.count(venue)) {
            r.passed = false;
            r.issue_ratio = 1.0;
            r.issues.push_back("all titles empty");
        }
        return r;
    }

    std::set<std::string> rejected_venues;
};

class OrchestratorTest : public EngineTest {
protected:
    void SetUp() override {
        EngineTest::SetUp();
        orch_config_.max_concurrent_venues = 2;
        orch_config_.min_concurrency = 1;
        orch_config_.max_concurrency = 4;
        orch_config_.max_retry_attempts = 3;
        orch_config_.retry_delay_ms = 1;
        orch_config_.max_retry_delay_ms = 4;
        orch_config_.checkpoint_interval_ms = 60000;
        orch_config_.health_check_interval_ms = 60000;
        orch_config_.resource_optimization_interval_ms = 60000;
        orch_config_.enable_adaptive_scaling = false;
        orch_config_.shutdown_grace_ms = 2000;
        orch_config_.slot_poll_min_ms = 1;
        orch_config_.slot_poll_max_ms = 5;
    }

    // Five units, collected in this order: A/2020 A/2021 B/2020 B/2021 C/2020
    CollectionSession five_unit_session() {
        return sessions_->create_session({venue("A", {2020, 2021}), venue("B", {2020, 2021}),
                                          venue("C", {2020})},
                                         nlohmann::json::object(), "session_orch");
    }

    std::unique_ptr<CollectionOrchestrator> make_orchestrator(CollectionApi& api) {
        Collaborators deps{&api, &limiter_, &health_, &quality_};
        return std::make_unique<CollectionOrchestrator>(*checkpoints_, orch_config_, deps, &stop_);
    }

    static std::vector<Paper> ten_papers(const std::string& venue, int year) {
        return papers_for(venue, year, 10);
    }

    OrchestrationConfig orch_config_;
    FakeRateLimiter limiter_;
    FakeHealthMonitor health_;
    FakeQualityMonitor quality_;
    std::atomic<bool> stop_{false};
};

} // namespace

TEST_F(OrchestratorTest, OneFailingUnitDoesNotStopTheOthers) {
    const VenueKey third{"B", 2020};
    FakeApi api([&third](const std::string& v, int y) {
        if (VenueKey{v, y} == third) throw std::runtime_error("upstream returned http 503");
        return ten_papers(v, y);
    }, 20);
    auto orch = make_orchestrator(api);
    auto session = five_unit_session();

    auto results = orch->coordinate_session(session);

    EXPECT_EQ(results.failed_venues, (VenueSet{third}));
    ASSERT_TRUE(results.failure_messages.count(third));
    EXPECT_NE(results.failure_messages.at(third).find("http 503"), std::string::npos);
    EXPECT_EQ(results.completed_venues,
              (VenueSet{{"A", 2020}, {"A", 2021}, {"B", 2021}, {"C", 2020}}));
    EXPECT_TRUE(results.unfinished_venues.empty());
    EXPECT_EQ(results.total_papers, 40);
    EXPECT_EQ(results.units_submitted, 5);
    EXPECT_EQ(results.retries, 3);
    EXPECT_EQ(results.final_status, SessionStatus::COMPLETED);

    EXPECT_EQ(api.calls(third), 4);
    EXPECT_EQ(api.calls({"A", 2020}), 1);
    EXPECT_LE(api.max_in_flight(), 2);
    EXPECT_EQ(limiter_.failures.load(), 4);
    EXPECT_EQ(limiter_.successes.load(), 4);

    auto on_disk = persistence_->load_session(session.session_id);
    ASSERT_TRUE(on_disk.ok());
    EXPECT_EQ(on_disk.value->venues_failed, (VenueSet{third}));
    EXPECT_EQ(on_disk.value->venues_completed.size(), 4u);
    EXPECT_EQ(on_disk.value->status, SessionStatus::COMPLETED);
    EXPECT_TRUE(on_disk.value->venues_in_progress.empty());
}

TEST_F(OrchestratorTest, PhasesRunInOrder) {
    FakeApi api(ten_papers);
    auto orch = make_orchestrator(api);
    auto session = five_unit_session();
    auto results = orch->coordinate_session(session);

    EXPECT_EQ(results.phases, (std::vector<WorkflowPhase>{WorkflowPhase::INITIALIZATION,
                                                          WorkflowPhase::API_SETUP,
                                                          WorkflowPhase::COLLECTION,
                                                          WorkflowPhase::PROCESSING,
                                                          WorkflowPhase::COMPLETION}));
    EXPECT_EQ(orch->phase(), WorkflowPhase::COMPLETION);
    EXPECT_EQ(results.components.size(), 6u);
    EXPECT_TRUE(orch->latest_api_health().count("fake"));
}

TEST_F(OrchestratorTest, QualityRejectionFailsTheUnit) {
    quality_.rejected_venues.insert("C");
    FakeApi api(ten_papers);
    auto orch = make_orchestrator(api);
    auto session = five_unit_session();
    auto results = orch->coordinate_session(session);

    EXPECT_EQ(results.failed_venues, (VenueSet{{"C", 2020}}));
    EXPECT_NE(results.failure_messages.at({"C", 2020}).find("quality check failed"), std::string::npos);
    EXPECT_EQ(api.calls({"C", 2020}), 4);
}

TEST_F(OrchestratorTest, AllUnitsFailingFailsTheSession) {
    FakeApi api([](const std::string&, int) -> std::vector<Paper> {
        throw std::runtime_error("openalex connection error");
    }, 1);
    orch_config_.max_retry_attempts = 1;
    auto orch = make_orchestrator(api);
    auto session = five_unit_session();
    auto results = orch->coordinate_session(session);

    EXPECT_EQ(results.failed_venues.size(), 5u);
    EXPECT_EQ(results.final_status, SessionStatus::FAILED);
}

TEST_F(OrchestratorTest, FiltersLimitTheUnitsAndLeaveSessionPaused) {
    FakeApi api(ten_papers);
    auto orch = make_orchestrator(api);
    auto session = five_unit_session();

    auto results = orch->coordinate_session(session, {"B"});
    EXPECT_EQ(results.units_submitted, 2);
    EXPECT_EQ(results.completed_venues, (VenueSet{{"B", 2020}, {"B", 2021}}));
    EXPECT_EQ(results.final_status, SessionStatus::PAUSED);
    EXPECT_EQ(results.unfinished_venues.size(), 3u);

    results = orch->coordinate_session(session, {}, {2021});
    EXPECT_EQ(results.units_submitted, 1);
    EXPECT_TRUE(results.completed_venues.count({"A", 2021}));

    EXPECT_THROW(orch->coordinate_session(session, {"Z"}), std::invalid_argument);
    EXPECT_THROW(orch->coordinate_session(session, {}, {1999}), std::invalid_argument);
}

TEST_F(OrchestratorTest, CompletedUnitsAreNotCollectedAgain) {
    FakeApi api(ten_papers);
    auto orch = make_orchestrator(api);
    auto session = five_unit_session();
    orch->coordinate_session(session);

    auto again = orch->coordinate_session(session);
    EXPECT_EQ(again.units_submitted, 0);
    EXPECT_EQ(again.final_status, SessionStatus::COMPLETED);
    EXPECT_EQ(api.calls({"A", 2020}), 1);
}

TEST_F(OrchestratorTest, StopFlagInterruptsTheSession) {
    orch_config_.max_concurrent_venues = 1;
    std::atomic<bool>* stop = &stop_;
    FakeApi api([stop](const std::string& v, int y) {
        stop->store(true);
        return ten_papers(v, y);
    });
    auto orch = make_orchestrator(api);
    auto session = five_unit_session();
    auto results = orch->coordinate_session(session);

    EXPECT_TRUE(results.stopped);
    EXPECT_EQ(results.final_status, SessionStatus::INTERRUPTED);
    EXPECT_EQ(results.units_submitted, 1);
    EXPECT_EQ(results.completed_venues, (VenueSet{{"A", 2020}}));
    EXPECT_EQ(results.unfinished_venues.size(), 4u);
    EXPECT_EQ(persistence_->load_session(session.session_id).value->status, SessionStatus::INTERRUPTED);
}

TEST_F(OrchestratorTest, UncontainedErrorEscalatesAndFailsTheSession) {
    limiter_.fail_on_wait = true;
    FakeApi api(ten_papers);
    auto orch = make_orchestrator(api);
    auto session = five_unit_session();

    EXPECT_THROW(orch->coordinate_session(session), std::runtime_error);
    EXPECT_EQ(orch->phase(), WorkflowPhase::ERROR_RECOVERY);
    EXPECT_EQ(session.status, SessionStatus::FAILED);
    EXPECT_EQ(api.calls({"A", 2020}), 0);

    auto latest = checkpoints_->load_latest_checkpoint(session.session_id);
    ASSERT_TRUE(latest.ok()) << latest.error;
    EXPECT_EQ(latest.value->checkpoint_type, CheckpointType::ERROR_OCCURRED);
    ASSERT_TRUE(latest.value->error_context.has_value());
    EXPECT_EQ(latest.value->error_context->error_type, "workflow_error");
    EXPECT_NE(latest.value->error_context->error_message.find("rate limiter state lost"), std::string::npos);
    EXPECT_EQ(latest.value->error_context->operation, "collection");

    auto on_disk = persistence_->load_session(session.session_id);
    ASSERT_TRUE(on_disk.ok());
    EXPECT_EQ(on_disk.value->status, SessionStatus::FAILED);
    EXPECT_TRUE(on_disk.value->venues_failed.empty());
}

TEST_F(OrchestratorTest, PeriodicCheckpointLoopWritesSnapshots) {
    orch_config_.max_concurrent_venues = 1;
    orch_config_.checkpoint_interval_ms = 5;
    FakeApi api(ten_papers, 40);
    auto orch = make_orchestrator(api);
    auto session = five_unit_session();
    orch->coordinate_session(session);

    // session_started + initial + one per unit + final, plus the loop's
    EXPECT_GT(session.checkpoint_count, 1 + 1 + 5 + 1);
}

TEST_F(OrchestratorTest, BusyLoopsAndWorkersShareTheSession) {
    orch_config_.max_concurrent_venues = 4;
    orch_config_.checkpoint_interval_ms = 1;
    orch_config_.health_check_interval_ms = 1;
    std::vector<VenueConfig> venues;
    for (const char* name : {"AAAI", "ACL", "CVPR", "ICLR", "ICML", "IJCAI", "KDD", "NeurIPS"}) {
        venues.push_back(venue(name, {2020, 2021, 2022, 2023}));
    }
    // Long enough to live on the heap
    const std::string id = make_session_id(now_utc());
    ASSERT_GT(id.size(), 16u);
    auto session = sessions_->create_session(venues, nlohmann::json::object(), id);
    FakeApi api([](const std::string& v, int y) { return papers_for(v, y, 3); }, 1);
    auto orch = make_orchestrator(api);

    auto results = orch->coordinate_session(session);

    EXPECT_EQ(session.session_id, id);
    EXPECT_EQ(results.session_id, id);
    EXPECT_EQ(results.completed_venues.size(), 32u);
    EXPECT_TRUE(results.failed_venues.empty());
    EXPECT_EQ(results.total_papers, 96);
    EXPECT_EQ(results.final_status, SessionStatus::COMPLETED);
    EXPECT_LE(api.max_in_flight(), 4);

    auto on_disk = persistence_->load_session(id);
    ASSERT_TRUE(on_disk.ok());
    EXPECT_EQ(on_disk.value->venues_completed.size(), 32u);
    for (const auto& c : orch->component_health()) {
        if (c.name == "state_manager") EXPECT_TRUE(c.healthy);
    }
}

TEST_F(OrchestratorTest, VenueCapTruncatesCollectedPapers) {
    auto capped = venue("A", {2020, 2021});
    capped.max_papers_per_year = 3;
    auto session = sessions_->create_session({capped, venue("B", {2020})}, nlohmann::json::object(),
                                             "session_capped");
    FakeApi api(ten_papers);
    auto orch = make_orchestrator(api);

    auto results = orch->coordinate_session(session);

    EXPECT_EQ(results.final_status, SessionStatus::COMPLETED);
    EXPECT_EQ(results.papers_by_venue.at("A").at(2020), 3);
    EXPECT_EQ(results.papers_by_venue.at("A").at(2021), 3);
    EXPECT_EQ(results.papers_by_venue.at("B").at(2020), 10);
    EXPECT_EQ(results.total_papers, 16);
}

TEST_F(OrchestratorTest, AdaptiveConcurrencyFollowsResponseTimes) {
    orch_config_.enable_adaptive_scaling = true;
    orch_config_.max_concurrent_venues = 3;
    FakeApi api(ten_papers);
    auto orch = make_orchestrator(api);
    EXPECT_EQ(orch->concurrency(), 3);

    // No response data yet
    EXPECT_EQ(orch->optimize_resource_allocation(), 3);

    health_.set_avg_response(8000.0);
    EXPECT_EQ(orch->optimize_resource_allocation(), 2);
    EXPECT_EQ(orch->optimize_resource_allocation(), 1);
    EXPECT_EQ(orch->optimize_resource_allocation(), 1);

    health_.set_avg_response(200.0);
    EXPECT_EQ(orch->optimize_resource_allocation(), 2);
    EXPECT_EQ(orch->optimize_resource_allocation(), 3);
    EXPECT_EQ(orch->optimize_resource_allocation(), 4);
    EXPECT_EQ(orch->optimize_resource_allocation(), 4);

    health_.set_avg_response(3000.0);
    EXPECT_EQ(orch->optimize_resource_allocation(), 4);
}

TEST_F(OrchestratorTest, ScalingDisabledKeepsConcurrency) {
    health_.set_avg_response(8000.0);
    FakeApi api(ten_papers);
    auto orch = make_orchestrator(api);
    EXPECT_EQ(orch->optimize_resource_allocation(), 2);
}

TEST_F(OrchestratorTest, ConcurrencyIsClampedAtConstruction) {
    orch_config_.max_concurrent_venues = 50;
    FakeApi api(ten_papers);
    EXPECT_EQ(make_orchestrator(api)->concurrency(), 4);
}

TEST_F(OrchestratorTest, MissingCollaboratorIsRejected) {
    FakeApi api(ten_papers);
    Collaborators deps{&api, &limiter_, nullptr, &quality_};
    EXPECT_THROW(CollectionOrchestrator orch(*checkpoints_, orch_config_, deps, &stop_),
                 std::invalid_argument);
}
