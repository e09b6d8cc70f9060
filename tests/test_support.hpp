#pragma once
// Shared fixtures: a throwaway state directory and a wired-up engine
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "state/checkpoint_manager.hpp"
#include "state/session_lock_table.hpp"
#include "state/session_manager.hpp"
#include "state/state_persistence.hpp"
#include "utils/atomic_file.hpp"
#include "utils/id_util.hpp"
#include "utils/logger.hpp"

namespace harvest {

class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("harvest_test_" + random_hex(12));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline VenueConfig venue(const std::string& name, std::vector<int> years, int priority = 1) {
    VenueConfig v;
    v.name = name;
    v.years = std::move(years);
    v.priority = priority;
    return v;
}

// Rewrites papers_collected in a stored checkpoint without resealing it
inline void tamper_checkpoint(StatePersistence& persistence, const std::string& session_id,
                              const std::string& checkpoint_id) {
    auto path = persistence.checkpoint_dir(session_id) / (checkpoint_id + ".json");
    std::string content;
    ASSERT_TRUE(read_file(path, content).ok) << path;
    auto j = nlohmann::json::parse(content);
    j["papers_collected"] = j["papers_collected"].get<int64_t>() + 1000;
    ASSERT_TRUE(write_file_atomic(path, j.dump(2)).ok);
}

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_log_level = LogLevel::ERROR;
        config_.persistence.state_dir = dir_.path().string();
        configure(config_);
        persistence_ = std::make_unique<StatePersistence>(config_, locks_);
        checkpoints_ = std::make_unique<CheckpointManager>(*persistence_, config_.checkpoints);
        sessions_ = std::make_unique<SessionManager>(*persistence_, *checkpoints_, config_);
    }

    virtual void configure(EngineConfig&) {}

    // ICML 2023/2024 and NeurIPS 2023
    CollectionSession make_session(const std::string& id = "session_test") {
        return sessions_->create_session({venue("ICML", {2023, 2024}), venue("NeurIPS", {2023})},
                                         nlohmann::json::object(), id);
    }

    TempDir dir_;
    EngineConfig config_;
    SessionLockTable locks_;
    std::unique_ptr<StatePersistence> persistence_;
    std::unique_ptr<CheckpointManager> checkpoints_;
    std::unique_ptr<SessionManager> sessions_;
};

} // namespace harvest
