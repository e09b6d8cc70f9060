#pragma once
// =============================================================================
// ApiHealthMonitor -- per-API sliding history of request outcomes
//
// Classification (success rate over the last 100 requests):
//   healthy   >= 0.95 and fewer than 5 consecutive errors
//   degraded  >= 0.80
//   critical  >= 0.50
//   offline   below that, or 10+ consecutive errors
// =============================================================================

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "../orchestration/collaborators.hpp"

namespace harvest {

class ApiHealthMonitor : public HealthMonitor {
public:
    static constexpr size_t HISTORY_SIZE = 100;
    static constexpr int CRITICAL_CONSECUTIVE_ERRORS = 5;
    static constexpr int OFFLINE_CONSECUTIVE_ERRORS = 10;

    void record(const std::string& api_name, bool success, double response_ms);

    // An API with no history is reported healthy
    ApiHealthSnapshot get_health_status(const std::string& api_name) override;

    ApiHealthMap all_statuses();
    std::vector<std::string> known_apis();

private:
    struct Sample {
        bool success;
        double response_ms;
    };
    struct History {
        std::deque<Sample> samples;
        int consecutive_errors = 0;
    };

    static ApiHealthSnapshot classify(const std::string& api_name, const History& h);

    std::mutex mutex_;
    std::map<std::string, History> history_;
};

} // namespace harvest
