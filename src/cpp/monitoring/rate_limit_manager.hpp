#pragma once
// =============================================================================
// RateLimitManager -- rolling-window limiter with a health multiplier per API
//
// The multiplier starts at 1.0 and moves with every recorded request:
//   success < 1 s    x0.90   (floor 1.0)
//   success < 5 s    x0.95   (floor 1.0)
//   slow success     x1.20   (ceiling 8.0)
//   failure          x1.50   (ceiling 8.0)
// A multiplier above 1.0 shrinks the usable window capacity and stretches
// the wait. Consecutive failures add exponential backoff. No wait exceeds 60 s.
// =============================================================================

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../orchestration/collaborators.hpp"
#include "api_health_monitor.hpp"

namespace harvest {

class RateLimitManager : public RateLimiter {
public:
    static constexpr double MAX_WAIT_SECONDS = 60.0;
    static constexpr double MIN_MULTIPLIER = 1.0;
    static constexpr double MAX_MULTIPLIER = 8.0;

    // `health` may be null; when set every recorded request is forwarded
    explicit RateLimitManager(const std::vector<ApiLimitConfig>& apis,
                              ApiHealthMonitor* health = nullptr);

    // All of these throw std::invalid_argument for an unconfigured API
    bool can_make_request(const std::string& api_name) override;
    double wait_if_needed(const std::string& api_name) override;
    void record_request(const std::string& api_name, bool success, double response_ms) override;

    // nullopt for an unconfigured API
    std::optional<RateLimitSnapshot> current_usage(const std::string& api_name) override;

    RateLimitMap all_usage();

private:
    using SteadyClock = std::chrono::steady_clock;

    struct ApiState {
        ApiLimitConfig config;
        std::mutex mutex;
        std::deque<SteadyClock::time_point> requests;
        double health_multiplier = 1.0;
        int consecutive_failures = 0;

        void expire(SteadyClock::time_point now);
        double seconds_until_next_slot(SteadyClock::time_point now) const;
    };

    ApiState& state_for(const std::string& api_name);

    std::map<std::string, std::unique_ptr<ApiState>> apis_;
    ApiHealthMonitor* health_;
};

} // namespace harvest
