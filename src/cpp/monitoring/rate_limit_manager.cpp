#include "rate_limit_manager.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace harvest {

static constexpr double FAST_RESPONSE_MS = 1000.0;
static constexpr double NORMAL_RESPONSE_MS = 5000.0;

RateLimitManager::RateLimitManager(const std::vector<ApiLimitConfig>& apis, ApiHealthMonitor* health)
    : health_(health) {
    for (const auto& cfg : apis) {
        auto state = std::make_unique<ApiState>();
        state->config = cfg;
        apis_[cfg.name] = std::move(state);
    }
}

RateLimitManager::ApiState& RateLimitManager::state_for(const std::string& api_name) {
    auto it = apis_.find(api_name);
    if (it == apis_.end()) {
        std::string known;
        for (const auto& entry : apis_) known += (known.empty() ? "" : ", ") + entry.first;
        LOG_ERR("[ratelimit] Unknown API '%s' (configured: %s)", api_name.c_str(), known.c_str());
        throw std::invalid_argument("unknown API '" + api_name + "'");
    }
    return *it->second;
}

void RateLimitManager::ApiState::expire(SteadyClock::time_point now) {
    auto window = std::chrono::seconds(config.window_seconds);
    while (!requests.empty() && now - requests.front() >= window) requests.pop_front();
}

double RateLimitManager::ApiState::seconds_until_next_slot(SteadyClock::time_point now) const {
    if (static_cast<int>(requests.size()) < config.requests_per_window || requests.empty()) return 0.0;
    auto free_at = requests.front() + std::chrono::seconds(config.window_seconds);
    if (free_at <= now) return 0.0;
    return std::chrono::duration<double>(free_at - now).count();
}

bool RateLimitManager::can_make_request(const std::string& api_name) {
    auto& s = state_for(api_name);
    std::lock_guard<std::mutex> guard(s.mutex);
    s.expire(SteadyClock::now());

    int available = s.config.requests_per_window - static_cast<int>(s.requests.size());
    if (s.health_multiplier > 1.0) {
        // Degraded API: less of the window is usable
        available = static_cast<int>(available / s.health_multiplier);
    }
    return available >= 1;
}

double RateLimitManager::wait_if_needed(const std::string& api_name) {
    auto& s = state_for(api_name);
    std::lock_guard<std::mutex> guard(s.mutex);
    auto now = SteadyClock::now();
    s.expire(now);

    double backoff = 0.0;
    if (s.consecutive_failures > 0) {
        backoff = s.config.base_delay_seconds * std::pow(2.0, s.consecutive_failures);
        backoff = std::min(backoff, s.config.max_delay_seconds);
    }
    double window_wait = s.seconds_until_next_slot(now) * s.health_multiplier;
    double wait = std::min(std::max(window_wait, backoff), MAX_WAIT_SECONDS);

    if (wait > 0.0) {
        LOG_INF("[ratelimit] %s: waiting %.2fs (multiplier %.2f, %d consecutive failures)",
            api_name.c_str(), wait, s.health_multiplier, s.consecutive_failures);
    }
    return wait;
}

void RateLimitManager::record_request(const std::string& api_name, bool success, double response_ms) {
    auto& s = state_for(api_name);
    {
        std::lock_guard<std::mutex> guard(s.mutex);
        auto now = SteadyClock::now();
        s.expire(now);
        s.requests.push_back(now);

        double m = s.health_multiplier;
        if (!success) {
            s.consecutive_failures += 1;
            m = std::min(MAX_MULTIPLIER, m * 1.5);
        } else {
            s.consecutive_failures = 0;
            if (response_ms < FAST_RESPONSE_MS) {
                m = std::max(MIN_MULTIPLIER, m * 0.9);
            } else if (response_ms < NORMAL_RESPONSE_MS) {
                m = std::max(MIN_MULTIPLIER, m * 0.95);
            } else {
                m = std::min(MAX_MULTIPLIER, m * 1.2);
            }
        }
        s.health_multiplier = m;
        LOG_DBG("[ratelimit] %s: %s in %.0f ms, multiplier %.2f", api_name.c_str(),
            success ? "ok" : "failed", response_ms, m);
    }
    if (health_) health_->record(api_name, success, response_ms);
}

std::optional<RateLimitSnapshot> RateLimitManager::current_usage(const std::string& api_name) {
    auto it = apis_.find(api_name);
    if (it == apis_.end()) return std::nullopt;

    auto& s = *it->second;
    std::lock_guard<std::mutex> guard(s.mutex);
    s.expire(SteadyClock::now());

    RateLimitSnapshot snap;
    snap.api_name = api_name;
    snap.requests_in_window = static_cast<int>(s.requests.size());
    snap.window_capacity = s.config.requests_per_window;
    snap.health_multiplier = s.health_multiplier;
    snap.current_delay_seconds =
        std::min(s.config.base_delay_seconds * s.health_multiplier, s.config.max_delay_seconds);
    return snap;
}

RateLimitMap RateLimitManager::all_usage() {
    RateLimitMap out;
    for (const auto& entry : apis_) {
        auto usage = current_usage(entry.first);
        if (usage) out[entry.first] = *usage;
    }
    return out;
}

} // namespace harvest
