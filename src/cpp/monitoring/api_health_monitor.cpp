#include "api_health_monitor.hpp"
#include "../utils/logger.hpp"

namespace harvest {

void ApiHealthMonitor::record(const std::string& api_name, bool success, double response_ms) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto& h = history_[api_name];
    ApiStatus before = classify(api_name, h).status;

    h.samples.push_back({success, response_ms});
    while (h.samples.size() > HISTORY_SIZE) h.samples.pop_front();
    h.consecutive_errors = success ? 0 : h.consecutive_errors + 1;

    ApiStatus after = classify(api_name, h).status;
    if (after != before) {
        LOG_WRN("[health] %s: %s -> %s", api_name.c_str(), api_status_str(before), api_status_str(after));
    }
}

ApiHealthSnapshot ApiHealthMonitor::classify(const std::string& api_name, const History& h) {
    ApiHealthSnapshot s;
    s.api_name = api_name;
    s.consecutive_errors = h.consecutive_errors;
    if (h.samples.empty()) return s;

    size_t ok = 0;
    double total_ms = 0.0;
    for (const auto& sample : h.samples) {
        if (sample.success) ++ok;
        total_ms += sample.response_ms;
    }
    s.success_rate = static_cast<double>(ok) / static_cast<double>(h.samples.size());
    s.avg_response_ms = total_ms / static_cast<double>(h.samples.size());

    if (h.consecutive_errors >= OFFLINE_CONSECUTIVE_ERRORS) {
        s.status = ApiStatus::OFFLINE;
    } else if (s.success_rate >= 0.95 && h.consecutive_errors < CRITICAL_CONSECUTIVE_ERRORS) {
        s.status = ApiStatus::HEALTHY;
    } else if (s.success_rate >= 0.8) {
        s.status = ApiStatus::DEGRADED;
    } else if (s.success_rate >= 0.5) {
        s.status = ApiStatus::CRITICAL;
    } else {
        s.status = ApiStatus::OFFLINE;
    }
    return s;
}

ApiHealthSnapshot ApiHealthMonitor::get_health_status(const std::string& api_name) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = history_.find(api_name);
    if (it == history_.end()) return classify(api_name, History{});
    return classify(api_name, it->second);
}

ApiHealthMap ApiHealthMonitor::all_statuses() {
    std::lock_guard<std::mutex> guard(mutex_);
    ApiHealthMap out;
    for (const auto& [name, h] : history_) out[name] = classify(name, h);
    return out;
}

std::vector<std::string> ApiHealthMonitor::known_apis() {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : history_) names.push_back(entry.first);
    return names;
}

} // namespace harvest
