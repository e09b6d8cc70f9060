#pragma once
// Interfaces of the external collaborators driven by the orchestrator.
// The engine owns none of them; defaults live in monitoring/ and sources/,
// tests substitute fakes.
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../state/state_types.hpp"

namespace harvest {

// One collected paper record
struct Paper {
    std::string id;
    std::string title;
    int year = 0;
    std::string venue;
    std::vector<std::string> authors;
    int64_t citations = 0;
    std::string doi;

    nlohmann::json to_json() const {
        return {
            {"id", id}, {"title", title}, {"year", year}, {"venue", venue},
            {"authors", authors}, {"citations", citations}, {"doi", doi}
        };
    }
};

// Paper source for one (venue, year) unit. Throws on failure; the
// orchestrator retries.
class CollectionApi {
public:
    virtual ~CollectionApi() = default;

    virtual std::vector<Paper> collect(const std::string& venue, int year) = 0;
    [[nodiscard]] virtual std::string api_name() const = 0;
};

class HealthMonitor {
public:
    virtual ~HealthMonitor() = default;

    virtual ApiHealthSnapshot get_health_status(const std::string& api_name) = 0;
};

class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    virtual bool can_make_request(const std::string& api_name) = 0;
    // Seconds the caller should sleep before the next request (0 = none)
    virtual double wait_if_needed(const std::string& api_name) = 0;
    virtual void record_request(const std::string& api_name, bool success, double response_ms) = 0;
    virtual std::optional<RateLimitSnapshot> current_usage(const std::string& api_name) = 0;
};

struct QualityReport {
    bool passed = true;
    double issue_ratio = 0.0;
    std::vector<std::string> issues;
};

class QualityMonitor {
public:
    virtual ~QualityMonitor() = default;

    virtual QualityReport check_collection_quality(const std::vector<Paper>& papers,
                                                   const std::string& venue, int year) = 0;
};

} // namespace harvest
