#pragma once
// OpenAlex paper source (public /works endpoint)
//
// One request per (venue, year): full-text search on the venue name,
// filtered to the publication year. Transport errors, non-200 responses and
// malformed bodies throw std::runtime_error so the orchestrator can retry.
#include <string>
#include <vector>

#include "../config.hpp"
#include "../orchestration/collaborators.hpp"

namespace harvest {

// libcurl process-wide setup. Create one in main before any thread can
// reach curl_easy_init; cleanup runs when it goes out of scope.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

class OpenAlexClient : public CollectionApi {
public:
    static constexpr int MAX_PER_PAGE = 200;

    explicit OpenAlexClient(const OpenAlexConfig& config);

    std::vector<Paper> collect(const std::string& venue, int year) override;
    [[nodiscard]] std::string api_name() const override { return "openalex"; }

    // Request URL for one unit (query string escaped)
    std::string build_works_url(const std::string& venue, int year) const;

    // Parses a /works response body. Papers are attributed to the requested
    // venue; missing titles stay empty for the quality gate to flag.
    static std::vector<Paper> parse_works_response(const std::string& body,
                                                   const std::string& venue, int year);

private:
    std::string http_get(const std::string& url) const;
    std::vector<Paper> synthetic_papers(const std::string& venue, int year) const;

    OpenAlexConfig config_;
};

} // namespace harvest
