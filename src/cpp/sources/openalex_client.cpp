#include "openalex_client.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace harvest {

static size_t oa_write_cb(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::string url_escape(CURL* curl, const std::string& s) {
    char* escaped = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
    if (!escaped) throw std::runtime_error("cannot escape '" + s + "'");
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

CurlGlobal::CurlGlobal() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
    LOG_DBG("[openalex] libcurl %s initialized", curl_version_info(CURLVERSION_NOW)->version);
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

OpenAlexClient::OpenAlexClient(const OpenAlexConfig& config) : config_(config) {}

std::string OpenAlexClient::build_works_url(const std::string& venue, int year) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("curl_easy_init failed");

    int per_page = std::min(std::max(config_.per_page, 1), MAX_PER_PAGE);
    std::string url = config_.base_url + "/works?search=" + url_escape(curl, venue) +
                      "&filter=publication_year:" + std::to_string(year) +
                      "&per-page=" + std::to_string(per_page) +
                      "&select=id,title,display_name,publication_year,cited_by_count,doi,authorships,locations";
    if (!config_.mailto.empty()) url += "&mailto=" + url_escape(curl, config_.mailto);
    curl_easy_cleanup(curl);
    return url;
}

std::string OpenAlexClient::http_get(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("curl_easy_init failed");

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, oa_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "paper-harvest/1.0");

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("openalex connection error: ") + curl_easy_strerror(res));
    }
    if (http_code == 429) {
        throw std::runtime_error("openalex rate limit exceeded (http 429)");
    }
    if (http_code != 200) {
        throw std::runtime_error("openalex api error: http " + std::to_string(http_code));
    }
    return response;
}

std::vector<Paper> OpenAlexClient::parse_works_response(const std::string& body,
                                                        const std::string& venue, int year) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("openalex response is not JSON: ") + e.what());
    }
    if (!j.is_object() || !j.contains("results") || !j["results"].is_array()) {
        throw std::runtime_error("openalex response has no results array");
    }

    std::vector<Paper> papers;
    for (const auto& work : j["results"]) {
        if (!work.is_object()) continue;
        Paper p;
        if (work.contains("id") && work["id"].is_string()) p.id = work["id"].get<std::string>();
        // display_name is the current field, title the legacy one
        if (work.contains("display_name") && work["display_name"].is_string()) {
            p.title = work["display_name"].get<std::string>();
        } else if (work.contains("title") && work["title"].is_string()) {
            p.title = work["title"].get<std::string>();
        }
        p.year = work.contains("publication_year") && work["publication_year"].is_number_integer()
                     ? work["publication_year"].get<int>()
                     : year;
        p.venue = venue;
        if (work.contains("cited_by_count") && work["cited_by_count"].is_number_integer()) {
            p.citations = work["cited_by_count"].get<int64_t>();
        }
        if (work.contains("doi") && work["doi"].is_string()) p.doi = work["doi"].get<std::string>();

        if (work.contains("authorships") && work["authorships"].is_array()) {
            for (const auto& a : work["authorships"]) {
                if (!a.is_object() || !a.contains("author") || !a["author"].is_object()) continue;
                const auto& author = a["author"];
                if (author.contains("display_name") && author["display_name"].is_string()) {
                    std::string name = author["display_name"].get<std::string>();
                    if (!name.empty()) p.authors.push_back(name);
                }
            }
        }
        papers.push_back(std::move(p));
    }
    return papers;
}

std::vector<Paper> OpenAlexClient::synthetic_papers(const std::string& venue, int year) const {
    std::vector<Paper> papers;
    for (int i = 0; i < 3; ++i) {
        Paper p;
        p.id = "dry-" + venue + "-" + std::to_string(year) + "-" + std::to_string(i);
        p.title = venue + " " + std::to_string(year) + " paper " + std::to_string(i);
        p.year = year;
        p.venue = venue;
        p.authors = {"Dry Run"};
        papers.push_back(std::move(p));
    }
    return papers;
}

std::vector<Paper> OpenAlexClient::collect(const std::string& venue, int year) {
    if (config_.dry_run) {
        LOG_DBG("[openalex] DRY RUN: %s/%d", venue.c_str(), year);
        return synthetic_papers(venue, year);
    }

    std::string url = build_works_url(venue, year);
    LOG_DBG("[openalex] GET %s", url.c_str());
    auto papers = parse_works_response(http_get(url), venue, year);
    LOG_INF("[openalex] %s/%d: %zu papers", venue.c_str(), year, papers.size());
    return papers;
}

} // namespace harvest
