#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "monitoring/quality_monitor.hpp"
#include "sources/openalex_client.hpp"
#include "utils/logger.hpp"

using namespace harvest;

namespace {

const char* SAMPLE_BODY = R"({
  "meta": {"count": 3, "per_page": 50},
  "results": [
    {
      "id": "https://openalex.org/W4385245566",
      "display_name": "Scaling Laws for Reward Model Overoptimization",
      "publication_year": 2023,
      "cited_by_count": 212,
      "doi": "https://doi.org/10.5555/3618408.3618845",
      "authorships": [
        {"author": {"display_name": "Leo Gao"}},
        {"author": {"display_name": ""}},
        {"author": null},
        {"author": {"display_name": "Jacob Hilton"}}
      ]
    },
    {
      "id": null,
      "display_name": null,
      "title": "A Legacy Title",
      "authorships": []
    },
    "not an object"
  ]
})";

class OpenAlexTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_log_level = LogLevel::ERROR;
        config_.base_url = "https://api.openalex.org";
    }

    OpenAlexConfig config_;
};

} // namespace

TEST_F(OpenAlexTest, ParsesWorks) {
    auto papers = OpenAlexClient::parse_works_response(SAMPLE_BODY, "ICML", 2023);
    ASSERT_EQ(papers.size(), 2u);

    const auto& first = papers[0];
    EXPECT_EQ(first.id, "https://openalex.org/W4385245566");
    EXPECT_EQ(first.title, "Scaling Laws for Reward Model Overoptimization");
    EXPECT_EQ(first.year, 2023);
    EXPECT_EQ(first.venue, "ICML");
    EXPECT_EQ(first.citations, 212);
    EXPECT_EQ(first.doi, "https://doi.org/10.5555/3618408.3618845");
    EXPECT_EQ(first.authors, (std::vector<std::string>{"Leo Gao", "Jacob Hilton"}));

    const auto& second = papers[1];
    EXPECT_TRUE(second.id.empty());
    EXPECT_EQ(second.title, "A Legacy Title");
    EXPECT_EQ(second.year, 2023);
    EXPECT_EQ(second.citations, 0);
    EXPECT_TRUE(second.authors.empty());
}

TEST_F(OpenAlexTest, RejectsMalformedBodies) {
    EXPECT_THROW(OpenAlexClient::parse_works_response("<html>502</html>", "ICML", 2023),
                 std::runtime_error);
    EXPECT_THROW(OpenAlexClient::parse_works_response(R"({"meta": {}})", "ICML", 2023),
                 std::runtime_error);
    EXPECT_THROW(OpenAlexClient::parse_works_response(R"({"results": {}})", "ICML", 2023),
                 std::runtime_error);
    EXPECT_TRUE(OpenAlexClient::parse_works_response(R"({"results": []})", "ICML", 2023).empty());
}

TEST_F(OpenAlexTest, BuildsEscapedWorksUrl) {
    config_.per_page = 500;
    config_.mailto = "harvest@example.org";
    OpenAlexClient client(config_);

    auto url = client.build_works_url("Neural Information Processing Systems", 2022);
    EXPECT_EQ(url.rfind("https://api.openalex.org/works?search=Neural%20Information%20Processing%20Systems", 0), 0u)
        << url;
    EXPECT_NE(url.find("filter=publication_year:2022"), std::string::npos);
    EXPECT_NE(url.find("per-page=200"), std::string::npos);
    EXPECT_NE(url.find("mailto=harvest%40example.org"), std::string::npos);
}

TEST_F(OpenAlexTest, NoMailtoWhenUnset) {
    OpenAlexClient client(config_);
    auto url = client.build_works_url("ICML", 2023);
    EXPECT_EQ(url.find("mailto"), std::string::npos);
    EXPECT_NE(url.find("per-page=50"), std::string::npos);
}

TEST_F(OpenAlexTest, WorkersShareOneCurlInitialization) {
    CurlGlobal curl;
    OpenAlexClient client(config_);

    std::atomic<int> good{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&client, &good, t] {
            for (int i = 0; i < 50; ++i) {
                auto url = client.build_works_url("Venue " + std::to_string(t), 2000 + i);
                if (url.find("filter=publication_year:" + std::to_string(2000 + i)) != std::string::npos) ++good;
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(good.load(), 8 * 50);
}

TEST_F(OpenAlexTest, DryRunReturnsPapersThatPassQuality) {
    config_.dry_run = true;
    OpenAlexClient client(config_);
    EXPECT_EQ(client.api_name(), "openalex");

    auto papers = client.collect("KDD", 2021);
    ASSERT_EQ(papers.size(), 3u);
    for (const auto& p : papers) {
        EXPECT_EQ(p.venue, "KDD");
        EXPECT_EQ(p.year, 2021);
    }
    BasicQualityMonitor quality;
    EXPECT_TRUE(quality.check_collection_quality(papers, "KDD", 2021).passed);
}
