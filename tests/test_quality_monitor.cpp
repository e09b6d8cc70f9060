#include <gtest/gtest.h>

#include "monitoring/quality_monitor.hpp"
#include "utils/logger.hpp"

using namespace harvest;

namespace {

Paper paper(const std::string& id, const std::string& title = "A title", int year = 2023,
            const std::string& venue = "ICML") {
    Paper p;
    p.id = id;
    p.title = title;
    p.year = year;
    p.venue = venue;
    return p;
}

class QualityMonitorTest : public ::testing::Test {
protected:
    void SetUp() override { g_log_level = LogLevel::ERROR; }

    bool has_issue(const QualityReport& r, const std::string& fragment) {
        for (const auto& issue : r.issues) {
            if (issue.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    BasicQualityMonitor monitor_;
};

} // namespace

TEST_F(QualityMonitorTest, EmptyCollectionPasses) {
    auto r = monitor_.check_collection_quality({}, "ICML", 2023);
    EXPECT_TRUE(r.passed);
    EXPECT_TRUE(r.issues.empty());
}

TEST_F(QualityMonitorTest, CleanCollectionPasses) {
    auto r = monitor_.check_collection_quality({paper("W1"), paper("W2"), paper("W3")}, "ICML", 2023);
    EXPECT_TRUE(r.passed);
    EXPECT_DOUBLE_EQ(r.issue_ratio, 0.0);
}

TEST_F(QualityMonitorTest, FlagsEachKindOfProblem) {
    BasicQualityMonitor lenient(1.0);
    auto r = lenient.check_collection_quality(
        {paper("W1", ""), paper("W2"), paper("W2"), paper("W3", "t", 2019), paper("W4", "t", 2023, "KDD")},
        "ICML", 2023);
    EXPECT_TRUE(has_issue(r, "W1: empty title"));
    EXPECT_TRUE(has_issue(r, "W2: duplicate id"));
    EXPECT_TRUE(has_issue(r, "W3: year 2019"));
    EXPECT_TRUE(has_issue(r, "W4: venue KDD"));
    EXPECT_EQ(r.issues.size(), 4u);
    EXPECT_DOUBLE_EQ(r.issue_ratio, 0.8);
    EXPECT_TRUE(r.passed);
}

TEST_F(QualityMonitorTest, UnknownYearAndVenueAreNotFlagged) {
    auto r = monitor_.check_collection_quality({paper("W1", "t", 0, "")}, "ICML", 2023);
    EXPECT_TRUE(r.issues.empty());
}

TEST_F(QualityMonitorTest, FailsAboveTheIssueRatio) {
    auto one_bad = monitor_.check_collection_quality(
        {paper("W1", ""), paper("W2"), paper("W3"), paper("W4"), paper("W5")}, "ICML", 2023);
    EXPECT_DOUBLE_EQ(one_bad.issue_ratio, 0.2);
    EXPECT_TRUE(one_bad.passed);

    auto two_bad = monitor_.check_collection_quality(
        {paper("W1", ""), paper("W2", ""), paper("W3"), paper("W4"), paper("W5")}, "ICML", 2023);
    EXPECT_DOUBLE_EQ(two_bad.issue_ratio, 0.4);
    EXPECT_FALSE(two_bad.passed);
}
