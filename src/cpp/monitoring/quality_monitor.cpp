#include "quality_monitor.hpp"
#include "../utils/logger.hpp"

#include <set>

namespace harvest {

QualityReport BasicQualityMonitor::check_collection_quality(const std::vector<Paper>& papers,
                                                            const std::string& venue, int year) {
    QualityReport report;
    if (papers.empty()) return report;

    std::set<std::string> seen_ids;
    size_t flagged = 0;
    for (const auto& p : papers) {
        bool bad = false;
        std::string label = p.id.empty() ? "<no id>" : p.id;

        if (p.title.empty()) {
            report.issues.push_back(label + ": empty title");
            bad = true;
        }
        if (!p.id.empty() && !seen_ids.insert(p.id).second) {
            report.issues.push_back(label + ": duplicate id");
            bad = true;
        }
        if (p.year != 0 && p.year != year) {
            report.issues.push_back(label + ": year " + std::to_string(p.year) +
                                    " outside " + std::to_string(year));
            bad = true;
        }
        if (!p.venue.empty() && p.venue != venue) {
            report.issues.push_back(label + ": venue " + p.venue + " instead of " + venue);
            bad = true;
        }
        if (bad) ++flagged;
    }

    report.issue_ratio = static_cast<double>(flagged) / static_cast<double>(papers.size());
    report.passed = report.issue_ratio <= max_issue_ratio_;
    if (!report.passed) {
        LOG_WRN("[quality] %s/%d: %zu of %zu papers flagged (%.0f%%)", venue.c_str(), year,
            flagged, papers.size(), report.issue_ratio * 100.0);
    }
    return report;
}

} // namespace harvest
