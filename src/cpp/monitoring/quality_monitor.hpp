#pragma once
// Basic per-unit quality gate: empty titles, duplicate ids, papers whose
// year or venue differs from the unit that returned them.
// The unit fails when the share of flagged papers exceeds max_issue_ratio.
#include <string>
#include <vector>

#include "../orchestration/collaborators.hpp"

namespace harvest {

class BasicQualityMonitor : public QualityMonitor {
public:
    explicit BasicQualityMonitor(double max_issue_ratio = 0.2) : max_issue_ratio_(max_issue_ratio) {}

    QualityReport check_collection_quality(const std::vector<Paper>& papers,
                                           const std::string& venue, int year) override;

private:
    double max_issue_ratio_;
};

} // namespace harvest
