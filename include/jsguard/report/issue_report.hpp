#ifndef JSGUARD_REPORT_ISSUE_REPORT_HPP
#define JSGUARD_REPORT_ISSUE_REPORT_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "jsguard/frontend/issue.hpp"

namespace jsguard::report {

struct SeverityCounts {
    std::size_t high = 0;
    std::size_t medium = 0;
    std::size_t low = 0;
};

struct KindCounts {
    std::size_t security = 0;
    std::size_t error = 0;
    std::size_t performance = 0;
    std::size_t style = 0;
    std::size_t complexity = 0;
};

struct IssueSummary {
    std::size_t total = 0;
    SeverityCounts by_severity;
    KindCounts by_kind;
};

// [<SEVERITY>] <kind>: <message> at line <line>, column <column>
std::string FormatIssue(const frontend::Issue& issue);

// One line per issue, or "No issues detected." for an empty list.
std::string FormatIssues(const std::vector<frontend::Issue>& issues);

IssueSummary Summarize(const std::vector<frontend::Issue>& issues);

std::size_t CountFor(const KindCounts& counts, frontend::IssueKind kind);
std::size_t CountFor(const SeverityCounts& counts, frontend::Severity severity);

}  // namespace jsguard::report

#endif  // JSGUARD_REPORT_ISSUE_REPORT_HPP
