#include "jsguard/report/issue_report.hpp"

#include <cctype>

namespace jsguard::report {

namespace {

std::string ToUpper(const char* text) {
    std::string upper(text);
    for (char& character : upper) {
        character = static_cast<char>(std::toupper(static_cast<unsigned char>(character)));
    }
    return upper;
}

}  // namespace

std::string FormatIssue(const frontend::Issue& issue) {
    return "[" + ToUpper(frontend::ToString(issue.severity)) + "] " + frontend::ToString(issue.kind) + ": " +
           issue.message + " at line " + std::to_string(issue.line) + ", column " + std::to_string(issue.column);
}

std::string FormatIssues(const std::vector<frontend::Issue>& issues) {
    if (issues.empty()) {
        return "No issues detected.";
    }

    std::string text;
    for (std::size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) {
            text.push_back('\n');
        }
        text += FormatIssue(issues[i]);
    }
    return text;
}

IssueSummary Summarize(const std::vector<frontend::Issue>& issues) {
    IssueSummary summary;
    summary.total = issues.size();

    for (const auto& issue : issues) {
        switch (issue.severity) {
        case frontend::Severity::High:
            ++summary.by_severity.high;
            break;
        case frontend::Severity::Medium:
            ++summary.by_severity.medium;
            break;
        case frontend::Severity::Low:
            ++summary.by_severity.low;
            break;
        }

        switch (issue.kind) {
        case frontend::IssueKind::Security:
            ++summary.by_kind.security;
            break;
        case frontend::IssueKind::Error:
            ++summary.by_kind.error;
            break;
        case frontend::IssueKind::Performance:
            ++summary.by_kind.performance;
            break;
        case frontend::IssueKind::Style:
            ++summary.by_kind.style;
            break;
        case frontend::IssueKind::Complexity:
            ++summary.by_kind.complexity;
            break;
        }
    }

    return summary;
}

std::size_t CountFor(const KindCounts& counts, frontend::IssueKind kind) {
    switch (kind) {
    case frontend::IssueKind::Security:
        return counts.security;
    case frontend::IssueKind::Error:
        return counts.error;
    case frontend::IssueKind::Performance:
        return counts.performance;
    case frontend::IssueKind::Style:
        return counts.style;
    case frontend::IssueKind::Complexity:
        return counts.complexity;
    }
    return 0;
}

std::size_t CountFor(const SeverityCounts& counts, frontend::Severity severity) {
    switch (severity) {
    case frontend::Severity::High:
        return counts.high;
    case frontend::Severity::Medium:
        return counts.medium;
    case frontend::Severity::Low:
        return counts.low;
    }
    return 0;
}

}  // namespace jsguard::report
