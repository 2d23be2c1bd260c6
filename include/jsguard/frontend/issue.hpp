#ifndef JSGUARD_FRONTEND_ISSUE_HPP
#define JSGUARD_FRONTEND_ISSUE_HPP

#include <cstddef>
#include <string>

namespace jsguard::frontend {

enum class IssueKind {
    Security,
    Error,
    Performance,
    Style,
    Complexity,
};

enum class Severity {
    High,
    Medium,
    Low,
};

struct Issue {
    IssueKind kind = IssueKind::Error;
    Severity severity = Severity::Low;
    std::string message;
    std::size_t line = 0;
    std::size_t column = 0;
};

bool operator==(const Issue& lhs, const Issue& rhs);
bool operator!=(const Issue& lhs, const Issue& rhs);

// Lower-case names: "security", "error", ... and "high", "medium", "low".
const char* ToString(IssueKind kind);
const char* ToString(Severity severity);

}  // namespace jsguard::frontend

#endif  // JSGUARD_FRONTEND_ISSUE_HPP
