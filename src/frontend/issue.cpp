#include "jsguard/frontend/issue.hpp"

namespace jsguard::frontend {

bool operator==(const Issue& lhs, const Issue& rhs) {
    return lhs.kind == rhs.kind &&
           lhs.severity == rhs.severity &&
           lhs.message == rhs.message &&
           lhs.line == rhs.line &&
           lhs.column == rhs.column;
}

bool operator!=(const Issue& lhs, const Issue& rhs) {
    return !(lhs == rhs);
}

const char* ToString(IssueKind kind) {
    switch (kind) {
    case IssueKind::Security:
        return "security";
    case IssueKind::Error:
        return "error";
    case IssueKind::Performance:
        return "performance";
    case IssueKind::Style:
        return "style";
    case IssueKind::Complexity:
        return "complexity";
    }
    return "error";
}

const char* ToString(Severity severity) {
    switch (severity) {
    case Severity::High:
        return "high";
    case Severity::Medium:
        return "medium";
    case Severity::Low:
        return "low";
    }
    return "low";
}

}  // namespace jsguard::frontend
