#include "jsguard/report/report_writer.hpp"

#include <algorithm>
#include <cstdint>
#include <system_error>
#include <utility>

#include "jsguard/report/issue_report.hpp"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

namespace jsguard::report {

namespace {

constexpr frontend::IssueKind kKindOrder[] = {
    frontend::IssueKind::Security,
    frontend::IssueKind::Error,
    frontend::IssueKind::Performance,
    frontend::IssueKind::Style,
    frontend::IssueKind::Complexity,
};

constexpr frontend::Severity kSeverityOrder[] = {
    frontend::Severity::High,
    frontend::Severity::Medium,
    frontend::Severity::Low,
};

// llvm::json::Value rejects uint64_t.
std::int64_t JsonCount(std::size_t count) {
    return static_cast<std::int64_t>(count);
}

llvm::json::Value IssueToJson(const frontend::Issue& issue) {
    return llvm::json::Object{
        {"type", frontend::ToString(issue.kind)},
        {"severity", frontend::ToString(issue.severity)},
        {"message", issue.message},
        {"line", JsonCount(issue.line)},
        {"column", JsonCount(issue.column)},
    };
}

llvm::json::Value SummaryToJson(const IssueSummary& summary) {
    llvm::json::Object by_severity;
    for (frontend::Severity severity : kSeverityOrder) {
        by_severity[frontend::ToString(severity)] = JsonCount(CountFor(summary.by_severity, severity));
    }

    llvm::json::Object by_kind;
    for (frontend::IssueKind kind : kKindOrder) {
        by_kind[frontend::ToString(kind)] = JsonCount(CountFor(summary.by_kind, kind));
    }

    return llvm::json::Object{
        {"total", JsonCount(summary.total)},
        {"bySeverity", std::move(by_severity)},
        {"byKind", std::move(by_kind)},
    };
}

}  // namespace

void WriteTextReport(const std::vector<frontend::Issue>& issues, llvm::raw_ostream& stream) {
    const IssueSummary summary = Summarize(issues);

    stream << "\nAnalysis Results:\n";
    stream << "----------------\n";
    stream << FormatIssues(issues) << "\n";
    stream << "\nSummary:\n";
    stream << "Total issues: " << summary.total << "\n";

    // Kinds are listed in order of first appearance.
    std::vector<frontend::IssueKind> seen;
    for (const auto& issue : issues) {
        if (std::find(seen.begin(), seen.end(), issue.kind) != seen.end()) {
            continue;
        }
        seen.push_back(issue.kind);
        stream << "- " << frontend::ToString(issue.kind) << ": " << CountFor(summary.by_kind, issue.kind) << "\n";
    }
}

void WriteJsonReport(const std::vector<frontend::Issue>& issues, llvm::raw_ostream& stream) {
    llvm::json::Array issue_array;
    for (const auto& issue : issues) {
        issue_array.push_back(IssueToJson(issue));
    }

    llvm::json::Value document = llvm::json::Object{
        {"issues", std::move(issue_array)},
        {"summary", SummaryToJson(Summarize(issues))},
    };

    stream << llvm::formatv("{0:2}", document) << "\n";
}

void WriteTokenDump(const std::vector<frontend::Token>& tokens, llvm::raw_ostream& stream) {
    for (const auto& token : tokens) {
        stream << frontend::ToString(token) << "\n";
    }
}

bool WriteReportFile(
    const std::string& output_path,
    const std::string& contents,
    std::string* out_error) {
    if (out_error == nullptr) {
        return false;
    }

    std::error_code error_code;
    llvm::raw_fd_ostream output(output_path, error_code, llvm::sys::fs::OF_Text);
    if (error_code) {
        *out_error = "Could not write report to '" + output_path + "': " + error_code.message();
        return false;
    }

    output << contents;
    output.close();
    if (output.has_error()) {
        *out_error = "Error writing report to '" + output_path + "': " + output.error().message();
        output.clear_error();
        return false;
    }

    return true;
}

}  // namespace jsguard::report
