#ifndef JSGUARD_REPORT_REPORT_WRITER_HPP
#define JSGUARD_REPORT_REPORT_WRITER_HPP

#include <string>
#include <vector>

#include "jsguard/frontend/issue.hpp"
#include "jsguard/frontend/token.hpp"

namespace llvm {
class raw_ostream;
}  // namespace llvm

namespace jsguard::report {

// Console layout: the formatted issue list followed by a per-kind summary,
// kinds listed in order of first appearance.
void WriteTextReport(const std::vector<frontend::Issue>& issues, llvm::raw_ostream& stream);

// {"issues":[...],"summary":{"total":N,"bySeverity":{...},"byKind":{...}}}
void WriteJsonReport(const std::vector<frontend::Issue>& issues, llvm::raw_ostream& stream);

void WriteTokenDump(const std::vector<frontend::Token>& tokens, llvm::raw_ostream& stream);

bool WriteReportFile(
    const std::string& output_path,
    const std::string& contents,
    std::string* out_error);

}  // namespace jsguard::report

#endif  // JSGUARD_REPORT_REPORT_WRITER_HPP
