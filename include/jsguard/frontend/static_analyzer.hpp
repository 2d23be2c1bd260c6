#ifndef JSGUARD_FRONTEND_STATIC_ANALYZER_HPP
#define JSGUARD_FRONTEND_STATIC_ANALYZER_HPP

#include <cstddef>
#include <vector>

#include "jsguard/frontend/ast.hpp"
#include "jsguard/frontend/issue.hpp"

namespace jsguard::frontend {

// Functions with more statements than this are reported as too large.
constexpr std::size_t kMaxFunctionStatements = 30;

// Walks the tree once in pre-order and evaluates the rule catalog at every
// node. Issues come back in traversal order; the analyzer keeps no state
// between calls.
class StaticAnalyzer {
public:
    std::vector<Issue> Analyze(const Program& program) const;
};

// Statement count used by the function-size rule. Nested blocks are counted
// recursively; a bare block contributes only its contents and a nested
// function declaration counts as a single statement.
std::size_t CountStatements(const BlockStatement& block);

}  // namespace jsguard::frontend

#endif  // JSGUARD_FRONTEND_STATIC_ANALYZER_HPP
