#include "jsguard/frontend/static_analyzer.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsguard::frontend {

namespace {

using IdentifierCounts = std::unordered_map<std::string, std::size_t>;

void CountIdentifiers(const Node& node, IdentifierCounts* counts) {
    if (const auto* identifier = dynamic_cast<const Identifier*>(&node)) {
        ++(*counts)[identifier->name];
    }
    for (const Node* child : node.Children()) {
        CountIdentifiers(*child, counts);
    }
}

std::size_t StatementWeight(const Statement& statement);

std::size_t CountStatementList(const std::vector<std::unique_ptr<Statement>>& statements) {
    std::size_t count = 0;
    for (const auto& statement : statements) {
        if (statement != nullptr) {
            count += StatementWeight(*statement);
        }
    }
    return count;
}

std::size_t StatementWeight(const Statement& statement) {
    if (const auto* block = dynamic_cast<const BlockStatement*>(&statement)) {
        return CountStatementList(block->body);
    }

    if (const auto* conditional = dynamic_cast<const IfStatement*>(&statement)) {
        std::size_t count = 1;
        if (conditional->consequent != nullptr) {
            count += StatementWeight(*conditional->consequent);
        }
        if (conditional->alternate != nullptr) {
            count += StatementWeight(*conditional->alternate);
        }
        return count;
    }

    if (const auto* while_loop = dynamic_cast<const WhileStatement*>(&statement)) {
        return 1 + (while_loop->body != nullptr ? StatementWeight(*while_loop->body) : 0);
    }

    if (const auto* for_loop = dynamic_cast<const ForStatement*>(&statement)) {
        return 1 + (for_loop->body != nullptr ? StatementWeight(*for_loop->body) : 0);
    }

    return 1;
}

bool IsIdentifierNamed(const Expr* expression, const char* name) {
    const auto* identifier = dynamic_cast<const Identifier*>(expression);
    return identifier != nullptr && identifier->name == name;
}

const std::string* StringLiteralValue(const Expr* expression) {
    const auto* literal = dynamic_cast<const Literal*>(expression);
    if (literal == nullptr) {
        return nullptr;
    }
    return std::get_if<std::string>(&literal->value);
}

bool StartsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

class AnalyzerEngine {
public:
    explicit AnalyzerEngine(std::vector<Issue>* issues) : issues_(issues) {}

    void Analyze(const Program& program) {
        CountIdentifiers(program, &identifier_counts_);
        Visit(program);
    }

private:
    void Visit(const Node& node) {
        ApplyRules(node);

        ancestors_.push_back(&node);
        for (const Node* child : node.Children()) {
            Visit(*child);
        }
        ancestors_.pop_back();
    }

    void ApplyRules(const Node& node) {
        if (const auto* call = dynamic_cast<const CallExpression*>(&node)) {
            CheckCodeExecution(*call);
            CheckStringTimer(*call);
            CheckDocumentWrite(*call);
            CheckInsecureRequest(*call);
            return;
        }

        if (const auto* member = dynamic_cast<const MemberExpression*>(&node)) {
            CheckMarkupProperty(*member);
            return;
        }

        if (const auto* binary = dynamic_cast<const BinaryExpression*>(&node)) {
            CheckLooseEquality(*binary);
            return;
        }

        if (const auto* assignment = dynamic_cast<const AssignmentExpression*>(&node)) {
            CheckImplicitGlobal(*assignment);
            CheckLoopConcatenation(*assignment);
            return;
        }

        if (const auto* declaration = dynamic_cast<const VariableDeclaration*>(&node)) {
            CheckVarKeyword(*declaration);
            return;
        }

        if (const auto* function = dynamic_cast<const FunctionDeclaration*>(&node)) {
            CheckFunctionSize(*function);
            return;
        }

        if (const auto* declarator = dynamic_cast<const VariableDeclarator*>(&node)) {
            CheckUnusedVariable(*declarator);
        }
    }

    void CheckCodeExecution(const CallExpression& call) {
        const auto* callee = dynamic_cast<const Identifier*>(call.callee.get());
        if (callee == nullptr) {
            return;
        }

        if (callee->name == "eval" || callee->name == "Function" || callee->name == "execScript") {
            Report(
                call,
                IssueKind::Security,
                Severity::High,
                "Unsafe use of " + callee->name + "() — can execute arbitrary code");
        }
    }

    void CheckStringTimer(const CallExpression& call) {
        const auto* callee = dynamic_cast<const Identifier*>(call.callee.get());
        if (callee == nullptr || (callee->name != "setTimeout" && callee->name != "setInterval")) {
            return;
        }

        if (!call.arguments.empty() && StringLiteralValue(call.arguments[0].get()) != nullptr) {
            Report(
                call,
                IssueKind::Security,
                Severity::High,
                "Unsafe use of " + callee->name + " with string argument — similar to eval()");
        }
    }

    void CheckDocumentWrite(const CallExpression& call) {
        const auto* callee = dynamic_cast<const MemberExpression*>(call.callee.get());
        if (callee == nullptr || callee->computed || !IsIdentifierNamed(callee->object.get(), "document")) {
            return;
        }

        const auto* method = dynamic_cast<const Identifier*>(callee->property.get());
        if (method != nullptr && (method->name == "write" || method->name == "writeln")) {
            Report(
                call,
                IssueKind::Security,
                Severity::High,
                "Insecure use of document." + method->name + "() — can enable XSS attacks");
        }
    }

    void CheckInsecureRequest(const CallExpression& call) {
        const auto* callee = dynamic_cast<const MemberExpression*>(call.callee.get());
        if (callee == nullptr || !IsIdentifierNamed(callee->property.get(), "open") || call.arguments.size() < 2) {
            return;
        }

        const std::string* url = StringLiteralValue(call.arguments[1].get());
        if (url != nullptr && StartsWith(*url, "http://")) {
            Report(call, IssueKind::Security, Severity::Medium, "Using insecure HTTP protocol instead of HTTPS");
        }
    }

    void CheckMarkupProperty(const MemberExpression& member) {
        const auto* property = dynamic_cast<const Identifier*>(member.property.get());
        if (property != nullptr && (property->name == "innerHTML" || property->name == "outerHTML")) {
            Report(
                member,
                IssueKind::Security,
                Severity::High,
                "Potential XSS vulnerability using " + property->name);
        }
    }

    void CheckLooseEquality(const BinaryExpression& binary) {
        if (binary.op == "==" || binary.op == "!=") {
            Report(
                binary,
                IssueKind::Error,
                Severity::Medium,
                "Unsafe equality comparison using " + binary.op + " instead of " + binary.op + "=");
        }
    }

    // Heuristic: fires for every bare identifier target, declared or not.
    void CheckImplicitGlobal(const AssignmentExpression& assignment) {
        const auto* target = dynamic_cast<const Identifier*>(assignment.left.get());
        if (target != nullptr) {
            Report(
                assignment,
                IssueKind::Error,
                Severity::High,
                "Potential implicit global variable: " + target->name);
        }
    }

    void CheckLoopConcatenation(const AssignmentExpression& assignment) {
        if (assignment.op != "+=" || StringLiteralValue(assignment.right.get()) == nullptr || !InsideLoop()) {
            return;
        }

        Report(
            assignment,
            IssueKind::Performance,
            Severity::Medium,
            "Inefficient string concatenation in loop — consider using array.join() instead");
    }

    void CheckVarKeyword(const VariableDeclaration& declaration) {
        if (declaration.declaration_kind == "var") {
            Report(
                declaration,
                IssueKind::Style,
                Severity::Medium,
                "Use of 'var' keyword — consider using 'let' or 'const' instead");
        }
    }

    void CheckFunctionSize(const FunctionDeclaration& function) {
        if (function.body == nullptr) {
            return;
        }

        const std::size_t count = CountStatements(*function.body);
        if (count > kMaxFunctionStatements) {
            Report(
                function,
                IssueKind::Complexity,
                Severity::Medium,
                "Function is too large (" + std::to_string(count) + " statements) — consider refactoring");
        }
    }

    // The declarator's own binding is one occurrence; any other Identifier
    // node with the same name anywhere in the tree counts as a use.
    void CheckUnusedVariable(const VariableDeclarator& declarator) {
        if (declarator.id == nullptr) {
            return;
        }

        const auto found = identifier_counts_.find(declarator.id->name);
        const std::size_t occurrences = found == identifier_counts_.end() ? 0 : found->second;
        if (occurrences <= 1) {
            Report(
                declarator,
                IssueKind::Performance,
                Severity::Low,
                "Unused variable: " + declarator.id->name);
        }
    }

    bool InsideLoop() const {
        for (const Node* ancestor : ancestors_) {
            if (ancestor->kind == NodeKind::WhileStatement || ancestor->kind == NodeKind::ForStatement) {
                return true;
            }
        }
        return false;
    }

    void Report(const Node& node, IssueKind kind, Severity severity, std::string message) {
        issues_->push_back(Issue{kind, severity, std::move(message), node.line, node.column});
    }

    std::vector<Issue>* issues_ = nullptr;
    std::vector<const Node*> ancestors_;
    IdentifierCounts identifier_counts_;
};

}  // namespace

std::size_t CountStatements(const BlockStatement& block) {
    return CountStatementList(block.body);
}

std::vector<Issue> StaticAnalyzer::Analyze(const Program& program) const {
    std::vector<Issue> issues;
    AnalyzerEngine engine(&issues);
    engine.Analyze(program);
    return issues;
}

}  // namespace jsguard::frontend
