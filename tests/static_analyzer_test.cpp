#include "jsguard/frontend/parser.hpp"
#include "jsguard/frontend/static_analyzer.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace jsguard::frontend;

class StaticAnalyzerTest : public ::testing::Test {
protected:
    std::vector<Issue> analyze(const std::string& code) {
        ParseResult result = ParseSource(code);
        StaticAnalyzer analyzer;
        return analyzer.Analyze(result.program);
    }

    static std::string function_with_statements(std::size_t count) {
        std::string code = "function big() {\n";
        for (std::size_t i = 0; i < count; ++i) {
            code += "  step();\n";
        }
        code += "}\n";
        return code;
    }

    static void expect_issue(
        const Issue& issue,
        IssueKind kind,
        Severity severity,
        const std::string& message,
        std::size_t line,
        std::size_t column) {
        EXPECT_EQ(issue.kind, kind);
        EXPECT_EQ(issue.severity, severity);
        EXPECT_EQ(issue.message, message);
        EXPECT_EQ(issue.line, line);
        EXPECT_EQ(issue.column, column);
    }
};

TEST_F(StaticAnalyzerTest, CleanProgramHasNoIssues) {
    auto issues = analyze("const total = 1;\nlet next = total + 1;\nreport(next);");
    EXPECT_TRUE(issues.empty());
}

TEST_F(StaticAnalyzerTest, EmptyProgramHasNoIssues) {
    EXPECT_TRUE(analyze("").empty());
}

// Code execution

TEST_F(StaticAnalyzerTest, EvalIsReported) {
    auto issues = analyze("eval(userInput);");
    ASSERT_EQ(issues.size(), 1u);
    expect_issue(
        issues[0], IssueKind::Security, Severity::High,
        "Unsafe use of eval() — can execute arbitrary code", 1, 1);
}

TEST_F(StaticAnalyzerTest, FunctionConstructorAndExecScriptAreReported) {
    auto issues = analyze("Function(body);\nexecScript(code);");
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].message, "Unsafe use of Function() — can execute arbitrary code");
    EXPECT_EQ(issues[1].message, "Unsafe use of execScript() — can execute arbitrary code");
    EXPECT_EQ(issues[1].line, 2u);
}

TEST_F(StaticAnalyzerTest, MemberNamedEvalIsNotReported) {
    EXPECT_TRUE(analyze("sandbox.eval(code);").empty());
}

// String timers

TEST_F(StaticAnalyzerTest, TimerWithStringArgument) {
    auto issues = analyze("setTimeout('tick()', 100);\nsetInterval(\"poll()\", 50);");
    ASSERT_EQ(issues.size(), 2u);
    expect_issue(
        issues[0], IssueKind::Security, Severity::High,
        "Unsafe use of setTimeout with string argument — similar to eval()", 1, 1);
    EXPECT_EQ(issues[1].message, "Unsafe use of setInterval with string argument — similar to eval()");
}

TEST_F(StaticAnalyzerTest, TimerWithCallbackIsNotReported) {
    EXPECT_TRUE(analyze("setTimeout(tick, 100);").empty());
    EXPECT_TRUE(analyze("setTimeout();").empty());
}

// document.write

TEST_F(StaticAnalyzerTest, DocumentWriteIsReported) {
    auto issues = analyze("document.write(x);");
    ASSERT_EQ(issues.size(), 1u);
    expect_issue(
        issues[0], IssueKind::Security, Severity::High,
        "Insecure use of document.write() — can enable XSS attacks", 1, 1);

    issues = analyze("document.writeln(x);");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].message, "Insecure use of document.writeln() — can enable XSS attacks");
}

TEST_F(StaticAnalyzerTest, WriteOnOtherObjectIsNotReported) {
    EXPECT_TRUE(analyze("foo.write(x);").empty());
    EXPECT_TRUE(analyze("document.open(x);").empty());
}

// Markup properties

TEST_F(StaticAnalyzerTest, InnerHtmlAssignmentIsReported) {
    auto issues = analyze("el.innerHTML = html;");
    ASSERT_EQ(issues.size(), 1u);
    expect_issue(
        issues[0], IssueKind::Security, Severity::High,
        "Potential XSS vulnerability using innerHTML", 1, 1);
}

TEST_F(StaticAnalyzerTest, OuterHtmlReadIsReported) {
    auto issues = analyze("show(panel.outerHTML);");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].message, "Potential XSS vulnerability using outerHTML");
    EXPECT_EQ(issues[0].column, 6u);
}

TEST_F(StaticAnalyzerTest, TextContentIsNotReported) {
    EXPECT_TRUE(analyze("el.textContent = text;").empty());
}

// Insecure requests

TEST_F(StaticAnalyzerTest, PlainHttpRequestIsReported) {
    auto issues = analyze("xhr.open('GET', 'http://example.com/api');");
    ASSERT_EQ(issues.size(), 1u);
    expect_issue(
        issues[0], IssueKind::Security, Severity::Medium,
        "Using insecure HTTP protocol instead of HTTPS", 1, 1);
}

TEST_F(StaticAnalyzerTest, SecureOrDynamicRequestIsNotReported) {
    EXPECT_TRUE(analyze("xhr.open('GET', 'https://example.com/api');").empty());
    EXPECT_TRUE(analyze("xhr.open('GET', url);").empty());
    EXPECT_TRUE(analyze("xhr.open('http://example.com');").empty());
}

// Loose equality

TEST_F(StaticAnalyzerTest, LooseEqualityIsReported) {
    auto issues = analyze("let x = 1; if (x == 2) {}");
    ASSERT_EQ(issues.size(), 1u);
    expect_issue(
        issues[0], IssueKind::Error, Severity::Medium,
        "Unsafe equality comparison using == instead of ===", 1, 16);
}

TEST_F(StaticAnalyzerTest, LooseInequalityIsReported) {
    auto issues = analyze("check(a != b);");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].message, "Unsafe equality comparison using != instead of !==");
}

TEST_F(StaticAnalyzerTest, StrictEqualityIsNotReported) {
    EXPECT_TRUE(analyze("check(a === b, a !== c);").empty());
}

// Implicit globals

TEST_F(StaticAnalyzerTest, BareAssignmentIsReported) {
    auto issues = analyze("counter = 0;");
    ASSERT_EQ(issues.size(), 1u);
    expect_issue(
        issues[0], IssueKind::Error, Severity::High,
        "Potential implicit global variable: counter", 1, 1);
}

TEST_F(StaticAnalyzerTest, MemberAssignmentIsNotReported) {
    EXPECT_TRUE(analyze("config.debug = true;").empty());
}

// Loop concatenation

TEST_F(StaticAnalyzerTest, StringConcatenationInLoopIsReported) {
    auto issues = analyze("for (let i = 0; i < 3; i++) { s += 'x'; }");
    ASSERT_EQ(issues.size(), 2u);
    expect_issue(
        issues[0], IssueKind::Error, Severity::High,
        "Potential implicit global variable: s", 1, 31);
    expect_issue(
        issues[1], IssueKind::Performance, Severity::Medium,
        "Inefficient string concatenation in loop — consider using array.join() instead", 1, 31);
}

TEST_F(StaticAnalyzerTest, ConcatenationInNestedWhileBodyIsReported) {
    auto issues = analyze("while (more) { if (ok) { out.text += 'line'; } }");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::Performance);
}

TEST_F(StaticAnalyzerTest, ConcatenationOutsideLoopIsNotPerformanceIssue) {
    auto issues = analyze("s += 'x';");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::Error);

    issues = analyze("while (more) { out.text += piece; }");
    EXPECT_TRUE(issues.empty());
}

// var keyword

TEST_F(StaticAnalyzerTest, VarDeclarationIsReported) {
    auto issues = analyze("var count = 0;\nuse(count);");
    ASSERT_EQ(issues.size(), 1u);
    expect_issue(
        issues[0], IssueKind::Style, Severity::Medium,
        "Use of 'var' keyword — consider using 'let' or 'const' instead", 1, 1);
}

// Function size

TEST_F(StaticAnalyzerTest, FunctionWithThirtyStatementsIsAccepted) {
    EXPECT_TRUE(analyze(function_with_statements(30)).empty());
}

TEST_F(StaticAnalyzerTest, FunctionWithThirtyOneStatementsIsReported) {
    auto issues = analyze(function_with_statements(31));
    ASSERT_EQ(issues.size(), 1u);
    expect_issue(
        issues[0], IssueKind::Complexity, Severity::Medium,
        "Function is too large (31 statements) — consider refactoring", 1, 1);
}

TEST_F(StaticAnalyzerTest, CountStatementsRecursesIntoNestedBodies) {
    ParseResult result = ParseSource(
        "function f() { if (a) { b(); c(); } else d(); { e(); } while (x) y(); function g() { h(); i(); } }");
    ASSERT_TRUE(result.errors.empty());
    const auto* function = dynamic_cast<const FunctionDeclaration*>(result.program.body[0].get());
    ASSERT_NE(function, nullptr);
    EXPECT_EQ(CountStatements(*function->body), 8u);
}

// Unused variables

TEST_F(StaticAnalyzerTest, UnusedVariableIsReported) {
    auto issues = analyze("let a = 1; let b = a;");
    ASSERT_EQ(issues.size(), 1u);
    expect_issue(issues[0], IssueKind::Performance, Severity::Low, "Unused variable: b", 1, 16);
}

TEST_F(StaticAnalyzerTest, VariableUsedInsideFunctionIsNotReported) {
    EXPECT_TRUE(analyze("const limit = 3;\nfunction check(n) { return n < limit; }").empty());
}

// Whole-program behaviour

TEST_F(StaticAnalyzerTest, IssuesFollowPreOrderTraversal) {
    auto issues = analyze("var a = eval(b);");
    ASSERT_EQ(issues.size(), 3u);
    EXPECT_EQ(issues[0].kind, IssueKind::Style);
    EXPECT_EQ(issues[0].column, 1u);
    EXPECT_EQ(issues[1].message, "Unused variable: a");
    EXPECT_EQ(issues[1].column, 5u);
    EXPECT_EQ(issues[2].kind, IssueKind::Security);
    EXPECT_EQ(issues[2].column, 9u);
}

TEST_F(StaticAnalyzerTest, SeveralRulesOnOneProgram) {
    const std::string code =
        "var html = '<b>' + name;\n"
        "el.innerHTML = html;\n"
        "if (name == null) {\n"
        "  document.write(html);\n"
        "}\n";
    auto issues = analyze(code);
    ASSERT_EQ(issues.size(), 4u);
    EXPECT_EQ(issues[0].kind, IssueKind::Style);
    EXPECT_EQ(issues[1].message, "Potential XSS vulnerability using innerHTML");
    EXPECT_EQ(issues[1].line, 2u);
    EXPECT_EQ(issues[2].message, "Unsafe equality comparison using == instead of ===");
    EXPECT_EQ(issues[2].line, 3u);
    EXPECT_EQ(issues[3].message, "Insecure use of document.write() — can enable XSS attacks");
    EXPECT_EQ(issues[3].line, 4u);
    EXPECT_EQ(issues[3].column, 3u);
}

TEST_F(StaticAnalyzerTest, AnalysisContinuesPastParseErrors) {
    ParseResult result = ParseSource("let x = ;\nif (a) eval(y);");
    EXPECT_EQ(result.errors.size(), 1u);
    ASSERT_EQ(result.program.body.size(), 1u);

    StaticAnalyzer analyzer;
    auto issues = analyzer.Analyze(result.program);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].message, "Unsafe use of eval() — can execute arbitrary code");
    EXPECT_EQ(issues[0].line, 2u);
}

TEST_F(StaticAnalyzerTest, RecoverySkipsToNextSemicolonWithoutKeyword) {
    ParseResult result = ParseSource("let x = ; eval(y);");
    EXPECT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(result.program.body.empty());

    StaticAnalyzer analyzer;
    EXPECT_TRUE(analyzer.Analyze(result.program).empty());
}

TEST_F(StaticAnalyzerTest, AnalyzeIsIdempotent) {
    ParseResult result = ParseSource(
        "var a = 1;\nfor (;;) { s += 'x'; }\nif (a == b) eval(c);\nel.outerHTML = d;");
    StaticAnalyzer analyzer;
    auto first = analyzer.Analyze(result.program);
    auto second = analyzer.Analyze(result.program);
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}
