#ifndef JSGUARD_FRONTEND_PARSER_HPP
#define JSGUARD_FRONTEND_PARSER_HPP

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "jsguard/frontend/ast.hpp"
#include "jsguard/frontend/token.hpp"

namespace jsguard::frontend {

struct Diagnostic {
    std::size_t line = 0;
    std::size_t column = 0;
    std::string message;
};

struct ParseResult {
    Program program;
    std::vector<Diagnostic> errors;
};

// Recursive-descent parser with panic-mode recovery. Parse() always returns
// a Program; statements that fail to parse are dropped and reported in
// ParseResult::errors.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    ParseResult Parse();

private:
    std::unique_ptr<Statement> ParseStatement();
    std::unique_ptr<Statement> ParseVariableDeclaration();
    std::unique_ptr<VariableDeclarator> ParseDeclarator();
    std::unique_ptr<Statement> ParseFunctionDeclaration();
    std::unique_ptr<BlockStatement> ParseBlock();
    std::unique_ptr<Statement> ParseReturn();
    std::unique_ptr<Statement> ParseIf();
    std::unique_ptr<Statement> ParseLoop();
    std::unique_ptr<Statement> ParseExpressionStatement();
    void SkipParenthesizedHeader();

    std::unique_ptr<Expr> ParseExpression();
    std::unique_ptr<Expr> ParseAssignment();
    std::unique_ptr<Expr> ParseLogicalOr();
    std::unique_ptr<Expr> ParseLogicalAnd();
    std::unique_ptr<Expr> ParseEquality();
    std::unique_ptr<Expr> ParseRelational();
    std::unique_ptr<Expr> ParseAdditive();
    std::unique_ptr<Expr> ParseMultiplicative();
    std::unique_ptr<Expr> ParseUnary();
    std::unique_ptr<Expr> ParsePostfix();
    std::unique_ptr<Expr> ParsePrimary();
    std::unique_ptr<Expr> ParseArrayLiteral();
    std::unique_ptr<Expr> ParseObjectLiteral();

    bool IsAtEnd() const;
    const Token& Peek() const;
    const Token& Advance();
    bool Check(TokenKind kind) const;
    bool CheckKeyword(const char* keyword) const;
    bool Match(TokenKind kind);
    bool MatchOperator(TokenKind kind, std::initializer_list<const char*> spellings, std::string* out_op);
    bool Expect(TokenKind kind, const Token** out_token);
    bool ExpectKeyword(const char* keyword, const Token** out_token);

    void ReportExpected(const std::string& expected);
    void ReportUnexpected();
    void Synchronize();

    std::vector<Token> tokens_;
    std::size_t cursor_ = 0;
    std::vector<Diagnostic> errors_;
};

// Tokenizes and parses in one step.
ParseResult ParseSource(const std::string& source);

}  // namespace jsguard::frontend

#endif  // JSGUARD_FRONTEND_PARSER_HPP
