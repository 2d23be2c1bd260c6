#include "jsguard/frontend/parser.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "jsguard/frontend/tokenizer.hpp"
#include "parser_support.hpp"

namespace jsguard::frontend {

Parser::Parser(std::vector<Token> tokens) : tokens_(internal::StripTrivia(std::move(tokens))) {}

ParseResult Parser::Parse() {
    cursor_ = 0;
    errors_.clear();

    ParseResult result;
    while (!IsAtEnd()) {
        auto statement = ParseStatement();
        if (statement == nullptr) {
            Synchronize();
            continue;
        }
        result.program.body.push_back(std::move(statement));
    }

    result.errors = std::move(errors_);
    errors_.clear();
    return result;
}

std::unique_ptr<Statement> Parser::ParseStatement() {
    if (Check(TokenKind::Keyword)) {
        const std::string& keyword = Peek().lexeme;
        if (keyword == "var" || keyword == "let" || keyword == "const") {
            return ParseVariableDeclaration();
        }
        if (keyword == "function") {
            return ParseFunctionDeclaration();
        }
        if (keyword == "return") {
            return ParseReturn();
        }
        if (keyword == "if") {
            return ParseIf();
        }
        if (keyword == "while" || keyword == "for") {
            return ParseLoop();
        }
    }

    if (Check(TokenKind::LBrace)) {
        return ParseBlock();
    }

    return ParseExpressionStatement();
}

// Drops the offending token, then skips ahead to the end of the current
// statement or to the next statement keyword.
void Parser::Synchronize() {
    Advance();

    while (!IsAtEnd()) {
        if (Match(TokenKind::Semicolon)) {
            return;
        }
        if (internal::IsStatementKeyword(Peek())) {
            return;
        }
        Advance();
    }
}

bool Parser::IsAtEnd() const {
    return tokens_[cursor_].kind == TokenKind::EndOfFile;
}

const Token& Parser::Peek() const {
    return tokens_[cursor_];
}

const Token& Parser::Advance() {
    const Token& token = tokens_[cursor_];
    if (!IsAtEnd()) {
        ++cursor_;
    }
    return token;
}

bool Parser::Check(TokenKind kind) const {
    return tokens_[cursor_].kind == kind;
}

bool Parser::CheckKeyword(const char* keyword) const {
    return Check(TokenKind::Keyword) && Peek().lexeme == keyword;
}

bool Parser::Match(TokenKind kind) {
    if (!Check(kind)) {
        return false;
    }
    Advance();
    return true;
}

bool Parser::MatchOperator(TokenKind kind, std::initializer_list<const char*> spellings, std::string* out_op) {
    if (!Check(kind)) {
        return false;
    }

    for (const char* spelling : spellings) {
        if (Peek().lexeme == spelling) {
            *out_op = Advance().lexeme;
            return true;
        }
    }
    return false;
}

bool Parser::Expect(TokenKind kind, const Token** out_token) {
    if (!Check(kind)) {
        ReportExpected(ToString(kind));
        return false;
    }

    const Token& token = Advance();
    if (out_token != nullptr) {
        *out_token = &token;
    }
    return true;
}

bool Parser::ExpectKeyword(const char* keyword, const Token** out_token) {
    if (!CheckKeyword(keyword)) {
        ReportExpected(std::string("Keyword(") + keyword + ")");
        return false;
    }

    const Token& token = Advance();
    if (out_token != nullptr) {
        *out_token = &token;
    }
    return true;
}

void Parser::ReportExpected(const std::string& expected) {
    const Token& actual = Peek();
    errors_.push_back(Diagnostic{
        actual.line,
        actual.column,
        "Expected " + expected + ", got " + internal::DescribeToken(actual) + " at " +
            internal::DescribeLocation(actual),
    });
}

void Parser::ReportUnexpected() {
    const Token& actual = Peek();
    errors_.push_back(Diagnostic{
        actual.line,
        actual.column,
        "Unexpected token " + internal::DescribeToken(actual) + " at " + internal::DescribeLocation(actual),
    });
}

ParseResult ParseSource(const std::string& source) {
    Parser parser(Tokenizer::Tokenize(source));
    return parser.Parse();
}

}  // namespace jsguard::frontend
