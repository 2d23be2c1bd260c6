#include "jsguard/frontend/parser.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "parser_support.hpp"

namespace jsguard::frontend {

std::unique_ptr<Statement> Parser::ParseVariableDeclaration() {
    const Token& keyword = Advance();

    std::vector<std::unique_ptr<VariableDeclarator>> declarations;
    while (true) {
        auto declarator = ParseDeclarator();
        if (declarator == nullptr) {
            return nullptr;
        }
        declarations.push_back(std::move(declarator));

        if (!Match(TokenKind::Comma)) {
            break;
        }
    }

    Match(TokenKind::Semicolon);
    return std::make_unique<VariableDeclaration>(keyword.lexeme, std::move(declarations), keyword.line, keyword.column);
}

std::unique_ptr<VariableDeclarator> Parser::ParseDeclarator() {
    const Token* name = nullptr;
    if (!Expect(TokenKind::Identifier, &name)) {
        return nullptr;
    }

    auto id = std::make_unique<Identifier>(name->lexeme, name->line, name->column);

    std::unique_ptr<Expr> init;
    if (Check(TokenKind::Assignment) && Peek().lexeme == "=") {
        Advance();
        init = ParseExpression();
        if (init == nullptr) {
            return nullptr;
        }
    }

    return std::make_unique<VariableDeclarator>(std::move(id), std::move(init), name->line, name->column);
}

std::unique_ptr<Statement> Parser::ParseFunctionDeclaration() {
    const Token* keyword = nullptr;
    if (!ExpectKeyword("function", &keyword)) {
        return nullptr;
    }

    const Token* name = nullptr;
    if (!Expect(TokenKind::Identifier, &name)) {
        return nullptr;
    }

    if (!Expect(TokenKind::LParen, nullptr)) {
        return nullptr;
    }

    std::vector<std::unique_ptr<Identifier>> params;
    if (!Check(TokenKind::RParen)) {
        while (true) {
            const Token* param = nullptr;
            if (!Expect(TokenKind::Identifier, &param)) {
                return nullptr;
            }
            params.push_back(std::make_unique<Identifier>(param->lexeme, param->line, param->column));

            if (!Match(TokenKind::Comma)) {
                break;
            }
        }
    }

    if (!Expect(TokenKind::RParen, nullptr)) {
        return nullptr;
    }

    auto body = ParseBlock();
    if (body == nullptr) {
        return nullptr;
    }

    return std::make_unique<FunctionDeclaration>(
        std::make_unique<Identifier>(name->lexeme, name->line, name->column),
        std::move(params),
        std::move(body),
        keyword->line,
        keyword->column);
}

std::unique_ptr<BlockStatement> Parser::ParseBlock() {
    const Token* open = nullptr;
    if (!Expect(TokenKind::LBrace, &open)) {
        return nullptr;
    }

    std::vector<std::unique_ptr<Statement>> body;
    while (!Check(TokenKind::RBrace) && !IsAtEnd()) {
        auto statement = ParseStatement();
        if (statement == nullptr) {
            return nullptr;
        }
        body.push_back(std::move(statement));
    }

    if (!Expect(TokenKind::RBrace, nullptr)) {
        return nullptr;
    }

    return std::make_unique<BlockStatement>(std::move(body), open->line, open->column);
}

std::unique_ptr<Statement> Parser::ParseReturn() {
    const Token& keyword = Advance();

    std::unique_ptr<Expr> argument;
    if (!Check(TokenKind::Semicolon) && !Check(TokenKind::RBrace) && !IsAtEnd()) {
        argument = ParseExpression();
        if (argument == nullptr) {
            return nullptr;
        }
    }

    Match(TokenKind::Semicolon);
    return std::make_unique<ReturnStatement>(std::move(argument), keyword.line, keyword.column);
}

std::unique_ptr<Statement> Parser::ParseIf() {
    const Token& keyword = Advance();

    if (!Expect(TokenKind::LParen, nullptr)) {
        return nullptr;
    }

    auto test = ParseExpression();
    if (test == nullptr) {
        return nullptr;
    }

    if (!Expect(TokenKind::RParen, nullptr)) {
        return nullptr;
    }

    auto consequent = ParseStatement();
    if (consequent == nullptr) {
        return nullptr;
    }

    std::unique_ptr<Statement> alternate;
    if (CheckKeyword("else")) {
        Advance();
        alternate = ParseStatement();
        if (alternate == nullptr) {
            return nullptr;
        }
    }

    return std::make_unique<IfStatement>(
        std::move(test),
        std::move(consequent),
        std::move(alternate),
        keyword.line,
        keyword.column);
}

// while (...) and for (...): the header is skipped, only the body is kept.
std::unique_ptr<Statement> Parser::ParseLoop() {
    const Token& keyword = Advance();

    if (!Expect(TokenKind::LParen, nullptr)) {
        return nullptr;
    }
    SkipParenthesizedHeader();

    auto body = ParseStatement();
    if (body == nullptr) {
        return nullptr;
    }

    if (keyword.lexeme == "while") {
        return std::make_unique<WhileStatement>(std::move(body), keyword.line, keyword.column);
    }
    return std::make_unique<ForStatement>(std::move(body), keyword.line, keyword.column);
}

// Expects the opening '(' to be consumed already; stops after the matching
// ')' or at end of input.
void Parser::SkipParenthesizedHeader() {
    int depth = 1;
    while (depth > 0 && !IsAtEnd()) {
        if (Check(TokenKind::LParen)) {
            ++depth;
        } else if (Check(TokenKind::RParen)) {
            --depth;
        }
        Advance();
    }
}

std::unique_ptr<Statement> Parser::ParseExpressionStatement() {
    auto expression = ParseExpression();
    if (expression == nullptr) {
        return nullptr;
    }

    Match(TokenKind::Semicolon);
    const std::size_t line = expression->line;
    const std::size_t column = expression->column;
    return std::make_unique<ExpressionStatement>(std::move(expression), line, column);
}

}  // namespace jsguard::frontend
