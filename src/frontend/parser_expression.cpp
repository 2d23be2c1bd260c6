#include "jsguard/frontend/parser.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace jsguard::frontend {

std::unique_ptr<Expr> Parser::ParseExpression() {
    return ParseAssignment();
}

// Right-associative: a = b = c parses as a = (b = c).
std::unique_ptr<Expr> Parser::ParseAssignment() {
    auto target = ParseLogicalOr();
    if (target == nullptr) {
        return nullptr;
    }

    if (!Check(TokenKind::Assignment)) {
        return target;
    }

    const std::string op = Advance().lexeme;
    auto value = ParseAssignment();
    if (value == nullptr) {
        return nullptr;
    }

    const std::size_t line = target->line;
    const std::size_t column = target->column;
    return std::make_unique<AssignmentExpression>(op, std::move(target), std::move(value), line, column);
}

std::unique_ptr<Expr> Parser::ParseLogicalOr() {
    auto expression = ParseLogicalAnd();
    std::string op;
    while (expression != nullptr && MatchOperator(TokenKind::Logical, {"||"}, &op)) {
        auto rhs = ParseLogicalAnd();
        if (rhs == nullptr) {
            return nullptr;
        }
        const std::size_t line = expression->line;
        const std::size_t column = expression->column;
        expression = std::make_unique<BinaryExpression>(op, std::move(expression), std::move(rhs), line, column);
    }
    return expression;
}

std::unique_ptr<Expr> Parser::ParseLogicalAnd() {
    auto expression = ParseEquality();
    std::string op;
    while (expression != nullptr && MatchOperator(TokenKind::Logical, {"&&"}, &op)) {
        auto rhs = ParseEquality();
        if (rhs == nullptr) {
            return nullptr;
        }
        const std::size_t line = expression->line;
        const std::size_t column = expression->column;
        expression = std::make_unique<BinaryExpression>(op, std::move(expression), std::move(rhs), line, column);
    }
    return expression;
}

std::unique_ptr<Expr> Parser::ParseEquality() {
    auto expression = ParseRelational();
    std::string op;
    while (expression != nullptr && MatchOperator(TokenKind::Comparison, {"==", "!=", "===", "!=="}, &op)) {
        auto rhs = ParseRelational();
        if (rhs == nullptr) {
            return nullptr;
        }
        const std::size_t line = expression->line;
        const std::size_t column = expression->column;
        expression = std::make_unique<BinaryExpression>(op, std::move(expression), std::move(rhs), line, column);
    }
    return expression;
}

std::unique_ptr<Expr> Parser::ParseRelational() {
    auto expression = ParseAdditive();
    std::string op;
    while (expression != nullptr && MatchOperator(TokenKind::Comparison, {"<", ">", "<=", ">="}, &op)) {
        auto rhs = ParseAdditive();
        if (rhs == nullptr) {
            return nullptr;
        }
        const std::size_t line = expression->line;
        const std::size_t column = expression->column;
        expression = std::make_unique<BinaryExpression>(op, std::move(expression), std::move(rhs), line, column);
    }
    return expression;
}

std::unique_ptr<Expr> Parser::ParseAdditive() {
    auto expression = ParseMultiplicative();
    std::string op;
    while (expression != nullptr && MatchOperator(TokenKind::Arithmetic, {"+", "-"}, &op)) {
        auto rhs = ParseMultiplicative();
        if (rhs == nullptr) {
            return nullptr;
        }
        const std::size_t line = expression->line;
        const std::size_t column = expression->column;
        expression = std::make_unique<BinaryExpression>(op, std::move(expression), std::move(rhs), line, column);
    }
    return expression;
}

std::unique_ptr<Expr> Parser::ParseMultiplicative() {
    auto expression = ParseUnary();
    std::string op;
    while (expression != nullptr && MatchOperator(TokenKind::Arithmetic, {"*", "/", "%"}, &op)) {
        auto rhs = ParseUnary();
        if (rhs == nullptr) {
            return nullptr;
        }
        const std::size_t line = expression->line;
        const std::size_t column = expression->column;
        expression = std::make_unique<BinaryExpression>(op, std::move(expression), std::move(rhs), line, column);
    }
    return expression;
}

std::unique_ptr<Expr> Parser::ParseUnary() {
    if (Check(TokenKind::Unary)) {
        const Token& op = Advance();
        auto operand = ParseUnary();
        if (operand == nullptr) {
            return nullptr;
        }
        return std::make_unique<UnaryExpression>(op.lexeme, std::move(operand), op.line, op.column);
    }

    return ParsePostfix();
}

std::unique_ptr<Expr> Parser::ParsePostfix() {
    auto expression = ParsePrimary();
    if (expression == nullptr) {
        return nullptr;
    }

    while (true) {
        const std::size_t line = expression->line;
        const std::size_t column = expression->column;

        if (Match(TokenKind::Dot)) {
            const Token* name = nullptr;
            if (!Expect(TokenKind::Identifier, &name)) {
                return nullptr;
            }
            auto property = std::make_unique<Identifier>(name->lexeme, name->line, name->column);
            expression = std::make_unique<MemberExpression>(std::move(expression), std::move(property), false, line, column);
            continue;
        }

        if (Match(TokenKind::LBracket)) {
            auto property = ParseExpression();
            if (property == nullptr) {
                return nullptr;
            }
            if (!Expect(TokenKind::RBracket, nullptr)) {
                return nullptr;
            }
            expression = std::make_unique<MemberExpression>(std::move(expression), std::move(property), true, line, column);
            continue;
        }

        if (Match(TokenKind::LParen)) {
            std::vector<std::unique_ptr<Expr>> arguments;
            if (!Check(TokenKind::RParen)) {
                while (true) {
                    auto argument = ParseExpression();
                    if (argument == nullptr) {
                        return nullptr;
                    }
                    arguments.push_back(std::move(argument));
                    if (!Match(TokenKind::Comma)) {
                        break;
                    }
                }
            }
            if (!Expect(TokenKind::RParen, nullptr)) {
                return nullptr;
            }
            expression = std::make_unique<CallExpression>(std::move(expression), std::move(arguments), line, column);
            continue;
        }

        break;
    }

    // x++ / x--
    if (Check(TokenKind::Unary) && (Peek().lexeme == "++" || Peek().lexeme == "--")) {
        const std::string op = Advance().lexeme;
        const std::size_t line = expression->line;
        const std::size_t column = expression->column;
        auto update = std::make_unique<UnaryExpression>(op, std::move(expression), line, column);
        update->prefix = false;
        return update;
    }

    return expression;
}

std::unique_ptr<Expr> Parser::ParsePrimary() {
    const Token& token = Peek();

    switch (token.kind) {
    case TokenKind::Identifier:
        Advance();
        return std::make_unique<Identifier>(token.lexeme, token.line, token.column);
    case TokenKind::Number:
        Advance();
        return std::make_unique<Literal>(
            LiteralValue(std::strtod(token.lexeme.c_str(), nullptr)),
            token.lexeme,
            token.line,
            token.column);
    case TokenKind::String:
        Advance();
        return std::make_unique<Literal>(LiteralValue(token.lexeme), token.lexeme, token.line, token.column);
    case TokenKind::Boolean:
        Advance();
        return std::make_unique<Literal>(LiteralValue(token.lexeme == "true"), token.lexeme, token.line, token.column);
    case TokenKind::Null:
        Advance();
        return std::make_unique<Literal>(LiteralValue(nullptr), token.lexeme, token.line, token.column);
    case TokenKind::LParen: {
        Advance();
        auto expression = ParseExpression();
        if (expression == nullptr) {
            return nullptr;
        }
        if (!Expect(TokenKind::RParen, nullptr)) {
            return nullptr;
        }
        return expression;
    }
    case TokenKind::LBracket:
        return ParseArrayLiteral();
    case TokenKind::LBrace:
        return ParseObjectLiteral();
    default:
        ReportUnexpected();
        return nullptr;
    }
}

std::unique_ptr<Expr> Parser::ParseArrayLiteral() {
    const Token& open = Advance();

    std::vector<std::unique_ptr<Expr>> elements;
    if (!Check(TokenKind::RBracket)) {
        while (true) {
            auto element = ParseExpression();
            if (element == nullptr) {
                return nullptr;
            }
            elements.push_back(std::move(element));
            if (!Match(TokenKind::Comma)) {
                break;
            }
        }
    }

    if (!Expect(TokenKind::RBracket, nullptr)) {
        return nullptr;
    }
    return std::make_unique<ArrayExpression>(std::move(elements), open.line, open.column);
}

std::unique_ptr<Expr> Parser::ParseObjectLiteral() {
    const Token& open = Advance();

    std::vector<std::unique_ptr<Property>> properties;
    if (!Check(TokenKind::RBrace)) {
        while (true) {
            const Token& key_token = Peek();
            std::unique_ptr<Expr> key;
            if (key_token.kind == TokenKind::Identifier) {
                key = std::make_unique<Identifier>(key_token.lexeme, key_token.line, key_token.column);
            } else if (key_token.kind == TokenKind::String) {
                key = std::make_unique<Literal>(
                    LiteralValue(key_token.lexeme),
                    key_token.lexeme,
                    key_token.line,
                    key_token.column);
            } else {
                ReportExpected("property name");
                return nullptr;
            }
            Advance();

            if (!Expect(TokenKind::Colon, nullptr)) {
                return nullptr;
            }

            auto value = ParseExpression();
            if (value == nullptr) {
                return nullptr;
            }

            properties.push_back(std::make_unique<Property>(std::move(key), std::move(value), key_token.line, key_token.column));
            if (!Match(TokenKind::Comma)) {
                break;
            }
        }
    }

    if (!Expect(TokenKind::RBrace, nullptr)) {
        return nullptr;
    }
    return std::make_unique<ObjectExpression>(std::move(properties), open.line, open.column);
}

}  // namespace jsguard::frontend
