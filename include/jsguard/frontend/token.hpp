#ifndef JSGUARD_FRONTEND_TOKEN_HPP
#define JSGUARD_FRONTEND_TOKEN_HPP

#include <cstddef>
#include <string>

namespace jsguard::frontend {

enum class TokenKind {
    Identifier,
    Number,
    String,
    Boolean,
    Null,
    Keyword,

    Assignment,
    Arithmetic,
    Comparison,
    Logical,
    Unary,

    Semicolon,
    Comma,
    Dot,
    Colon,
    LParen,
    RParen,
    LBrace,
    RBrace,
    LBracket,
    RBracket,

    Comment,
    Newline,
    EndOfFile,
    Unknown,
};

struct Token {
    TokenKind kind = TokenKind::Unknown;
    std::string lexeme;
    std::size_t line = 1;
    std::size_t column = 1;
};

const char* ToString(TokenKind kind);

// Token(<Kind>, "<lexeme>", <line>:<column>)
std::string ToString(const Token& token);

}  // namespace jsguard::frontend

#endif  // JSGUARD_FRONTEND_TOKEN_HPP
