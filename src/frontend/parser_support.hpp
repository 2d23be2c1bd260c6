#ifndef JSGUARD_FRONTEND_PARSER_SUPPORT_HPP
#define JSGUARD_FRONTEND_PARSER_SUPPORT_HPP

#include <string>
#include <utility>
#include <vector>

#include "jsguard/frontend/token.hpp"

namespace jsguard::frontend::internal {

inline bool IsTrivia(TokenKind kind) {
    return kind == TokenKind::Comment || kind == TokenKind::Newline;
}

// Keywords that begin a statement; panic-mode recovery stops in front of them.
inline bool IsStatementKeyword(const Token& token) {
    if (token.kind != TokenKind::Keyword) {
        return false;
    }

    static const char* const kSyncKeywords[] = {
        "function", "var", "let", "const", "if", "while", "for", "return",
    };
    for (const char* keyword : kSyncKeywords) {
        if (token.lexeme == keyword) {
            return true;
        }
    }
    return false;
}

inline std::string DescribeToken(const Token& token) {
    return std::string(ToString(token.kind)) + "(" + token.lexeme + ")";
}

inline std::string DescribeLocation(const Token& token) {
    return "line " + std::to_string(token.line) + ":" + std::to_string(token.column);
}

inline std::vector<Token> StripTrivia(std::vector<Token> tokens) {
    std::vector<Token> significant;
    significant.reserve(tokens.size());
    for (auto& token : tokens) {
        if (!IsTrivia(token.kind)) {
            significant.push_back(std::move(token));
        }
    }

    if (significant.empty() || significant.back().kind != TokenKind::EndOfFile) {
        Token end;
        end.kind = TokenKind::EndOfFile;
        if (!significant.empty()) {
            end.line = significant.back().line;
            end.column = significant.back().column;
        }
        significant.push_back(end);
    }
    return significant;
}

}  // namespace jsguard::frontend::internal

#endif  // JSGUARD_FRONTEND_PARSER_SUPPORT_HPP
