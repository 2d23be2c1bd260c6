#include "jsguard/frontend/tokenizer.hpp"

#include <cctype>
#include <cstring>
#include <utility>

namespace jsguard::frontend {

namespace {

struct OperatorSpelling {
    const char* text;
    TokenKind kind;
};

constexpr OperatorSpelling kThreeCharOperators[] = {
    {"===", TokenKind::Comparison},
    {"!==", TokenKind::Comparison},
    {">>>", TokenKind::Arithmetic},
    {"<<=", TokenKind::Assignment},
    {">>=", TokenKind::Assignment},
};

constexpr OperatorSpelling kTwoCharOperators[] = {
    {"==", TokenKind::Comparison},
    {"!=", TokenKind::Comparison},
    {"<=", TokenKind::Comparison},
    {">=", TokenKind::Comparison},
    {"&&", TokenKind::Logical},
    {"||", TokenKind::Logical},
    {"++", TokenKind::Unary},
    {"--", TokenKind::Unary},
    {"+=", TokenKind::Assignment},
    {"-=", TokenKind::Assignment},
    {"*=", TokenKind::Assignment},
    {"/=", TokenKind::Assignment},
    {"%=", TokenKind::Assignment},
    {"&=", TokenKind::Assignment},
    {"|=", TokenKind::Assignment},
    {"^=", TokenKind::Assignment},
    {"<<", TokenKind::Arithmetic},
    {">>", TokenKind::Arithmetic},
    {"**", TokenKind::Arithmetic},
};

constexpr OperatorSpelling kOneCharOperators[] = {
    {"+", TokenKind::Arithmetic},
    {"-", TokenKind::Arithmetic},
    {"*", TokenKind::Arithmetic},
    {"/", TokenKind::Arithmetic},
    {"%", TokenKind::Arithmetic},
    {"&", TokenKind::Arithmetic},
    {"|", TokenKind::Arithmetic},
    {"^", TokenKind::Arithmetic},
    {"=", TokenKind::Assignment},
    {"<", TokenKind::Comparison},
    {">", TokenKind::Comparison},
    {"!", TokenKind::Unary},
    {"~", TokenKind::Unary},
};

constexpr const char* kKeywords[] = {
    "var", "let", "const", "function", "return", "if", "else", "for", "while",
};

bool IsIdentifierStart(char character) {
    return std::isalpha(static_cast<unsigned char>(character)) || character == '_' || character == '$';
}

bool IsIdentifierBody(char character) {
    return std::isalnum(static_cast<unsigned char>(character)) || character == '_' || character == '$';
}

bool IsDigit(char character) {
    return std::isdigit(static_cast<unsigned char>(character)) != 0;
}

bool IsOperatorChar(char character) {
    return character != '\0' && std::strchr("+-*/%=<>!&|^~", character) != nullptr;
}

bool PunctuationToTokenKind(char character, TokenKind* out_kind) {
    switch (character) {
    case ';':
        *out_kind = TokenKind::Semicolon;
        return true;
    case ',':
        *out_kind = TokenKind::Comma;
        return true;
    case '.':
        *out_kind = TokenKind::Dot;
        return true;
    case ':':
        *out_kind = TokenKind::Colon;
        return true;
    case '(':
        *out_kind = TokenKind::LParen;
        return true;
    case ')':
        *out_kind = TokenKind::RParen;
        return true;
    case '{':
        *out_kind = TokenKind::LBrace;
        return true;
    case '}':
        *out_kind = TokenKind::RBrace;
        return true;
    case '[':
        *out_kind = TokenKind::LBracket;
        return true;
    case ']':
        *out_kind = TokenKind::RBracket;
        return true;
    default:
        return false;
    }
}

TokenKind WordToTokenKind(const std::string& text) {
    if (text == "true" || text == "false") {
        return TokenKind::Boolean;
    }
    if (text == "null") {
        return TokenKind::Null;
    }
    for (const char* keyword : kKeywords) {
        if (text == keyword) {
            return TokenKind::Keyword;
        }
    }
    return TokenKind::Identifier;
}

std::string Trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

class Scanner {
public:
    explicit Scanner(const std::string& source) : source_(source) {}

    std::vector<Token> Run() {
        while (!IsAtEnd()) {
            const char current = Peek();

            if (current == ' ' || current == '\t' || current == '\r') {
                Advance();
                continue;
            }

            if (current == '\n') {
                Emit(TokenKind::Newline, "\\n", line_, column_);
                Advance();
                continue;
            }

            if (current == '/' && Peek(1) == '/') {
                ScanLineComment();
                continue;
            }

            if (current == '/' && Peek(1) == '*') {
                ScanBlockComment();
                continue;
            }

            if (current == '"' || current == '\'' || current == '`') {
                ScanString(current);
                continue;
            }

            if (IsDigit(current)) {
                ScanNumber();
                continue;
            }

            if (IsIdentifierStart(current)) {
                ScanWord();
                continue;
            }

            TokenKind punctuation = TokenKind::Unknown;
            if (PunctuationToTokenKind(current, &punctuation)) {
                Emit(punctuation, std::string(1, current), line_, column_);
                Advance();
                continue;
            }

            if (IsOperatorChar(current)) {
                ScanOperator();
                continue;
            }

            Emit(TokenKind::Unknown, std::string(1, current), line_, column_);
            Advance();
        }

        Emit(TokenKind::EndOfFile, "", line_, column_);
        return std::move(tokens_);
    }

private:
    void ScanLineComment() {
        const std::size_t line = line_;
        const std::size_t column = column_;
        Advance();
        Advance();

        std::string text;
        while (!IsAtEnd() && Peek() != '\n') {
            text.push_back(Peek());
            Advance();
        }
        Emit(TokenKind::Comment, Trim(text), line, column);
    }

    // An unterminated block comment runs to the end of the input.
    void ScanBlockComment() {
        const std::size_t line = line_;
        const std::size_t column = column_;
        Advance();
        Advance();

        std::string text;
        while (!IsAtEnd()) {
            if (Peek() == '*' && Peek(1) == '/') {
                Advance();
                Advance();
                break;
            }
            text.push_back(Peek());
            Advance();
        }
        Emit(TokenKind::Comment, Trim(text), line, column);
    }

    // Escapes are kept raw: the character after a backslash is stored as-is.
    void ScanString(char quote) {
        const std::size_t line = line_;
        const std::size_t column = column_;
        Advance();

        std::string literal;
        while (!IsAtEnd() && Peek() != quote) {
            if (Peek() == '\\') {
                Advance();
                if (IsAtEnd()) {
                    break;
                }
            }
            literal.push_back(Peek());
            Advance();
        }

        if (!IsAtEnd()) {
            Advance();
        }
        Emit(TokenKind::String, literal, line, column);
    }

    void ScanNumber() {
        const std::size_t line = line_;
        const std::size_t column = column_;
        std::string text;
        bool has_dot = false;

        while (!IsAtEnd()) {
            const char candidate = Peek();
            if (candidate == '.') {
                if (has_dot) {
                    break;
                }
                has_dot = true;
            } else if (!IsDigit(candidate)) {
                break;
            }
            text.push_back(candidate);
            Advance();
        }
        Emit(TokenKind::Number, text, line, column);
    }

    void ScanWord() {
        const std::size_t line = line_;
        const std::size_t column = column_;
        std::string text;
        while (!IsAtEnd() && IsIdentifierBody(Peek())) {
            text.push_back(Peek());
            Advance();
        }
        Emit(WordToTokenKind(text), text, line, column);
    }

    void ScanOperator() {
        const std::size_t line = line_;
        const std::size_t column = column_;

        if (MatchOperator(kThreeCharOperators, 3, line, column) ||
            MatchOperator(kTwoCharOperators, 2, line, column) ||
            MatchOperator(kOneCharOperators, 1, line, column)) {
            return;
        }

        Emit(TokenKind::Unknown, std::string(1, Peek()), line, column);
        Advance();
    }

    template <std::size_t N>
    bool MatchOperator(
        const OperatorSpelling (&table)[N],
        std::size_t length,
        std::size_t line,
        std::size_t column) {
        if (offset_ + length > source_.size()) {
            return false;
        }

        const std::string candidate = source_.substr(offset_, length);
        for (const auto& spelling : table) {
            if (candidate == spelling.text) {
                for (std::size_t i = 0; i < length; ++i) {
                    Advance();
                }
                Emit(spelling.kind, candidate, line, column);
                return true;
            }
        }
        return false;
    }

    bool IsAtEnd() const {
        return offset_ >= source_.size();
    }

    char Peek(std::size_t ahead = 0) const {
        const std::size_t index = offset_ + ahead;
        return index < source_.size() ? source_[index] : '\0';
    }

    void Advance() {
        if (IsAtEnd()) {
            return;
        }
        if (source_[offset_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++offset_;
    }

    void Emit(TokenKind kind, std::string lexeme, std::size_t line, std::size_t column) {
        tokens_.push_back(Token{kind, std::move(lexeme), line, column});
    }

    const std::string& source_;
    std::size_t offset_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
    std::vector<Token> tokens_;
};

}  // namespace

const char* ToString(TokenKind kind) {
    switch (kind) {
    case TokenKind::Identifier:
        return "Identifier";
    case TokenKind::Number:
        return "Number";
    case TokenKind::String:
        return "String";
    case TokenKind::Boolean:
        return "Boolean";
    case TokenKind::Null:
        return "Null";
    case TokenKind::Keyword:
        return "Keyword";
    case TokenKind::Assignment:
        return "Assignment";
    case TokenKind::Arithmetic:
        return "Arithmetic";
    case TokenKind::Comparison:
        return "Comparison";
    case TokenKind::Logical:
        return "Logical";
    case TokenKind::Unary:
        return "Unary";
    case TokenKind::Semicolon:
        return "Semicolon";
    case TokenKind::Comma:
        return "Comma";
    case TokenKind::Dot:
        return "Dot";
    case TokenKind::Colon:
        return "Colon";
    case TokenKind::LParen:
        return "LParen";
    case TokenKind::RParen:
        return "RParen";
    case TokenKind::LBrace:
        return "LBrace";
    case TokenKind::RBrace:
        return "RBrace";
    case TokenKind::LBracket:
        return "LBracket";
    case TokenKind::RBracket:
        return "RBracket";
    case TokenKind::Comment:
        return "Comment";
    case TokenKind::Newline:
        return "Newline";
    case TokenKind::EndOfFile:
        return "EOF";
    case TokenKind::Unknown:
    default:
        return "Unknown";
    }
}

std::string ToString(const Token& token) {
    return std::string("Token(") + ToString(token.kind) + ", \"" + token.lexeme + "\", " +
           std::to_string(token.line) + ":" + std::to_string(token.column) + ")";
}

std::vector<Token> Tokenizer::Tokenize(const std::string& source) {
    Scanner scanner(source);
    return scanner.Run();
}

}  // namespace jsguard::frontend
