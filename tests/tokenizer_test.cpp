#include "jsguard/frontend/tokenizer.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace jsguard::frontend;

class TokenizerTest : public ::testing::Test {
protected:
    std::vector<Token> lex(const std::string& code) {
        return Tokenizer::Tokenize(code);
    }

    // Drops Newline, Comment and the trailing EndOfFile.
    std::vector<Token> lex_significant(const std::string& code) {
        std::vector<Token> significant;
        for (const auto& token : lex(code)) {
            if (token.kind != TokenKind::Newline && token.kind != TokenKind::Comment &&
                token.kind != TokenKind::EndOfFile) {
                significant.push_back(token);
            }
        }
        return significant;
    }

    Token lex_one(const std::string& code) {
        auto tokens = lex_significant(code);
        EXPECT_GE(tokens.size(), 1u);
        return tokens.empty() ? Token{} : tokens[0];
    }
};

TEST_F(TokenizerTest, EmptyInputYieldsOnlyEndOfFile) {
    auto tokens = lex("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TokenKind::EndOfFile);
    EXPECT_EQ(tokens[0].lexeme, "");
    EXPECT_EQ(tokens[0].line, 1u);
    EXPECT_EQ(tokens[0].column, 1u);
}

TEST_F(TokenizerTest, Keywords) {
    for (const char* keyword : {"var", "let", "const", "function", "return", "if", "else", "for", "while"}) {
        auto token = lex_one(keyword);
        EXPECT_EQ(token.kind, TokenKind::Keyword) << keyword;
        EXPECT_EQ(token.lexeme, keyword);
    }
}

TEST_F(TokenizerTest, LiteralWords) {
    EXPECT_EQ(lex_one("true").kind, TokenKind::Boolean);
    EXPECT_EQ(lex_one("false").kind, TokenKind::Boolean);
    EXPECT_EQ(lex_one("null").kind, TokenKind::Null);
}

TEST_F(TokenizerTest, Identifiers) {
    EXPECT_EQ(lex_one("foo").kind, TokenKind::Identifier);
    EXPECT_EQ(lex_one("_private").lexeme, "_private");
    EXPECT_EQ(lex_one("$el").lexeme, "$el");
    EXPECT_EQ(lex_one("item42").lexeme, "item42");
    EXPECT_EQ(lex_one("variable").kind, TokenKind::Identifier);
}

TEST_F(TokenizerTest, Numbers) {
    EXPECT_EQ(lex_one("42").kind, TokenKind::Number);
    EXPECT_EQ(lex_one("3.14").lexeme, "3.14");

    auto tokens = lex_significant("1.2.3");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].lexeme, "1.2");
    EXPECT_EQ(tokens[1].kind, TokenKind::Dot);
    EXPECT_EQ(tokens[2].lexeme, "3");
}

TEST_F(TokenizerTest, StringsWithEitherQuote) {
    auto single = lex_one("'hello'");
    EXPECT_EQ(single.kind, TokenKind::String);
    EXPECT_EQ(single.lexeme, "hello");

    auto dbl = lex_one("\"world\"");
    EXPECT_EQ(dbl.kind, TokenKind::String);
    EXPECT_EQ(dbl.lexeme, "world");
}

TEST_F(TokenizerTest, StringEscapeKeepsEscapedCharacter) {
    auto token = lex_one("'it\\'s'");
    EXPECT_EQ(token.kind, TokenKind::String);
    EXPECT_EQ(token.lexeme, "it's");
}

TEST_F(TokenizerTest, UnterminatedStringRunsToEnd) {
    auto tokens = lex("'abc");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::String);
    EXPECT_EQ(tokens[0].lexeme, "abc");
    EXPECT_EQ(tokens[1].kind, TokenKind::EndOfFile);
}

TEST_F(TokenizerTest, MaximalMunchPrefersLongestOperator) {
    auto tokens = lex_significant("a === b");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].kind, TokenKind::Comparison);
    EXPECT_EQ(tokens[1].lexeme, "===");

    EXPECT_EQ(lex_one("!==").lexeme, "!==");
    EXPECT_EQ(lex_one("==").lexeme, "==");
    EXPECT_EQ(lex_one("+=").kind, TokenKind::Assignment);
    EXPECT_EQ(lex_one("++").kind, TokenKind::Unary);
    EXPECT_EQ(lex_one("&&").kind, TokenKind::Logical);
    EXPECT_EQ(lex_one("||").kind, TokenKind::Logical);
}

TEST_F(TokenizerTest, OperatorClassification) {
    EXPECT_EQ(lex_one("=").kind, TokenKind::Assignment);
    EXPECT_EQ(lex_one("+").kind, TokenKind::Arithmetic);
    EXPECT_EQ(lex_one("%").kind, TokenKind::Arithmetic);
    EXPECT_EQ(lex_one("<=").kind, TokenKind::Comparison);
    EXPECT_EQ(lex_one("!").kind, TokenKind::Unary);
    EXPECT_EQ(lex_one("~").kind, TokenKind::Unary);
}

TEST_F(TokenizerTest, Punctuation) {
    auto tokens = lex_significant(";,.:(){}[]");
    const TokenKind expected[] = {
        TokenKind::Semicolon, TokenKind::Comma, TokenKind::Dot, TokenKind::Colon,
        TokenKind::LParen, TokenKind::RParen, TokenKind::LBrace, TokenKind::RBrace,
        TokenKind::LBracket, TokenKind::RBracket,
    };
    ASSERT_EQ(tokens.size(), sizeof(expected) / sizeof(expected[0]));
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        EXPECT_EQ(tokens[i].kind, expected[i]) << i;
    }
}

TEST_F(TokenizerTest, CommentsAreTrimmed) {
    auto tokens = lex("// note here  \n/* block\ncomment */x");
    ASSERT_GE(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Comment);
    EXPECT_EQ(tokens[0].lexeme, "note here");
    EXPECT_EQ(tokens[1].kind, TokenKind::Newline);
    EXPECT_EQ(tokens[2].kind, TokenKind::Comment);
    EXPECT_EQ(tokens[2].lexeme, "block\ncomment");
    EXPECT_EQ(tokens[3].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[3].line, 3u);
}

TEST_F(TokenizerTest, UnterminatedBlockCommentRunsToEnd) {
    auto tokens = lex("/* never closed");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Comment);
    EXPECT_EQ(tokens[0].lexeme, "never closed");
    EXPECT_EQ(tokens[1].kind, TokenKind::EndOfFile);
}

TEST_F(TokenizerTest, NewlinesAreTokens) {
    auto tokens = lex("a\nb");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].kind, TokenKind::Newline);
    EXPECT_EQ(tokens[1].lexeme, "\\n");
}

TEST_F(TokenizerTest, PositionsAreOneBased) {
    auto tokens = lex_significant("let x = 1;\n  foo();");
    ASSERT_EQ(tokens.size(), 9u);
    EXPECT_EQ(tokens[0].line, 1u);
    EXPECT_EQ(tokens[0].column, 1u);
    EXPECT_EQ(tokens[1].column, 5u);
    EXPECT_EQ(tokens[5].lexeme, "foo");
    EXPECT_EQ(tokens[5].line, 2u);
    EXPECT_EQ(tokens[5].column, 3u);
}

TEST_F(TokenizerTest, UnknownCharactersDoNotStopScanning) {
    auto tokens = lex_significant("a # b @");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].kind, TokenKind::Unknown);
    EXPECT_EQ(tokens[1].lexeme, "#");
    EXPECT_EQ(tokens[2].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[3].kind, TokenKind::Unknown);
}

TEST_F(TokenizerTest, AlwaysEndsWithSingleEndOfFile) {
    for (const char* source : {"", "x", "'open", "/* open", "\n\n", "@#", "a+++b"}) {
        auto tokens = lex(source);
        ASSERT_FALSE(tokens.empty()) << source;
        EXPECT_EQ(tokens.back().kind, TokenKind::EndOfFile) << source;
        std::size_t eof_count = 0;
        for (const auto& token : tokens) {
            if (token.kind == TokenKind::EndOfFile) {
                ++eof_count;
            }
        }
        EXPECT_EQ(eof_count, 1u) << source;
    }
}

TEST_F(TokenizerTest, TokenToString) {
    auto token = lex_one("foo");
    EXPECT_EQ(ToString(token), "Token(Identifier, \"foo\", 1:1)");
    EXPECT_STREQ(ToString(TokenKind::EndOfFile), "EOF");
}
