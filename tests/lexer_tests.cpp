#include "../src/lexer.hpp"
#include "../src/errors.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
struct TokenExpectation {
    Type type;
    std::string value;
};

void expect_tokens(std::string_view source, const std::vector<TokenExpectation>& expected) {
    Lexer lexer(source);
    const auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), expected.size()) << "Token count mismatch";

    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tokens[i].type, expected[i].type) << "Token type mismatch at index " << i;
        EXPECT_EQ(tokens[i].value, expected[i].value) << "Token value mismatch at index " << i;
    }
}
} // namespace

TEST(LexerTests, ParsesImmediateInstruction) {
    expect_tokens("LDA #$01", {
        {Type::IDENTIFIER, "LDA"},
        {Type::HASH, "#"},
        {Type::NUMBER, "$01"},
        {Type::END, ""},
    });
}

TEST(LexerTests, ParsesLabelsAndDirectives) {
    expect_tokens("reset: .org $8000\n@loop: BNE @loop", {
        {Type::IDENTIFIER, "reset"},
        {Type::COLON, ":"},
        {Type::DIRECTIVE, ".org"},
        {Type::NUMBER, "$8000"},
        {Type::NEWLINE, "\n"},
        {Type::LOCAL_IDENTIFIER, "@loop"},
        {Type::COLON, ":"},
        {Type::IDENTIFIER, "BNE"},
        {Type::LOCAL_IDENTIFIER, "@loop"},
        {Type::END, ""},
    });
}

TEST(LexerTests, ParsesNumericFormats) {
    expect_tokens(".byte $2A, %1010, 42", {
        {Type::DIRECTIVE, ".byte"},
        {Type::NUMBER, "$2A"},
        {Type::COMMA, ","},
        {Type::NUMBER, "%1010"},
        {Type::COMMA, ","},
        {Type::NUMBER, "42"},
        {Type::END, ""},
    });
}

TEST(LexerTests, ParsesIndirectOperands) {
    expect_tokens("LDA (ptr),Y", {
        {Type::IDENTIFIER, "LDA"},
        {Type::OPEN_PAREN, "("},
        {Type::IDENTIFIER, "ptr"},
        {Type::CLOSE_PAREN, ")"},
        {Type::COMMA, ","},
        {Type::IDENTIFIER, "Y"},
        {Type::END, ""},
    });
}

TEST(LexerTests, ParsesStringLiteral) {
    expect_tokens(".byte \"hi there\", 'x'", {
        {Type::DIRECTIVE, ".byte"},
        {Type::STRING, "hi there"},
        {Type::COMMA, ","},
        {Type::STRING, "x"},
        {Type::END, ""},
    });
}

TEST(LexerTests, ParsesAssignmentAndOperators) {
    expect_tokens("PPUCTRL = $2000 + 1 - 2 * 3 / 4", {
        {Type::IDENTIFIER, "PPUCTRL"},
        {Type::ASSIGN, "="},
        {Type::NUMBER, "$2000"},
        {Type::PLUS, "+"},
        {Type::NUMBER, "1"},
        {Type::MINUS, "-"},
        {Type::NUMBER, "2"},
        {Type::ASTERISK, "*"},
        {Type::NUMBER, "3"},
        {Type::SLASH, "/"},
        {Type::NUMBER, "4"},
        {Type::END, ""},
    });
}

TEST(LexerTests, SkipsWhitespaceAndComments) {
    expect_tokens("   ; comment\n\tNOP ; trailing", {
        {Type::NEWLINE, "\n"},
        {Type::IDENTIFIER, "NOP"},
        {Type::END, ""},
    });
}

TEST(LexerTests, EmptyInput) {
    expect_tokens("", {
        {Type::END, ""},
    });
}

TEST(LexerTests, TracksLineNumbers) {
    Lexer lexer("NOP\n\nINX\n");
    const auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].line, 1u);
    EXPECT_EQ(tokens[3].value, "INX");
    EXPECT_EQ(tokens[3].line, 3u);
    EXPECT_EQ(tokens.back().line, 4u);
}

TEST(LexerTests, RejectsBareNumberPrefix) {
    Lexer lexer("LDA #$");
    EXPECT_THROW(lexer.tokenize(), ParseError);
}

TEST(LexerTests, RejectsUnterminatedString) {
    Lexer lexer(".byte \"abc\n");
    EXPECT_THROW(lexer.tokenize(), ParseError);
}

TEST(LexerTests, RejectsUnknownCharacter) {
    Lexer lexer("\nLDA !1");
    try {
        lexer.tokenize();
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 2u);
    }
}
