#pragma once
#include <string_view>
#include <string>
#include <vector>
#include <cstddef>

enum class Type
{
    IDENTIFIER,
    LOCAL_IDENTIFIER, // @name
    DIRECTIVE,        // .name
    NUMBER,
    STRING,
    COLON,
    COMMA,
    HASH,
    OPEN_PAREN,
    CLOSE_PAREN,
    PLUS,
    MINUS,
    ASTERISK,
    SLASH,
    ASSIGN,
    NEWLINE,
    END = -1,
    UNKNOWN = -2, // should neva happen
};

struct Token
{
    Type type;
    std::string_view value; // No more std::string allocations per token
    size_t line = 1;
    std::string to_string() const;
};

class Lexer
{
    std::string_view source;
    size_t cursor = 0;
    size_t line = 1;

public:
    explicit Lexer(std::string_view src) : source(src) {}
    std::vector<Token> tokenize();

private:
    void skip_whitespace_and_comments();
    constexpr bool is_eof() const { return cursor >= source.length(); }
    constexpr char peek() const { return is_eof() ? '\0' : source[cursor]; }
    constexpr void advance() { cursor++; }
    static constexpr bool is_word_char(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    }
};
