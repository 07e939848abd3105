#include "lexer.hpp"
#include "errors.hpp"
#include <cctype>

std::string Token::to_string() const
{
    return "Token(" + std::to_string(static_cast<int>(type)) + ", \"" + std::string(value) + "\", line " + std::to_string(line) + ")";
}

void Lexer::skip_whitespace_and_comments() {
    while (!is_eof()) {
        const char c = peek();
        if (c == ' ' || c == '\t' || c == '\r') {
            advance();
        } else if (c == ';') {
            while (!is_eof() && peek() != '\n') advance();
        } else {
            break;
        }
    }
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        skip_whitespace_and_comments();
        if (is_eof()) break;

        size_t start = cursor;
        char c = peek();

        if (c == '\n') {
            tokens.push_back({Type::NEWLINE, source.substr(cursor, 1), line});
            advance();
            line++;
            continue;
        }

        // $hex, %binary, decimal
        if (c == '$' || c == '%' || std::isdigit(static_cast<unsigned char>(c))) {
            if (c == '$') {
                advance();
                while (!is_eof() && std::isxdigit(static_cast<unsigned char>(peek()))) advance();
            } else if (c == '%') {
                advance();
                while (!is_eof() && (peek() == '0' || peek() == '1')) advance();
            } else {
                while (!is_eof() && std::isdigit(static_cast<unsigned char>(peek()))) advance();
            }
            if (cursor - start == 1 && (c == '$' || c == '%')) {
                throw ParseError("Malformed numeric literal '" + std::string(1, c) + "'", line);
            }
            tokens.push_back({Type::NUMBER, source.substr(start, cursor - start), line});
            continue;
        }

        if (c == '"' || c == '\'') {
            const char quote = c;
            advance(); // make sure we dont end a string immediately
            while (!is_eof() && peek() != quote && peek() != '\n') {
                advance();
            }
            if (peek() != quote) {
                throw ParseError("Unterminated string literal", line);
            }
            std::string_view str = source.substr(start + 1, cursor - start - 1);
            tokens.push_back({Type::STRING, str, line});
            advance();
            continue;
        }

        if (c == '.' || c == '@' || std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            advance();
            while (!is_eof() && is_word_char(peek())) {
                advance();
            }

            std::string_view word = source.substr(start, cursor - start);
            if (word.size() == 1 && (c == '.' || c == '@')) {
                throw ParseError("Expected a name after '" + std::string(1, c) + "'", line);
            }

            if (c == '.')       tokens.push_back({Type::DIRECTIVE, word, line});
            else if (c == '@')  tokens.push_back({Type::LOCAL_IDENTIFIER, word, line});
            else                tokens.push_back({Type::IDENTIFIER, word, line});
            continue;
        }

        Type symType = Type::UNKNOWN;
        switch (c) {
            case ':': symType = Type::COLON; break;
            case ',': symType = Type::COMMA; break;
            case '#': symType = Type::HASH; break;
            case '(': symType = Type::OPEN_PAREN; break;
            case ')': symType = Type::CLOSE_PAREN; break;
            case '+': symType = Type::PLUS; break;
            case '-': symType = Type::MINUS; break;
            case '*': symType = Type::ASTERISK; break;
            case '/': symType = Type::SLASH; break;
            case '=': symType = Type::ASSIGN; break;
            default:
                throw ParseError("Unknown character: '" + std::string(1, c) + "'", line);
        }

        tokens.push_back({symType, source.substr(cursor, 1), line});
        advance();
    }

    tokens.push_back({Type::END, "", line});
    return tokens;
}
