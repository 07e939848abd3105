#pragma once
#include "lexer.hpp"
#include "errors.hpp"
#include "ast.hpp"
#include <string>
#include <memory>

class Parser
{
    Token currentToken;
    std::vector<Token> tokens;
    size_t position = 0;

    inline void consume(Type type)
    {
        if (currentToken.type == type)
        {
            position++;
            if (position < tokens.size())
                currentToken = tokens[position];
        }
        else
            throw ParseError("Unexpected token " + currentToken.to_string(), currentToken.line);
    }

    inline Token peek(int offset = 1) {
        if (position + offset >= tokens.size())
            return tokens.back();

        return tokens[position + offset];
    }

    inline bool atEndOfLine() const {
        return currentToken.type == Type::NEWLINE || currentToken.type == Type::END;
    }

public:
    explicit Parser(const std::vector<Token>& toks) : tokens(toks)
    {
        if (tokens.empty() || tokens.back().type != Type::END)
            tokens.push_back({Type::END, "", tokens.empty() ? 1 : tokens.back().line});
        currentToken = tokens[position];
    }

    std::unique_ptr<ProgramNode> parseProgram();
    std::unique_ptr<ProgramNode> parse() { return parseProgram(); }

    StatementGroup parseLine();
    std::unique_ptr<Statement> parseStatement();

    std::unique_ptr<LabelNode> parseLabel();
    std::unique_ptr<SymbolDefinitionNode> parseSymbolDefinition();
    std::unique_ptr<DirectiveNode> parseDirective();
    std::unique_ptr<InstructionNode> parseInstruction();

    IndexRegister parseIndexRegister();

    int parseNumber();
    std::unique_ptr<StringNode> parseString();

    // --- Expression Parsing (Precedence Hierarchy) ---
    /*
        |Level|Precedence    |Operator       |Method               |
        |-----|--------------|---------------|---------------------|
        |1    |Add / Subtract|+, -           |parseAdditive()      |
        |2    |Mult / Div    |*, /           |parseMultiplicative()|
        |3    |Highest       |(), Literals   |parsePrimary()       |

    */
    std::unique_ptr<Expression> parseExpression();
    std::unique_ptr<Expression> parseAdditive();
    std::unique_ptr<Expression> parseMultiplicative();
    std::unique_ptr<Expression> parsePrimary();
};

// Uppercase copy, used for mnemonics and directive names.
std::string toUpper(std::string_view text);
