#include "parser.hpp"
#include <cctype>
#include <cstdint>
#include <memory>

std::string toUpper(std::string_view text)
{
    std::string upper(text);
    for (auto& c : upper)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return upper;
}

namespace {

bool isAccumulatorShift(const std::string& mnemonic)
{
    return mnemonic == "ASL" || mnemonic == "LSR" || mnemonic == "ROL" || mnemonic == "ROR";
}

} // namespace

int Parser::parseNumber()
{
    std::string_view sv = currentToken.value;
    const size_t line = currentToken.line;
    consume(Type::NUMBER);

    int base = 10;
    std::size_t start = 0;

    if (!sv.empty() && sv[0] == '$')
    {
        base = 16;
        start = 1;
    }
    else if (!sv.empty() && sv[0] == '%')
    {
        base = 2;
        start = 1;
    }

    const std::string clean(sv.substr(start));
    if (clean.empty())
        throw ParseError("Invalid numeric literal: " + std::string(sv), line);

    std::size_t pos = 0;
    try
    {
        const unsigned long value = std::stoul(clean, &pos, base);
        if (pos != clean.size() || value > 0x7FFFFFFFul)
            throw ParseError("Invalid numeric literal: " + std::string(sv), line);
        return static_cast<int>(value);
    }
    catch (const std::logic_error&)
    {
        throw ParseError("Invalid numeric literal: " + std::string(sv), line);
    }
}

std::unique_ptr<StringNode> Parser::parseString()
{
    const auto str = currentToken.value;
    consume(Type::STRING);
    return std::make_unique<StringNode>(std::string(str));
}

std::unique_ptr<ProgramNode> Parser::parseProgram()
{
    auto root = std::make_unique<ProgramNode>();

    while (currentToken.type != Type::END)
    {
        if (currentToken.type == Type::NEWLINE)
        {
            consume(Type::NEWLINE);
            continue;
        }
        auto group = parseLine();
        if (!group.statements.empty())
            root->groups.push_back(std::move(group));
    }
    return root;
}

StatementGroup Parser::parseLine()
{
    StatementGroup group;
    group.line = currentToken.line;

    while (!atEndOfLine())
    {
        const bool labelAhead = (currentToken.type == Type::IDENTIFIER || currentToken.type == Type::LOCAL_IDENTIFIER)
                                && peek().type == Type::COLON;
        if (labelAhead)
        {
            group.statements.push_back(parseLabel());
            continue;
        }

        group.statements.push_back(parseStatement());
        if (!atEndOfLine())
            throw ParseError("Unexpected " + currentToken.to_string() + " after statement", currentToken.line);
    }

    if (currentToken.type == Type::NEWLINE)
        consume(Type::NEWLINE);
    return group;
}

std::unique_ptr<Statement> Parser::parseStatement()
{
    const size_t line = currentToken.line;
    std::unique_ptr<Statement> statement;

    switch (currentToken.type)
    {
    case Type::DIRECTIVE:
        statement = parseDirective();
        break;
    case Type::IDENTIFIER:
    {
        const Token next = peek();
        if (next.type == Type::ASSIGN || (next.type == Type::IDENTIFIER && toUpper(next.value) == "EQU"))
            statement = parseSymbolDefinition();
        else
            statement = parseInstruction();
        break;
    }
    case Type::LOCAL_IDENTIFIER:
        throw ParseError("Local label " + std::string(currentToken.value) + " must be followed by ':'", line);
    default:
        throw ParseError("Unexpected token " + currentToken.to_string(), line);
    }

    statement->line = line;
    return statement;
}

std::unique_ptr<LabelNode> Parser::parseLabel()
{
    const size_t line = currentToken.line;
    const std::string name(currentToken.value);
    consume(currentToken.type);
    consume(Type::COLON);

    auto label = std::make_unique<LabelNode>(name);
    label->line = line;
    return label;
}

std::unique_ptr<SymbolDefinitionNode> Parser::parseSymbolDefinition()
{
    const std::string name(currentToken.value);
    consume(Type::IDENTIFIER);
    // `=` or EQU
    consume(currentToken.type);
    return std::make_unique<SymbolDefinitionNode>(name, parseExpression());
}

std::unique_ptr<DirectiveNode> Parser::parseDirective()
{
    const size_t line = currentToken.line;
    const std::string name = toUpper(currentToken.value);
    consume(Type::DIRECTIVE);

    Directive kind;
    if (name == ".ORG")                         kind = Directive::ORG;
    else if (name == ".BYTE" || name == ".DB")  kind = Directive::BYTE;
    else if (name == ".WORD" || name == ".DW")  kind = Directive::WORD;
    else if (name == ".ENUM")                   kind = Directive::ENUM;
    else if (name == ".ENDE")                   kind = Directive::ENDE;
    else if (name == ".ALIGN")                  kind = Directive::ALIGN;
    else if (name == ".DSB" || name == ".DS")   kind = Directive::DSB;
    else
        throw ParseError("Unknown directive: " + name, line);

    std::vector<std::unique_ptr<Expression>> arguments;
    while (!atEndOfLine())
    {
        // quoted text is only meaningful as raw bytes
        if (currentToken.type == Type::STRING && kind == Directive::BYTE)
            arguments.push_back(parseString());
        else
            arguments.push_back(parseExpression());

        if (atEndOfLine())
            break;
        consume(Type::COMMA);
    }

    size_t minArgs = 1, maxArgs = 1;
    switch (kind)
    {
    case Directive::BYTE:
    case Directive::WORD: maxArgs = SIZE_MAX; break;
    case Directive::ENDE: minArgs = 0; maxArgs = 0; break;
    case Directive::DSB: maxArgs = 2; break;
    default: break;
    }
    if (arguments.size() < minArgs || arguments.size() > maxArgs)
        throw ParseError("Wrong number of arguments for " + std::string(directiveName(kind)), line);

    return std::make_unique<DirectiveNode>(kind, std::move(arguments));
}

std::unique_ptr<InstructionNode> Parser::parseInstruction()
{
    const std::string mnemonic = toUpper(currentToken.value);
    consume(Type::IDENTIFIER);

    if (atEndOfLine())
        return std::make_unique<InstructionNode>(mnemonic);

    switch (currentToken.type)
    {
    case Type::HASH:
    {
        consume(Type::HASH);
        return std::make_unique<InstructionNode>(mnemonic, OperandSyntax::IMMEDIATE, parseExpression());
    }
    case Type::OPEN_PAREN:
    {
        consume(Type::OPEN_PAREN);
        auto operand = parseExpression();
        if (currentToken.type == Type::COMMA)
        {
            consume(Type::COMMA);
            const size_t line = currentToken.line;
            if (parseIndexRegister() != IndexRegister::X)
                throw ParseError("Indexed indirect addressing requires X", line);
            consume(Type::CLOSE_PAREN);
            return std::make_unique<InstructionNode>(mnemonic, OperandSyntax::INDIRECT_X, std::move(operand), IndexRegister::X);
        }
        consume(Type::CLOSE_PAREN);
        if (currentToken.type == Type::COMMA)
        {
            consume(Type::COMMA);
            const size_t line = currentToken.line;
            if (parseIndexRegister() != IndexRegister::Y)
                throw ParseError("Indirect indexed addressing requires Y", line);
            return std::make_unique<InstructionNode>(mnemonic, OperandSyntax::INDIRECT_Y, std::move(operand), IndexRegister::Y);
        }
        return std::make_unique<InstructionNode>(mnemonic, OperandSyntax::INDIRECT, std::move(operand));
    }
    case Type::IDENTIFIER:
    {
        const Token next = peek();
        const bool lone = next.type == Type::NEWLINE || next.type == Type::END;
        if (lone && isAccumulatorShift(mnemonic) && toUpper(currentToken.value) == "A")
        {
            consume(Type::IDENTIFIER);
            return std::make_unique<InstructionNode>(mnemonic, OperandSyntax::ACCUMULATOR);
        }
        break;
    }
    default:
        break;
    }

    auto operand = parseExpression();
    if (currentToken.type == Type::COMMA)
    {
        consume(Type::COMMA);
        const auto index = parseIndexRegister();
        return std::make_unique<InstructionNode>(mnemonic, OperandSyntax::INDEXED, std::move(operand), index);
    }
    return std::make_unique<InstructionNode>(mnemonic, OperandSyntax::DIRECT, std::move(operand));
}

IndexRegister Parser::parseIndexRegister()
{
    const Token reg = currentToken;
    consume(Type::IDENTIFIER);
    const auto name = toUpper(reg.value);
    if (name == "X") return IndexRegister::X;
    if (name == "Y") return IndexRegister::Y;
    throw ParseError("Expected index register X or Y, got " + std::string(reg.value), reg.line);
}

std::unique_ptr<Expression> Parser::parseExpression()
{
    return parseAdditive();
}

std::unique_ptr<Expression> Parser::parseAdditive()
{
    auto left = parseMultiplicative();

    while (currentToken.type == Type::PLUS || currentToken.type == Type::MINUS)
    {
        Token operate = currentToken;
        consume(operate.type);
        auto right = parseMultiplicative();
        left = std::make_unique<BinaryOperationNode>(tokenToOperator(operate), std::move(left), std::move(right));
    }

    return left;
}

std::unique_ptr<Expression> Parser::parseMultiplicative()
{
    auto left = parsePrimary();

    while (currentToken.type == Type::ASTERISK || currentToken.type == Type::SLASH)
    {
        Token operate = currentToken;
        consume(operate.type);
        auto right = parsePrimary();
        left = std::make_unique<BinaryOperationNode>(tokenToOperator(operate), std::move(left), std::move(right));
    }

    return left;
}

std::unique_ptr<Expression> Parser::parsePrimary()
{
    switch (currentToken.type)
    {
    case Type::NUMBER:
        return std::make_unique<NumberNode>(parseNumber());
    case Type::IDENTIFIER:
    case Type::LOCAL_IDENTIFIER:
    {
        std::string name(currentToken.value);
        consume(currentToken.type);
        return std::make_unique<SymbolNode>(std::move(name));
    }
    case Type::OPEN_PAREN:
    {
        consume(Type::OPEN_PAREN);
        auto inner = parseExpression();
        consume(Type::CLOSE_PAREN);
        return inner;
    }
    default:
        throw ParseError("Unknown expression at " + currentToken.to_string(), currentToken.line);
    }
}
