#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <cstddef>
#include "lexer.hpp"

enum class Operator
{
    ADD = 1,
    SUBTRACT,
    MULTIPLY,
    DIVIDE,
    UNKNOWN = -1,
}; // only ADD is ever evaluated

enum class Directive
{
    ORG,
    BYTE,
    WORD,
    ENUM,   // scratch block open
    ENDE,   // scratch block close
    ALIGN,
    DSB,    // reserve
};

// Operand forms as written in the source; the encoder derives the
// addressing mode from these plus the resolved operand value.
enum class OperandSyntax
{
    NONE,
    ACCUMULATOR,      // ASL A
    IMMEDIATE,        // #expr
    DIRECT,           // expr
    INDEXED,          // expr,X  expr,Y
    INDIRECT,         // (expr)
    INDIRECT_X,       // (expr,X)
    INDIRECT_Y,       // (expr),Y
};

enum class IndexRegister
{
    NONE,
    X,
    Y,
};

struct NumberNode;
struct StringNode;
struct SymbolNode;
struct BinaryOperationNode;
struct LabelNode;
struct SymbolDefinitionNode;
struct DirectiveNode;
struct InstructionNode;

class ExpressionVisitor
{
public:
    virtual ~ExpressionVisitor() = default;
    virtual void visit(const NumberNode &node) = 0;
    virtual void visit(const StringNode &node) = 0;
    virtual void visit(const SymbolNode &node) = 0;
    virtual void visit(const BinaryOperationNode &node) = 0;
};

class StatementVisitor
{
public:
    virtual ~StatementVisitor() = default;
    virtual void visit(const LabelNode &node) = 0;
    virtual void visit(const SymbolDefinitionNode &node) = 0;
    virtual void visit(const DirectiveNode &node) = 0;
    virtual void visit(const InstructionNode &node) = 0;
};

constexpr Operator tokenToOperator(const Token token) {
    switch (token.type) {
        case Type::PLUS     : return Operator::ADD      ;
        case Type::MINUS    : return Operator::SUBTRACT ;
        case Type::ASTERISK : return Operator::MULTIPLY ;
        case Type::SLASH    : return Operator::DIVIDE   ;
        default             : return Operator::UNKNOWN  ;
    }
}

constexpr char operatorSymbol(Operator op) {
    switch (op) {
        case Operator::ADD      : return '+';
        case Operator::SUBTRACT : return '-';
        case Operator::MULTIPLY : return '*';
        case Operator::DIVIDE   : return '/';
        default                 : return '?';
    }
}

// --- Expressions ---

struct Expression
{
    virtual void accept(ExpressionVisitor &v) const = 0;
    virtual std::string to_string() const = 0;
    virtual ~Expression() = default;
};

struct NumberNode : Expression
{
    std::int32_t value;
    explicit NumberNode(std::int32_t val) : value(val) {}
    void accept(ExpressionVisitor &v) const override { v.visit(*this); }
    std::string to_string() const override { return std::to_string(value); }
};

struct StringNode : Expression
{
    std::string value;
    explicit StringNode(std::string val) : value(std::move(val)) {}
    void accept(ExpressionVisitor &v) const override { v.visit(*this); }
    std::string to_string() const override { return "\"" + value + "\""; }
};

struct SymbolNode : Expression
{
    std::string name;
    explicit SymbolNode(std::string val) : name(std::move(val)) {}
    void accept(ExpressionVisitor &v) const override { v.visit(*this); }
    std::string to_string() const override { return name; }
};

struct BinaryOperationNode : Expression
{
    Operator operation;
    std::unique_ptr<Expression> left, right;
    explicit BinaryOperationNode(Operator operation, std::unique_ptr<Expression> left, std::unique_ptr<Expression> right) : operation(operation), left(std::move(left)), right(std::move(right)) {}
    void accept(ExpressionVisitor &v) const override { v.visit(*this); }
    std::string to_string() const override {
        return left->to_string() + operatorSymbol(operation) + right->to_string();
    }
};

// --- Statements ---

struct Statement
{
    size_t line = 0;
    virtual void accept(StatementVisitor &v) const = 0;
    virtual ~Statement() = default;
};

struct LabelNode : Statement
{
    std::string name;
    explicit LabelNode(std::string id) : name(std::move(id)) {}
    bool isLocal() const { return !name.empty() && name[0] == '@'; }
    void accept(StatementVisitor &v) const override { v.visit(*this); }
};

struct SymbolDefinitionNode : Statement
{
    std::string name;
    std::unique_ptr<Expression> value;
    explicit SymbolDefinitionNode(std::string id, std::unique_ptr<Expression> expr) : name(std::move(id)), value(std::move(expr)) {}
    void accept(StatementVisitor &v) const override { v.visit(*this); }
};

struct DirectiveNode : Statement
{
    Directive directive;
    std::vector<std::unique_ptr<Expression>> arguments;
    explicit DirectiveNode(Directive kind, std::vector<std::unique_ptr<Expression>> args) : directive(kind), arguments(std::move(args)) {}
    void accept(StatementVisitor &v) const override { v.visit(*this); }
};

struct InstructionNode : Statement
{
    std::string mnemonic; // uppercased by the parser
    OperandSyntax syntax;
    std::unique_ptr<Expression> operand; // nullptr for NONE and ACCUMULATOR
    IndexRegister index;
    explicit InstructionNode(std::string mnem, OperandSyntax syntax = OperandSyntax::NONE, std::unique_ptr<Expression> operand = nullptr, IndexRegister index = IndexRegister::NONE) : mnemonic(std::move(mnem)), syntax(syntax), operand(std::move(operand)), index(index) {}
    void accept(StatementVisitor &v) const override { v.visit(*this); }
};

// One group per source line, e.g. a label followed by an instruction.
struct StatementGroup
{
    size_t line = 0;
    std::vector<std::unique_ptr<Statement>> statements;
};

struct ProgramNode
{
    std::vector<StatementGroup> groups;

    void accept(StatementVisitor &v) const {
        for (const auto& group : groups) {
            for (const auto& statement : group.statements) {
                statement->accept(v);
            }
        }
    }
};

constexpr const char* directiveName(Directive directive) {
    switch (directive) {
        case Directive::ORG   : return ".org"  ;
        case Directive::BYTE  : return ".byte" ;
        case Directive::WORD  : return ".word" ;
        case Directive::ENUM  : return ".enum" ;
        case Directive::ENDE  : return ".ende" ;
        case Directive::ALIGN : return ".align";
        case Directive::DSB   : return ".dsb"  ;
    }
    return "?";
}
