#pragma once

#include "ast.hpp"
#include "errors.hpp"
#include "symbol_table.hpp"
#include <optional>
#include <set>
#include <stack>
#include <string>
#include <variant>
#include <cstdint>

class ExpressionResolver : public ExpressionVisitor
{
private:
    const SymbolTable& symbols;
    const std::optional<std::string>& currentScope;

    std::stack<ResolvedValue> evalStack;
    std::set<std::string> resolvingConstants; // guards `a = b` / `b = a` cycles

public:
    ExpressionResolver(const SymbolTable& table, const std::optional<std::string>& scope)
        : symbols(table), currentScope(scope) {}

    /**
     * Literal numbers resolve to themselves, names through the constant map
     * then the label tables, and binary nodes to the sum of both sides when
     * the operator is `+` and both sides are numeric. Anything else is
     * returned as the unchanged node. A sum past INT32_MAX throws
     * ArgumentRangeError.
     */
    ResolvedValue resolve(const Expression& expr);

    std::optional<int32_t> resolveNumber(const Expression& expr);

    // Names the first symbol (or unsupported operator) keeping `expr` symbolic.
    UnresolvedSymbolError unresolved(const Expression& expr);

    void visit(const NumberNode &node) override;
    void visit(const StringNode &node) override;
    void visit(const SymbolNode &node) override;
    void visit(const BinaryOperationNode &node) override;
};
