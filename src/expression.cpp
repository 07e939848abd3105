#include "expression.hpp"
#include <limits>

ResolvedValue ExpressionResolver::resolve(const Expression& expr)
{
    expr.accept(*this);
    auto result = evalStack.top();
    evalStack.pop();
    return result;
}

std::optional<int32_t> ExpressionResolver::resolveNumber(const Expression& expr)
{
    auto result = resolve(expr);
    if (!isResolved(result))
        return std::nullopt;
    return std::get<int32_t>(result);
}

UnresolvedSymbolError ExpressionResolver::unresolved(const Expression& expr)
{
    if (const auto* symbol = dynamic_cast<const SymbolNode*>(&expr)) {
        return UnresolvedSymbolError(symbol->name);
    }
    if (const auto* str = dynamic_cast<const StringNode*>(&expr)) {
        return UnresolvedSymbolError(str->to_string(), "Text literal " + str->to_string() + " has no numeric value");
    }
    if (const auto* binary = dynamic_cast<const BinaryOperationNode*>(&expr)) {
        if (!isResolved(resolve(*binary->left)))
            return unresolved(*binary->left);
        if (!isResolved(resolve(*binary->right)))
            return unresolved(*binary->right);
        return UnresolvedSymbolError(binary->to_string(),
            std::string("Operator '") + operatorSymbol(binary->operation) + "' is not supported in " + binary->to_string());
    }
    return UnresolvedSymbolError(expr.to_string());
}

void ExpressionResolver::visit(const NumberNode &node)
{
    evalStack.push(node.value);
}

void ExpressionResolver::visit(const StringNode &node)
{
    evalStack.push(&node);
}

void ExpressionResolver::visit(const SymbolNode &node)
{
    // constants shadow labels
    if (const ResolvedValue* constant = symbols.findConstant(node.name)) {
        if (isResolved(*constant)) {
            evalStack.push(*constant);
            return;
        }
        if (resolvingConstants.count(node.name)) {
            evalStack.push(&node);
            return;
        }
        resolvingConstants.insert(node.name);
        auto value = resolve(*std::get<const Expression*>(*constant));
        resolvingConstants.erase(node.name);

        if (isResolved(value))
            evalStack.push(value);
        else
            evalStack.push(&node);
        return;
    }

    auto address = symbols.resolve(node.name, currentScope);
    if (address.has_value())
        evalStack.push(*address);
    else
        evalStack.push(&node);
}

void ExpressionResolver::visit(const BinaryOperationNode &node)
{
    const auto left = resolve(*node.left);
    const auto right = resolve(*node.right);

    if (node.operation == Operator::ADD && isResolved(left) && isResolved(right)) {
        const int64_t sum = static_cast<int64_t>(std::get<int32_t>(left)) + std::get<int32_t>(right);
        if (sum > std::numeric_limits<int32_t>::max() || sum < std::numeric_limits<int32_t>::min())
            throw ArgumentRangeError("Value of " + node.to_string() + " overflows");
        evalStack.push(static_cast<int32_t>(sum));
        return;
    }
    evalStack.push(&node);
}
