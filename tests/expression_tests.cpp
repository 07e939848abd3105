/**
 * @file expression_tests.cpp
 * @brief ExpressionResolver: literals, names, `+` and what stays symbolic
 */

#include "test_helpers.hpp"
#include "expression.hpp"
#include <gtest/gtest.h>

class ExpressionTest : public AssemblerTestBase {
protected:
    SymbolTable symbols;
    std::optional<std::string> scope;

    ResolvedValue resolve(const Expression& expr) {
        ExpressionResolver resolver(symbols, scope);
        return resolver.resolve(expr);
    }

    std::optional<int32_t> resolveNumber(const Expression& expr) {
        ExpressionResolver resolver(symbols, scope);
        return resolver.resolveNumber(expr);
    }
};

// ============================================================================
// Literals and Names
// ============================================================================

TEST_F(ExpressionTest, NumberResolvesToItself) {
    auto node = makeNumber(0x42);
    auto result = resolve(*node);
    ASSERT_TRUE(isResolved(result));
    EXPECT_EQ(std::get<int32_t>(result), 0x42);
}

TEST_F(ExpressionTest, LabelResolvesThroughSymbolTable) {
    symbols.defineGlobalLabel("reset", 0x8000, true);
    auto node = makeSymbol("reset");
    EXPECT_EQ(resolveNumber(*node), 0x8000);
}

TEST_F(ExpressionTest, UnknownNameReturnsTheNodeUnchanged) {
    auto node = makeSymbol("later");
    auto result = resolve(*node);
    ASSERT_FALSE(isResolved(result));
    EXPECT_EQ(std::get<const Expression*>(result), node.get());
}

TEST_F(ExpressionTest, ConstantShadowsLabel) {
    auto value = makeNumber(7);
    symbols.defineGlobalLabel("speed", 0x8000, true);
    symbols.defineConstant("speed", value.get());

    auto node = makeSymbol("speed");
    EXPECT_EQ(resolveNumber(*node), 7);
}

TEST_F(ExpressionTest, ConstantDefinedInTermsOfLabel) {
    auto value = makeBinary(Operator::ADD, makeSymbol("table"), makeNumber(2));
    symbols.defineConstant("entry", value.get());

    auto node = makeSymbol("entry");
    EXPECT_FALSE(resolveNumber(*node).has_value());

    symbols.defineGlobalLabel("table", 0x9000, true);
    EXPECT_EQ(resolveNumber(*node), 0x9002);
}

TEST_F(ExpressionTest, CyclicConstantsStaySymbolic) {
    auto a = makeSymbol("b");
    auto b = makeSymbol("a");
    symbols.defineConstant("a", a.get());
    symbols.defineConstant("b", b.get());

    auto node = makeSymbol("a");
    EXPECT_FALSE(resolveNumber(*node).has_value());
}

TEST_F(ExpressionTest, ResolvedConstantIgnoresItsOldExpression) {
    auto selfReference = makeBinary(Operator::ADD, makeSymbol("n"), makeNumber(1));
    symbols.defineConstant("n", 4);

    ExpressionResolver resolver(symbols, scope);
    auto next = resolver.resolve(*selfReference);
    ASSERT_TRUE(isResolved(next));
    symbols.defineConstant("n", next);

    auto node = makeSymbol("n");
    EXPECT_EQ(resolveNumber(*node), 5);
}

TEST_F(ExpressionTest, LocalLabelUsesCurrentScope) {
    symbols.defineLocalLabel("main", "@loop", 0x8003, true);
    auto node = makeSymbol("@loop");

    EXPECT_FALSE(resolveNumber(*node).has_value());
    scope = "main";
    EXPECT_EQ(resolveNumber(*node), 0x8003);
}

// ============================================================================
// Binary Expressions
// ============================================================================

TEST_F(ExpressionTest, AdditionOfResolvedSides) {
    symbols.defineGlobalLabel("base", 0x0200, true);
    auto node = makeBinary(Operator::ADD, makeSymbol("base"), makeNumber(5));
    EXPECT_EQ(resolveNumber(*node), 0x0205);
}

TEST_F(ExpressionTest, AdditionWithSymbolicSideIsUnchanged) {
    auto node = makeBinary(Operator::ADD, makeSymbol("later"), makeNumber(5));
    auto result = resolve(*node);
    ASSERT_FALSE(isResolved(result));
    EXPECT_EQ(std::get<const Expression*>(result), node.get());
}

TEST_F(ExpressionTest, OtherOperatorsAreNeverEvaluated) {
    auto sub = makeBinary(Operator::SUBTRACT, makeNumber(10), makeNumber(3));
    auto mul = makeBinary(Operator::MULTIPLY, makeNumber(10), makeNumber(3));
    EXPECT_FALSE(resolveNumber(*sub).has_value());
    EXPECT_FALSE(resolveNumber(*mul).has_value());
}

TEST_F(ExpressionTest, NestedAddition) {
    auto node = makeBinary(Operator::ADD,
                           makeBinary(Operator::ADD, makeNumber(1), makeNumber(2)),
                           makeNumber(3));
    EXPECT_EQ(resolveNumber(*node), 6);
}

TEST_F(ExpressionTest, AdditionOverflowIsARangeError) {
    auto node = makeBinary(Operator::ADD, makeNumber(0x7FFFFFFF), makeNumber(1));
    EXPECT_THROW(resolve(*node), ArgumentRangeError);

    auto largest = makeBinary(Operator::ADD, makeNumber(0x7FFFFFFE), makeNumber(1));
    EXPECT_EQ(resolveNumber(*largest), 0x7FFFFFFF);
}

TEST_F(ExpressionTest, ResolutionIsIdempotent) {
    symbols.defineGlobalLabel("base", 0x10, true);
    auto node = makeBinary(Operator::ADD, makeSymbol("base"), makeNumber(1));

    auto first = resolveNumber(*node);
    ASSERT_TRUE(first.has_value());
    auto again = makeNumber(*first);
    EXPECT_EQ(resolveNumber(*again), first);
    EXPECT_EQ(resolveNumber(*node), first);
}

// ============================================================================
// Error Reporting
// ============================================================================

TEST_F(ExpressionTest, UnresolvedNamesTheFirstMissingSymbol) {
    symbols.defineGlobalLabel("known", 1, true);
    auto node = makeBinary(Operator::ADD, makeSymbol("known"), makeSymbol("missing"));

    ExpressionResolver resolver(symbols, scope);
    auto error = resolver.unresolved(*node);
    EXPECT_EQ(error.symbol, "missing");
}

TEST_F(ExpressionTest, UnresolvedReportsUnsupportedOperator) {
    auto node = makeBinary(Operator::SUBTRACT, makeNumber(10), makeNumber(3));

    ExpressionResolver resolver(symbols, scope);
    auto error = resolver.unresolved(*node);
    EXPECT_NE(error.detail().find("Operator '-' is not supported"), std::string::npos) << error.detail();
}
