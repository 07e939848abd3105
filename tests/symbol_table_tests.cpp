/**
 * @file symbol_table_tests.cpp
 * @brief Global labels, scoped local labels and constants
 */

#include "test_helpers.hpp"
#include "symbol_table.hpp"
#include <gtest/gtest.h>

namespace {
const std::optional<std::string> NO_SCOPE = std::nullopt;
}

// ============================================================================
// Global Labels
// ============================================================================

TEST(SymbolTableTests, DefinesAndResolvesGlobalLabel) {
    SymbolTable table;
    table.defineGlobalLabel("reset", 0x8000, true);

    auto address = table.resolve("reset", NO_SCOPE);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, 0x8000);
}

TEST(SymbolTableTests, UnknownNameStaysSymbolic) {
    SymbolTable table;
    EXPECT_FALSE(table.resolve("nowhere", NO_SCOPE).has_value());
}

TEST(SymbolTableTests, DuplicateGlobalFailsWhileCollecting) {
    SymbolTable table;
    table.defineGlobalLabel("main", 0x8000, true);

    try {
        table.defineGlobalLabel("main", 0x8010, true);
        FAIL() << "Expected DuplicateLabelError";
    } catch (const DuplicateLabelError& e) {
        EXPECT_EQ(e.label, "main");
    }
    // first definition is kept
    EXPECT_EQ(*table.resolve("main", NO_SCOPE), 0x8000);
}

TEST(SymbolTableTests, ReassignmentWithoutUniquenessCheck) {
    SymbolTable table;
    table.defineGlobalLabel("main", 0x8000, true);
    table.defineGlobalLabel("main", 0x8002, false);

    EXPECT_EQ(*table.resolve("main", NO_SCOPE), 0x8002);
    EXPECT_EQ(table.globals().order.size(), 1u);
}

TEST(SymbolTableTests, GlobalsKeepDefinitionOrder) {
    SymbolTable table;
    table.defineGlobalLabel("zeta", 1, true);
    table.defineGlobalLabel("alpha", 2, true);
    table.defineGlobalLabel("mid", 3, true);

    const auto& order = table.globals().order;
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], "zeta");
    EXPECT_EQ(order[1], "alpha");
    EXPECT_EQ(order[2], "mid");
}

// ============================================================================
// Local Labels
// ============================================================================

TEST(SymbolTableTests, LocalLabelsResolveOnlyInTheirScope) {
    SymbolTable table;
    table.defineLocalLabel("first", "@loop", 0x8002, true);
    table.defineLocalLabel("second", "@loop", 0x8010, true);

    const std::optional<std::string> first = "first";
    const std::optional<std::string> second = "second";
    const std::optional<std::string> third = "third";

    EXPECT_EQ(*table.resolve("@loop", first), 0x8002);
    EXPECT_EQ(*table.resolve("@loop", second), 0x8010);
    EXPECT_FALSE(table.resolve("@loop", third).has_value());
    EXPECT_FALSE(table.resolve("@loop", NO_SCOPE).has_value());
}

TEST(SymbolTableTests, LocalMarkerNeverFallsBackToGlobals) {
    SymbolTable table;
    table.defineGlobalLabel("@odd", 0x10, true);
    const std::optional<std::string> scope = "main";
    EXPECT_FALSE(table.resolve("@odd", scope).has_value());
}

TEST(SymbolTableTests, DuplicateLocalInSameScopeFails) {
    SymbolTable table;
    table.defineLocalLabel("main", "@loop", 0x8000, true);
    EXPECT_THROW(table.defineLocalLabel("main", "@loop", 0x8004, true), DuplicateLabelError);
    EXPECT_NO_THROW(table.defineLocalLabel("main", "@loop", 0x8004, false));
}

TEST(SymbolTableTests, ScopesCreatedLazilyInOrder) {
    SymbolTable table;
    EXPECT_TRUE(table.scopes().empty());

    table.defineLocalLabel("b", "@x", 1, true);
    table.defineLocalLabel("a", "@x", 2, true);
    table.defineLocalLabel("b", "@y", 3, true);

    ASSERT_EQ(table.scopes().size(), 2u);
    EXPECT_EQ(table.scopes()[0], "b");
    EXPECT_EQ(table.scopes()[1], "a");
    EXPECT_EQ(table.locals().at("b").order.size(), 2u);
}

// ============================================================================
// Constants
// ============================================================================

TEST(SymbolTableTests, ConstantsAreStoredAndReassignable) {
    SymbolTable table;
    NumberNode first(1);
    NumberNode second(2);

    EXPECT_EQ(table.findConstant("SPEED"), nullptr);
    table.defineConstant("SPEED", &first);
    ASSERT_NE(table.findConstant("SPEED"), nullptr);
    EXPECT_EQ(std::get<const Expression*>(*table.findConstant("SPEED")), &first);
    table.defineConstant("SPEED", &second);
    EXPECT_EQ(std::get<const Expression*>(*table.findConstant("SPEED")), &second);
}

TEST(SymbolTableTests, ConstantsMayHoldResolvedValues) {
    SymbolTable table;
    NumberNode pending(1);

    table.defineConstant("SPEED", &pending);
    table.defineConstant("SPEED", 3);
    const ResolvedValue* value = table.findConstant("SPEED");
    ASSERT_NE(value, nullptr);
    ASSERT_TRUE(isResolved(*value));
    EXPECT_EQ(std::get<int32_t>(*value), 3);
}

TEST(SymbolTableTests, IsLocalChecksMarker) {
    EXPECT_TRUE(SymbolTable::isLocal("@loop"));
    EXPECT_FALSE(SymbolTable::isLocal("loop"));
    EXPECT_FALSE(SymbolTable::isLocal(""));
}
