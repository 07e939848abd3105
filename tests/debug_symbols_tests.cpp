/**
 * @file debug_symbols_tests.cpp
 * @brief Label merging and .mlb line rendering
 */

#include "test_helpers.hpp"
#include "debug_symbols.hpp"
#include <gtest/gtest.h>

// ============================================================================
// Line Format
// ============================================================================

TEST(DebugSymbolTests, HighAddressesAreRebased) {
    DebugSymbolExporter exporter;
    EXPECT_EQ(exporter.formatLine("reset", 0x8000), "NesPrgRom:0000:reset");
    EXPECT_EQ(exporter.formatLine("irq", 0xC0AB), "NesPrgRom:40ab:irq");
}

TEST(DebugSymbolTests, LowAddressesKeepTheirValue) {
    DebugSymbolExporter exporter;
    EXPECT_EQ(exporter.formatLine("player_x", 0x0300), "NesInternalRam:0300:player_x");
    EXPECT_EQ(exporter.formatLine("temp", 0x0A), "NesInternalRam:000a:temp");
    EXPECT_EQ(exporter.formatLine("last", 0x7FFF), "NesInternalRam:7fff:last");
}

TEST(DebugSymbolTests, ConfigurableSplitAndRegions) {
    DebugSymbolOptions options;
    options.splitAddress = 0x6000;
    options.highRegion = "Prg";
    options.lowRegion = "Ram";
    DebugSymbolExporter exporter(options);

    EXPECT_EQ(exporter.formatLine("code", 0x6010), "Prg:0010:code");
    EXPECT_EQ(exporter.formatLine("data", 0x5FFF), "Ram:5fff:data");
}

// ============================================================================
// Merging
// ============================================================================

TEST(DebugSymbolTests, EmptyTableRendersNothing) {
    SymbolTable symbols;
    EXPECT_EQ(DebugSymbolExporter().render(symbols), "");
}

TEST(DebugSymbolTests, RepeatedLocalGetsCompositeKey) {
    SymbolTable symbols;
    symbols.defineGlobalLabel("first", 0x8000, true);
    symbols.defineLocalLabel("first", "@loop", 0x8000, true);
    symbols.defineGlobalLabel("second", 0x8003, true);
    symbols.defineLocalLabel("second", "@loop", 0x8003, true);

    auto merged = DebugSymbolExporter().flatten(symbols);
    ASSERT_EQ(merged.size(), 4u);
    EXPECT_EQ(merged[0].first, "first");
    EXPECT_EQ(merged[1].first, "second");
    EXPECT_EQ(merged[2].first, "@loop");
    EXPECT_EQ(merged[2].second, 0x8000);
    EXPECT_EQ(merged[3].first, "@second_loop");
    EXPECT_EQ(merged[3].second, 0x8003);
}

TEST(DebugSymbolTests, LocalCollidingWithGlobalName) {
    SymbolTable symbols;
    symbols.defineGlobalLabel("@tmp", 0x10, true);
    symbols.defineGlobalLabel("main", 0x8000, true);
    symbols.defineLocalLabel("main", "@tmp", 0x8001, true);

    auto merged = DebugSymbolExporter().flatten(symbols);
    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[2].first, "@main_tmp");
}

// ============================================================================
// End to End
// ============================================================================

TEST(DebugSymbolTests, AssembledProgramRendersInSourceOrder) {
    auto result = assemble(
        ".enum $0000\n"
        "frame: .dsb 1\n"
        ".ende\n"
        ".org $8000\n"
        "first:\n"
        "@loop: DEX\n"
        "       BNE @loop\n"
        "second:\n"
        "@loop: DEY\n"
        "       BNE @loop\n");

    EXPECT_EQ(result.debugSymbols,
              "NesInternalRam:0000:frame\n"
              "NesPrgRom:0000:first\n"
              "NesPrgRom:0003:second\n"
              "NesPrgRom:0000:@loop\n"
              "NesPrgRom:0003:@second_loop\n");
}

TEST(DebugSymbolTests, AssembleUsesGivenOptions) {
    DebugSymbolOptions options;
    options.splitAddress = 0xC000;
    options.highRegion = "Bank";

    auto result = assemble(".org $C000\nentry: RTS", options);
    EXPECT_EQ(result.debugSymbols, "Bank:0000:entry\n");
}
