#pragma once

#include "symbol_table.hpp"
#include <string>
#include <utility>
#include <vector>
#include <cstdint>

// Address-space split for the exported label file. The defaults describe
// the NES memory map as Mesen's .mlb import expects it.
struct DebugSymbolOptions {
    int32_t splitAddress = 0x8000;
    std::string highRegion = "NesPrgRom";      // addresses >= splitAddress, rebased
    std::string lowRegion = "NesInternalRam";  // addresses below, as is
};

class DebugSymbolExporter
{
private:
    DebugSymbolOptions options;

public:
    explicit DebugSymbolExporter(DebugSymbolOptions opts = {}) : options(std::move(opts)) {}

    /**
     * Merge global and local labels into one namespace. A local name that is
     * already taken is renamed to "@<scope>_<name>".
     */
    std::vector<std::pair<std::string, int32_t>> flatten(const SymbolTable& symbols) const;

    // "<region>:<4 hex digits>:<name>"
    std::string formatLine(const std::string& name, int32_t address) const;

    std::string render(const SymbolTable& symbols) const;
};
