#include "debug_symbols.hpp"
#include <iomanip>
#include <set>
#include <sstream>

std::vector<std::pair<std::string, int32_t>> DebugSymbolExporter::flatten(const SymbolTable& symbols) const
{
    std::vector<std::pair<std::string, int32_t>> merged;
    std::set<std::string> taken;

    const auto& globals = symbols.globals();
    for (const auto& name : globals.order) {
        merged.emplace_back(name, globals.addresses.at(name));
        taken.insert(name);
    }

    for (const auto& scope : symbols.scopes()) {
        const auto& locals = symbols.locals().at(scope);
        for (const auto& name : locals.order) {
            std::string key = name;
            if (taken.count(key)) {
                key = std::string(1, SymbolTable::LOCAL_MARKER) + scope + "_" + name.substr(1);
            }
            merged.emplace_back(key, locals.addresses.at(name));
            taken.insert(key);
        }
    }
    return merged;
}

std::string DebugSymbolExporter::formatLine(const std::string& name, int32_t address) const
{
    const bool high = address >= options.splitAddress;
    const int32_t offset = high ? address - options.splitAddress : address;

    std::ostringstream oss;
    oss << (high ? options.highRegion : options.lowRegion) << ':'
        << std::hex << std::setw(4) << std::setfill('0') << offset
        << ':' << name;
    return oss.str();
}

std::string DebugSymbolExporter::render(const SymbolTable& symbols) const
{
    std::string result;
    for (const auto& [name, address] : flatten(symbols)) {
        result += formatLine(name, address);
        result += '\n';
    }
    return result;
}
