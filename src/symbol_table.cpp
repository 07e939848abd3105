#include "symbol_table.hpp"
#include "errors.hpp"

namespace {

void assign(LabelScope& scope, const std::string& name, int32_t pc)
{
    auto [it, inserted] = scope.addresses.insert_or_assign(name, pc);
    if (inserted)
        scope.order.push_back(name);
}

} // namespace

void SymbolTable::defineGlobalLabel(const std::string& name, int32_t pc, bool checkUnique)
{
    if (checkUnique && globalLabels.addresses.count(name)) {
        throw DuplicateLabelError(name);
    }
    assign(globalLabels, name, pc);
}

void SymbolTable::defineLocalLabel(const std::string& scopeOwner, const std::string& name, int32_t pc, bool checkUnique)
{
    auto found = localLabels.find(scopeOwner);
    if (found == localLabels.end()) {
        found = localLabels.emplace(scopeOwner, LabelScope{}).first;
        scopeOrder.push_back(scopeOwner);
    }

    if (checkUnique && found->second.addresses.count(name)) {
        throw DuplicateLabelError(scopeOwner + "." + name);
    }
    assign(found->second, name, pc);
}

void SymbolTable::defineConstant(const std::string& name, ResolvedValue value)
{
    constants.insert_or_assign(name, value);
}

const ResolvedValue* SymbolTable::findConstant(const std::string& name) const
{
    auto found = constants.find(name);
    return found == constants.end() ? nullptr : &found->second;
}

std::optional<int32_t> SymbolTable::resolve(const std::string& name, const std::optional<std::string>& currentScope) const
{
    if (isLocal(name)) {
        if (!currentScope.has_value())
            return std::nullopt;
        auto scope = localLabels.find(*currentScope);
        if (scope == localLabels.end())
            return std::nullopt;
        auto found = scope->second.addresses.find(name);
        if (found == scope->second.addresses.end())
            return std::nullopt;
        return found->second;
    }

    auto found = globalLabels.addresses.find(name);
    if (found == globalLabels.addresses.end())
        return std::nullopt;
    return found->second;
}
