#pragma once

#include "ast.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <cstdint>

// Either a concrete value or the expression node that could not be
// reduced, returned unchanged.
using ResolvedValue = std::variant<int32_t, const Expression*>;

inline bool isResolved(const ResolvedValue& value) {
    return std::holds_alternative<int32_t>(value);
}

// Labels keep their definition order so the debug export lists them the
// way they appear in the source.
struct LabelScope {
    std::map<std::string, int32_t> addresses;
    std::vector<std::string> order;
};

class SymbolTable
{
private:
    LabelScope globalLabels;
    std::map<std::string, LabelScope> localLabels; // keyed by scope owner
    std::vector<std::string> scopeOrder;
    std::map<std::string, ResolvedValue> constants;

public:
    static constexpr char LOCAL_MARKER = '@';

    static bool isLocal(std::string_view name) {
        return !name.empty() && name[0] == LOCAL_MARKER;
    }

    /**
     * Define or re-assign a global label.
     * @param checkUnique true during label collection; a second definition
     *        of the same name then throws DuplicateLabelError
     */
    void defineGlobalLabel(const std::string& name, int32_t pc, bool checkUnique);

    /**
     * Define or re-assign a local label inside a scope owner's map, which is
     * created on first use.
     */
    void defineLocalLabel(const std::string& scopeOwner, const std::string& name, int32_t pc, bool checkUnique);

    /**
     * Define or re-assign a constant. A value that was already resolvable
     * when the definition ran is stored as a number; otherwise the
     * expression is kept and resolved at each use.
     */
    void defineConstant(const std::string& name, ResolvedValue value);
    const ResolvedValue* findConstant(const std::string& name) const;

    /**
     * Look up a label. Names with the local marker are searched in the
     * current scope's map only, anything else in the global map.
     * @return nullopt while the name is still symbolic
     */
    std::optional<int32_t> resolve(const std::string& name, const std::optional<std::string>& currentScope) const;

    const LabelScope& globals() const { return globalLabels; }
    const std::map<std::string, LabelScope>& locals() const { return localLabels; }
    const std::vector<std::string>& scopes() const { return scopeOrder; }
};
