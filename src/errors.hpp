#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

// Every failure aborts the assemble invocation. The source line is attached
// by whichever layer knows it (lexer/parser directly, the pass driver for
// errors raised while a statement is being processed).
class AssemblyError : public std::runtime_error
{
    std::string message;
    size_t sourceLine;
    std::string formatted;

    void format() {
        formatted = sourceLine == 0 ? message : "line " + std::to_string(sourceLine) + ": " + message;
    }

public:
    explicit AssemblyError(const std::string& msg, size_t line = 0)
        : std::runtime_error(msg), message(msg), sourceLine(line) { format(); }

    const char* what() const noexcept override { return formatted.c_str(); }

    const std::string& detail() const { return message; }
    size_t line() const { return sourceLine; }
    void setLine(size_t line) {
        sourceLine = line;
        format();
    }
};

struct ParseError : AssemblyError
{
    using AssemblyError::AssemblyError;
};

struct DuplicateLabelError : AssemblyError
{
    std::string label;
    explicit DuplicateLabelError(const std::string& name, size_t line = 0)
        : AssemblyError("Duplicate label: " + name, line), label(name) {}
};

struct UndefinedLocalLabelScopeError : AssemblyError
{
    std::string label;
    explicit UndefinedLocalLabelScopeError(const std::string& name, size_t line = 0)
        : AssemblyError("Local label " + name + " defined before any global label", line), label(name) {}
};

struct UnresolvedSymbolError : AssemblyError
{
    std::string symbol;
    explicit UnresolvedSymbolError(const std::string& sym, size_t line = 0)
        : AssemblyError("Unresolved symbol: " + sym, line), symbol(sym) {}
    UnresolvedSymbolError(const std::string& sym, const std::string& msg, size_t line = 0)
        : AssemblyError(msg, line), symbol(sym) {}
};

struct InvalidMnemonicError : AssemblyError
{
    std::string mnemonic;
    explicit InvalidMnemonicError(const std::string& mnem, size_t line = 0)
        : AssemblyError("Unknown mnemonic: " + mnem, line), mnemonic(mnem) {}
};

struct InvalidAddressingModeError : AssemblyError
{
    using AssemblyError::AssemblyError;
};

struct ArgumentRangeError : AssemblyError
{
    using AssemblyError::AssemblyError;
};

struct ScratchBlockError : AssemblyError
{
    using AssemblyError::AssemblyError;
};
