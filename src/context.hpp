#pragma once

#include "ast.hpp"
#include "errors.hpp"
#include "expression.hpp"
#include "opcodes.hpp"
#include "symbol_table.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

constexpr int32_t ADDRESS_MAX = 0xFFFF;

enum class Pass
{
    COLLECTING_LABELS,
    EMITTING_CODE,
};

/**
 * All mutable state of one assemble invocation. Created fresh per call and
 * threaded through the directive processor and instruction encoder.
 *
 * The symbol tables and the committed addressing modes survive from pass 1
 * into pass 2; everything else is reset by startPass().
 */
struct AssemblyContext
{
    Pass pass = Pass::COLLECTING_LABELS;
    int32_t pc = 0;
    bool originFixed = false;
    std::optional<int32_t> scratchSavedPc; // single slot, no nesting
    size_t scratchOpenedAt = 0;
    std::optional<std::string> currentScope;
    std::optional<int32_t> startAddress;
    size_t line = 0;

    SymbolTable symbols;
    std::vector<uint8_t> output;

    // Modes picked in pass 1, reused in pass 2 so instruction lengths (and
    // therefore label addresses) cannot change between passes.
    std::map<const InstructionNode*, mos6502::AddressingMode> committedModes;

    void startPass(Pass next) {
        pass = next;
        pc = 0;
        originFixed = false;
        scratchSavedPc.reset();
        scratchOpenedAt = 0;
        currentScope.reset();
        output.clear();
    }

    bool emitting() const { return pass == Pass::EMITTING_CODE; }
    bool inScratchBlock() const { return scratchSavedPc.has_value(); }

    ExpressionResolver resolver() const { return ExpressionResolver(symbols, currentScope); }

    // Throws unless `count` more bytes fit below $10000.
    void requireSpace(int64_t count) const {
        if (count > static_cast<int64_t>(ADDRESS_MAX) + 1 - pc) {
            throw ArgumentRangeError(std::to_string(count) + " byte(s) at PC " + std::to_string(pc)
                                     + " run past the end of the address space");
        }
    }

    // --- Emitters ---
    // Every emitted byte advances PC; only pass 2 outside a scratch block
    // keeps the byte.
    void emit(uint8_t byte) {
        requireSpace(1);
        pc++;
        if (emitting() && !inScratchBlock())
            output.push_back(byte);
    }

    void emitWord(uint16_t word) {
        emit(static_cast<uint8_t>(word & 0x00FF));
        emit(static_cast<uint8_t>((word & 0xFF00) >> 8));
    }

    // Placeholder for an operand that is still symbolic. Only legal while
    // collecting labels; in pass 2 it is fatal.
    void emitUnresolved(const Expression& expr, size_t width) {
        if (emitting())
            throw resolver().unresolved(expr);
        requireSpace(static_cast<int64_t>(width));
        pc += static_cast<int32_t>(width);
    }
};
