#pragma once

#include "context.hpp"
#include <optional>

// Candidate addressing modes in ascending priority. When several match,
// the one listed last wins.
enum class ModeCandidate
{
    ZEROPAGE,
    IMMEDIATE,
    INDEXED,
    INDIRECT,
    ABSOLUTE,
    INDIRECT_Y,
    INDIRECT_X,
    IMPLIED,
    BRANCH,
};

class InstructionEncoder
{
private:
    AssemblyContext& context;

    void emitByteOperand(const InstructionNode& node, const std::optional<int32_t>& value);
    void emitWordOperand(const InstructionNode& node, const std::optional<int32_t>& value);
    void emitBranchOffset(const InstructionNode& node, const std::optional<int32_t>& target);

public:
    explicit InstructionEncoder(AssemblyContext& ctx) : context(ctx) {}

    void encode(const InstructionNode& node);

    /**
     * Run the candidate predicates over the instruction and its (possibly
     * unresolved) operand value.
     * @return nullopt if no candidate matches
     */
    static std::optional<ModeCandidate> selectCandidate(const InstructionNode& node, const std::optional<int32_t>& value);

    /**
     * Map a candidate onto a concrete opcode-table column, choosing the
     * zero-page or 16-bit variant of indexed operands by magnitude.
     * Symbolic operands get the 16-bit variant unless the mnemonic lacks it.
     */
    static mos6502::AddressingMode concreteMode(ModeCandidate candidate, const InstructionNode& node,
                                                const mos6502::OpcodeRow& row, const std::optional<int32_t>& value);
};
