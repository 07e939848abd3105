#include "encoder.hpp"
#include <array>
#include <string>

using mos6502::AddressingMode;

namespace {

using ModePredicate = bool (*)(const InstructionNode&, const std::optional<int32_t>&);

struct ModeRule {
    ModeCandidate candidate;
    ModePredicate matches;
};

bool isZeropage(const InstructionNode&, const std::optional<int32_t>& value)
{
    return value.has_value() && *value >= 0 && *value < 256;
}

bool isImmediate(const InstructionNode& node, const std::optional<int32_t>&)
{
    return node.syntax == OperandSyntax::IMMEDIATE;
}

bool isIndexed(const InstructionNode& node, const std::optional<int32_t>&)
{
    return node.syntax == OperandSyntax::INDEXED
        && (node.index == IndexRegister::X || node.index == IndexRegister::Y);
}

bool isIndirect(const InstructionNode& node, const std::optional<int32_t>&)
{
    return node.syntax == OperandSyntax::INDIRECT;
}

// JSR/JMP are never zero page. A plain operand that is still symbolic is
// taken as 16-bit so its length is fixed from the first pass on.
bool isAbsolute(const InstructionNode& node, const std::optional<int32_t>& value)
{
    if (node.syntax != OperandSyntax::DIRECT)
        return false;
    if (node.mnemonic == "JSR" || node.mnemonic == "JMP")
        return true;
    return !value.has_value() || *value > 255;
}

bool isIndirectY(const InstructionNode& node, const std::optional<int32_t>&)
{
    return node.syntax == OperandSyntax::INDIRECT_Y;
}

bool isIndirectX(const InstructionNode& node, const std::optional<int32_t>&)
{
    return node.syntax == OperandSyntax::INDIRECT_X;
}

bool isImplied(const InstructionNode& node, const std::optional<int32_t>&)
{
    return node.syntax == OperandSyntax::NONE || node.syntax == OperandSyntax::ACCUMULATOR;
}

bool isBranch(const InstructionNode& node, const std::optional<int32_t>&)
{
    static constexpr std::array<std::string_view, 8> branches = {
        "BPL", "BMI", "BVC", "BVS", "BCC", "BCS", "BNE", "BEQ",
    };
    for (auto mnemonic : branches) {
        if (node.mnemonic == mnemonic)
            return true;
    }
    return false;
}

// Ascending priority; do not reorder.
constexpr std::array<ModeRule, 9> MODE_RULES = {{
    {ModeCandidate::ZEROPAGE,   isZeropage},
    {ModeCandidate::IMMEDIATE,  isImmediate},
    {ModeCandidate::INDEXED,    isIndexed},
    {ModeCandidate::INDIRECT,   isIndirect},
    {ModeCandidate::ABSOLUTE,   isAbsolute},
    {ModeCandidate::INDIRECT_Y, isIndirectY},
    {ModeCandidate::INDIRECT_X, isIndirectX},
    {ModeCandidate::IMPLIED,    isImplied},
    {ModeCandidate::BRANCH,     isBranch},
}};

bool supports(const mos6502::OpcodeRow& row, AddressingMode mode)
{
    return mos6502::opcodeIn(row, mode).has_value();
}

// Use `preferred` unless only `fallback` exists for this mnemonic.
AddressingMode preferOrFallback(const mos6502::OpcodeRow& row, AddressingMode preferred, AddressingMode fallback)
{
    return (supports(row, preferred) || !supports(row, fallback)) ? preferred : fallback;
}

} // namespace

std::optional<ModeCandidate> InstructionEncoder::selectCandidate(const InstructionNode& node, const std::optional<int32_t>& value)
{
    for (auto rule = MODE_RULES.rbegin(); rule != MODE_RULES.rend(); ++rule) {
        if (rule->matches(node, value))
            return rule->candidate;
    }
    return std::nullopt;
}

AddressingMode InstructionEncoder::concreteMode(ModeCandidate candidate, const InstructionNode& node,
                                                const mos6502::OpcodeRow& row, const std::optional<int32_t>& value)
{
    switch (candidate) {
        case ModeCandidate::ZEROPAGE:
            return preferOrFallback(row, AddressingMode::ZEROPAGE, AddressingMode::ABSOLUTE);
        case ModeCandidate::IMMEDIATE:
            return AddressingMode::IMMEDIATE;
        case ModeCandidate::INDEXED: {
            const bool x = node.index == IndexRegister::X;
            const auto zeropage = x ? AddressingMode::ZEROPAGE_X : AddressingMode::ZEROPAGE_Y;
            const auto absolute = x ? AddressingMode::ABSOLUTE_X : AddressingMode::ABSOLUTE_Y;
            if (isZeropage(node, value))
                return preferOrFallback(row, zeropage, absolute);
            return preferOrFallback(row, absolute, zeropage);
        }
        case ModeCandidate::INDIRECT:
            return AddressingMode::INDIRECT;
        case ModeCandidate::ABSOLUTE:
            return preferOrFallback(row, AddressingMode::ABSOLUTE, AddressingMode::ZEROPAGE);
        case ModeCandidate::INDIRECT_Y:
            return AddressingMode::INDIRECT_Y;
        case ModeCandidate::INDIRECT_X:
            return AddressingMode::INDIRECT_X;
        case ModeCandidate::IMPLIED:
            return AddressingMode::IMPLIED;
        case ModeCandidate::BRANCH:
            return AddressingMode::RELATIVE;
    }
    return AddressingMode::IMPLIED;
}

void InstructionEncoder::encode(const InstructionNode& node)
{
    const auto* row = mos6502::findRow(node.mnemonic);
    if (!row)
        throw InvalidMnemonicError(node.mnemonic);

    std::optional<int32_t> value;
    if (node.operand)
        value = context.resolver().resolveNumber(*node.operand);

    AddressingMode mode;
    auto committed = context.committedModes.find(&node);
    if (context.emitting() && committed != context.committedModes.end()) {
        mode = committed->second;
    } else {
        auto candidate = selectCandidate(node, value);
        if (!candidate.has_value()) {
            if (value.has_value())
                throw ArgumentRangeError(node.mnemonic + " operand out of range: " + std::to_string(*value));
            throw InvalidAddressingModeError("No addressing mode matches " + node.mnemonic + " operand");
        }
        mode = concreteMode(*candidate, node, *row, value);
        if (!context.emitting())
            context.committedModes[&node] = mode;
    }

    const auto opcode = mos6502::opcodeIn(*row, mode);
    if (!opcode.has_value()) {
        throw InvalidAddressingModeError(node.mnemonic + " does not support " + mos6502::modeName(mode) + " addressing");
    }
    if (mode != AddressingMode::IMPLIED && !node.operand) {
        throw InvalidAddressingModeError(node.mnemonic + " requires an operand");
    }

    const size_t length = mos6502::instructionLength(mode);
    context.requireSpace(static_cast<int64_t>(length));
    context.emit(*opcode);

    if (mode == AddressingMode::RELATIVE) {
        emitBranchOffset(node, value);
    } else if (length == 3) {
        emitWordOperand(node, value);
    } else if (length == 2) {
        emitByteOperand(node, value);
    }
}

void InstructionEncoder::emitByteOperand(const InstructionNode& node, const std::optional<int32_t>& value)
{
    if (!value.has_value()) {
        context.emitUnresolved(*node.operand, 1);
        return;
    }
    if (context.emitting() && (*value < 0 || *value > 0xFF)) {
        throw ArgumentRangeError(node.mnemonic + " operand " + node.operand->to_string() + " = "
                                 + std::to_string(*value) + " does not fit in one byte");
    }
    context.emit(static_cast<uint8_t>(*value & 0xFF));
}

void InstructionEncoder::emitWordOperand(const InstructionNode& node, const std::optional<int32_t>& value)
{
    if (!value.has_value()) {
        context.emitUnresolved(*node.operand, 2);
        return;
    }
    if (context.emitting() && (*value < 0 || *value > 0xFFFF)) {
        throw ArgumentRangeError(node.mnemonic + " operand " + node.operand->to_string() + " = "
                                 + std::to_string(*value) + " is not a 16-bit address");
    }
    context.emitWord(static_cast<uint16_t>(*value & 0xFFFF));
}

// Runs after PC has moved past the opcode byte and before the offset byte.
void InstructionEncoder::emitBranchOffset(const InstructionNode& node, const std::optional<int32_t>& target)
{
    if (!target.has_value()) {
        context.emitUnresolved(*node.operand, 1);
        return;
    }

    const int32_t pcNow = context.pc;
    const int32_t displacement = *target - (pcNow + 1);
    if (context.emitting() && (displacement < -128 || displacement > 127)) {
        throw ArgumentRangeError("Branch to " + node.operand->to_string() + " is out of range ("
                                 + std::to_string(displacement) + " bytes)");
    }

    int32_t offset;
    if (*target < pcNow)
        offset = (0xFF - (pcNow - *target)) & 0xFF;
    else
        offset = (*target - pcNow - 1) & 0xFF;
    context.emit(static_cast<uint8_t>(offset));
}
