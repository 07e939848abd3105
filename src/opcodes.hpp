/**
 * @file opcodes.hpp
 * @brief NMOS 6502 opcode table, one row per mnemonic and one column per
 *        addressing mode.
 *
 * Rows cover the 56 documented mnemonics. A column holding NO_OPCODE means
 * the mnemonic has no encoding in that mode.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string_view>

namespace mos6502 {

enum class AddressingMode
{
    IMMEDIATE,
    ZEROPAGE,
    ZEROPAGE_X,
    ZEROPAGE_Y,
    ABSOLUTE,
    ABSOLUTE_X,
    ABSOLUTE_Y,
    INDIRECT,
    INDIRECT_X,   // (zp,X)
    INDIRECT_Y,   // (zp),Y
    IMPLIED,      // includes the accumulator form of the shifts
    RELATIVE,
};

constexpr size_t MODE_COUNT = 12;
constexpr int16_t NO_OPCODE = -1;

struct OpcodeRow
{
    std::string_view mnemonic;
    std::array<int16_t, MODE_COUNT> opcodes;
};

/**
 * @brief Encoded instruction length in bytes for a mode (opcode included)
 */
constexpr size_t instructionLength(AddressingMode mode)
{
    switch (mode) {
        case AddressingMode::IMPLIED:
            return 1;
        case AddressingMode::ABSOLUTE:
        case AddressingMode::ABSOLUTE_X:
        case AddressingMode::ABSOLUTE_Y:
        case AddressingMode::INDIRECT:
            return 3;
        default:
            return 2;
    }
}

constexpr const char* modeName(AddressingMode mode)
{
    switch (mode) {
        case AddressingMode::IMMEDIATE  : return "immediate"        ;
        case AddressingMode::ZEROPAGE   : return "zero page"        ;
        case AddressingMode::ZEROPAGE_X : return "zero page,X"      ;
        case AddressingMode::ZEROPAGE_Y : return "zero page,Y"      ;
        case AddressingMode::ABSOLUTE   : return "absolute"         ;
        case AddressingMode::ABSOLUTE_X : return "absolute,X"       ;
        case AddressingMode::ABSOLUTE_Y : return "absolute,Y"       ;
        case AddressingMode::INDIRECT   : return "indirect"         ;
        case AddressingMode::INDIRECT_X : return "(indirect,X)"     ;
        case AddressingMode::INDIRECT_Y : return "(indirect),Y"     ;
        case AddressingMode::IMPLIED    : return "implied"          ;
        case AddressingMode::RELATIVE   : return "relative"         ;
    }
    return "unknown";
}

/**
 * @brief Find the table row for an uppercase mnemonic
 * @return nullptr if the mnemonic is not in the table
 */
const OpcodeRow* findRow(std::string_view mnemonic);

bool isKnownMnemonic(std::string_view mnemonic);

/**
 * @brief Opcode byte for a mnemonic in a given mode
 * @return nullopt if the mnemonic is unknown or lacks the mode
 */
std::optional<uint8_t> lookup(std::string_view mnemonic, AddressingMode mode);

inline std::optional<uint8_t> opcodeIn(const OpcodeRow& row, AddressingMode mode)
{
    const int16_t value = row.opcodes[static_cast<size_t>(mode)];
    if (value == NO_OPCODE)
        return std::nullopt;
    return static_cast<uint8_t>(value);
}

} // namespace mos6502
