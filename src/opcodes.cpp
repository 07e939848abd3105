#include "opcodes.hpp"
#include <algorithm>

namespace mos6502 {

namespace {

constexpr int16_t NA = NO_OPCODE;

// IMM   ZP   ZPX   ZPY   ABS  ABSX  ABSY   IND  INDX  INDY  IMPL   REL
constexpr std::array<OpcodeRow, 56> TABLE = {{
    {"ADC", {0x69, 0x65, 0x75,   NA, 0x6D, 0x7D, 0x79,   NA, 0x61, 0x71,   NA,   NA}},
    {"AND", {0x29, 0x25, 0x35,   NA, 0x2D, 0x3D, 0x39,   NA, 0x21, 0x31,   NA,   NA}},
    {"ASL", {  NA, 0x06, 0x16,   NA, 0x0E, 0x1E,   NA,   NA,   NA,   NA, 0x0A,   NA}},
    {"BCC", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x90}},
    {"BCS", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xB0}},
    {"BEQ", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xF0}},
    {"BIT", {  NA, 0x24,   NA,   NA, 0x2C,   NA,   NA,   NA,   NA,   NA,   NA,   NA}},
    {"BMI", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x30}},
    {"BNE", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xD0}},
    {"BPL", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x10}},
    {"BRK", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x00,   NA}},
    {"BVC", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x50}},
    {"BVS", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x70}},
    {"CLC", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x18,   NA}},
    {"CLD", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xD8,   NA}},
    {"CLI", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x58,   NA}},
    {"CLV", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xB8,   NA}},
    {"CMP", {0xC9, 0xC5, 0xD5,   NA, 0xCD, 0xDD, 0xD9,   NA, 0xC1, 0xD1,   NA,   NA}},
    {"CPX", {0xE0, 0xE4,   NA,   NA, 0xEC,   NA,   NA,   NA,   NA,   NA,   NA,   NA}},
    {"CPY", {0xC0, 0xC4,   NA,   NA, 0xCC,   NA,   NA,   NA,   NA,   NA,   NA,   NA}},
    {"DEC", {  NA, 0xC6, 0xD6,   NA, 0xCE, 0xDE,   NA,   NA,   NA,   NA,   NA,   NA}},
    {"DEX", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xCA,   NA}},
    {"DEY", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x88,   NA}},
    {"EOR", {0x49, 0x45, 0x55,   NA, 0x4D, 0x5D, 0x59,   NA, 0x41, 0x51,   NA,   NA}},
    {"INC", {  NA, 0xE6, 0xF6,   NA, 0xEE, 0xFE,   NA,   NA,   NA,   NA,   NA,   NA}},
    {"INX", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xE8,   NA}},
    {"INY", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xC8,   NA}},
    {"JMP", {  NA,   NA,   NA,   NA, 0x4C,   NA,   NA, 0x6C,   NA,   NA,   NA,   NA}},
    {"JSR", {  NA,   NA,   NA,   NA, 0x20,   NA,   NA,   NA,   NA,   NA,   NA,   NA}},
    {"LDA", {0xA9, 0xA5, 0xB5,   NA, 0xAD, 0xBD, 0xB9,   NA, 0xA1, 0xB1,   NA,   NA}},
    {"LDX", {0xA2, 0xA6,   NA, 0xB6, 0xAE,   NA, 0xBE,   NA,   NA,   NA,   NA,   NA}},
    {"LDY", {0xA0, 0xA4, 0xB4,   NA, 0xAC, 0xBC,   NA,   NA,   NA,   NA,   NA,   NA}},
    {"LSR", {  NA, 0x46, 0x56,   NA, 0x4E, 0x5E,   NA,   NA,   NA,   NA, 0x4A,   NA}},
    {"NOP", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xEA,   NA}},
    {"ORA", {0x09, 0x05, 0x15,   NA, 0x0D, 0x1D, 0x19,   NA, 0x01, 0x11,   NA,   NA}},
    {"PHA", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x48,   NA}},
    {"PHP", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x08,   NA}},
    {"PLA", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x68,   NA}},
    {"PLP", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x28,   NA}},
    {"ROL", {  NA, 0x26, 0x36,   NA, 0x2E, 0x3E,   NA,   NA,   NA,   NA, 0x2A,   NA}},
    {"ROR", {  NA, 0x66, 0x76,   NA, 0x6E, 0x7E,   NA,   NA,   NA,   NA, 0x6A,   NA}},
    {"RTI", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x40,   NA}},
    {"RTS", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x60,   NA}},
    {"SBC", {0xE9, 0xE5, 0xF5,   NA, 0xED, 0xFD, 0xF9,   NA, 0xE1, 0xF1,   NA,   NA}},
    {"SEC", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x38,   NA}},
    {"SED", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xF8,   NA}},
    {"SEI", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x78,   NA}},
    {"STA", {  NA, 0x85, 0x95,   NA, 0x8D, 0x9D, 0x99,   NA, 0x81, 0x91,   NA,   NA}},
    {"STX", {  NA, 0x86,   NA, 0x96, 0x8E,   NA,   NA,   NA,   NA,   NA,   NA,   NA}},
    {"STY", {  NA, 0x84, 0x94,   NA, 0x8C,   NA,   NA,   NA,   NA,   NA,   NA,   NA}},
    {"TAX", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xAA,   NA}},
    {"TAY", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xA8,   NA}},
    {"TSX", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0xBA,   NA}},
    {"TXA", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x8A,   NA}},
    {"TXS", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x9A,   NA}},
    {"TYA", {  NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA,   NA, 0x98,   NA}},
}};

} // namespace

const OpcodeRow* findRow(std::string_view mnemonic)
{
    // TABLE is sorted by mnemonic
    auto it = std::lower_bound(TABLE.begin(), TABLE.end(), mnemonic,
        [](const OpcodeRow& row, std::string_view key) { return row.mnemonic < key; });
    if (it == TABLE.end() || it->mnemonic != mnemonic)
        return nullptr;
    return &*it;
}

bool isKnownMnemonic(std::string_view mnemonic)
{
    return findRow(mnemonic) != nullptr;
}

std::optional<uint8_t> lookup(std::string_view mnemonic, AddressingMode mode)
{
    const OpcodeRow* row = findRow(mnemonic);
    if (!row)
        return std::nullopt;
    return opcodeIn(*row, mode);
}

} // namespace mos6502
