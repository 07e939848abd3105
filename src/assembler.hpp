#pragma once

#include "ast.hpp"
#include "context.hpp"
#include "debug_symbols.hpp"
#include "directives.hpp"
#include "encoder.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

struct AssemblyResult {
    std::vector<uint8_t> bytes;             // in emission order
    std::map<std::string, int32_t> labels;  // global labels only
    std::string debugSymbols;
    // Target of the first .org, 0 without one. Bytes emitted before that
    // .org are still at the front of `bytes`, so it only names the load
    // address of bytes[0] when the program opens with .org.
    int32_t startAddress = 0;
};

/**
 * Dispatches each statement of a pass to the symbol table, directive
 * processor or instruction encoder. Pass 1 (COLLECTING_LABELS) fills the
 * tables and moves PC exactly like pass 2 does but keeps no bytes; pass 2
 * (EMITTING_CODE) produces the final image.
 */
class Assembler : public StatementVisitor
{
private:
    AssemblyContext& context;
    DirectiveProcessor directives;
    InstructionEncoder encoder;

public:
    explicit Assembler(AssemblyContext& ctx) : context(ctx), directives(ctx), encoder(ctx) {}

    void runPass(const ProgramNode& program, Pass pass);

    void visit(const LabelNode &node) override;
    void visit(const SymbolDefinitionNode &node) override;
    void visit(const DirectiveNode &node) override;
    void visit(const InstructionNode &node) override;
};

// Both passes over an already parsed program, with a fresh context.
AssemblyResult assemble(const ProgramNode& program, const DebugSymbolOptions& options = {});

// Lex, parse and assemble source text.
AssemblyResult assemble(std::string_view source, const DebugSymbolOptions& options = {});
