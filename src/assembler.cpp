#include "assembler.hpp"
#include "lexer.hpp"
#include "parser.hpp"

void Assembler::runPass(const ProgramNode& program, Pass pass)
{
    context.startPass(pass);

    try {
        program.accept(*this);
    } catch (AssemblyError& e) {
        if (e.line() == 0)
            e.setLine(context.line);
        throw;
    }

    if (context.inScratchBlock()) {
        throw ScratchBlockError(".enum block is never closed", context.scratchOpenedAt);
    }
}

void Assembler::visit(const LabelNode &node)
{
    context.line = node.line;
    const bool collecting = context.pass == Pass::COLLECTING_LABELS;

    if (context.pc > ADDRESS_MAX)
        throw ArgumentRangeError("Label " + node.name + " lies past the end of the address space");

    if (node.isLocal()) {
        if (!context.currentScope.has_value())
            throw UndefinedLocalLabelScopeError(node.name);
        context.symbols.defineLocalLabel(*context.currentScope, node.name, context.pc, collecting);
        return;
    }

    context.symbols.defineGlobalLabel(node.name, context.pc, collecting);
    context.currentScope = node.name;
}

void Assembler::visit(const SymbolDefinitionNode &node)
{
    context.line = node.line;
    // evaluated against the current bindings, so `N = N + 1` sees the old N
    auto value = context.resolver().resolve(*node.value);
    if (isResolved(value))
        context.symbols.defineConstant(node.name, value);
    else
        context.symbols.defineConstant(node.name, node.value.get());
}

void Assembler::visit(const DirectiveNode &node)
{
    context.line = node.line;
    directives.process(node);
}

void Assembler::visit(const InstructionNode &node)
{
    context.line = node.line;
    encoder.encode(node);
}

AssemblyResult assemble(const ProgramNode& program, const DebugSymbolOptions& options)
{
    AssemblyContext context;
    Assembler assembler(context);

    assembler.runPass(program, Pass::COLLECTING_LABELS);
    assembler.runPass(program, Pass::EMITTING_CODE);

    AssemblyResult result;
    result.bytes = std::move(context.output);
    result.labels = context.symbols.globals().addresses;
    result.startAddress = context.startAddress.value_or(0);
    result.debugSymbols = DebugSymbolExporter(options).render(context.symbols);
    return result;
}

AssemblyResult assemble(std::string_view source, const DebugSymbolOptions& options)
{
    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    Parser parser(tokens);
    auto program = parser.parseProgram();
    return assemble(*program, options);
}
