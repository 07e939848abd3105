#include "directives.hpp"
#include <iomanip>
#include <sstream>

namespace {

std::string hexAddress(int32_t address)
{
    std::ostringstream oss;
    oss << '$' << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << address;
    return oss.str();
}

} // namespace

void DirectiveProcessor::process(const DirectiveNode& node)
{
    switch (node.directive) {
        case Directive::BYTE:  defineBytes(node);      break;
        case Directive::WORD:  defineWords(node);      break;
        case Directive::ENUM:  openScratchBlock(node); break;
        case Directive::ENDE:  closeScratchBlock();    break;
        case Directive::ORG:   origin(node);           break;
        case Directive::ALIGN: align(node);            break;
        case Directive::DSB:   reserve(node);          break;
    }
}

int32_t DirectiveProcessor::requireValue(const Expression& expr)
{
    auto resolver = context.resolver();
    auto value = resolver.resolveNumber(expr);
    if (!value.has_value())
        throw resolver.unresolved(expr);
    return *value;
}

void DirectiveProcessor::defineBytes(const DirectiveNode& node)
{
    auto resolver = context.resolver();
    for (const auto& argument : node.arguments) {
        if (const auto* text = dynamic_cast<const StringNode*>(argument.get())) {
            for (char c : text->value) {
                context.emit(static_cast<uint8_t>(c));
            }
            continue;
        }

        auto value = resolver.resolveNumber(*argument);
        if (value.has_value())
            context.emit(static_cast<uint8_t>(*value & 0xFF));
        else
            context.emitUnresolved(*argument, 1);
    }
}

void DirectiveProcessor::defineWords(const DirectiveNode& node)
{
    auto resolver = context.resolver();
    for (const auto& argument : node.arguments) {
        auto value = resolver.resolveNumber(*argument);
        if (value.has_value())
            context.emitWord(static_cast<uint16_t>(*value & 0xFFFF));
        else
            context.emitUnresolved(*argument, 2);
    }
}

void DirectiveProcessor::openScratchBlock(const DirectiveNode& node)
{
    if (context.inScratchBlock()) {
        throw ScratchBlockError("Nested .enum blocks are not supported (block opened on line "
                                + std::to_string(context.scratchOpenedAt) + " is still open)");
    }
    const int32_t start = requireValue(*node.arguments[0]);
    if (start < 0 || start > ADDRESS_MAX)
        throw ArgumentRangeError(".enum address out of range: " + hexAddress(start));

    context.scratchSavedPc = context.pc;
    context.scratchOpenedAt = context.line;
    context.pc = start;
}

void DirectiveProcessor::closeScratchBlock()
{
    if (!context.inScratchBlock())
        throw ScratchBlockError(".ende without a matching .enum");

    context.pc = *context.scratchSavedPc;
    context.scratchSavedPc.reset();
}

void DirectiveProcessor::origin(const DirectiveNode& node)
{
    const int32_t target = requireValue(*node.arguments[0]);
    if (target < 0 || target > ADDRESS_MAX)
        throw ArgumentRangeError(".org address out of range: " + hexAddress(target));

    if (!context.originFixed) {
        context.pc = target;
        context.originFixed = true;
        if (!context.startAddress.has_value())
            context.startAddress = target;
        return;
    }

    if (target < context.pc) {
        throw ArgumentRangeError(".org " + hexAddress(target) + " is behind the current address "
                                 + hexAddress(context.pc));
    }
    // physically pad the gap so the output stays one contiguous image
    while (context.pc < target) {
        context.emit(0x00);
    }
}

void DirectiveProcessor::align(const DirectiveNode& node)
{
    const int32_t boundary = requireValue(*node.arguments[0]);
    if (boundary < 1)
        throw ArgumentRangeError(".align boundary must be positive, got " + std::to_string(boundary));

    const int32_t padding = (boundary - (context.pc % boundary)) % boundary;
    context.requireSpace(padding);
    for (int32_t i = 0; i < padding; ++i) {
        context.emit(0x00);
    }
}

void DirectiveProcessor::reserve(const DirectiveNode& node)
{
    const int32_t count = requireValue(*node.arguments[0]);
    if (count < 0)
        throw ArgumentRangeError(".dsb length must not be negative, got " + std::to_string(count));

    context.requireSpace(count);

    const Expression* fill = node.arguments.size() > 1 ? node.arguments[1].get() : nullptr;
    std::optional<int32_t> fillValue = 0;
    if (fill) {
        auto resolver = context.resolver();
        fillValue = resolver.resolveNumber(*fill);
    }

    for (int32_t i = 0; i < count; ++i) {
        if (fillValue.has_value())
            context.emit(static_cast<uint8_t>(*fillValue & 0xFF));
        else
            context.emitUnresolved(*fill, 1);
    }
}
