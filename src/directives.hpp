#pragma once

#include "context.hpp"

class DirectiveProcessor
{
private:
    AssemblyContext& context;

    void defineBytes(const DirectiveNode& node);
    void defineWords(const DirectiveNode& node);
    void openScratchBlock(const DirectiveNode& node);
    void closeScratchBlock();
    void origin(const DirectiveNode& node);
    void align(const DirectiveNode& node);
    void reserve(const DirectiveNode& node);

    // Arguments that move PC have to be known the first time they are seen.
    int32_t requireValue(const Expression& expr);

public:
    explicit DirectiveProcessor(AssemblyContext& ctx) : context(ctx) {}

    void process(const DirectiveNode& node);
};
