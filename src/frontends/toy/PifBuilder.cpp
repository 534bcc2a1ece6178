//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/PifBuilder.cpp
// Purpose: Implements node collection and final rank resolution for the PIF.
// Key invariants: Ranks are resolved once, after the last insertion.
// Ownership/Lifetime: finish() moves the table out of the builder.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/toy/PifBuilder.hpp"

#include <utility>

namespace lexis::frontends::toy
{

void PifBuilder::add(const ClassifiedToken &token)
{
    if (token.value)
        slots_.push_back(Slot{token.kind, table_.insert(*token.value)});
    else
        slots_.push_back(Slot{token.kind, kNoNode});
}

PifBuild PifBuilder::finish() &&
{
    const std::vector<std::size_t> ranks = table_.ranks();

    PifBuild build;
    build.pif.reserve(slots_.size());
    for (const Slot &slot : slots_)
    {
        const int64_t index =
            slot.node == kNoNode ? kNoSymbol : static_cast<int64_t>(ranks[slot.node]);
        build.pif.push_back(PifEntry{slot.kind, index});
    }
    build.table = std::move(table_);
    slots_.clear();
    return build;
}

PifBuild buildPif(const std::vector<ClassifiedToken> &tokens)
{
    PifBuilder builder;
    for (const ClassifiedToken &token : tokens)
        builder.add(token);
    return std::move(builder).finish();
}

} // namespace lexis::frontends::toy
