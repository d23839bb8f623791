#include "../include/context.hpp"
#include <stdexcept>

AssembledContext assemble_context(const std::vector<Chunk>& candidates, int max_tokens,
                                  const TokenCounter& count_tokens) {
    if (!count_tokens) throw std::invalid_argument("assemble_context: no token counter");
    AssembledContext out;
    ContextBudget budget;
    budget.max_tokens = max_tokens;

    for (const auto& c : candidates) {
        const std::string& source = c.source_id();
        if (budget.seen(source)) {
            ++out.skipped_duplicates;
            continue;
        }
        int tokens = count_tokens(c.text);
        if (tokens < 0) throw std::runtime_error("token counter returned a negative count");
        if (!budget.fits(tokens)) {
            out.stop = StopReason::TokenBudget;
            break;
        }
        budget.take(source, tokens);

        ContextEntry e;
        e.number = (int)out.entries.size() + 1;
        e.chunk = c;
        e.tokens = tokens;
        if (!out.text.empty()) out.text += "\n\n";
        out.text += "[" + std::to_string(e.number) + "] " + c.title() + "\n" + c.text;
        out.source_ids.push_back(source);
        out.entries.push_back(std::move(e));
    }
    out.tokens = budget.used_tokens;
    return out;
}

std::vector<Citation> citations_for(const AssembledContext& ctx) {
    std::vector<Citation> out;
    out.reserve(ctx.entries.size());
    for (auto& e : ctx.entries) {
        const Paper& p = *e.chunk.paper;
        Citation c;
        c.number = e.number;
        c.source_id = p.ref.id;
        c.title = p.ref.title;
        c.authors = p.authors;
        c.publication_id = p.publication_id;
        c.url = p.url;
        out.push_back(std::move(c));
    }
    return out;
}
