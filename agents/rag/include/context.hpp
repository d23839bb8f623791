#pragma once
#include "types.hpp"
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

using TokenCounter = std::function<int(const std::string&)>;

// Running state of one assembly: tokens spent and sources already cited.
struct ContextBudget {
    int max_tokens{0};
    int used_tokens{0};
    std::unordered_set<std::string> used_sources;

    bool seen(const std::string& source_id) const { return used_sources.count(source_id) > 0; }
    bool fits(int tokens) const { return used_tokens + tokens <= max_tokens; }
    void take(const std::string& source_id, int tokens) {
        used_sources.insert(source_id);
        used_tokens += tokens;
    }
};

enum class StopReason {
    Exhausted,   // every candidate was considered
    TokenBudget, // the next distinct-source candidate did not fit
};

struct ContextEntry {
    int number{0}; // 1-based [n] tag
    Chunk chunk;
    int tokens{0};
};

struct AssembledContext {
    std::string text;
    std::vector<std::string> source_ids; // in context order
    std::vector<ContextEntry> entries;
    int tokens{0};
    int skipped_duplicates{0};
    StopReason stop{StopReason::Exhausted};
};

/**
 * Greedy context assembly over candidates ordered nearest first.
 *
 * A candidate whose paper is already in the context is skipped. The first
 * candidate that would push the total over max_tokens ends assembly, even if a
 * later candidate is small enough to fit. Only chunk text is counted; the
 * "[n] title" tags are not.
 */
AssembledContext assemble_context(const std::vector<Chunk>& candidates, int max_tokens,
                                  const TokenCounter& count_tokens);

std::vector<Citation> citations_for(const AssembledContext& ctx);
