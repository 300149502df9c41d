#include "frame_types.hpp"

#include <algorithm>

namespace spex {

std::vector<Fact> order_facts(std::vector<Fact> facts) {
    std::stable_sort(facts.begin(), facts.end(), [](const Fact& a, const Fact& b) {
        return tier_rank(a.tier) < tier_rank(b.tier);
    });
    return facts;
}

std::string merge_facts(const std::vector<Fact>& facts) {
    std::string out;
    for (const auto& f : order_facts(facts)) {
        if (f.text.empty()) continue;
        if (!out.empty()) out += " ";
        out += f.text;
        if (out.back() != '.' && out.back() != '?' && out.back() != '!') out += ".";
    }
    return out;
}

}  // namespace spex
