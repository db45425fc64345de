#include "ensemble/PromptTemplate.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace champ {

std::string build_prompt(const RoundContext& ctx) {
    // No round_id here: the dispatcher derives the id from this text.
    json context = {
        {"symbol",           ctx.symbol},
        {"price",            ctx.price},
        {"sol_tips_proxy",   ctx.sol_tips_proxy},
        {"sol_whales_proxy", ctx.sol_whales_proxy},
        {"trending_source",  ctx.trending_source},
        {"timestamp",        ctx.timestamp}
    };

    std::string out;
    out += "You are competing in a public Novelty Championship.\n";
    out += "Respond with exactly ONE item starting with:\n";
    out += "TRADE: <pair, direction, entry, exit, expected X% profit, 3-line python stub>\n";
    out += "or\n";
    out += "PAPER: <Title> - 300 words abstract with a concrete mechanism and evaluation path.\n\n";
    out += "Context JSON: " + context.dump(4) + "\n\n";
    out += "Rules: no filler, no preamble, one output only.";
    return out;
}

} // namespace champ
