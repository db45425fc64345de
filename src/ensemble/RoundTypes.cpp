#include "ensemble/RoundTypes.hpp"

using json = nlohmann::json;

namespace champ {

void to_json(json& j, const RoundContext& c) {
    j = json{
        {"symbol",           c.symbol},
        {"price",            c.price},
        {"sol_tips_proxy",   c.sol_tips_proxy},
        {"sol_whales_proxy", c.sol_whales_proxy},
        {"trending_source",  c.trending_source},
        {"timestamp",        c.timestamp},
        {"round_id",         c.round_id}
    };
}

void to_json(json& j, const RoundResult& r) {
    j = json{
        {"model",   r.endpoint_name},
        {"text",    r.text},
        {"lat_ms",  r.latency_ms},
        {"error",   r.error},
        {"success", r.success}
    };
}

void to_json(json& j, const RoundRecord& r) {
    j = json{
        {"round_id",  r.round_id},
        {"timestamp", r.timestamp},
        {"context",   r.context},
        {"results",   r.results}
    };
}

void from_json(const json& j, RoundContext& c) {
    j.at("symbol").get_to(c.symbol);
    j.at("price").get_to(c.price);
    j.at("sol_tips_proxy").get_to(c.sol_tips_proxy);
    j.at("sol_whales_proxy").get_to(c.sol_whales_proxy);
    j.at("trending_source").get_to(c.trending_source);
    j.at("timestamp").get_to(c.timestamp);
    j.at("round_id").get_to(c.round_id);
}

void from_json(const json& j, RoundResult& r) {
    j.at("model").get_to(r.endpoint_name);
    j.at("text").get_to(r.text);
    j.at("lat_ms").get_to(r.latency_ms);
    j.at("error").get_to(r.error);
    j.at("success").get_to(r.success);
}

void from_json(const json& j, RoundRecord& r) {
    j.at("round_id").get_to(r.round_id);
    j.at("timestamp").get_to(r.timestamp);
    j.at("context").get_to(r.context);
    j.at("results").get_to(r.results);
}

} // namespace champ
