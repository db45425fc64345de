#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace champ {

// Input to one round. Built once by the round driver, never mutated.
struct RoundContext {
    std::string symbol;
    double      price{0.0};
    double      sol_tips_proxy{0.0};
    double      sol_whales_proxy{0.0};
    std::string trending_source;
    double      timestamp{0.0};   // epoch seconds
    std::string round_id;
};

// One endpoint's outcome for one round.
struct RoundResult {
    std::string endpoint_name;
    std::string text;
    double      latency_ms{0.0};
    std::string error;
    bool        success{false};
};

// Unit persisted by ChainedLog.
struct RoundRecord {
    std::string              round_id;
    double                   timestamp{0.0};
    RoundContext             context;
    std::vector<RoundResult> results;
};

// Archive field names. Keys are emitted sorted by nlohmann::json's default
// std::map object, which is what makes the serialization canonical.
void to_json(nlohmann::json& j, const RoundContext& c);
void to_json(nlohmann::json& j, const RoundResult& r);
void to_json(nlohmann::json& j, const RoundRecord& r);

void from_json(const nlohmann::json& j, RoundContext& c);
void from_json(const nlohmann::json& j, RoundResult& r);
void from_json(const nlohmann::json& j, RoundRecord& r);

} // namespace champ
