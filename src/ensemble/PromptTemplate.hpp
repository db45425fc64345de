#pragma once
#include <string>
#include "ensemble/RoundTypes.hpp"

namespace champ {

// Fixed championship prompt with the round context embedded as JSON.
// Same context -> same prompt bytes (the round id hash depends on it).
std::string build_prompt(const RoundContext& ctx);

} // namespace champ
