#include "stream/TradeFeed.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

using namespace champ;
using json = nlohmann::json;

static double now_sec() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

TradeFeed::TradeFeed(MarketState& state) : state_(state) {}

void TradeFeed::on_message(const std::string& msg) {
    json j = json::parse(msg);  // parse_error propagates to the stream

    if (!j.is_object() || !j.contains("p")) return;

    const json& p = j["p"];
    double price = p.is_string() ? std::stod(p.get<std::string>()) : p.get<double>();

    double ts = now_sec();
    if (j.contains("T") && j["T"].is_number()) {
        ts = static_cast<double>(j["T"].get<long long>()) / 1000.0;
    }

    state_.push_price(ts, price);
    ++trades_;
}
