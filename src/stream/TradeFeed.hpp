#pragma once
#include <string>
#include "runtime/MarketState.hpp"

namespace champ {

// ---------------------------------------------------------------------------
// Binance <symbol>@trade frame -> MarketState price buffer.
//
//   {"e":"trade","E":1700000000123,"s":"BTCUSDT","t":1,
//    "p":"43000.10","q":"0.01","T":1700000000120,"m":true}
//
//   p  -- price, sent as a string
//   T  -- trade time, epoch ms
//
// Frames without "p" (subscription acks, etc.) are skipped. A frame that is
// not JSON at all throws: ResilientStream counts it and reconnects.
// ---------------------------------------------------------------------------
class TradeFeed {
public:
    explicit TradeFeed(MarketState& state);

    void on_message(const std::string& msg);

    unsigned long long trades() const { return trades_; }

private:
    MarketState&       state_;
    unsigned long long trades_{0};
};

} // namespace champ
