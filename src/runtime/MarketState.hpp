#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace champ {

struct PricePoint {
    double ts{0.0};      // epoch seconds
    double price{0.0};
};

struct ProxyPoint {
    double ts{0.0};
    double tips{0.0};
    double whales{0.0};
};

// Shared between the feed threads (writers) and the round driver (reader).
// Bounded FIFO buffers; readers get copies.
class MarketState {
public:
    explicit MarketState(size_t hist_points);

    void push_price(double ts, double price);
    void push_proxies(double ts, double tips, double whales);

    std::optional<PricePoint> last_price() const;
    std::optional<ProxyPoint> last_proxies() const;
    std::vector<PricePoint>   price_history() const;

    size_t capacity() const { return cap_; }

private:
    const size_t cap_;
    mutable std::mutex mtx_;
    std::deque<PricePoint> prices_;
    std::deque<ProxyPoint> proxies_;
};

} // namespace champ
