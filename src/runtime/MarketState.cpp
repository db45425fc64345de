#include "runtime/MarketState.hpp"
#include <stdexcept>

using namespace champ;

MarketState::MarketState(size_t hist_points) : cap_(hist_points) {
    if (cap_ == 0) throw std::invalid_argument("MarketState: hist_points must be positive");
}

void MarketState::push_price(double ts, double price) {
    std::lock_guard<std::mutex> lock(mtx_);
    prices_.push_back({ts, price});
    while (prices_.size() > cap_) prices_.pop_front();
}

void MarketState::push_proxies(double ts, double tips, double whales) {
    std::lock_guard<std::mutex> lock(mtx_);
    proxies_.push_back({ts, tips, whales});
    while (proxies_.size() > cap_) proxies_.pop_front();
}

std::optional<PricePoint> MarketState::last_price() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (prices_.empty()) return std::nullopt;
    return prices_.back();
}

std::optional<ProxyPoint> MarketState::last_proxies() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (proxies_.empty()) return std::nullopt;
    return proxies_.back();
}

std::vector<PricePoint> MarketState::price_history() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<PricePoint>(prices_.begin(), prices_.end());
}
