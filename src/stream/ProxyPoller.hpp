#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "runtime/MarketState.hpp"

namespace champ {

struct ProxySample {
    double tips{0.0};
    double whales{0.0};
};

// Periodic Solana proxy source. No on-chain feed is wired yet, so the
// default sampler reports zeros; the round driver only needs "a sample
// exists" to proceed.
class ProxyPoller {
public:
    using Sampler = std::function<ProxySample()>;

    ProxyPoller(MarketState& state, std::chrono::milliseconds interval);
    ProxyPoller(MarketState& state, std::chrono::milliseconds interval, Sampler sampler);
    ~ProxyPoller();

    void start();
    void stop();

private:
    void run();

    MarketState&              state_;
    std::chrono::milliseconds interval_;
    Sampler                   sampler_;

    std::atomic<bool>       running_{false};
    std::thread             worker_;
    std::mutex              mtx_;
    std::condition_variable cv_;
};

} // namespace champ
