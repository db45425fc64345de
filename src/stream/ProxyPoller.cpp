#include "stream/ProxyPoller.hpp"
#include <iostream>

using namespace champ;

static double now_sec() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

ProxyPoller::ProxyPoller(MarketState& state, std::chrono::milliseconds interval)
    : ProxyPoller(state, interval, []() { return ProxySample{}; }) {}

ProxyPoller::ProxyPoller(MarketState& state, std::chrono::milliseconds interval,
                         Sampler sampler)
    : state_(state), interval_(interval), sampler_(std::move(sampler)) {}

ProxyPoller::~ProxyPoller() {
    stop();
}

void ProxyPoller::start() {
    if (running_.exchange(true)) return;  // already running
    worker_ = std::thread([this]() { run(); });
}

void ProxyPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_.store(false);
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void ProxyPoller::run() {
    while (running_.load()) {
        try {
            ProxySample s = sampler_();
            state_.push_proxies(now_sec(), s.tips, s.whales);
        } catch (const std::exception& e) {
            std::cerr << "[PROXY] Sample failed: " << e.what() << "\n";
        }

        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
    }
}
