#include "core/CircuitBreaker.hpp"
#include <iostream>
#include <stdexcept>

using namespace champ;

const char* champ::to_string(CircuitState s) {
    switch (s) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(int max_failures, std::chrono::seconds timeout,
                               TimeFn now)
    : max_failures_(max_failures), timeout_(timeout), now_(std::move(now)) {
    if (max_failures_ <= 0)
        throw std::invalid_argument("CircuitBreaker: max_failures must be positive");
    if (timeout_.count() <= 0)
        throw std::invalid_argument("CircuitBreaker: timeout must be positive");
    if (!now_)
        throw std::invalid_argument("CircuitBreaker: clock must be callable");
}

bool CircuitBreaker::can_execute() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (state_ != CircuitState::OPEN) return true;

    // Strictly greater: a probe at exactly last_failure + timeout stays blocked.
    if (now_() - last_failure_ > timeout_) {
        state_ = CircuitState::HALF_OPEN;
        std::cout << "[BREAKER] OPEN -> HALF_OPEN (probe allowed)\n";
        return true;
    }
    return false;
}

void CircuitBreaker::on_success() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (state_ != CircuitState::CLOSED) {
        std::cout << "[BREAKER] " << to_string(state_) << " -> CLOSED\n";
    }
    state_    = CircuitState::CLOSED;
    failures_ = 0;
}

void CircuitBreaker::on_failure() {
    std::lock_guard<std::mutex> lock(mtx_);
    ++failures_;
    last_failure_ = now_();

    // HALF_OPEN probe failed: straight back to OPEN with a fresh timer.
    if (state_ == CircuitState::HALF_OPEN || failures_ >= max_failures_) {
        if (state_ != CircuitState::OPEN) {
            std::cout << "[BREAKER] " << to_string(state_) << " -> OPEN"
                      << " (failures=" << failures_ << ")\n";
        }
        state_ = CircuitState::OPEN;
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

int CircuitBreaker::failures() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return failures_;
}
