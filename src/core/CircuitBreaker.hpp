#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace champ {

enum class CircuitState : uint8_t {
    CLOSED    = 0,
    OPEN      = 1,
    HALF_OPEN = 2
};

const char* to_string(CircuitState s);

// ---------------------------------------------------------------------------
// Tri-state gate in front of one external resource.
//
//   CLOSED    -- max_failures failures -->  OPEN
//   OPEN      -- timeout elapsed, next can_execute() -->  HALF_OPEN
//   HALF_OPEN -- on_success -->  CLOSED  |  on_failure -->  OPEN
//
// No timer thread. The OPEN -> HALF_OPEN edge is taken lazily inside
// can_execute(), as a pure function of the injected clock.
// ---------------------------------------------------------------------------
class CircuitBreaker {
public:
    using Clock     = std::chrono::steady_clock;
    using TimeFn    = std::function<Clock::time_point()>;

    CircuitBreaker(int max_failures, std::chrono::seconds timeout,
                   TimeFn now = &Clock::now);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    bool can_execute();
    void on_success();
    void on_failure();

    CircuitState state() const;
    int          failures() const;

    int                  max_failures() const { return max_failures_; }
    std::chrono::seconds timeout() const      { return timeout_; }

private:
    const int                  max_failures_;
    const std::chrono::seconds timeout_;
    TimeFn                     now_;

    mutable std::mutex mtx_;
    CircuitState       state_{CircuitState::CLOSED};
    int                failures_{0};
    Clock::time_point  last_failure_{};
};

} // namespace champ
