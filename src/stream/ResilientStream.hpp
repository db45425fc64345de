#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "core/CircuitBreaker.hpp"
#include "stream/StreamTransport.hpp"

namespace champ {

struct ConnectionHealth {
    uint64_t message_count{0};
    uint64_t error_count{0};
    uint64_t reconnect_count{0};
    double   last_message_time{0.0};   // epoch seconds, 0 = never
    double   current_downtime{0.0};    // seconds
    double   total_downtime{0.0};      // seconds
    CircuitState breaker_state{CircuitState::CLOSED};
};

void to_json(nlohmann::json& j, const ConnectionHealth& h);

// ---------------------------------------------------------------------------
// Keeps one inbound feed alive while running. Every frame goes to the
// handler on the stream thread.
//
//   - breaker closed to us      -> wait breaker_wait, re-check
//   - open ok                   -> backoff = floor, reconnect_count++
//   - handler throws            -> error_count++, breaker failure, reconnect
//   - open/read throws          -> error_count++, breaker failure,
//                                  sleep backoff, backoff = min(2x, cap)
//
// Never lets a connection failure escape. stop() is observed after every
// frame, every idle read timeout and every connect attempt; sleeps wake early.
// ---------------------------------------------------------------------------
class ResilientStream {
public:
    using MessageHandler   = std::function<void(const std::string&)>;
    using TransportFactory = std::function<std::unique_ptr<StreamTransport>()>;

    struct Options {
        std::chrono::milliseconds backoff_floor{1000};
        std::chrono::milliseconds backoff_cap{32000};
        std::chrono::milliseconds breaker_wait{5000};
        std::chrono::milliseconds read_timeout{500};
        std::chrono::seconds      downtime_grace{30};
    };

    ResilientStream(TransportFactory factory, CircuitBreaker& breaker);
    ResilientStream(TransportFactory factory, CircuitBreaker& breaker, Options opts);
    ~ResilientStream();

    ResilientStream(const ResilientStream&) = delete;
    ResilientStream& operator=(const ResilientStream&) = delete;

    void start(MessageHandler handler);
    void stop();
    bool running() const { return running_.load(); }

    // Value copy; safe from any thread.
    ConnectionHealth health() const;

private:
    void worker();
    void record_message();
    void record_error();
    void sleep_for(std::chrono::milliseconds d);

    TransportFactory factory_;
    CircuitBreaker&  breaker_;
    Options          opts_;
    MessageHandler   handler_;

    std::atomic<bool> running_{false};
    std::thread       thread_;

    std::mutex              wake_mtx_;
    std::condition_variable wake_cv_;

    mutable std::mutex mtx_;
    ConnectionHealth   health_;
    std::chrono::system_clock::time_point last_message_{};
};

} // namespace champ
