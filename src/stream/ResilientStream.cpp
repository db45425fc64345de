#include "stream/ResilientStream.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace champ;

static double to_epoch_sec(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    return duration_cast<duration<double>>(tp.time_since_epoch()).count();
}

void champ::to_json(nlohmann::json& j, const ConnectionHealth& h) {
    j = nlohmann::json{
        {"message_count",         h.message_count},
        {"error_count",           h.error_count},
        {"reconnect_count",       h.reconnect_count},
        {"last_message_time",     h.last_message_time},
        {"current_downtime",      h.current_downtime},
        {"total_downtime",        h.total_downtime},
        {"circuit_breaker_state", to_string(h.breaker_state)}
    };
}

ResilientStream::ResilientStream(TransportFactory factory, CircuitBreaker& breaker)
    : ResilientStream(std::move(factory), breaker, Options{}) {}

ResilientStream::ResilientStream(TransportFactory factory, CircuitBreaker& breaker,
                                 Options opts)
    : factory_(std::move(factory)), breaker_(breaker), opts_(opts) {
    if (!factory_)
        throw std::invalid_argument("ResilientStream: transport factory required");
}

ResilientStream::~ResilientStream() {
    stop();
}

void ResilientStream::start(MessageHandler handler) {
    if (!handler) throw std::invalid_argument("ResilientStream: handler required");
    if (running_.exchange(true)) return;  // already running
    handler_ = std::move(handler);
    thread_  = std::thread([this]() { worker(); });
}

void ResilientStream::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
        running_.store(false);
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void ResilientStream::sleep_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(wake_mtx_);
    wake_cv_.wait_for(lock, d, [this]() { return !running_.load(); });
}

// ---------------------------------------------------------------------------
// Downtime is accumulated here, on the stream thread, when a frame ends a
// silence longer than the grace period. health() only reads.
// ---------------------------------------------------------------------------
void ResilientStream::record_message() {
    auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mtx_);
    if (health_.message_count > 0) {
        double gap = std::chrono::duration<double>(now - last_message_).count()
                   - static_cast<double>(opts_.downtime_grace.count());
        if (gap > 0.0) health_.total_downtime += gap;
    }
    last_message_             = now;
    health_.last_message_time = to_epoch_sec(now);
    ++health_.message_count;
}

void ResilientStream::record_error() {
    std::lock_guard<std::mutex> lock(mtx_);
    ++health_.error_count;
}

ConnectionHealth ResilientStream::health() const {
    ConnectionHealth snap;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        snap = health_;
        if (health_.message_count > 0) {
            double age = std::chrono::duration<double>(
                             std::chrono::system_clock::now() - last_message_).count();
            snap.current_downtime = std::max(
                0.0, age - static_cast<double>(opts_.downtime_grace.count()));
        }
    }
    snap.breaker_state = breaker_.state();
    return snap;
}

void ResilientStream::worker() {
    auto backoff = opts_.backoff_floor;

    while (running_.load()) {
        if (!breaker_.can_execute()) {
            sleep_for(opts_.breaker_wait);
            continue;
        }

        std::unique_ptr<StreamTransport> transport;
        try {
            transport = factory_();
            if (!transport) throw std::runtime_error("transport factory returned null");
            transport->open();

            {
                std::lock_guard<std::mutex> lock(mtx_);
                ++health_.reconnect_count;
            }
            backoff = opts_.backoff_floor;

            while (running_.load()) {
                std::string msg;
                if (!transport->read(msg, opts_.read_timeout)) continue;  // idle

                record_message();
                try {
                    handler_(msg);
                    breaker_.on_success();
                } catch (const std::exception& e) {
                    record_error();
                    breaker_.on_failure();
                    std::cerr << "[STREAM] Handler error: " << e.what()
                              << "; reconnecting\n";
                    break;
                }
            }
            transport->close();
        } catch (const std::exception& e) {
            if (transport) transport->close();
            record_error();
            breaker_.on_failure();
            if (!running_.load()) break;

            std::cerr << "[STREAM] Connection error: " << e.what()
                      << "; retry in " << backoff.count() << "ms\n";
            sleep_for(backoff);
            backoff = std::min(backoff * 2, opts_.backoff_cap);
        }
    }

    std::cout << "[STREAM] Stopped\n";
}
