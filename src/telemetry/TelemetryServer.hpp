#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

#include "telemetry/HealthMonitor.hpp"

namespace champ {

// ---------------------------------------------------------------------------
// Beast HTTP endpoint for scrapers and probes:
//   GET /metrics     Prometheus text
//   GET /health, /   JSON health report
//
// Connections are served asynchronously on one thread, one request each.
// A client has read_timeout to deliver its request and read the reply;
// after that the connection is dropped. stop() closes every open socket.
// ---------------------------------------------------------------------------
class TelemetryServer {
public:
    TelemetryServer(uint16_t port, const HealthMonitor& monitor,
                    std::chrono::milliseconds read_timeout = std::chrono::seconds(5));
    ~TelemetryServer();

    void start();
    void stop();

private:
    void run();

    uint16_t                  port_;
    const HealthMonitor&      monitor_;
    std::chrono::milliseconds read_timeout_;
    std::atomic<bool>         running_{false};
    std::thread               worker_;
};

} // namespace champ
