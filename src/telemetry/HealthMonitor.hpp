#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace champ {

struct ModelCallCounters {
    uint64_t success{0};
    uint64_t error{0};
    double   latency_ms_sum{0.0};
    uint64_t latency_count{0};
};

// ---------------------------------------------------------------------------
// Process-level health registry. Components register a named check that
// returns a JSON snapshot (value copy); the telemetry server polls
// health_check() and to_prometheus(). Checks run on the caller's thread.
// ---------------------------------------------------------------------------
class HealthMonitor {
public:
    using Check = std::function<nlohmann::json()>;

    HealthMonitor();

    void register_check(const std::string& name, Check check);

    void record_model_call(const std::string& model, bool success, double latency_ms);
    void set_stage(const std::string& stage, double value);
    void increment_rounds();
    void increment_log_failures();

    // {"status","uptime_seconds","timestamp","services":{name: check()}}
    // A throwing check is reported in place and marks status "degraded".
    nlohmann::json health_check() const;

    std::string to_prometheus() const;

    std::map<std::string, ModelCallCounters> model_calls() const;
    uint64_t rounds() const       { return rounds_.load(); }
    uint64_t log_failures() const { return log_failures_.load(); }

private:
    double uptime_seconds() const;

    const std::chrono::steady_clock::time_point start_;

    mutable std::mutex mtx_;
    std::map<std::string, Check>             checks_;
    std::map<std::string, ModelCallCounters> calls_;
    std::map<std::string, double>            stages_;

    std::atomic<uint64_t> rounds_{0};
    std::atomic<uint64_t> log_failures_{0};
};

} // namespace champ
