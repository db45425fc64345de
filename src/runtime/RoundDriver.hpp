#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "ensemble/EnsembleDispatcher.hpp"
#include "ledger/ChainedLog.hpp"
#include "notify/AlertSink.hpp"
#include "runtime/MarketState.hpp"
#include "telemetry/HealthMonitor.hpp"

namespace champ {

// ---------------------------------------------------------------------------
// Caller-driven round trigger. Every `interval` it snapshots MarketState into
// a RoundContext, runs the ensemble and appends the record to the chain.
//
// run_round() lets PersistenceError through to its caller; the periodic loop
// catches it, counts it and raises an alert, then carries on with the next
// round. The chain root is not advanced for a round that failed to persist.
// ---------------------------------------------------------------------------
class RoundDriver {
public:
    struct Options {
        std::string               symbol;
        std::string               trending_source;
        std::chrono::milliseconds interval{30000};
    };

    RoundDriver(MarketState& market, EnsembleDispatcher& ensemble, ChainedLog& log,
                HealthMonitor& monitor, AlertSink& alerts, Options opts);
    ~RoundDriver();

    // nullopt when there is no price or proxy sample yet.
    std::optional<std::string> run_round();

    void start();
    void stop();

    std::vector<std::string> latest_outputs() const;   // newest first, max 10
    std::string              last_root() const;
    nlohmann::json           snapshot() const;

private:
    void loop();

    MarketState&        market_;
    EnsembleDispatcher& ensemble_;
    ChainedLog&         log_;
    HealthMonitor&      monitor_;
    AlertSink&          alerts_;
    Options             opts_;

    std::atomic<bool>       running_{false};
    std::thread             worker_;
    std::mutex              wake_mtx_;
    std::condition_variable wake_cv_;

    mutable std::mutex      mtx_;
    std::deque<std::string> latest_outputs_;
    std::string             last_root_;
};

} // namespace champ
