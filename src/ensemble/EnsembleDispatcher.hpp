#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "endpoint/EndpointClient.hpp"
#include "ensemble/RoundTypes.hpp"

namespace champ {

struct PerformanceMetrics {
    size_t   active_clients{0};
    size_t   total_rounds{0};
    double   success_rate{1.0};
    double   avg_latency_ms{0.0};
    uint64_t total_errors{0};
};

void to_json(nlohmann::json& j, const PerformanceMetrics& m);

// ---------------------------------------------------------------------------
// Fans one prompt out to every endpoint and collects exactly one result per
// endpoint, in configured order.
//
// Each call runs on its own detached thread and reports through a promise.
// The dispatcher waits on all futures against one shared deadline; a call
// still running at the deadline is recorded as "timeout" and left to finish
// on its own. Its result is discarded. Endpoint failures never escape
// execute_round().
// ---------------------------------------------------------------------------
class EnsembleDispatcher {
public:
    struct Options {
        std::chrono::milliseconds round_timeout{120000};
        size_t                    history_cap{1000};
        size_t                    max_text_length{0};   // 0 = keep full text
    };

    explicit EnsembleDispatcher(std::vector<std::shared_ptr<EndpointClient>> clients);
    EnsembleDispatcher(std::vector<std::shared_ptr<EndpointClient>> clients, Options opts);

    // The returned record's results are ordered like clients().
    RoundRecord execute_round(const RoundContext& ctx);

    PerformanceMetrics performance_metrics() const;

    std::vector<RoundRecord> history() const;
    size_t                   history_size() const;

    const std::vector<std::shared_ptr<EndpointClient>>& clients() const { return clients_; }

    // Endpoint calls still running, abandoned ones included.
    size_t in_flight() const;

    // Blocks until no endpoint call is running or the timeout passes.
    // Returns true when drained. Call before curl_global_cleanup().
    bool drain(std::chrono::milliseconds timeout) const;

    // round_<epoch_s>_<hash(prompt) % 10000, zero-padded to 4>
    static std::string make_round_id(const std::string& prompt,
                                     std::chrono::system_clock::time_point now);

    // Largest length <= limit that does not split a UTF-8 sequence.
    static size_t utf8_cut(const std::string& s, size_t limit);

private:
    // Shared with the detached workers so it outlives the dispatcher.
    struct InFlight {
        std::mutex              mtx;
        std::condition_variable cv;
        size_t                  count{0};
    };

    RoundResult truncate(RoundResult r) const;

    std::vector<std::shared_ptr<EndpointClient>> clients_;
    Options                                      opts_;
    std::shared_ptr<InFlight>                    in_flight_{std::make_shared<InFlight>()};

    mutable std::mutex      history_mtx_;
    std::deque<RoundRecord> history_;
};

} // namespace champ
