#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <curl/curl.h>

#include "config/Settings.hpp"
#include "core/CircuitBreaker.hpp"
#include "core/Errors.hpp"
#include "endpoint/CurlHttpTransport.hpp"
#include "endpoint/EndpointClient.hpp"
#include "ensemble/EnsembleDispatcher.hpp"
#include "ledger/ChainedLog.hpp"
#include "notify/AlertSink.hpp"
#include "runtime/MarketState.hpp"
#include "runtime/RoundDriver.hpp"
#include "stream/BeastStreamTransport.hpp"
#include "stream/ProxyPoller.hpp"
#include "stream/ResilientStream.hpp"
#include "stream/TradeFeed.hpp"
#include "telemetry/HealthMonitor.hpp"
#include "telemetry/TelemetryServer.hpp"

using namespace champ;

// Signal handler only touches this flag; all teardown runs on the main thread.
static std::atomic<bool> g_sigint_flag{false};

static void handle_sigint(int) {
    g_sigint_flag.store(true, std::memory_order_relaxed);
}

int main() {
    load_dotenv(".env");
    load_dotenv("../.env");

    Settings cfg;
    try {
        cfg = Settings::from_env();
    } catch (const ConfigError& e) {
        std::cerr << "[CHAMP] Bad configuration: " << e.what() << "\n";
        return 2;
    }

    std::cout << "[CHAMP] symbol=" << cfg.symbol << " feed=" << cfg.ws_url << "\n"
              << "[CHAMP] endpoints=" << cfg.model_endpoints.size()
              << " retries=" << cfg.max_retries << " backoff=" << cfg.retry_backoff
              << " round_timeout=" << cfg.round_timeout_sec << "s\n"
              << "[CHAMP] archive=" << cfg.data_root << " cap=" << cfg.archive_cap << "\n";

    // Process-wide, exactly once, before any transport is used.
    curl_global_init(CURL_GLOBAL_ALL);

    std::signal(SIGINT,  handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    // Abandoned endpoint calls can outlive a round. libcurl must not be torn
    // down while any of them is still inside curl_easy_perform().
    constexpr auto DRAIN_GRACE = std::chrono::seconds(10);
    bool curl_idle = true;

    int exit_code = 0;
    try {
        auto http = std::make_shared<CurlHttpTransport>();

        // ---- ENDPOINTS ----
        EndpointClient::Options eopts;
        eopts.max_retries              = cfg.max_retries;
        eopts.retry_backoff            = cfg.retry_backoff;
        eopts.circuit_breaker_failures = cfg.circuit_breaker_failures;

        std::vector<std::shared_ptr<EndpointClient>> clients;
        for (const auto& ep : cfg.model_endpoints) {
            clients.push_back(std::make_shared<EndpointClient>(ep.first, ep.second, http, eopts));
            std::cout << "[CHAMP] endpoint " << ep.first << " -> " << ep.second << "\n";
        }

        EnsembleDispatcher::Options dopts;
        dopts.round_timeout   = std::chrono::seconds(cfg.round_timeout_sec);
        dopts.max_text_length = static_cast<size_t>(cfg.max_text_length);
        EnsembleDispatcher ensemble(std::move(clients), dopts);

        // ---- LEDGER ----
        ChainedLog ledger(cfg.data_root, static_cast<size_t>(cfg.archive_cap));

        // ---- FEEDS ----
        MarketState market(static_cast<size_t>(cfg.hist_points));
        TradeFeed   trades(market);

        CircuitBreaker  stream_breaker(cfg.circuit_breaker_failures,
                                       std::chrono::seconds(cfg.circuit_breaker_timeout));
        const std::string ws_url = cfg.ws_url;
        const auto ping_interval = std::chrono::seconds(cfg.ping_interval_sec);
        const auto ping_timeout  = std::chrono::seconds(cfg.ping_timeout_sec);
        ResilientStream stream(
            [ws_url, ping_interval, ping_timeout]() -> std::unique_ptr<StreamTransport> {
                return std::make_unique<BeastStreamTransport>(ws_url, ping_interval, ping_timeout);
            },
            stream_breaker);

        ProxyPoller proxies(market, std::chrono::seconds(5));

        // ---- TELEMETRY ----
        HealthMonitor monitor;
        monitor.register_check("stream_manager", [&stream]() {
            return nlohmann::json(stream.health());
        });
        monitor.register_check("orchestrator", [&ensemble]() {
            return nlohmann::json(ensemble.performance_metrics());
        });
        monitor.register_check("ledger", [&ledger]() {
            return nlohmann::json{{"merkle_root", ledger.current_root()},
                                  {"entries",     ledger.entry_count()}};
        });
        TelemetryServer telemetry(static_cast<uint16_t>(cfg.metrics_port), monitor);

        AlertSink alerts(cfg.alert_webhook, http);

        // ---- ROUNDS ----
        RoundDriver::Options ropts;
        ropts.symbol          = cfg.symbol;
        ropts.trending_source = cfg.trending_source;
        ropts.interval        = std::chrono::seconds(cfg.batch_seconds);
        RoundDriver rounds(market, ensemble, ledger, monitor, alerts, ropts);

        curl_idle = false;
        telemetry.start();
        proxies.start();
        stream.start([&trades](const std::string& msg) { trades.on_message(msg); });
        rounds.start();

        auto last_print = std::chrono::steady_clock::now();
        constexpr int PRINT_INTERVAL_S = 30;

        while (!g_sigint_flag.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            auto now = std::chrono::steady_clock::now();
            if (std::chrono::duration_cast<std::chrono::seconds>(now - last_print).count()
                    < PRINT_INTERVAL_S) continue;
            last_print = now;

            ConnectionHealth   h = stream.health();
            PerformanceMetrics m = ensemble.performance_metrics();
            auto last = market.last_price();

            std::cout << "───────────────────────────────────────────────────────────\n"
                      << " CHAMP  |  rounds=" << m.total_rounds
                      << "  active=" << m.active_clients << "/" << ensemble.clients().size()
                      << "  success=" << std::fixed << std::setprecision(3) << m.success_rate
                      << "  avg_lat=" << std::setprecision(1) << m.avg_latency_ms << "ms\n"
                      << " FEED   |  msgs=" << h.message_count
                      << "  errors=" << h.error_count
                      << "  reconnects=" << h.reconnect_count
                      << "  breaker=" << to_string(h.breaker_state)
                      << "  price=" << std::setprecision(2) << (last ? last->price : 0.0) << "\n"
                      << " CHAIN  |  root=" << rounds.last_root() << "\n"
                      << "───────────────────────────────────────────────────────────\n"
                      << std::flush;
        }

        std::cout << "[CHAMP] Shutdown requested\n";
        rounds.stop();
        stream.stop();
        proxies.stop();
        telemetry.stop();
        curl_idle = ensemble.drain(DRAIN_GRACE);
        std::cout << "[CHAMP] Final root: " << ledger.current_root() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[CHAMP] Fatal: " << e.what() << "\n";
        exit_code = 1;
    }

    if (curl_idle) {
        curl_global_cleanup();
    } else {
        std::cerr << "[CHAMP] Endpoint calls still running; skipping curl_global_cleanup\n";
    }
    return exit_code;
}
