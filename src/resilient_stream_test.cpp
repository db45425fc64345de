// =============================================================================
// resilient_stream_test.cpp - ResilientStream reconnect / health test
// =============================================================================
// Runs the real stream loop against scripted transports. Backoff and read
// timeouts are shrunk to milliseconds; no network is touched.
// =============================================================================
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/CircuitBreaker.hpp"
#include "stream/ResilientStream.hpp"
#include "stream/TradeFeed.hpp"
#include "test_support/FakeTransports.hpp"

using namespace champ;
using namespace champ::testing;
using namespace std::chrono_literals;

static ResilientStream::Options fast_options() {
    ResilientStream::Options o;
    o.backoff_floor = 10ms;
    o.backoff_cap   = 40ms;
    o.breaker_wait  = 10ms;
    o.read_timeout  = 5ms;
    return o;
}

template <class Pred>
static bool wait_until(Pred pred, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

class ResilientStreamTest {
public:
    int run_all_tests() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║           RESILIENT STREAM - UNIT TESTS                          ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";

        test_reconnect_sequence();
        test_breaker_gates_connects();
        test_backoff_grows_to_cap();
        test_stop_on_quiet_feed();
        test_trade_feed_wiring();

        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

private:
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    void check(bool cond, const char* name, const std::string& reason) {
        if (cond) {
            std::cout << "  ✓ " << name << "\n";
            tests_passed_++;
        } else {
            std::cout << "  ✗ " << name << " - " << reason << "\n";
            tests_failed_++;
        }
    }

    // =========================================================================
    // TESTS
    // =========================================================================

    // attempt 0: open fails
    // attempt 1: m1, m2, bad (handler throws)
    // attempt 2: m3, then the read drops
    // attempt 3+: connected, idle
    void test_reconnect_sequence() {
        std::cout << "Testing reconnect sequence...\n";
        CircuitBreaker breaker(100, std::chrono::seconds(60));

        std::atomic<int> attempts{0};
        auto factory = [&attempts]() -> std::unique_ptr<StreamTransport> {
            int n = attempts.fetch_add(1);
            StreamScript s;
            if (n == 0) s.open_fails = true;
            if (n == 1) s.frames = {"m1", "m2", "bad"};
            if (n == 2) { s.frames = {"m3"}; s.drop_after_frames = true; }
            return std::make_unique<ScriptedStreamTransport>(s);
        };

        std::mutex seen_mtx;
        std::vector<std::string> seen;

        ResilientStream stream(factory, breaker, fast_options());
        stream.start([&](const std::string& msg) {
            {
                std::lock_guard<std::mutex> lock(seen_mtx);
                seen.push_back(msg);
            }
            if (msg == "bad") throw std::runtime_error("handler rejected frame");
        });

        bool settled = wait_until([&]() {
            ConnectionHealth h = stream.health();
            return h.reconnect_count >= 3 && h.message_count >= 4;
        }, 3000ms);
        check(settled, "Stream reaches third connection", "timed out");

        ConnectionHealth h = stream.health();
        check(h.message_count == 4, "Four frames counted",
              "got " + std::to_string(h.message_count));
        check(h.error_count == 3, "Open, handler and read failures counted",
              "got " + std::to_string(h.error_count));
        check(h.reconnect_count == 3, "Three successful opens",
              "got " + std::to_string(h.reconnect_count));
        check(h.last_message_time > 0.0, "Last message stamped", "zero");
        check(h.current_downtime == 0.0, "No downtime inside grace period", "non-zero");
        check(h.breaker_state == CircuitState::CLOSED, "Breaker recovered via successes",
              to_string(h.breaker_state));

        {
            std::lock_guard<std::mutex> lock(seen_mtx);
            bool order_ok = seen.size() == 4 && seen[0] == "m1" && seen[1] == "m2" &&
                            seen[2] == "bad" && seen[3] == "m3";
            check(order_ok, "Frames delivered in order, none after handler failure",
                  "unexpected frame sequence");
        }

        auto t0 = std::chrono::steady_clock::now();
        stream.stop();
        auto took = std::chrono::steady_clock::now() - t0;
        check(!stream.running(), "Stopped flag cleared", "still running");
        check(took < 1s, "stop() returns promptly", "slow stop");
        std::cout << "\n";
    }

    void test_breaker_gates_connects() {
        std::cout << "Testing breaker gating...\n";
        auto now = CircuitBreaker::Clock::now();
        CircuitBreaker breaker(1, std::chrono::seconds(60), [now]() { return now; });

        std::atomic<int> attempts{0};
        auto factory = [&attempts]() -> std::unique_ptr<StreamTransport> {
            attempts.fetch_add(1);
            StreamScript s;
            s.open_fails = true;
            return std::make_unique<ScriptedStreamTransport>(s);
        };

        ResilientStream stream(factory, breaker, fast_options());
        stream.start([](const std::string&) {});

        wait_until([&]() { return attempts.load() >= 1; }, 1000ms);
        std::this_thread::sleep_for(150ms);

        check(attempts.load() == 1, "No connect while breaker is OPEN",
              "attempts=" + std::to_string(attempts.load()));
        ConnectionHealth h = stream.health();
        check(h.breaker_state == CircuitState::OPEN, "Health reports OPEN", to_string(h.breaker_state));
        check(h.error_count == 1, "Single failure counted", std::to_string(h.error_count));

        stream.stop();
        std::cout << "\n";
    }

    void test_backoff_grows_to_cap() {
        std::cout << "Testing exponential backoff...\n";
        CircuitBreaker breaker(1000, std::chrono::seconds(60));

        ResilientStream::Options o = fast_options();
        o.backoff_floor = 20ms;
        o.backoff_cap   = 80ms;

        std::mutex mtx;
        std::vector<std::chrono::steady_clock::time_point> stamps;
        auto factory = [&]() -> std::unique_ptr<StreamTransport> {
            {
                std::lock_guard<std::mutex> lock(mtx);
                stamps.push_back(std::chrono::steady_clock::now());
            }
            StreamScript s;
            s.open_fails = true;
            return std::make_unique<ScriptedStreamTransport>(s);
        };

        ResilientStream stream(factory, breaker, o);
        stream.start([](const std::string&) {});
        wait_until([&]() {
            std::lock_guard<std::mutex> lock(mtx);
            return stamps.size() >= 6;
        }, 3000ms);
        stream.stop();

        std::lock_guard<std::mutex> lock(mtx);
        bool ok = stamps.size() >= 6;
        const int expected_ms[] = {20, 40, 80, 80, 80};
        for (size_t i = 0; ok && i < 5; ++i) {
            auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(
                           stamps[i + 1] - stamps[i]).count();
            if (gap + 1 < expected_ms[i]) ok = false;
        }
        check(ok, "Gaps double from floor and hold at cap", "gap shorter than backoff");
        std::cout << "\n";
    }

    void test_stop_on_quiet_feed() {
        std::cout << "Testing stop on an idle connection...\n";
        CircuitBreaker breaker(5, std::chrono::seconds(60));
        auto factory = []() -> std::unique_ptr<StreamTransport> {
            return std::make_unique<ScriptedStreamTransport>(StreamScript{});
        };

        ResilientStream stream(factory, breaker, fast_options());
        stream.start([](const std::string&) {});
        wait_until([&]() { return stream.health().reconnect_count >= 1; }, 1000ms);

        auto t0 = std::chrono::steady_clock::now();
        stream.stop();
        check(std::chrono::steady_clock::now() - t0 < 500ms,
              "Idle read loop observes stop", "slow stop");
        check(stream.health().reconnect_count == 1, "Single connection held", "reconnected");
        std::cout << "\n";
    }

    void test_trade_feed_wiring() {
        std::cout << "Testing trade frames into MarketState...\n";
        CircuitBreaker breaker(5, std::chrono::seconds(60));
        MarketState market(16);
        TradeFeed feed(market);

        auto factory = []() -> std::unique_ptr<StreamTransport> {
            StreamScript s;
            s.frames = {
                R"({"result":null,"id":1})",
                R"({"e":"trade","s":"BTCUSDT","p":"43000.50","q":"0.1","T":1700000000000})",
                R"({"e":"trade","s":"BTCUSDT","p":"43001.00","q":"0.2","T":1700000001000})"
            };
            return std::make_unique<ScriptedStreamTransport>(s);
        };

        ResilientStream stream(factory, breaker, fast_options());
        stream.start([&feed](const std::string& msg) { feed.on_message(msg); });
        wait_until([&]() { return stream.health().message_count >= 3; }, 1000ms);
        stream.stop();

        auto last = market.last_price();
        check(last.has_value() && last->price == 43001.00, "Last trade price stored", "missing");
        check(last.has_value() && last->ts == 1700000001.0, "Trade time converted to seconds", "bad ts");
        check(market.price_history().size() == 2, "Ack frame skipped", "wrong history size");
        check(stream.health().error_count == 0, "No handler errors", "errors recorded");
        std::cout << "\n";
    }

    void print_summary() {
        std::cout << "╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║                         TEST SUMMARY                             ║\n";
        std::cout << "╠══════════════════════════════════════════════════════════════════╣\n";
        std::cout << "║  Passed: " << std::setw(3) << tests_passed_
                  << "                                                      ║\n";
        std::cout << "║  Failed: " << std::setw(3) << tests_failed_
                  << "                                                      ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n";

        if (tests_failed_ == 0) {
            std::cout << "\n✓ ALL TESTS PASSED\n\n";
        } else {
            std::cout << "\n✗ SOME TESTS FAILED\n\n";
        }
    }
};

int main() {
    ResilientStreamTest tester;
    return tester.run_all_tests();
}
