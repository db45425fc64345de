// =============================================================================
// ensemble_dispatcher_test.cpp - EnsembleDispatcher fan-out test
// =============================================================================
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <regex>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "ensemble/EnsembleDispatcher.hpp"
#include "ensemble/PromptTemplate.hpp"
#include "test_support/FakeTransports.hpp"

using namespace champ;
using namespace champ::testing;
using namespace std::chrono_literals;
using json = nlohmann::json;

static RoundContext sample_context() {
    RoundContext ctx;
    ctx.symbol           = "BTCUSDT";
    ctx.price            = 43000.5;
    ctx.sol_tips_proxy   = 0.42;
    ctx.sol_whales_proxy = 0.17;
    ctx.trending_source  = "twitter";
    ctx.timestamp        = 1700000000.0;
    ctx.round_id         = "round_1700000000";
    return ctx;
}

static std::shared_ptr<EndpointClient> make_client(const std::string& name,
                                                   std::shared_ptr<FakeHttp> http) {
    EndpointClient::Options o;
    o.max_retries   = 0;
    o.retry_backoff = 0.01;
    return std::make_shared<EndpointClient>(name, "http://" + name + "/generate", http, o);
}

class EnsembleDispatcherTest {
public:
    int run_all_tests() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║           ENSEMBLE DISPATCHER - UNIT TESTS                       ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";

        test_success_and_failure_in_order();
        test_slow_endpoint_times_out();
        test_history_is_bounded();
        test_metrics_without_calls();
        test_round_id_format();
        test_text_truncation();
        test_truncation_keeps_utf8_whole();
        test_drain_waits_for_abandoned_calls();
        test_prompt_reaches_endpoints();

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

    void test_success_and_failure_in_order() {
        std::cout << "Testing one success and one failure...\n";
        auto http_a = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"text":"ok"})", 10ms)
        });
        auto http_b = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::fail("model crashed")
        });

        EnsembleDispatcher d({make_client("A", http_a), make_client("B", http_b)});
        RoundContext ctx = sample_context();
        RoundRecord rec = d.execute_round(ctx);

        check(rec.results.size() == 2, "One result per endpoint",
              std::to_string(rec.results.size()));
        if (rec.results.size() == 2) {
            const RoundResult& a = rec.results[0];
            const RoundResult& b = rec.results[1];
            check(a.endpoint_name == "A" && b.endpoint_name == "B", "Configured order kept",
                  a.endpoint_name + "," + b.endpoint_name);
            check(a.success && a.text == "ok" && a.error.empty(), "A succeeded", a.text);
            check(a.latency_ms >= 10.0, "A latency recorded", std::to_string(a.latency_ms));
            check(!b.success && b.text == "ERROR: model crashed", "B error text", b.text);
            check(b.error == "model crashed", "B error field", b.error);
            check(b.latency_ms == 0.0, "B latency zero", std::to_string(b.latency_ms));
        }

        check(rec.timestamp == ctx.timestamp, "Record stamped from context", "bad timestamp");
        check(rec.context.symbol == "BTCUSDT", "Context carried", rec.context.symbol);
        check(rec.round_id.rfind("round_", 0) == 0, "Round id prefix", rec.round_id);
        check(d.history_size() == 1, "Round stored in history", std::to_string(d.history_size()));

        PerformanceMetrics m = d.performance_metrics();
        check(m.total_rounds == 1, "Metrics count one round", std::to_string(m.total_rounds));
        check(m.success_rate == 0.5, "Half of the calls succeeded", std::to_string(m.success_rate));
        check(m.total_errors == 1, "One error total", std::to_string(m.total_errors));
        check(m.active_clients == 2, "Both clients still healthy", std::to_string(m.active_clients));
        check(m.avg_latency_ms == rec.results[0].latency_ms,
              "Average ignores clients without latency", std::to_string(m.avg_latency_ms));

        json j = m;
        check(j.contains("avg_latency") && j.contains("success_rate") && j.contains("active_clients"),
              "Metrics serialize", j.dump());
        std::cout << "\n";
    }

    void test_slow_endpoint_times_out() {
        std::cout << "Testing round deadline...\n";
        auto fast1 = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"text":"one"})", 20ms)
        });
        auto slow = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"text":"late"})", 1000ms)
        });
        auto bad = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(500, "")
        });
        auto fast2 = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"response":"two"})", 5ms)
        });

        EnsembleDispatcher::Options o;
        o.round_timeout = 300ms;
        EnsembleDispatcher d({make_client("fast1", fast1), make_client("slow", slow),
                              make_client("bad", bad), make_client("fast2", fast2)}, o);

        auto t0 = std::chrono::steady_clock::now();
        RoundRecord rec = d.execute_round(sample_context());
        auto took = std::chrono::steady_clock::now() - t0;

        check(rec.results.size() == 4, "Every endpoint reported", std::to_string(rec.results.size()));
        check(took < 900ms, "Round bounded by deadline, not slow endpoint", "waited for slow");
        if (rec.results.size() == 4) {
            check(rec.results[0].success && rec.results[0].text == "one", "fast1 ok",
                  rec.results[0].text);
            const RoundResult& s = rec.results[1];
            check(!s.success && s.text == "ERROR: Request timeout" && s.error == "timeout",
                  "slow marked as timeout", s.text);
            check(s.latency_ms == 0.0, "Timeout latency zero", std::to_string(s.latency_ms));
            check(!rec.results[2].success && rec.results[2].error == "HTTP 500", "bad failed",
                  rec.results[2].error);
            check(rec.results[3].success && rec.results[3].text == "two", "fast2 ok",
                  rec.results[3].text);
        }

        // The abandoned call finishes on its own thread.
        auto limit = std::chrono::steady_clock::now() + 3s;
        while (slow->finished() < 1 && std::chrono::steady_clock::now() < limit)
            std::this_thread::sleep_for(10ms);
        check(slow->finished() == 1, "Abandoned call completed in background", "still running");
        check(d.history_size() == 1, "Late result not added to history",
              std::to_string(d.history_size()));
        std::cout << "\n";
    }

    void test_history_is_bounded() {
        std::cout << "Testing history cap...\n";
        auto http = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"text":"x"})")
        });
        EnsembleDispatcher::Options o;
        o.history_cap = 3;
        EnsembleDispatcher d({make_client("A", http)}, o);

        std::vector<double> stamps;
        for (int i = 0; i < 5; ++i) {
            RoundContext ctx = sample_context();
            ctx.timestamp += i;
            stamps.push_back(ctx.timestamp);
            d.execute_round(ctx);
        }

        std::vector<RoundRecord> h = d.history();
        check(h.size() == 3, "Oldest rounds evicted", std::to_string(h.size()));
        check(h.size() == 3 && h.front().timestamp == stamps[2] && h.back().timestamp == stamps[4],
              "Newest three kept in order", "wrong records");
        check(d.performance_metrics().total_rounds == 3, "total_rounds follows history",
              std::to_string(d.performance_metrics().total_rounds));

        bool threw = false;
        o.history_cap = 0;
        try { EnsembleDispatcher bad({make_client("A", http)}, o); }
        catch (const std::invalid_argument&) { threw = true; }
        check(threw, "Zero history cap rejected", "accepted");
        std::cout << "\n";
    }

    void test_metrics_without_calls() {
        std::cout << "Testing empty dispatcher...\n";
        EnsembleDispatcher d(std::vector<std::shared_ptr<EndpointClient>>{});
        PerformanceMetrics m = d.performance_metrics();
        check(m.success_rate == 1.0, "No calls reports full success", std::to_string(m.success_rate));
        check(m.avg_latency_ms == 0.0 && m.active_clients == 0 && m.total_errors == 0,
              "Zeroed counters", "non-zero");

        RoundRecord rec = d.execute_round(sample_context());
        check(rec.results.empty(), "No endpoints, no results", std::to_string(rec.results.size()));
        check(d.history_size() == 1, "Empty round still recorded", std::to_string(d.history_size()));
        std::cout << "\n";
    }

    void test_round_id_format() {
        std::cout << "Testing round id...\n";
        auto t = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
        std::string id1 = EnsembleDispatcher::make_round_id("prompt text", t);
        std::string id2 = EnsembleDispatcher::make_round_id("prompt text", t + 400ms);

        check(std::regex_match(id1, std::regex("round_1700000000_[0-9]{4}")),
              "round_<epoch>_<4 digits>", id1);
        check(id1 == id2, "Same prompt, same second, same id", id1 + " vs " + id2);

        std::string later = EnsembleDispatcher::make_round_id("prompt text", t + 1s);
        check(later.rfind("round_1700000001_", 0) == 0, "Epoch advances", later);
        std::cout << "\n";
    }

    void test_text_truncation() {
        std::cout << "Testing max_text_length...\n";
        auto http = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"text":"abcdefghij"})")
        });
        auto down = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::fail("a very long transport failure message")
        });
        EnsembleDispatcher::Options o;
        o.max_text_length = 5;
        EnsembleDispatcher d({make_client("A", http), make_client("B", down)}, o);

        RoundRecord rec = d.execute_round(sample_context());
        check(rec.results[0].text == "abcde", "Success text cut", rec.results[0].text);
        check(rec.results[1].text == "ERROR", "Error text cut too", rec.results[1].text);
        check(rec.results[1].error == "a very long transport failure message",
              "Error field untouched", rec.results[1].error);
        std::cout << "\n";
    }

    void test_truncation_keeps_utf8_whole() {
        std::cout << "Testing truncation on multi-byte text...\n";
        const std::string euro = "\xE2\x82\xAC";
        const std::string text = "abcd" + euro + " tail";

        check(EnsembleDispatcher::utf8_cut(text, 5) == 4, "Cut inside a sequence backs off",
              std::to_string(EnsembleDispatcher::utf8_cut(text, 5)));
        check(EnsembleDispatcher::utf8_cut(text, 6) == 4, "Cut on the last continuation byte",
              std::to_string(EnsembleDispatcher::utf8_cut(text, 6)));
        check(EnsembleDispatcher::utf8_cut(text, 7) == 7, "Cut after the sequence kept",
              std::to_string(EnsembleDispatcher::utf8_cut(text, 7)));
        check(EnsembleDispatcher::utf8_cut(text, 100) == text.size(), "Short text untouched",
              std::to_string(EnsembleDispatcher::utf8_cut(text, 100)));

        auto http = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"text":"abcd\u20ac tail"})")
        });
        EnsembleDispatcher::Options o;
        o.max_text_length = 5;
        EnsembleDispatcher d({make_client("A", http)}, o);

        RoundRecord rec = d.execute_round(sample_context());
        check(rec.results.size() == 1 && rec.results[0].text == "abcd",
              "Partial character dropped", rec.results.empty() ? "" : rec.results[0].text);

        bool dumped = true;
        try { json(rec).dump(); }
        catch (const json::exception&) { dumped = false; }
        check(dumped, "Truncated record is valid UTF-8", "dump threw");
        std::cout << "\n";
    }

    void test_drain_waits_for_abandoned_calls() {
        std::cout << "Testing drain...\n";
        auto slow = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"text":"late"})", 400ms)
        });
        EnsembleDispatcher::Options o;
        o.round_timeout = 50ms;
        EnsembleDispatcher d({make_client("slow", slow)}, o);

        check(d.drain(0ms), "Idle dispatcher drains at once", "not drained");

        RoundRecord rec = d.execute_round(sample_context());
        check(rec.results.size() == 1 && rec.results[0].error == "timeout", "Round timed out",
              rec.results.empty() ? "" : rec.results[0].error);
        check(d.in_flight() == 1, "Abandoned call still counted", std::to_string(d.in_flight()));
        check(!d.drain(20ms), "Short drain reports the running call", "drained early");

        check(d.drain(3s), "Drain returns once the call ends", "still running");
        check(d.in_flight() == 0 && slow->finished() == 1, "Nothing left in flight",
              std::to_string(d.in_flight()));
        std::cout << "\n";
    }

    void test_prompt_reaches_endpoints() {
        std::cout << "Testing prompt fan-out...\n";
        auto a = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"text":"ok"})")
        });
        auto b = std::make_shared<FakeHttp>(std::vector<HttpStep>{
            HttpStep::reply(200, R"({"text":"ok"})")
        });
        EnsembleDispatcher d({make_client("A", a), make_client("B", b)});
        RoundContext ctx = sample_context();
        RoundRecord rec = d.execute_round(ctx);

        json ja = json::parse(a->last_body());
        json jb = json::parse(b->last_body());
        check(ja["prompt"] == build_prompt(ctx), "Prompt built from context", "prompt differs");
        check(ja["prompt"] == jb["prompt"], "Every endpoint gets the same prompt", "differs");
        check(ja["round_id"] == rec.round_id && jb["round_id"] == rec.round_id,
              "Round id shared with endpoints", ja.dump());
        check(ja["prompt"].get<std::string>().find("BTCUSDT") != std::string::npos,
              "Prompt embeds the symbol", "missing symbol");
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
    EnsembleDispatcherTest tester;
    return tester.run_all_tests();
}
