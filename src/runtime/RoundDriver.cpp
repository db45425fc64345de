#include "runtime/RoundDriver.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

#include "core/Errors.hpp"

using namespace champ;
using json = nlohmann::json;

static constexpr size_t LATEST_OUTPUTS = 10;

static double now_sec() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

RoundDriver::RoundDriver(MarketState& market, EnsembleDispatcher& ensemble, ChainedLog& log,
                         HealthMonitor& monitor, AlertSink& alerts, Options opts)
    : market_(market), ensemble_(ensemble), log_(log),
      monitor_(monitor), alerts_(alerts), opts_(std::move(opts)) {
    for (char& c : opts_.symbol) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

RoundDriver::~RoundDriver() {
    stop();
}

std::optional<std::string> RoundDriver::run_round() {
    auto price   = market_.last_price();
    auto proxies = market_.last_proxies();
    if (!price || !proxies) {
        std::cout << "[ROUND] Skipped: waiting for "
                  << (!price ? "price" : "proxy") << " data\n";
        return std::nullopt;
    }

    RoundContext ctx;
    ctx.symbol           = opts_.symbol;
    ctx.price            = price->price;
    ctx.sol_tips_proxy   = proxies->tips;
    ctx.sol_whales_proxy = proxies->whales;
    ctx.trending_source  = opts_.trending_source;
    ctx.timestamp        = now_sec();
    ctx.round_id         = "round_" + std::to_string(static_cast<long long>(ctx.timestamp));

    monitor_.set_stage("dispatch", 1.0);
    RoundRecord record = ensemble_.execute_round(ctx);
    monitor_.set_stage("dispatch", 0.0);
    monitor_.increment_rounds();

    for (const auto& r : record.results) {
        monitor_.record_model_call(r.endpoint_name, r.success, r.latency_ms);
    }

    monitor_.set_stage("log", 1.0);
    std::string root = log_.log_round(record);   // PersistenceError propagates
    monitor_.set_stage("log", 0.0);

    {
        std::lock_guard<std::mutex> lock(mtx_);
        last_root_ = root;
        if (!record.results.empty()) {
            auto top = std::max_element(
                record.results.begin(), record.results.end(),
                [](const RoundResult& a, const RoundResult& b) {
                    return a.text.size() < b.text.size();
                });
            latest_outputs_.push_front(top->text);
            while (latest_outputs_.size() > LATEST_OUTPUTS) latest_outputs_.pop_back();
        }
    }

    std::cout << "[ROUND] " << record.round_id << " root=" << root << "\n";
    return root;
}

void RoundDriver::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]() { loop(); });
}

void RoundDriver::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
        running_.store(false);
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void RoundDriver::loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mtx_);
            wake_cv_.wait_for(lock, opts_.interval, [this]() { return !running_.load(); });
        }
        if (!running_.load()) break;

        try {
            run_round();
        } catch (const PersistenceError& e) {
            monitor_.set_stage("log", -1.0);
            monitor_.increment_log_failures();
            std::cerr << "[ROUND] Persistence failure: " << e.what() << "\n";
            alerts_.send(json{{"severity", "critical"},
                              {"component", "ledger"},
                              {"message", e.what()},
                              {"timestamp", now_sec()}});
        } catch (const std::exception& e) {
            std::cerr << "[ROUND] Round failed: " << e.what() << "\n";
        }
    }
}

std::vector<std::string> RoundDriver::latest_outputs() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<std::string>(latest_outputs_.begin(), latest_outputs_.end());
}

std::string RoundDriver::last_root() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_root_;
}

json RoundDriver::snapshot() const {
    json prices = json::array();
    for (const auto& p : market_.price_history()) prices.push_back({p.ts, p.price});

    return json{
        {"merkle_root",    log_.current_root()},
        {"latest_outputs", latest_outputs()},
        {"price_data",     prices}
    };
}
