#include "ensemble/EnsembleDispatcher.hpp"
#include <cstdio>
#include <functional>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "ensemble/PromptTemplate.hpp"

using namespace champ;

void champ::to_json(nlohmann::json& j, const PerformanceMetrics& m) {
    j = nlohmann::json{
        {"active_clients", m.active_clients},
        {"total_rounds",   m.total_rounds},
        {"success_rate",   m.success_rate},
        {"avg_latency",    m.avg_latency_ms},
        {"total_errors",   m.total_errors}
    };
}

EnsembleDispatcher::EnsembleDispatcher(std::vector<std::shared_ptr<EndpointClient>> clients)
    : EnsembleDispatcher(std::move(clients), Options{}) {}

EnsembleDispatcher::EnsembleDispatcher(std::vector<std::shared_ptr<EndpointClient>> clients,
                                       Options opts)
    : clients_(std::move(clients)), opts_(opts) {
    for (const auto& c : clients_) {
        if (!c) throw std::invalid_argument("EnsembleDispatcher: null client");
    }
    if (opts_.history_cap == 0)
        throw std::invalid_argument("EnsembleDispatcher: history_cap must be positive");
}

std::string EnsembleDispatcher::make_round_id(const std::string& prompt,
                                              std::chrono::system_clock::time_point now) {
    long long epoch = std::chrono::duration_cast<std::chrono::seconds>(
                          now.time_since_epoch()).count();
    unsigned suffix = static_cast<unsigned>(std::hash<std::string>{}(prompt) % 10000);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "round_%lld_%04u", epoch, suffix);
    return buf;
}

size_t EnsembleDispatcher::utf8_cut(const std::string& s, size_t limit) {
    if (limit >= s.size()) return s.size();
    // Back off continuation bytes (10xxxxxx) so the cut lands on a lead byte.
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return cut;
}

RoundResult EnsembleDispatcher::truncate(RoundResult r) const {
    if (opts_.max_text_length > 0 && r.text.size() > opts_.max_text_length) {
        r.text.resize(utf8_cut(r.text, opts_.max_text_length));
    }
    return r;
}

RoundRecord EnsembleDispatcher::execute_round(const RoundContext& ctx) {
    const std::string prompt   = build_prompt(ctx);
    const std::string round_id = make_round_id(prompt, std::chrono::system_clock::now());

    // ---------------------------------------------------------------------------
    // Launch. The worker owns a shared_ptr to both its client and its promise,
    // so an abandoned call outlives this frame safely.
    // ---------------------------------------------------------------------------
    std::vector<std::future<EndpointResponse>> futures;
    futures.reserve(clients_.size());

    for (const auto& client : clients_) {
        auto promise = std::make_shared<std::promise<EndpointResponse>>();
        futures.push_back(promise->get_future());

        auto tracker = in_flight_;
        {
            std::lock_guard<std::mutex> lock(tracker->mtx);
            ++tracker->count;
        }

        std::thread([client, promise, tracker, prompt, round_id]() {
            try {
                promise->set_value(client->generate(prompt, round_id));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            std::lock_guard<std::mutex> lock(tracker->mtx);
            if (--tracker->count == 0) tracker->cv.notify_all();
        }).detach();
    }

    // ---------------------------------------------------------------------------
    // Collect against a single deadline, in configured order.
    // ---------------------------------------------------------------------------
    const auto deadline = std::chrono::steady_clock::now() + opts_.round_timeout;

    RoundRecord record;
    record.round_id  = round_id;
    record.timestamp = ctx.timestamp;
    record.context   = ctx;
    record.results.reserve(clients_.size());

    size_t ok = 0;
    for (size_t i = 0; i < clients_.size(); ++i) {
        RoundResult r;
        r.endpoint_name = clients_[i]->name();

        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            r.text    = "ERROR: Request timeout";
            r.error   = "timeout";
            r.success = false;
            std::cerr << "[ENSEMBLE] " << r.endpoint_name << " timed out in " << round_id << "\n";
        } else {
            try {
                EndpointResponse resp = futures[i].get();
                r.text       = resp.text;
                r.latency_ms = resp.latency_ms;
                r.success    = true;
                ++ok;
            } catch (const std::exception& e) {
                r.text  = std::string("ERROR: ") + e.what();
                r.error = e.what();
            } catch (...) {
                r.text  = "ERROR: unknown failure";
                r.error = "unknown failure";
            }
        }
        record.results.push_back(truncate(std::move(r)));
    }

    std::cout << "[ENSEMBLE] " << round_id << " " << ok << "/" << clients_.size()
              << " endpoints answered\n";

    {
        std::lock_guard<std::mutex> lock(history_mtx_);
        history_.push_back(record);
        while (history_.size() > opts_.history_cap) history_.pop_front();
    }
    return record;
}

size_t EnsembleDispatcher::in_flight() const {
    std::lock_guard<std::mutex> lock(in_flight_->mtx);
    return in_flight_->count;
}

bool EnsembleDispatcher::drain(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(in_flight_->mtx);
    bool drained = in_flight_->cv.wait_for(lock, timeout, [this]() {
        return in_flight_->count == 0;
    });
    if (!drained) {
        std::cerr << "[ENSEMBLE] " << in_flight_->count
                  << " endpoint call(s) still running after drain\n";
    }
    return drained;
}

PerformanceMetrics EnsembleDispatcher::performance_metrics() const {
    PerformanceMetrics m;
    uint64_t total = 0, successful = 0;
    double   latency_sum = 0.0;
    size_t   latency_n   = 0;

    for (const auto& c : clients_) {
        EndpointStats s = c->stats();
        total          += s.total_calls;
        successful     += s.successful_calls;
        m.total_errors += s.error_count;
        if (s.avg_latency_ms != 0.0) {
            latency_sum += s.avg_latency_ms;
            ++latency_n;
        }
        if (c->is_healthy()) ++m.active_clients;
    }

    m.success_rate   = total ? static_cast<double>(successful) / static_cast<double>(total) : 1.0;
    m.avg_latency_ms = latency_n ? latency_sum / static_cast<double>(latency_n) : 0.0;
    m.total_rounds   = history_size();
    return m;
}

std::vector<RoundRecord> EnsembleDispatcher::history() const {
    std::lock_guard<std::mutex> lock(history_mtx_);
    return std::vector<RoundRecord>(history_.begin(), history_.end());
}

size_t EnsembleDispatcher::history_size() const {
    std::lock_guard<std::mutex> lock(history_mtx_);
    return history_.size();
}
