#include "telemetry/HealthMonitor.hpp"
#include <sstream>
#include <vector>

using namespace champ;
using json = nlohmann::json;

HealthMonitor::HealthMonitor() : start_(std::chrono::steady_clock::now()) {}

double HealthMonitor::uptime_seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

void HealthMonitor::register_check(const std::string& name, Check check) {
    std::lock_guard<std::mutex> lock(mtx_);
    checks_[name] = std::move(check);
}

void HealthMonitor::record_model_call(const std::string& model, bool success, double latency_ms) {
    std::lock_guard<std::mutex> lock(mtx_);
    ModelCallCounters& c = calls_[model];
    if (success) {
        ++c.success;
        c.latency_ms_sum += latency_ms;
        ++c.latency_count;
    } else {
        ++c.error;
    }
}

void HealthMonitor::set_stage(const std::string& stage, double value) {
    std::lock_guard<std::mutex> lock(mtx_);
    stages_[stage] = value;
}

void HealthMonitor::increment_rounds() {
    rounds_.fetch_add(1);
}

void HealthMonitor::increment_log_failures() {
    log_failures_.fetch_add(1);
}

json HealthMonitor::health_check() const {
    // Copy the checks out so a slow check never runs under mtx_.
    std::vector<std::pair<std::string, Check>> checks;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        checks.assign(checks_.begin(), checks_.end());
    }

    std::string status = "healthy";
    json services = json::object();
    for (const auto& kv : checks) {
        try {
            services[kv.first] = kv.second();
        } catch (const std::exception& e) {
            services[kv.first] = json{{"error", e.what()}};
            status = "degraded";
        }
    }

    using namespace std::chrono;
    double now = duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();

    return json{
        {"status",         status},
        {"uptime_seconds", uptime_seconds()},
        {"timestamp",      now},
        {"rounds",         rounds_.load()},
        {"log_failures",   log_failures_.load()},
        {"services",       services}
    };
}

std::string HealthMonitor::to_prometheus() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ostringstream out;
    out << "champ_uptime_seconds " << uptime_seconds() << "\n"
        << "champ_rounds_total " << rounds_.load() << "\n"
        << "champ_log_failures_total " << log_failures_.load() << "\n";

    for (const auto& kv : calls_) {
        out << "champ_model_calls_total{model=\"" << kv.first << "\",status=\"success\"} "
            << kv.second.success << "\n"
            << "champ_model_calls_total{model=\"" << kv.first << "\",status=\"error\"} "
            << kv.second.error << "\n"
            << "champ_request_latency_ms_sum{model=\"" << kv.first << "\"} "
            << kv.second.latency_ms_sum << "\n"
            << "champ_request_latency_ms_count{model=\"" << kv.first << "\"} "
            << kv.second.latency_count << "\n";
    }
    for (const auto& kv : stages_) {
        out << "champ_pipeline_status{stage=\"" << kv.first << "\"} " << kv.second << "\n";
    }
    return out.str();
}

std::map<std::string, ModelCallCounters> HealthMonitor::model_calls() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return calls_;
}
