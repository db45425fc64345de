#include "endpoint/EndpointClient.hpp"
#include <iostream>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

#include "core/Errors.hpp"

using namespace champ;
using json = nlohmann::json;

EndpointClient::EndpointClient(std::string name, std::string url,
                               std::shared_ptr<HttpTransport> http, Options opts)
    : name_(std::move(name)), url_(std::move(url)), http_(std::move(http)), opts_(opts) {
    if (!http_) throw std::invalid_argument("EndpointClient: transport required");
    if (opts_.max_retries < 0)
        throw std::invalid_argument("EndpointClient: max_retries must be >= 0");
    if (opts_.retry_backoff < 0.0)
        throw std::invalid_argument("EndpointClient: retry_backoff must be >= 0");
}

// "text" wins when it is a non-empty string, then "response", else "".
static std::string extract_text(const json& j) {
    for (const char* key : {"text", "response"}) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            std::string s = it->get<std::string>();
            if (!s.empty()) return s;
        }
    }
    return "";
}

EndpointResponse EndpointClient::generate(const std::string& prompt,
                                          const std::string& round_id) {
    const std::string body = json{{"prompt", prompt}, {"round_id", round_id}}.dump();

    int    retries = 0;
    double backoff = opts_.retry_backoff;

    while (true) {
        auto start = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            ++stats_.total_calls;
        }

        try {
            HttpResponse res = http_->post_json(url_, body, opts_.request_timeout);
            if (res.status < 200 || res.status >= 300) {
                throw std::runtime_error("HTTP " + std::to_string(res.status));
            }

            json data = json::parse(res.body);
            if (!data.is_object()) throw std::runtime_error("malformed response body");

            EndpointResponse out;
            out.text       = extract_text(data);
            out.latency_ms = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - start).count();

            std::lock_guard<std::mutex> lock(mtx_);
            ++stats_.successful_calls;
            double n = static_cast<double>(stats_.successful_calls);
            stats_.avg_latency_ms = (stats_.avg_latency_ms * (n - 1.0) + out.latency_ms) / n;
            return out;

        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                ++stats_.error_count;
            }
            if (retries >= opts_.max_retries) {
                std::cerr << "[ENDPOINT] " << name_ << " exhausted after "
                          << (retries + 1) << " attempts: " << e.what() << "\n";
                throw EndpointError(name_, e.what());
            }
            ++retries;
            std::cout << "[ENDPOINT] " << name_ << " retry " << retries << "/"
                      << opts_.max_retries << " in " << backoff << "s ("
                      << e.what() << ")\n";
            std::this_thread::sleep_for(std::chrono::duration<double>(backoff));
            backoff *= opts_.retry_backoff;
        }
    }
}

bool EndpointClient::is_healthy() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stats_.error_count < static_cast<uint64_t>(
        opts_.circuit_breaker_failures < 0 ? 0 : opts_.circuit_breaker_failures);
}

EndpointStats EndpointClient::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stats_;
}
