#include "notify/AlertSink.hpp"
#include <chrono>
#include <iostream>

using namespace champ;

AlertSink::AlertSink(std::string webhook, std::shared_ptr<HttpTransport> http)
    : webhook_(std::move(webhook)), http_(std::move(http)) {}

bool AlertSink::send(const nlohmann::json& payload) {
    // Messages can carry exception text with arbitrary bytes.
    const std::string body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (webhook_.empty() || !http_) {
        std::cout << "[ALERT] Webhook not configured; dropping alert: " << body << "\n";
        return false;
    }
    try {
        HttpResponse res = http_->post_json(webhook_, body, std::chrono::seconds(5));
        if (res.status < 200 || res.status >= 300) {
            std::cerr << "[ALERT] Webhook returned HTTP " << res.status << "\n";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ALERT] Failed to send alert: " << e.what() << "\n";
        return false;
    }
}
