#pragma once
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "endpoint/HttpTransport.hpp"

namespace champ {

// Fire-and-forget webhook. Never throws: an alert that cannot be delivered
// is logged and dropped.
class AlertSink {
public:
    AlertSink(std::string webhook, std::shared_ptr<HttpTransport> http);

    // true when the webhook answered 2xx.
    bool send(const nlohmann::json& payload);

    bool configured() const { return !webhook_.empty(); }

private:
    std::string                    webhook_;
    std::shared_ptr<HttpTransport> http_;
};

} // namespace champ
