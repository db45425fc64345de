#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "endpoint/HttpTransport.hpp"

namespace champ {

struct EndpointResponse {
    std::string text;
    double      latency_ms{0.0};
};

struct EndpointStats {
    uint64_t total_calls{0};       // every attempt, retries included
    uint64_t successful_calls{0};
    uint64_t error_count{0};
    double   avg_latency_ms{0.0};  // running mean over successful calls
};

// ---------------------------------------------------------------------------
// One remote inference endpoint.
//
// generate() POSTs {"prompt","round_id"} and reads "text" (falling back to
// "response"). Non-2xx, non-JSON or transport errors are failures. A failed
// attempt sleeps `backoff` seconds (starting at retry_backoff, multiplied by
// retry_backoff each time) and tries again until max_retries retries have
// been spent, then throws EndpointError.
//
// Thread-safe: an abandoned call from a timed-out round may still be running
// when the next round calls in.
// ---------------------------------------------------------------------------
class EndpointClient {
public:
    struct Options {
        int                  max_retries{3};
        double               retry_backoff{1.5};
        int                  circuit_breaker_failures{5};
        std::chrono::seconds request_timeout{30};
    };

    EndpointClient(std::string name, std::string url,
                   std::shared_ptr<HttpTransport> http, Options opts);

    EndpointResponse generate(const std::string& prompt, const std::string& round_id);

    // Plain counter test, not a breaker: healthy until error_count reaches
    // circuit_breaker_failures.
    bool is_healthy() const;

    EndpointStats stats() const;

    const std::string& name() const { return name_; }
    const std::string& url() const  { return url_; }

private:
    const std::string              name_;
    const std::string              url_;
    std::shared_ptr<HttpTransport> http_;
    const Options                  opts_;

    mutable std::mutex mtx_;
    EndpointStats      stats_;
};

} // namespace champ
