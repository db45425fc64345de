#pragma once
#include <string>
#include <utility>
#include <vector>

namespace champ {

using EndpointSpec = std::pair<std::string, std::string>;   // name, url

// ---------------------------------------------------------------------------
// Runtime configuration. Every field has a default; the environment
// overrides it. Read once in main() and passed down by value/reference.
//
//   SYMBOL           btcusdt
//   WS_URL           wss://stream.binance.com:9443/ws/<symbol>@trade
//   PING_INTERVAL    20        PING_TIMEOUT   10
//   BATCH_SEC        30        HIST_POINTS    360
//   MODEL_ENDPOINTS  name=url[,name=url...]
//   MAX_RETRIES      3         RETRY_BACKOFF  1.5
//   CB_FAILURES      5         CB_TIMEOUT     60
//   ROUND_TIMEOUT    120
//   DATA_ROOT        /data     ARCHIVE_CAP    12000    MAX_TEXT 2000
//   METRICS_PORT     9090      ALERT_WEBHOOK  ""
//   TRENDING_SOURCE  https://arxiv.org/list/cs.AI/recent
// ---------------------------------------------------------------------------
struct Settings {
    std::string symbol{"btcusdt"};
    std::string ws_url;
    int         ping_interval_sec{20};
    int         ping_timeout_sec{10};
    int         batch_seconds{30};
    int         hist_points{360};

    std::vector<EndpointSpec> model_endpoints;
    int         max_retries{3};
    double      retry_backoff{1.5};
    int         circuit_breaker_failures{5};
    int         circuit_breaker_timeout{60};
    int         round_timeout_sec{120};

    std::string data_root{"/data"};
    int         archive_cap{12000};
    int         max_text_length{2000};

    int         metrics_port{9090};
    std::string alert_webhook;
    std::string trending_source{"https://arxiv.org/list/cs.AI/recent"};

    // Defaults + environment. Throws ConfigError on malformed values.
    static Settings from_env();

    // "a=http://x,b=http://y" -> {{a,http://x},{b,http://y}}
    static std::vector<EndpointSpec> parse_endpoints(const std::string& list);
};

// KEY=VALUE file -> environment, without overriding variables already set.
// Missing file is not an error. Returns number of variables applied.
int load_dotenv(const char* path);

} // namespace champ
