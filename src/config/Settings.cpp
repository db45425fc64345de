#include "config/Settings.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include "core/Errors.hpp"

using namespace champ;

// ---------------------------------------------------------------------------
// .env loader: KEY=VALUE pairs, "export " prefix allowed, blank lines and
// # comments skipped, surrounding quotes stripped. Existing env wins.
// ---------------------------------------------------------------------------
int champ::load_dotenv(const char* path) {
    std::ifstream f(path);
    if (!f.is_open()) return 0;  // no .env = silent skip

    int applied = 0;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key.compare(0, 7, "export ") == 0) key = key.substr(7);
        while (!key.empty() && key.back() == ' ') key.pop_back();
        if (key.empty()) continue;

        size_t vs = 0;
        while (vs < value.size() && value[vs] == ' ') vs++;
        if (vs > 0) value = value.substr(vs);

        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!std::getenv(key.c_str())) {
            setenv(key.c_str(), value.c_str(), 0);
            ++applied;
        }
    }

    std::cout << "[CONFIG] .env loaded from " << path << " (" << applied << " vars)\n";
    return applied;
}

// ---------------------------------------------------------------------------
// Typed env readers. Unset or empty -> default kept.
// ---------------------------------------------------------------------------
static const char* env(const char* key) {
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

static void read_str(const char* key, std::string& out) {
    if (const char* v = env(key)) out = v;
}

static void read_int(const char* key, int& out, int min_value) {
    const char* v = env(key);
    if (!v) return;
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(v, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(key) + ": not an integer: '" + v + "'");
    }
    if (v[used] != '\0') throw ConfigError(std::string(key) + ": trailing junk in '" + v + "'");
    if (!std::isfinite(parsed)) throw ConfigError(std::string(key) + ": not finite: '" + v + "'");
    if (parsed < min_value) {
        throw ConfigError(std::string(key) + ": must be >= " + std::to_string(min_value));
    }
    out = parsed;
}

static void read_double(const char* key, double& out, double min_value) {
    const char* v = env(key);
    if (!v) return;
    size_t used = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(v, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(key) + ": not a number: '" + v + "'");
    }
    if (v[used] != '\0') throw ConfigError(std::string(key) + ": trailing junk in '" + v + "'");
    if (parsed < min_value) {
        throw ConfigError(std::string(key) + ": must be >= " + std::to_string(min_value));
    }
    out = parsed;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::vector<EndpointSpec> Settings::parse_endpoints(const std::string& list) {
    std::vector<EndpointSpec> out;
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        std::string item = trim(list.substr(pos, comma == std::string::npos
                                                     ? std::string::npos : comma - pos));
        if (!item.empty()) {
            size_t eq = item.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == item.size()) {
                throw ConfigError("MODEL_ENDPOINTS: expected name=url, got '" + item + "'");
            }
            out.emplace_back(trim(item.substr(0, eq)), trim(item.substr(eq + 1)));
        }
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return out;
}

Settings Settings::from_env() {
    Settings s;

    read_str("SYMBOL", s.symbol);
    for (char& c : s.symbol) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    s.ws_url = "wss://stream.binance.com:9443/ws/" + s.symbol + "@trade";
    read_str("WS_URL", s.ws_url);

    read_int("PING_INTERVAL", s.ping_interval_sec, 1);
    read_int("PING_TIMEOUT",  s.ping_timeout_sec,  1);
    read_int("BATCH_SEC",     s.batch_seconds,     1);
    read_int("HIST_POINTS",   s.hist_points,       1);

    if (const char* v = env("MODEL_ENDPOINTS")) s.model_endpoints = parse_endpoints(v);
    if (s.model_endpoints.empty()) {
        s.model_endpoints = {
            {"llama3_8b",  "http://llama3-8b:8001/generate"},
            {"mistral_7b", "http://mistral-7b:8002/generate"},
        };
    }

    read_int   ("MAX_RETRIES",   s.max_retries,              0);
    read_double("RETRY_BACKOFF", s.retry_backoff,            0.0);
    read_int   ("CB_FAILURES",   s.circuit_breaker_failures, 1);
    read_int   ("CB_TIMEOUT",    s.circuit_breaker_timeout,  1);
    read_int   ("ROUND_TIMEOUT", s.round_timeout_sec,        1);

    read_str("DATA_ROOT",    s.data_root);
    read_int("ARCHIVE_CAP",  s.archive_cap,     1);
    read_int("MAX_TEXT",     s.max_text_length, 0);

    read_int("METRICS_PORT", s.metrics_port, 1);
    if (s.metrics_port > 65535) throw ConfigError("METRICS_PORT: out of range");
    read_str("ALERT_WEBHOOK",   s.alert_webhook);
    read_str("TRENDING_SOURCE", s.trending_source);

    return s;
}
