#pragma once
// =============================================================================
// Scripted stand-ins for the network seams. Test-only.
// =============================================================================
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "endpoint/HttpTransport.hpp"
#include "stream/StreamTransport.hpp"

namespace champ {
namespace testing {

// -----------------------------------------------------------------------------
// HTTP: each call pops the next step; the last step repeats forever.
// -----------------------------------------------------------------------------
struct HttpStep {
    enum class Kind { THROW, REPLY };

    Kind                      kind{Kind::REPLY};
    long                      status{200};
    std::string               body;
    std::string               error;
    std::chrono::milliseconds delay{0};

    static HttpStep reply(long status, std::string body,
                          std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        HttpStep s;
        s.kind   = Kind::REPLY;
        s.status = status;
        s.body   = std::move(body);
        s.delay  = delay;
        return s;
    }

    static HttpStep fail(std::string error,
                         std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        HttpStep s;
        s.kind  = Kind::THROW;
        s.error = std::move(error);
        s.delay = delay;
        return s;
    }
};

class FakeHttp : public HttpTransport {
public:
    explicit FakeHttp(std::vector<HttpStep> steps) : steps_(steps.begin(), steps.end()) {
        if (steps_.empty()) throw std::invalid_argument("FakeHttp: no steps");
    }

    HttpResponse post_json(const std::string& url, const std::string& body,
                           std::chrono::seconds) override {
        HttpStep step;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            ++calls_;
            last_url_  = url;
            last_body_ = body;
            step = steps_.front();
            if (steps_.size() > 1) steps_.pop_front();
        }

        if (step.delay.count() > 0) std::this_thread::sleep_for(step.delay);
        finished_.fetch_add(1);

        if (step.kind == HttpStep::Kind::THROW) throw std::runtime_error(step.error);
        return HttpResponse{step.status, step.body};
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return calls_;
    }
    int finished() const { return finished_.load(); }

    std::string last_body() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return last_body_;
    }
    std::string last_url() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return last_url_;
    }

private:
    mutable std::mutex   mtx_;
    std::deque<HttpStep> steps_;
    int                  calls_{0};
    std::atomic<int>     finished_{0};
    std::string          last_url_;
    std::string          last_body_;
};

// -----------------------------------------------------------------------------
// Stream: one scripted connection. open() may fail; then the frames are
// served in order; after them either the read throws (drop) or the
// connection idles until closed.
// -----------------------------------------------------------------------------
struct StreamScript {
    bool                     open_fails{false};
    std::vector<std::string> frames;
    bool                     drop_after_frames{false};
};

class ScriptedStreamTransport : public StreamTransport {
public:
    explicit ScriptedStreamTransport(StreamScript script) : script_(std::move(script)) {}

    void open() override {
        if (script_.open_fails) throw std::runtime_error("connection refused");
    }

    bool read(std::string& out, std::chrono::milliseconds timeout) override {
        if (next_ < script_.frames.size()) {
            out = script_.frames[next_++];
            return true;
        }
        if (script_.drop_after_frames) throw std::runtime_error("connection reset by peer");
        std::this_thread::sleep_for(timeout);
        return false;
    }

    void close() noexcept override { closed_ = true; }

private:
    StreamScript script_;
    size_t       next_{0};
    bool         closed_{false};
};

} // namespace testing
} // namespace champ
