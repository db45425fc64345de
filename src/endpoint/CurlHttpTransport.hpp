#pragma once
#include <curl/curl.h>
#include "endpoint/HttpTransport.hpp"

namespace champ {

// libcurl transport. One easy handle per request: concurrent rounds may
// call the same endpoint while an abandoned call from an earlier round is
// still in flight, and a CURL handle must not be shared between threads.
// curl_global_init() is the caller's job (once, in main).
class CurlHttpTransport : public HttpTransport {
public:
    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           std::chrono::seconds timeout) override;

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);
};

} // namespace champ
