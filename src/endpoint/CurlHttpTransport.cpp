#include "endpoint/CurlHttpTransport.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace champ;

size_t CurlHttpTransport::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpResponse CurlHttpTransport::post_json(const std::string& url,
                                          const std::string& body,
                                          std::chrono::seconds timeout) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>
        curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw std::runtime_error("curl_easy_init failed");

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>
        headers(curl_slist_append(nullptr, "Content-Type: application/json"),
                &curl_slist_free_all);

    HttpResponse res;
    long connect_timeout = std::min<long>(10L, static_cast<long>(timeout.count()));

    curl_easy_setopt(curl.get(), CURLOPT_URL,            url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER,     headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST,           1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA,      &res.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,        static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connect_timeout);
    // Worker threads: no SIGALRM-based DNS timeouts.
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL,       1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw std::runtime_error(std::string("POST ") + url + ": " + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
    return res;
}
