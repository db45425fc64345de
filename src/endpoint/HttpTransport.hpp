#pragma once
#include <chrono>
#include <string>

namespace champ {

struct HttpResponse {
    long        status{0};
    std::string body;
};

// Outbound JSON POST. Implementations throw on transport failure (DNS,
// connect, timeout); any HTTP status is returned, not thrown.
// Must be safe to call from several threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse post_json(const std::string& url,
                                   const std::string& body,
                                   std::chrono::seconds timeout) = 0;
};

} // namespace champ
