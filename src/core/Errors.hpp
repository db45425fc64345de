#pragma once
#include <stdexcept>
#include <string>

namespace champ {

// Endpoint exhausted its retry budget. Carries the endpoint name so the
// dispatcher can attribute the failure without parsing what().
class EndpointError : public std::runtime_error {
public:
    EndpointError(const std::string& endpoint, const std::string& what)
        : std::runtime_error(what), endpoint_(endpoint) {}

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
};

// A round could not be written to the archive. Not recoverable locally:
// an un-persisted round breaks the chain's audit trail.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace champ
