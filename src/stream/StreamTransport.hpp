#pragma once
#include <chrono>
#include <string>

namespace champ {

// One connection attempt to an inbound text feed. ResilientStream creates a
// fresh transport per attempt through a factory and never reuses a closed one.
class StreamTransport {
public:
    virtual ~StreamTransport() = default;

    // Throws on resolve/connect/handshake failure.
    virtual void open() = 0;

    // Waits up to `timeout` for one text frame.
    // true  -> `out` holds the frame.
    // false -> nothing arrived yet; connection still usable.
    // Throws when the connection is lost or the peer closed it.
    virtual bool read(std::string& out, std::chrono::milliseconds timeout) = 0;

    virtual void close() noexcept = 0;
};

} // namespace champ
