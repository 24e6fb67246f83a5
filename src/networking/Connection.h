#pragma once

#include <cstdint>
#include <string>

namespace relaychat::networking {

using ClientId = std::uint64_t;

// A live client stream as seen by the chat layer.
class Connection {
public:
    virtual ~Connection() = default;

    virtual ClientId id() const noexcept = 0;

    // Queues one line (the terminating '\n' is added here).
    // Returns false when the peer is already closed or closing; the disconnect is
    // reported separately, so callers may drop the result.
    virtual bool send(const std::string& line) = 0;

    // Flushes whatever is queued, then shuts the stream down.
    virtual void close() = 0;
};

} // namespace relaychat::networking
