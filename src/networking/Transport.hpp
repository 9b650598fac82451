#pragma once

#include <cstdint>
#include <string>

namespace marketchat::networking {

using ClientId = std::uint64_t;

// Verdict on a new connection's claimed identity.
enum class Admission { Accept, Reject };

// Outbound side of a connection-oriented server, as seen by the router.
class Transport {
public:
    virtual ~Transport() = default;

    // Queues a text frame. false when the connection is unknown or closed.
    virtual bool send(ClientId client, const std::string& msg) = 0;

    virtual void close(ClientId client) = 0;
};

} // namespace marketchat::networking
