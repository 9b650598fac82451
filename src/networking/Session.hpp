#pragma once

#include "networking/Transport.hpp"

#include <string>

namespace marketchat::networking {

// One live connection, bound to exactly one user at handshake.
struct Session {
    ClientId client = 0;         // transport handle
    std::string connection_id;   // "conn-<ulid>", the handle presence records point at
    std::string user_id;
};

} // namespace marketchat::networking
