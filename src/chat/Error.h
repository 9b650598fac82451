#pragma once

#include <stdexcept>
#include <string>

namespace marketchat::chat {

enum class ErrorKind {
    Unauthorized,        // actor is not a participant
    NotFound,            // conversation / message / user absent
    InvalidPayload,      // missing or malformed fields
    PersistenceFailure,  // store write or read failed
    TransportFailure,    // emission to a peer connection failed
    Internal,            // unexpected failure inside the server
};

const char* error_code(ErrorKind kind) noexcept;

class ChatError : public std::runtime_error {
public:
    ChatError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    const char* code() const noexcept { return error_code(kind_); }

private:
    ErrorKind kind_;
};

} // namespace marketchat::chat
