#include "chat/Error.h"

namespace marketchat::chat {

const char* error_code(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Unauthorized:       return "unauthorized";
        case ErrorKind::NotFound:           return "not_found";
        case ErrorKind::InvalidPayload:     return "invalid_payload";
        case ErrorKind::PersistenceFailure: return "persistence_failure";
        case ErrorKind::TransportFailure:   return "transport_failure";
        case ErrorKind::Internal:           return "internal_error";
    }
    return "unknown";
}

} // namespace marketchat::chat
