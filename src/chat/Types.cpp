#include "chat/Types.h"

namespace marketchat::chat {

const char* to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::Text:     return "text";
        case MessageType::Image:    return "image";
        case MessageType::Video:    return "video";
        case MessageType::Voice:    return "voice";
        case MessageType::Document: return "document";
    }
    return "text";
}

const char* to_string(MessageStatus status) noexcept {
    switch (status) {
        case MessageStatus::Sent:      return "sent";
        case MessageStatus::Delivered: return "delivered";
        case MessageStatus::Read:      return "read";
    }
    return "sent";
}

std::optional<MessageType> parse_message_type(std::string_view s) {
    if (s == "text")     return MessageType::Text;
    if (s == "image")    return MessageType::Image;
    if (s == "video")    return MessageType::Video;
    if (s == "voice")    return MessageType::Voice;
    if (s == "document") return MessageType::Document;
    return std::nullopt;
}

std::string preview_text(MessageType type, const std::string& caption) {
    switch (type) {
        case MessageType::Text:
            return caption.empty() ? "Message" : caption;
        case MessageType::Image:
            return caption.empty() ? "\xF0\x9F\x93\xB7 Photo" : "\xF0\x9F\x93\xB7 " + caption;
        case MessageType::Video:
            return caption.empty() ? "\xF0\x9F\x8E\xA5 Video" : "\xF0\x9F\x8E\xA5 " + caption;
        case MessageType::Voice:
            return "\xF0\x9F\x8E\xB5 Voice message";
        case MessageType::Document:
            return "\xF0\x9F\x93\x84 " + (caption.empty() ? std::string("Document") : caption);
    }
    return "Message";
}

} // namespace marketchat::chat
