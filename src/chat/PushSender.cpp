#include "chat/PushSender.h"

#include "util/Log.hpp"

namespace marketchat::chat {

std::string push_body(MessageType type, const std::string& caption) {
    switch (type) {
        case MessageType::Image:    return "\xF0\x9F\x93\xB7 Sent a photo";
        case MessageType::Video:    return "\xF0\x9F\x8E\xA5 Sent a video";
        case MessageType::Voice:    return "\xF0\x9F\x8E\xB5 Sent a voice message";
        case MessageType::Document: return "\xF0\x9F\x93\x84 Sent a document";
        case MessageType::Text:     break;
    }
    return caption.empty() ? std::string("New message") : caption;
}

PushNotification make_message_push(const UserId& recipient, const Message& message,
                                   const std::string& caption) {
    PushNotification n;
    n.recipient       = recipient;
    n.title           = message.sender;
    n.body            = push_body(message.type, caption);
    n.conversation_id = message.conversation_id;
    n.sender_id       = message.sender;
    n.message_type    = message.type;
    return n;
}

bool LogPushSender::send(const PushNotification& n) {
    util::log_info("push") << "to=" << n.recipient << " conversation=" << n.conversation_id
                           << " type=" << to_string(n.message_type) << " body=\"" << n.body << "\"";
    return true;
}

} // namespace marketchat::chat
