#pragma once

#include "chat/Types.h"

#include <string>

namespace marketchat::chat {

struct PushNotification {
    UserId recipient;
    std::string title;
    std::string body;
    // Routing data the client app uses to open the right screen.
    ConversationId conversation_id;
    UserId sender_id;
    MessageType message_type = MessageType::Text;
};

// Offline-recipient notifier. Dispatch (FCM/APNs device tokens) lives with
// the collaborator; the core only decides when and what to send.
class PushSender {
public:
    virtual ~PushSender() = default;

    // false when the collaborator reports the notification was not sent.
    virtual bool send(const PushNotification& notification) = 0;
};

// Body line for a new-message push: "📷 Sent a photo", etc.
std::string push_body(MessageType type, const std::string& caption);

PushNotification make_message_push(const UserId& recipient, const Message& message,
                                   const std::string& caption);

// Default sender: records the notification in the log.
class LogPushSender : public PushSender {
public:
    bool send(const PushNotification& notification) override;
};

} // namespace marketchat::chat
