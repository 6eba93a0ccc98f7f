#include "printfleet/notification/NotificationMessage.hpp"

namespace printfleet::notification {

    NotificationMessage composeMessage(EventKind kind, const device::DeviceSummary &summary,
                                       const std::string &host) {
        NotificationMessage message;

        switch (kind) {
            case EventKind::PrintComplete:
                message.subject = "Print complete on " + summary.name;
                message.body = "File: " + summary.currentFile.value_or("unknown") + "\n" +
                               "IP: " + host + "\n";
                break;
        }

        return message;
    }

    nlohmann::json buildWebhookPayload(const std::string &username, const NotificationMessage &message,
                                       bool withImage) {
        nlohmann::json embed = {
                {"title",       message.subject},
                {"description", message.body}
        };
        if (withImage) {
            embed["image"] = {{"url", "attachment://snapshot.jpg"}};
        }

        nlohmann::json payload = {
                {"username", username},
                {"embeds",   nlohmann::json::array({embed})}
        };
        return payload;
    }

} // namespace printfleet::notification
