#pragma once

#include "printfleet/device/DeviceClient.hpp"
#include "printfleet/notification/EventKind.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace printfleet::notification {

    struct Attachment {
        std::string filename;
        std::string contentType;
        std::string data;
    };

    struct NotificationMessage {
        std::string subject;
        std::string body;
    };

    /**
     * @brief Where an event kind is delivered. Either list may be empty.
     */
    struct NotificationDestinations {
        std::vector<std::string> emails;
        std::vector<std::string> webhooks;

        bool empty() const {
            return emails.empty() && webhooks.empty();
        }
    };

    NotificationMessage composeMessage(EventKind kind, const device::DeviceSummary &summary,
                                       const std::string &host);

    /**
     * @brief Discord compatible webhook body. The embed references the attachment when
     * `withImage` is set.
     */
    nlohmann::json buildWebhookPayload(const std::string &username, const NotificationMessage &message,
                                       bool withImage);

} // namespace printfleet::notification
