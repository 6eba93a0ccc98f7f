#pragma once

#include "printfleet/notification/NotificationMessage.hpp"
#include "printfleet/types/Result.hpp"
#include <optional>
#include <string>

namespace printfleet::notification {

    class IWebhookClient {
    public:
        virtual ~IWebhookClient() = default;

        /**
         * @brief POSTs a JSON payload, as multipart together with the attachment if one is given.
         */
        virtual types::Result<> post(const std::string &url, const std::string &jsonPayload,
                                     const std::optional<Attachment> &attachment) = 0;
    };

} // namespace printfleet::notification
