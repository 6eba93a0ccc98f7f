#pragma once

#include "printfleet/notification/NotificationMessage.hpp"
#include "printfleet/types/Result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace printfleet::notification {

    /**
     * @brief One outgoing mail. Recipients are never listed in the headers (blind copy).
     */
    struct MailMessage {
        std::string from;
        std::vector<std::string> bcc;
        std::string subject;
        std::string body;
        std::optional<Attachment> attachment;
    };

    class IMailTransport {
    public:
        virtual ~IMailTransport() = default;

        virtual types::Result<> send(const MailMessage &message) = 0;
    };

} // namespace printfleet::notification
