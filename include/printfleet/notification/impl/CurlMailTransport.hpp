#pragma once

#include "printfleet/notification/IMailTransport.hpp"
#include "printfleet/notification/SmtpSettings.hpp"
#include <chrono>

namespace printfleet::notification {

    /**
     * @brief SMTP delivery through libcurl.
     *
     * Recipients are passed only as RCPT, the headers carry no address list.
     */
    class CurlMailTransport : public IMailTransport {
    public:
        explicit CurlMailTransport(SmtpSettings settings,
                                   std::chrono::seconds timeout = std::chrono::seconds(30));

        types::Result<> send(const MailMessage &message) override;

        std::string serverUrl() const;

    private:
        SmtpSettings settings_;
        std::chrono::seconds timeout_;
    };

} // namespace printfleet::notification
