#pragma once

#include "printfleet/notification/IMailTransport.hpp"
#include "printfleet/notification/INotifier.hpp"
#include "printfleet/notification/IWebhookClient.hpp"
#include "printfleet/notification/NotificationMessage.hpp"
#include <map>
#include <memory>
#include <string>

namespace printfleet::notification {

    /**
     * @brief Composes event notifications and hands them to the mail and webhook transports.
     *
     * One mail per event with every address in blind copy, one POST per webhook. Each destination
     * fails on its own: a failure is logged and the remaining destinations are still served.
     * Nothing is retried.
     */
    class NotificationDispatcher : public INotifier {
    public:
        /**
         * @param mailTransport may be null when SMTP is not configured, emails are then skipped
         */
        NotificationDispatcher(std::map<EventKind, NotificationDestinations> destinations,
                               std::string fromAddress,
                               std::shared_ptr<IMailTransport> mailTransport,
                               std::shared_ptr<IWebhookClient> webhookClient);

        DispatchReport notify(const device::DeviceClient &device, EventKind kind,
                              const std::optional<std::string> &file) override;

    private:
        std::map<EventKind, NotificationDestinations> destinations_;
        std::string fromAddress_;
        std::shared_ptr<IMailTransport> mailTransport_;
        std::shared_ptr<IWebhookClient> webhookClient_;

        void sendEmails(const std::string &deviceId, const std::vector<std::string> &emails,
                        const NotificationMessage &message, const std::optional<Attachment> &snapshot,
                        DispatchReport &report);

        void sendWebhooks(const std::string &deviceId, const std::vector<std::string> &urls,
                          const std::string &payload, const std::optional<Attachment> &snapshot,
                          DispatchReport &report);
    };

} // namespace printfleet::notification
