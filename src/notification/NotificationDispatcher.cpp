#include "printfleet/notification/NotificationDispatcher.hpp"
#include "printfleet/camera/CameraMultiplexer.hpp"
#include "printfleet/logger/Logger.hpp"

namespace printfleet::notification {

    NotificationDispatcher::NotificationDispatcher(std::map<EventKind, NotificationDestinations> destinations,
                                                   std::string fromAddress,
                                                   std::shared_ptr<IMailTransport> mailTransport,
                                                   std::shared_ptr<IWebhookClient> webhookClient)
            : destinations_(std::move(destinations)), fromAddress_(std::move(fromAddress)),
              mailTransport_(std::move(mailTransport)), webhookClient_(std::move(webhookClient)) {
    }

    DispatchReport NotificationDispatcher::notify(const device::DeviceClient &device, EventKind kind,
                                                  const std::optional<std::string> &file) {
        DispatchReport report;

        auto it = destinations_.find(kind);
        if (it == destinations_.end() || it->second.empty()) {
            Logger::logDebug("[NotificationDispatcher] No destinations for " + eventKindToString(kind));
            return report;
        }

        auto summary = device.summary();
        if (file) {
            summary.currentFile = file;
        }
        auto message = composeMessage(kind, summary, device.host());

        std::optional<Attachment> snapshot;
        if (auto camera = device.camera()) {
            if (auto frame = camera->lastFrame()) {
                snapshot = Attachment{"snapshot.jpg", frame->contentType(), frame->body};
            }
        }

        Logger::logInfo("[NotificationDispatcher] Sending " + eventKindToString(kind) + " for " + device.id() +
                        (snapshot ? " with snapshot" : ""));

        sendEmails(device.id(), it->second.emails, message, snapshot, report);

        if (!it->second.webhooks.empty()) {
            auto payload = buildWebhookPayload(summary.name, message, snapshot.has_value()).dump();
            sendWebhooks(device.id(), it->second.webhooks, payload, snapshot, report);
        }

        Logger::logInfo("[NotificationDispatcher] " + device.id() + ": " + std::to_string(report.delivered) + "/" +
                        std::to_string(report.attempted) + " destinations reached");
        return report;
    }

    void NotificationDispatcher::sendEmails(const std::string &deviceId, const std::vector<std::string> &emails,
                                            const NotificationMessage &message,
                                            const std::optional<Attachment> &snapshot,
                                            DispatchReport &report) {
        if (emails.empty()) return;

        report.attempted++;
        if (!mailTransport_) {
            Logger::logWarning("[NotificationDispatcher] SMTP not configured, skipping " +
                               std::to_string(emails.size()) + " email recipients for " + deviceId);
            return;
        }

        MailMessage mail;
        mail.from = fromAddress_;
        mail.bcc = emails;
        mail.subject = message.subject;
        mail.body = message.body;
        mail.attachment = snapshot;

        try {
            auto result = mailTransport_->send(mail);
            if (result.isSuccess()) {
                report.delivered++;
            } else {
                Logger::logError("[NotificationDispatcher] Email for " + deviceId + " failed: " + result.message);
            }
        } catch (const std::exception &e) {
            Logger::logError("[NotificationDispatcher] Email for " + deviceId + " failed: " + std::string(e.what()));
        }
    }

    void NotificationDispatcher::sendWebhooks(const std::string &deviceId, const std::vector<std::string> &urls,
                                              const std::string &payload,
                                              const std::optional<Attachment> &snapshot,
                                              DispatchReport &report) {
        for (const auto &url: urls) {
            report.attempted++;
            if (!webhookClient_) {
                Logger::logWarning("[NotificationDispatcher] No webhook client, skipping " + url);
                continue;
            }

            try {
                auto result = webhookClient_->post(url, payload, snapshot);
                if (result.isSuccess()) {
                    report.delivered++;
                } else {
                    Logger::logError("[NotificationDispatcher] Webhook \"" + url + "\" for " + deviceId +
                                     " failed: " + result.message);
                }
            } catch (const std::exception &e) {
                Logger::logError("[NotificationDispatcher] Webhook \"" + url + "\" for " + deviceId +
                                 " failed: " + std::string(e.what()));
            }
        }
    }

} // namespace printfleet::notification
