#include "printfleet/notification/impl/CurlMailTransport.hpp"
#include "printfleet/logger/Logger.hpp"
#include <curl/curl.h>

namespace printfleet::notification {

    using types::ResultCode;

    namespace {
        std::string angleAddress(const std::string &address) {
            return "<" + address + ">";
        }
    }

    CurlMailTransport::CurlMailTransport(SmtpSettings settings, std::chrono::seconds timeout)
            : settings_(std::move(settings)), timeout_(timeout) {
    }

    std::string CurlMailTransport::serverUrl() const {
        std::string scheme = settings_.encryption == SmtpEncryption::Tls ? "smtps://" : "smtp://";
        return scheme + settings_.host + ":" + std::to_string(settings_.port);
    }

    types::Result<> CurlMailTransport::send(const MailMessage &message) {
        if (message.bcc.empty()) {
            return types::Result<>::success();
        }

        CURL *curl = curl_easy_init();
        if (!curl) {
            Logger::logError("[CurlMailTransport] Failed to initialize CURL");
            return types::Result<>::error(ResultCode::DeliveryFailed, "Failed to initialize CURL");
        }

        curl_slist *recipients = nullptr;
        for (const auto &address: message.bcc) {
            recipients = curl_slist_append(recipients, angleAddress(address).c_str());
        }

        curl_slist *headers = nullptr;
        headers = curl_slist_append(headers, ("From: " + angleAddress(message.from)).c_str());
        headers = curl_slist_append(headers, "To: undisclosed-recipients:;");
        headers = curl_slist_append(headers, ("Subject: " + message.subject).c_str());

        curl_mime *mime = curl_mime_init(curl);
        curl_mimepart *text = curl_mime_addpart(mime);
        curl_mime_data(text, message.body.c_str(), CURL_ZERO_TERMINATED);
        curl_mime_type(text, "text/plain; charset=utf-8");

        if (message.attachment) {
            curl_mimepart *image = curl_mime_addpart(mime);
            curl_mime_data(image, message.attachment->data.data(), message.attachment->data.size());
            curl_mime_type(image, message.attachment->contentType.c_str());
            curl_mime_filename(image, message.attachment->filename.c_str());
            curl_mime_encoder(image, "base64");
        }

        curl_easy_setopt(curl, CURLOPT_URL, serverUrl().c_str());
        if (settings_.encryption == SmtpEncryption::StartTls) {
            curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        }
        curl_easy_setopt(curl, CURLOPT_USERNAME, settings_.user.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, settings_.password.c_str());
        curl_easy_setopt(curl, CURLOPT_MAIL_FROM, angleAddress(message.from).c_str());
        curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

        CURLcode res = curl_easy_perform(curl);

        curl_slist_free_all(recipients);
        curl_slist_free_all(headers);
        curl_mime_free(mime);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            std::string error = "SMTP delivery failed: " + std::string(curl_easy_strerror(res));
            Logger::logError("[CurlMailTransport] " + error);
            return types::Result<>::error(ResultCode::DeliveryFailed, error);
        }

        Logger::logInfo("[CurlMailTransport] Sent \"" + message.subject + "\" to " +
                        std::to_string(message.bcc.size()) + " recipients");
        return types::Result<>::success();
    }

} // namespace printfleet::notification
