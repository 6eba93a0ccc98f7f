#pragma once

#include "printfleet/notification/IWebhookClient.hpp"
#include <chrono>

namespace printfleet::notification {

    /**
     * @brief Webhook POSTs through libcurl. Any status outside 2xx counts as a failure.
     */
    class CurlWebhookClient : public IWebhookClient {
    public:
        explicit CurlWebhookClient(std::chrono::seconds timeout = std::chrono::seconds(5));

        types::Result<> post(const std::string &url, const std::string &jsonPayload,
                             const std::optional<Attachment> &attachment) override;

        static std::string userAgent();

    private:
        std::chrono::seconds timeout_;

        static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp);
    };

} // namespace printfleet::notification
