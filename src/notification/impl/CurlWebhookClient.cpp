#include "printfleet/notification/impl/CurlWebhookClient.hpp"
#include "printfleet/logger/Logger.hpp"
#include <curl/curl.h>

#ifndef PRINTFLEET_VERSION
#define PRINTFLEET_VERSION "0.0.0"
#endif

namespace printfleet::notification {

    using types::ResultCode;

    namespace {
        constexpr size_t MAX_ERROR_BODY = 256;
    }

    CurlWebhookClient::CurlWebhookClient(std::chrono::seconds timeout)
            : timeout_(timeout) {
    }

    std::string CurlWebhookClient::userAgent() {
        return std::string("printfleet/") + PRINTFLEET_VERSION;
    }

    types::Result<> CurlWebhookClient::post(const std::string &url, const std::string &jsonPayload,
                                            const std::optional<Attachment> &attachment) {
        CURL *curl = curl_easy_init();
        if (!curl) {
            Logger::logError("[CurlWebhookClient] Failed to initialize CURL");
            return types::Result<>::error(ResultCode::DeliveryFailed, "Failed to initialize CURL");
        }

        std::string responseBody;
        curl_slist *headers = nullptr;
        curl_mime *mime = nullptr;

        if (attachment) {
            mime = curl_mime_init(curl);

            curl_mimepart *json = curl_mime_addpart(mime);
            curl_mime_name(json, "payload_json");
            curl_mime_data(json, jsonPayload.data(), jsonPayload.size());
            curl_mime_type(json, "application/json");

            curl_mimepart *file = curl_mime_addpart(mime);
            curl_mime_name(file, "files[0]");
            curl_mime_data(file, attachment->data.data(), attachment->data.size());
            curl_mime_filename(file, attachment->filename.c_str());
            curl_mime_type(file, attachment->contentType.c_str());

            curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
        } else {
            headers = curl_slist_append(headers, "Content-Type: application/json");
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, jsonPayload.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(jsonPayload.size()));
        }

        std::string agent = userAgent();
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, agent.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

        CURLcode res = curl_easy_perform(curl);
        long responseCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);

        curl_slist_free_all(headers);
        curl_mime_free(mime);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            return types::Result<>::error(ResultCode::DeliveryFailed,
                                          "Request failed: " + std::string(curl_easy_strerror(res)));
        }
        if (responseCode < 200 || responseCode >= 300) {
            return types::Result<>::error(ResultCode::DeliveryFailed,
                                          "HTTP " + std::to_string(responseCode) + ": " +
                                          responseBody.substr(0, MAX_ERROR_BODY));
        }

        Logger::logDebug("[CurlWebhookClient] POST " + url + " -> HTTP " + std::to_string(responseCode));
        return types::Result<>::success();
    }

    size_t CurlWebhookClient::writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
        auto *body = static_cast<std::string *>(userp);
        size_t totalSize = size * nmemb;
        body->append(static_cast<char *>(contents), totalSize);
        return totalSize;
    }

} // namespace printfleet::notification
