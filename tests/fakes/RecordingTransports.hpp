#pragma once

#include "printfleet/notification/IMailTransport.hpp"
#include "printfleet/notification/INotifier.hpp"
#include "printfleet/notification/IWebhookClient.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace printfleet::testing {

    class RecordingMailTransport : public notification::IMailTransport {
    public:
        types::Result<> send(const notification::MailMessage &message) override {
            sent.push_back(message);
            if (fail) {
                return types::Result<>::error(types::ResultCode::DeliveryFailed, "550 mailbox unavailable");
            }
            return types::Result<>::success();
        }

        bool fail = false;
        std::vector<notification::MailMessage> sent;
    };

    class RecordingWebhookClient : public notification::IWebhookClient {
    public:
        struct Post {
            std::string url;
            std::string payload;
            std::optional<notification::Attachment> attachment;
        };

        types::Result<> post(const std::string &url, const std::string &jsonPayload,
                             const std::optional<notification::Attachment> &attachment) override {
            posts.push_back(Post{url, jsonPayload, attachment});
            if (failing.count(url)) {
                return types::Result<>::error(types::ResultCode::DeliveryFailed, "HTTP 500 from " + url);
            }
            if (throwing.count(url)) {
                throw std::runtime_error("resolver exploded for " + url);
            }
            return types::Result<>::success();
        }

        std::set<std::string> failing;
        std::set<std::string> throwing;
        std::vector<Post> posts;
    };

    /**
     * @brief Notifier that only remembers which device and file it was asked about.
     *
     * `delay` keeps each call busy for a while so overlapping callers can be observed.
     */
    class RecordingNotifier : public notification::INotifier {
    public:
        notification::DispatchReport notify(const device::DeviceClient &device, notification::EventKind,
                                            const std::optional<std::string> &file) override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                calls_.emplace_back(device.id(), file.value_or(device.currentFile().value_or("")));
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            if (throwOnNotify) {
                throw std::runtime_error("transport crashed");
            }
            return notification::DispatchReport{1, 1};
        }

        std::vector<std::pair<std::string, std::string>> calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return calls_;
        }

        bool throwOnNotify = false;
        std::chrono::milliseconds delay{0};

    private:
        mutable std::mutex mutex_;
        std::vector<std::pair<std::string, std::string>> calls_;
    };

} // namespace printfleet::testing
