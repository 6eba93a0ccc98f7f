#pragma once

#include <map>
#include <optional>
#include <string>

namespace printfleet::registry {

    /**
     * @brief Remembers, per device, the file a completion notification was last sent for.
     *
     * Plain value type; the registry guards the shared copy.
     */
    class NotificationLedger {
    public:
        /**
         * @brief True unless a notification was already sent for exactly this file.
         */
        bool shouldNotify(const std::string &deviceId, const std::string &file) const;

        void record(const std::string &deviceId, const std::string &file);

        std::optional<std::string> lastNotified(const std::string &deviceId) const;

        size_t size() const { return entries_.size(); }

    private:
        std::map<std::string, std::string> entries_;
    };

} // namespace printfleet::registry
