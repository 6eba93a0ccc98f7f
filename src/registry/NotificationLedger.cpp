#include "printfleet/registry/NotificationLedger.hpp"

namespace printfleet::registry {

    bool NotificationLedger::shouldNotify(const std::string &deviceId, const std::string &file) const {
        auto it = entries_.find(deviceId);
        return it == entries_.end() || it->second != file;
    }

    void NotificationLedger::record(const std::string &deviceId, const std::string &file) {
        entries_[deviceId] = file;
    }

    std::optional<std::string> NotificationLedger::lastNotified(const std::string &deviceId) const {
        auto it = entries_.find(deviceId);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

} // namespace printfleet::registry
