#pragma once

#include "printfleet/device/DeviceClient.hpp"
#include "printfleet/registry/NotificationLedger.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace printfleet::registry {

    /**
     * @brief Owns every DeviceClient, keyed by device id.
     *
     * The registry lock only guards the map and the ledger: it is held to copy handles, never
     * while talking to a printer.
     */
    class DeviceRegistry {
    public:
        using DeviceClientFactory = std::function<std::shared_ptr<device::DeviceClient>(
                const std::string &id, const std::string &host)>;

        explicit DeviceRegistry(DeviceClientFactory factory);

        /**
         * @brief Creates the client, tries once to fetch its identity and registers it.
         *
         * The identity fetch is best effort: an unreachable printer is still registered.
         * @return false if the id is already taken
         */
        bool addDevice(const std::string &id, const std::string &host);

        std::shared_ptr<device::DeviceClient> getDevice(const std::string &id) const;

        std::vector<std::shared_ptr<device::DeviceClient>> listDevices() const;

        std::vector<std::string> listDeviceIds() const;

        size_t size() const;

        NotificationLedger ledgerSnapshot() const;

        void commitLedger(NotificationLedger ledger);

    private:
        DeviceClientFactory factory_;

        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<device::DeviceClient>> devices_;
        NotificationLedger ledger_;
    };

} // namespace printfleet::registry
