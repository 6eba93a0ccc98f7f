#include "printfleet/registry/DeviceRegistry.hpp"
#include "printfleet/logger/Logger.hpp"

namespace printfleet::registry {

    DeviceRegistry::DeviceRegistry(DeviceClientFactory factory)
            : factory_(std::move(factory)) {
    }

    bool DeviceRegistry::addDevice(const std::string &id, const std::string &host) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (devices_.count(id)) {
                Logger::logWarning("[DeviceRegistry] Device " + id + " already registered, ignoring " + host);
                return false;
            }
        }

        Logger::logInfo("[DeviceRegistry] Adding device " + id + " at " + host);
        auto client = factory_(id, host);
        auto identity = client->fetchIdentityOnce();
        if (!identity.isSuccess()) {
            Logger::logWarning("[DeviceRegistry] " + id + " registered without identity (" +
                               types::resultCodeToString(identity.code) + ")");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto inserted = devices_.emplace(id, std::move(client));
        if (!inserted.second) {
            Logger::logWarning("[DeviceRegistry] Device " + id + " registered concurrently, ignoring " + host);
        }
        return inserted.second;
    }

    std::shared_ptr<device::DeviceClient> DeviceRegistry::getDevice(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(id);
        return it != devices_.end() ? it->second : nullptr;
    }

    std::vector<std::shared_ptr<device::DeviceClient>> DeviceRegistry::listDevices() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<device::DeviceClient>> devices;
        devices.reserve(devices_.size());
        for (const auto &[id, client]: devices_) {
            devices.push_back(client);
        }
        return devices;
    }

    std::vector<std::string> DeviceRegistry::listDeviceIds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(devices_.size());
        for (const auto &[id, client]: devices_) {
            ids.push_back(id);
        }
        return ids;
    }

    size_t DeviceRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_.size();
    }

    NotificationLedger DeviceRegistry::ledgerSnapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ledger_;
    }

    void DeviceRegistry::commitLedger(NotificationLedger ledger) {
        std::lock_guard<std::mutex> lock(mutex_);
        ledger_ = std::move(ledger);
    }

} // namespace printfleet::registry
