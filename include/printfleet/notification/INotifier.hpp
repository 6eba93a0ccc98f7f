#pragma once

#include "printfleet/device/DeviceClient.hpp"
#include "printfleet/notification/EventKind.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace printfleet::notification {

    struct DispatchReport {
        size_t attempted = 0;
        size_t delivered = 0;

        size_t failed() const {
            return attempted - delivered;
        }
    };

    class INotifier {
    public:
        virtual ~INotifier() = default;

        /**
         * @param file the file the event is about; when empty the device's last known file is used
         */
        virtual DispatchReport notify(const device::DeviceClient &device, EventKind kind,
                                      const std::optional<std::string> &file) = 0;
    };

} // namespace printfleet::notification
