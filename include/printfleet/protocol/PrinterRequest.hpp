#pragma once

#include "printfleet/protocol/Models.hpp"

namespace printfleet::protocol {

    /*
     * Every request is its own type carrying the response type it decodes to, so a request
     * without a decoder cannot be sent.
     */

    struct ControlMessage {
        using Response = ControlSuccess;
        static constexpr const char *name = "ControlMessage";
    };

    struct GetInfo {
        using Response = PrinterInfo;
        static constexpr const char *name = "GetInfo";
    };

    struct GetHeadPosition {
        using Response = PrinterHeadPosition;
        static constexpr const char *name = "GetHeadPosition";
    };

    struct GetTemperature {
        using Response = PrinterTemperature;
        static constexpr const char *name = "GetTemperature";
    };

    struct GetProgress {
        using Response = PrinterProgress;
        static constexpr const char *name = "GetProgress";
    };

    struct GetStatus {
        using Response = PrinterStatus;
        static constexpr const char *name = "GetStatus";
    };

    struct SetTemperature {
        using Response = ControlSuccess;
        static constexpr const char *name = "SetTemperature";

        int toolIndex = 0;
        double temperature = 0.0;
    };

} // namespace printfleet::protocol
