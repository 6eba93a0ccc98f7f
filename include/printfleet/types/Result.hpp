#pragma once

#include <optional>
#include <string>
#include <utility>

namespace printfleet::types {

    enum class ResultCode {
        Success,
        UnknownDevice,
        ConnectionError,
        Timeout,
        ProtocolError,
        Offline,
        CameraUnavailable,
        DeliveryFailed
    };

    inline std::string resultCodeToString(ResultCode code) {
        switch (code) {
            case ResultCode::Success: return "SUCCESS";
            case ResultCode::UnknownDevice: return "UNKNOWN_DEVICE";
            case ResultCode::ConnectionError: return "CONNECTION_ERROR";
            case ResultCode::Timeout: return "TIMEOUT";
            case ResultCode::ProtocolError: return "PROTOCOL_ERROR";
            case ResultCode::Offline: return "OFFLINE";
            case ResultCode::CameraUnavailable: return "CAMERA_UNAVAILABLE";
            case ResultCode::DeliveryFailed: return "DELIVERY_FAILED";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Placeholder payload for results that only carry a status.
     */
    struct Empty {
    };

    template<typename T = Empty>
    struct Result {
        ResultCode code = ResultCode::Success;
        std::string message;
        std::optional<T> value;

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isUnknownDevice() const {
            return code == ResultCode::UnknownDevice;
        }

        inline bool isConnectionError() const {
            return code == ResultCode::ConnectionError;
        }

        inline bool isTimeout() const {
            return code == ResultCode::Timeout;
        }

        inline bool isProtocolError() const {
            return code == ResultCode::ProtocolError;
        }

        inline bool isOffline() const {
            return code == ResultCode::Offline;
        }

        inline bool isCameraUnavailable() const {
            return code == ResultCode::CameraUnavailable;
        }

        inline const T &get() const {
            return *value;
        }

        inline T &get() {
            return *value;
        }

        static inline Result success(T payload = T{}, const std::string &msg = "Success") {
            return {ResultCode::Success, msg, std::optional<T>(std::move(payload))};
        }

        static inline Result error(ResultCode errorCode, const std::string &msg) {
            return {errorCode, msg, std::nullopt};
        }

        /**
         * @brief Carries the failure of another result over to this payload type.
         */
        template<typename U>
        static inline Result propagate(const Result<U> &other) {
            return {other.code, other.message, std::nullopt};
        }
    };

} // namespace printfleet::types
