#pragma once

#include "printfleet/device/PrinterSocket.hpp"
#include "printfleet/protocol/ProtocolCodec.hpp"
#include "printfleet/types/Result.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace printfleet::camera {
    class CameraMultiplexer;
}

namespace printfleet::device {

    struct ConnectionSettings {
        uint16_t port = 8899;
        std::chrono::milliseconds connectTimeout{3000};
        std::chrono::milliseconds writeTimeout{3000};
        std::chrono::milliseconds readTimeout{10000};
    };

    /**
     * @brief Cached view of a printer, readable without touching the hardware.
     */
    struct DeviceSummary {
        std::string id;
        std::string name;
        bool online = false;
        std::optional<std::string> currentFile;
        std::optional<std::string> firmwareVersion;
    };

    /**
     * @brief Client for a single printer.
     *
     * Every request opens a fresh connection, performs the mandatory handshake and then the
     * request itself. Hardware sessions are serialized by the session lock, which callers may
     * also hold across several requests (see lockSession()).
     */
    class DeviceClient {
    public:
        using SocketFactory = std::function<std::unique_ptr<PrinterSocket>()>;

        DeviceClient(std::string id, std::string host, ConnectionSettings settings,
                     SocketFactory socketFactory, std::shared_ptr<camera::CameraMultiplexer> camera = nullptr);

        const std::string &id() const { return id_; }

        const std::string &host() const { return host_; }

        /**
         * @brief Sends one request and decodes the answer.
         *
         * Connection failures map to ResultCode::ConnectionError, expired deadlines to
         * ResultCode::Timeout and malformed answers to ResultCode::ProtocolError.
         */
        template<typename Request>
        types::Result<typename Request::Response> sendRequest(const Request &request) {
            auto raw = exchange(protocol::ProtocolCodec::encode(request), Request::name);
            if (!raw.isSuccess()) {
                return types::Result<typename Request::Response>::propagate(raw);
            }
            return protocol::ProtocolCodec::decode(request, raw.get());
        }

        types::Result<protocol::PrinterInfo> getInfo();

        types::Result<protocol::PrinterStatus> getStatus();

        types::Result<protocol::PrinterTemperature> getTemperatures();

        types::Result<protocol::PrinterProgress> getProgress();

        types::Result<protocol::PrinterHeadPosition> getHeadPosition();

        types::Result<protocol::ControlSuccess> setTemperature(int toolIndex, double temperature);

        /**
         * @brief Polls the status and updates the online flag and current file.
         *
         * The only operation that changes the online flag. Any failure marks the printer offline
         * and is reported as ResultCode::Offline.
         */
        types::Result<protocol::PrinterStatus> refreshStatus();

        /**
         * @brief Returns the cached identity, fetching it first if it is not cached yet.
         *
         * A successful fetch is kept for the lifetime of the client. A failed one is not cached,
         * so the next call tries again.
         */
        types::Result<protocol::PrinterInfo> fetchIdentityOnce();

        std::optional<protocol::PrinterInfo> identity() const;

        bool isOnline() const;

        std::optional<std::string> currentFile() const;

        DeviceSummary summary() const;

        std::shared_ptr<camera::CameraMultiplexer> camera() const { return camera_; }

        /**
         * @brief Holds this printer's session lock. Other devices are unaffected.
         */
        std::unique_lock<std::recursive_mutex> lockSession();

    private:
        const std::string id_;
        const std::string host_;
        const ConnectionSettings settings_;
        SocketFactory socketFactory_;
        std::shared_ptr<camera::CameraMultiplexer> camera_;

        std::recursive_mutex sessionMutex_;

        mutable std::mutex stateMutex_;
        std::optional<protocol::PrinterInfo> identity_;
        bool online_ = false;
        std::optional<std::string> currentFile_;

        types::Result<std::string> exchange(const std::string &command, const char *requestName);
    };

} // namespace printfleet::device
