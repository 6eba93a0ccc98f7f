#pragma once

#include "printfleet/camera/CameraMultiplexer.hpp"
#include "printfleet/registry/DeviceRegistry.hpp"
#include "printfleet/types/Result.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace printfleet::service {

    /**
     * @brief Entry point for the request handling layer.
     *
     * Resolves device ids through the registry and forwards to the device or its camera.
     * An unknown id is always ResultCode::UnknownDevice, distinct from any device failure.
     */
    class PrinterService {
    public:
        explicit PrinterService(std::shared_ptr<registry::DeviceRegistry> registry);

        std::vector<std::string> listDeviceIds() const;

        std::vector<device::DeviceSummary> listSummaries() const;

        types::Result<protocol::PrinterInfo> getInfo(const std::string &id);

        types::Result<protocol::PrinterStatus> getStatus(const std::string &id);

        types::Result<protocol::PrinterTemperature> getTemperatures(const std::string &id);

        types::Result<protocol::PrinterProgress> getProgress(const std::string &id);

        types::Result<protocol::PrinterHeadPosition> getHeadPosition(const std::string &id);

        types::Result<protocol::ControlSuccess> setTemperature(const std::string &id, int toolIndex,
                                                               double temperature);

        types::Result<camera::CameraMultiplexer::FrameReceiver> subscribeCamera(const std::string &id);

        types::Result<camera::FramePtr> snapshot(const std::string &id);

        /**
         * @brief Cached frame without waiting; CameraUnavailable if none was seen yet.
         */
        types::Result<camera::FramePtr> lastFrame(const std::string &id);

        /**
         * @brief Error body for a failed result: UNKNOWN_PRINTER, CAMERA_UNAVAILABLE or PRINTER_ERROR.
         */
        static nlohmann::json toApiError(types::ResultCode code, const std::string &message);

        template<typename T>
        static nlohmann::json toApiError(const types::Result<T> &result) {
            return toApiError(result.code, result.message);
        }

    private:
        std::shared_ptr<registry::DeviceRegistry> registry_;

        template<typename T>
        static types::Result<T> unknownDevice(const std::string &id) {
            return types::Result<T>::error(types::ResultCode::UnknownDevice, "unknown printer " + id);
        }

        std::shared_ptr<camera::CameraMultiplexer> cameraOf(const std::string &id, types::Result<> &failure);
    };

} // namespace printfleet::service
