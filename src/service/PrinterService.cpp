#include "printfleet/service/PrinterService.hpp"
#include "printfleet/logger/Logger.hpp"

namespace printfleet::service {

    using types::ResultCode;

    PrinterService::PrinterService(std::shared_ptr<registry::DeviceRegistry> registry)
            : registry_(std::move(registry)) {
    }

    std::vector<std::string> PrinterService::listDeviceIds() const {
        return registry_->listDeviceIds();
    }

    std::vector<device::DeviceSummary> PrinterService::listSummaries() const {
        std::vector<device::DeviceSummary> summaries;
        for (const auto &device: registry_->listDevices()) {
            summaries.push_back(device->summary());
        }
        return summaries;
    }

    types::Result<protocol::PrinterInfo> PrinterService::getInfo(const std::string &id) {
        auto device = registry_->getDevice(id);
        if (!device) return unknownDevice<protocol::PrinterInfo>(id);
        return device->getInfo();
    }

    types::Result<protocol::PrinterStatus> PrinterService::getStatus(const std::string &id) {
        auto device = registry_->getDevice(id);
        if (!device) return unknownDevice<protocol::PrinterStatus>(id);
        return device->getStatus();
    }

    types::Result<protocol::PrinterTemperature> PrinterService::getTemperatures(const std::string &id) {
        auto device = registry_->getDevice(id);
        if (!device) return unknownDevice<protocol::PrinterTemperature>(id);
        return device->getTemperatures();
    }

    types::Result<protocol::PrinterProgress> PrinterService::getProgress(const std::string &id) {
        auto device = registry_->getDevice(id);
        if (!device) return unknownDevice<protocol::PrinterProgress>(id);
        return device->getProgress();
    }

    types::Result<protocol::PrinterHeadPosition> PrinterService::getHeadPosition(const std::string &id) {
        auto device = registry_->getDevice(id);
        if (!device) return unknownDevice<protocol::PrinterHeadPosition>(id);
        return device->getHeadPosition();
    }

    types::Result<protocol::ControlSuccess> PrinterService::setTemperature(const std::string &id, int toolIndex,
                                                                           double temperature) {
        auto device = registry_->getDevice(id);
        if (!device) return unknownDevice<protocol::ControlSuccess>(id);
        return device->setTemperature(toolIndex, temperature);
    }

    std::shared_ptr<camera::CameraMultiplexer> PrinterService::cameraOf(const std::string &id,
                                                                        types::Result<> &failure) {
        auto device = registry_->getDevice(id);
        if (!device) {
            failure = unknownDevice<types::Empty>(id);
            return nullptr;
        }

        auto camera = device->camera();
        if (!camera) {
            failure = types::Result<>::error(ResultCode::CameraUnavailable, "printer " + id + " has no camera");
        }
        return camera;
    }

    types::Result<camera::CameraMultiplexer::FrameReceiver> PrinterService::subscribeCamera(const std::string &id) {
        types::Result<> failure;
        auto camera = cameraOf(id, failure);
        if (!camera) return types::Result<camera::CameraMultiplexer::FrameReceiver>::propagate(failure);
        return types::Result<camera::CameraMultiplexer::FrameReceiver>::success(camera->subscribe());
    }

    types::Result<camera::FramePtr> PrinterService::snapshot(const std::string &id) {
        types::Result<> failure;
        auto camera = cameraOf(id, failure);
        if (!camera) return types::Result<camera::FramePtr>::propagate(failure);

        auto frame = camera->snapshot();
        if (!frame.isSuccess()) {
            Logger::logWarning("[PrinterService] Snapshot of " + id + " failed: " + frame.message);
        }
        return frame;
    }

    types::Result<camera::FramePtr> PrinterService::lastFrame(const std::string &id) {
        types::Result<> failure;
        auto camera = cameraOf(id, failure);
        if (!camera) return types::Result<camera::FramePtr>::propagate(failure);

        auto frame = camera->lastFrame();
        if (!frame) {
            return types::Result<camera::FramePtr>::error(ResultCode::CameraUnavailable,
                                                          "no frame received from " + id + " yet");
        }
        return types::Result<camera::FramePtr>::success(frame);
    }

    nlohmann::json PrinterService::toApiError(ResultCode code, const std::string &message) {
        std::string error;
        switch (code) {
            case ResultCode::UnknownDevice:
                error = "UNKNOWN_PRINTER";
                break;
            case ResultCode::CameraUnavailable:
                error = "CAMERA_UNAVAILABLE";
                break;
            default:
                error = "PRINTER_ERROR";
                break;
        }
        return nlohmann::json{{"error", error}, {"message", message}};
    }

} // namespace printfleet::service
