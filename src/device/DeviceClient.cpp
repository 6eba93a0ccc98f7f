#include "printfleet/device/DeviceClient.hpp"
#include "printfleet/types/Error.hpp"
#include "printfleet/logger/Logger.hpp"

namespace printfleet::device {

    using types::ResultCode;

    DeviceClient::DeviceClient(std::string id, std::string host, ConnectionSettings settings,
                               SocketFactory socketFactory, std::shared_ptr<camera::CameraMultiplexer> camera)
            : id_(std::move(id)), host_(std::move(host)), settings_(settings),
              socketFactory_(std::move(socketFactory)), camera_(std::move(camera)) {
    }

    types::Result<std::string> DeviceClient::exchange(const std::string &command, const char *requestName) {
        std::lock_guard<std::recursive_mutex> session(sessionMutex_);

        try {
            auto socket = socketFactory_();
            socket->connect(host_, settings_.port, settings_.connectTimeout);

            protocol::ControlMessage handshake;
            socket->send(protocol::ProtocolCodec::encode(handshake), settings_.writeTimeout);
            auto acknowledged = protocol::ProtocolCodec::decode(handshake, socket->receiveResponse(settings_.readTimeout));
            if (!acknowledged.isSuccess()) {
                socket->close();
                return types::Result<std::string>::propagate(acknowledged);
            }

            socket->send(command, settings_.writeTimeout);
            std::string raw = socket->receiveResponse(settings_.readTimeout);
            socket->close();
            return types::Result<std::string>::success(std::move(raw));
        } catch (const types::TimeoutException &e) {
            Logger::logWarning("[DeviceClient] " + id_ + " " + requestName + ": " + e.what());
            return types::Result<std::string>::error(ResultCode::Timeout, e.what());
        } catch (const types::DriverException &e) {
            Logger::logWarning("[DeviceClient] " + id_ + " " + requestName + ": " + e.what());
            return types::Result<std::string>::error(ResultCode::ConnectionError, e.what());
        } catch (const std::exception &e) {
            Logger::logError("[DeviceClient] " + id_ + " " + requestName + " unexpected error: " + e.what());
            return types::Result<std::string>::error(ResultCode::ConnectionError, e.what());
        }
    }

    types::Result<protocol::PrinterInfo> DeviceClient::getInfo() {
        return sendRequest(protocol::GetInfo{});
    }

    types::Result<protocol::PrinterStatus> DeviceClient::getStatus() {
        return sendRequest(protocol::GetStatus{});
    }

    types::Result<protocol::PrinterTemperature> DeviceClient::getTemperatures() {
        return sendRequest(protocol::GetTemperature{});
    }

    types::Result<protocol::PrinterProgress> DeviceClient::getProgress() {
        return sendRequest(protocol::GetProgress{});
    }

    types::Result<protocol::PrinterHeadPosition> DeviceClient::getHeadPosition() {
        return sendRequest(protocol::GetHeadPosition{});
    }

    types::Result<protocol::ControlSuccess> DeviceClient::setTemperature(int toolIndex, double temperature) {
        protocol::SetTemperature request;
        request.toolIndex = toolIndex;
        request.temperature = temperature;

        Logger::logInfo("[DeviceClient] " + id_ + " set T" + std::to_string(toolIndex) + " to " +
                        std::to_string(temperature));
        return sendRequest(request);
    }

    types::Result<protocol::PrinterStatus> DeviceClient::refreshStatus() {
        auto status = getStatus();

        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!status.isSuccess()) {
            if (online_) {
                Logger::logWarning("[DeviceClient] " + id_ + " went offline: " + status.message);
            }
            online_ = false;
            return types::Result<protocol::PrinterStatus>::error(ResultCode::Offline, status.message);
        }

        if (!online_) {
            Logger::logInfo("[DeviceClient] " + id_ + " is online");
        }
        online_ = true;
        currentFile_ = status.get().currentFile;
        return status;
    }

    types::Result<protocol::PrinterInfo> DeviceClient::fetchIdentityOnce() {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (identity_) {
                return types::Result<protocol::PrinterInfo>::success(*identity_);
            }
        }

        auto info = getInfo();
        if (!info.isSuccess()) {
            Logger::logWarning("[DeviceClient] " + id_ + " identity unavailable, will retry: " + info.message);
            return info;
        }

        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!identity_) {
            identity_ = info.get();
            Logger::logInfo("[DeviceClient] " + id_ + " identified as \"" + identity_->name + "\" (" +
                            identity_->modelName + ", firmware " + identity_->firmwareVersion + ")");
        }
        return types::Result<protocol::PrinterInfo>::success(*identity_);
    }

    std::optional<protocol::PrinterInfo> DeviceClient::identity() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return identity_;
    }

    bool DeviceClient::isOnline() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return online_;
    }

    std::optional<std::string> DeviceClient::currentFile() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return currentFile_;
    }

    DeviceSummary DeviceClient::summary() const {
        std::lock_guard<std::mutex> lock(stateMutex_);

        DeviceSummary summary;
        summary.id = id_;
        summary.name = identity_ ? identity_->name : id_;
        summary.online = online_;
        summary.currentFile = currentFile_;
        if (identity_) {
            summary.firmwareVersion = identity_->firmwareVersion;
        }
        return summary;
    }

    std::unique_lock<std::recursive_mutex> DeviceClient::lockSession() {
        return std::unique_lock<std::recursive_mutex>(sessionMutex_);
    }

} // namespace printfleet::device
