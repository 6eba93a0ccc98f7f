#include "printfleet/protocol/ProtocolCodec.hpp"
#include "printfleet/protocol/ResponseParser.hpp"
#include "printfleet/types/Error.hpp"
#include "printfleet/utils/FloatFormatter.hpp"
#include "printfleet/logger/Logger.hpp"

namespace printfleet::protocol {

    using types::ResultCode;

    namespace {
        template<typename T>
        types::Result<T> protocolError(const char *requestName, const std::exception &e) {
            Logger::logWarning(std::string("[ProtocolCodec] Malformed ") + requestName + " response: " + e.what());
            return types::Result<T>::error(ResultCode::ProtocolError, e.what());
        }
    }

    std::string ProtocolCodec::gcode(const ControlMessage &) {
        return "~M601 S1";
    }

    std::string ProtocolCodec::gcode(const GetInfo &) {
        return "~M115";
    }

    std::string ProtocolCodec::gcode(const GetHeadPosition &) {
        return "~M114";
    }

    std::string ProtocolCodec::gcode(const GetTemperature &) {
        return "~M105";
    }

    std::string ProtocolCodec::gcode(const GetProgress &) {
        return "~M27";
    }

    std::string ProtocolCodec::gcode(const GetStatus &) {
        return "~M119";
    }

    std::string ProtocolCodec::gcode(const SetTemperature &request) {
        return "~M104 S" + utils::formatFloat(request.temperature) + " T" + std::to_string(request.toolIndex);
    }

    types::Result<ControlSuccess> ProtocolCodec::decode(const ControlMessage &, const std::string &raw) {
        return decodeAcknowledge(ControlMessage::name, raw);
    }

    types::Result<ControlSuccess> ProtocolCodec::decode(const SetTemperature &, const std::string &raw) {
        return decodeAcknowledge(SetTemperature::name, raw);
    }

    types::Result<ControlSuccess> ProtocolCodec::decodeAcknowledge(const char *requestName, const std::string &raw) {
        if (!ResponseParser::hasTerminator(raw)) {
            Logger::logWarning(std::string("[ProtocolCodec] ") + requestName + " not acknowledged: " + raw);
            return types::Result<ControlSuccess>::error(ResultCode::ProtocolError,
                                                        "end of data, but did not see \"ok\"");
        }
        return types::Result<ControlSuccess>::success(ControlSuccess{true});
    }

    types::Result<PrinterInfo> ProtocolCodec::decode(const GetInfo &, const std::string &raw) {
        try {
            auto kv = ResponseParser::parseKeyValues(raw);

            PrinterInfo info;
            info.name = ResponseParser::require(kv, "Machine Name");
            info.firmwareVersion = ResponseParser::require(kv, "Firmware");
            info.serialNumber = ResponseParser::require(kv, "SN");
            info.toolCount = ResponseParser::requireInt(kv, "Tool Count");
            info.modelName = ResponseParser::require(kv, "Machine Type");
            info.macAddress = ResponseParser::require(kv, "Mac Address");
            info.position.x = ResponseParser::requireInt(kv, "X");
            info.position.y = ResponseParser::requireInt(kv, "Y");
            info.position.z = ResponseParser::requireInt(kv, "Z");
            return types::Result<PrinterInfo>::success(std::move(info));
        } catch (const types::ProtocolException &e) {
            return protocolError<PrinterInfo>(GetInfo::name, e);
        }
    }

    types::Result<PrinterHeadPosition> ProtocolCodec::decode(const GetHeadPosition &, const std::string &raw) {
        try {
            auto kv = ResponseParser::parseKeyValues(raw);

            PrinterHeadPosition position;
            position.x = ResponseParser::requireDouble(kv, "X");
            position.y = ResponseParser::requireDouble(kv, "Y");
            position.z = ResponseParser::requireDouble(kv, "Z");
            position.a = ResponseParser::requireDouble(kv, "A");
            position.b = ResponseParser::requireDouble(kv, "B");
            return types::Result<PrinterHeadPosition>::success(position);
        } catch (const types::ProtocolException &e) {
            return protocolError<PrinterHeadPosition>(GetHeadPosition::name, e);
        }
    }

    types::Result<PrinterTemperature> ProtocolCodec::decode(const GetTemperature &, const std::string &raw) {
        try {
            auto kv = ResponseParser::parseKeyValues(raw);
            if (kv.empty()) {
                throw types::ProtocolException("no temperature readings in response");
            }

            PrinterTemperature temperatures;
            for (const auto &[key, value]: kv) {
                size_t slash = value.find('/');
                if (slash == std::string::npos || value.find('/', slash + 1) != std::string::npos) {
                    throw types::ProtocolException("invalid temperature \"" + value + "\" for " + key);
                }

                TemperatureMeasurement measurement;
                measurement.current = ResponseParser::toDouble(value.substr(0, slash), key);
                measurement.target = ResponseParser::toDouble(value.substr(slash + 1), key);
                temperatures.sensors[key] = measurement;
            }
            return types::Result<PrinterTemperature>::success(std::move(temperatures));
        } catch (const types::ProtocolException &e) {
            return protocolError<PrinterTemperature>(GetTemperature::name, e);
        }
    }

    types::Result<PrinterProgress> ProtocolCodec::decode(const GetProgress &, const std::string &raw) {
        try {
            if (!ResponseParser::hasTerminator(raw)) {
                throw types::ProtocolException("end of data, but did not see \"ok\"");
            }

            auto ratios = ResponseParser::parseRatios(raw);
            if (ratios.size() < 2) {
                throw types::ProtocolException("expected byte and layer progress, found " +
                                               std::to_string(ratios.size()) + " ratios");
            }

            // Byte progress always precedes layer progress
            PrinterProgress progress;
            progress.byte = {ratios[0].first, ratios[0].second};
            progress.layer = {ratios[1].first, ratios[1].second};
            return types::Result<PrinterProgress>::success(progress);
        } catch (const types::ProtocolException &e) {
            return protocolError<PrinterProgress>(GetProgress::name, e);
        }
    }

    types::Result<PrinterStatus> ProtocolCodec::decode(const GetStatus &, const std::string &raw) {
        try {
            auto kv = ResponseParser::parseKeyValues(raw);

            PrinterStatus status;
            status.endStop.xMax = ResponseParser::requireInt(kv, "X-max");
            status.endStop.yMax = ResponseParser::requireInt(kv, "Y-max");
            status.endStop.zMin = ResponseParser::requireInt(kv, "Z-min");
            status.machineStatus = ResponseParser::require(kv, "MachineStatus");
            status.moveMode = ResponseParser::require(kv, "MoveMode");
            status.led = ResponseParser::require(kv, "LED") == "1";

            auto file = kv.find("CurrentFile");
            if (file != kv.end() && !file->second.empty()) {
                status.currentFile = file->second;
            }
            return types::Result<PrinterStatus>::success(std::move(status));
        } catch (const types::ProtocolException &e) {
            return protocolError<PrinterStatus>(GetStatus::name, e);
        }
    }

} // namespace printfleet::protocol
