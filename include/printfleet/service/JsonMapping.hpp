#pragma once

#include "printfleet/device/DeviceClient.hpp"
#include "printfleet/protocol/Models.hpp"
#include <nlohmann/json.hpp>

/*
 * JSON representation of the printer models, as served to API clients.
 * Progress ratios keep their tuple form: [completed, total].
 */

namespace printfleet::protocol {

    inline void to_json(nlohmann::json &j, const Position &p) {
        j = nlohmann::json{{"x", p.x}, {"y", p.y}, {"z", p.z}};
    }

    inline void to_json(nlohmann::json &j, const EndStopPosition &p) {
        j = nlohmann::json{{"x_max", p.xMax}, {"y_max", p.yMax}, {"z_min", p.zMin}};
    }

    inline void to_json(nlohmann::json &j, const TemperatureMeasurement &t) {
        j = nlohmann::json{{"current", t.current}, {"target", t.target}};
    }

    inline void to_json(nlohmann::json &j, const ControlSuccess &c) {
        j = nlohmann::json{{"success", c.success}};
    }

    inline void to_json(nlohmann::json &j, const PrinterInfo &info) {
        j = nlohmann::json{
                {"name",             info.name},
                {"firmware_version", info.firmwareVersion},
                {"sn",               info.serialNumber},
                {"tool_count",       info.toolCount},
                {"model_name",       info.modelName},
                {"mac_address",      info.macAddress},
                {"position",         info.position}
        };
    }

    inline void to_json(nlohmann::json &j, const PrinterHeadPosition &p) {
        j = nlohmann::json{{"x", p.x}, {"y", p.y}, {"z", p.z}, {"a", p.a}, {"b", p.b}};
    }

    inline void to_json(nlohmann::json &j, const PrinterTemperature &t) {
        j = nlohmann::json::object();
        for (const auto &[sensor, measurement]: t.sensors) {
            j[sensor] = measurement;
        }
    }

    inline void to_json(nlohmann::json &j, const ProgressRatio &r) {
        j = nlohmann::json::array({r.completed, r.total});
    }

    inline void to_json(nlohmann::json &j, const PrinterProgress &p) {
        j = nlohmann::json{{"byte", p.byte}, {"layer", p.layer}};
    }

    inline void to_json(nlohmann::json &j, const PrinterStatus &s) {
        j = nlohmann::json{
                {"endstop",        s.endStop},
                {"machine_status", s.machineStatus},
                {"move_mode",      s.moveMode},
                {"led",            s.led},
                {"current_file",   s.currentFile ? nlohmann::json(*s.currentFile) : nlohmann::json(nullptr)}
        };
    }

} // namespace printfleet::protocol

namespace printfleet::device {

    inline void to_json(nlohmann::json &j, const DeviceSummary &s) {
        j = nlohmann::json{
                {"id",               s.id},
                {"name",             s.name},
                {"is_online",        s.online},
                {"current_file",     s.currentFile ? nlohmann::json(*s.currentFile) : nlohmann::json(nullptr)},
                {"firmware_version", s.firmwareVersion ? nlohmann::json(*s.firmwareVersion)
                                                       : nlohmann::json(nullptr)}
        };
    }

} // namespace printfleet::device
