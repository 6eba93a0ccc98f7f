#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace printfleet::protocol {

    struct Position {
        int x = 0;
        int y = 0;
        int z = 0;
    };

    struct EndStopPosition {
        int xMax = 0;
        int yMax = 0;
        int zMin = 0;
    };

    struct TemperatureMeasurement {
        double current = 0.0;
        double target = 0.0;
    };

    struct ControlSuccess {
        bool success = true;
    };

    /**
     * @brief Printer identity as reported by M115. Immutable once fetched.
     */
    struct PrinterInfo {
        std::string name;
        std::string firmwareVersion;
        std::string serialNumber;
        int toolCount = 0;
        std::string modelName;
        std::string macAddress;
        Position position;
    };

    struct PrinterHeadPosition {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
        double a = 0.0;
        double b = 0.0;
    };

    struct PrinterTemperature {
        std::map<std::string, TemperatureMeasurement> sensors;
    };

    struct ProgressRatio {
        uint64_t completed = 0;
        uint64_t total = 0;
    };

    struct PrinterProgress {
        ProgressRatio byte;
        ProgressRatio layer;

        bool isLayerComplete() const {
            return layer.completed >= layer.total;
        }
    };

    struct PrinterStatus {
        EndStopPosition endStop;
        std::string machineStatus;
        std::string moveMode;
        bool led = false;
        std::optional<std::string> currentFile;
    };

} // namespace printfleet::protocol
