#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <cmath>

namespace printfleet::utils {
    constexpr int DEFAULT_PRECISION = 2;

    /**
     * @brief Formats a command parameter without trailing zeros: 210.0 -> "210", 62.50 -> "62.5".
     */
    inline std::string formatFloat(double value, int precision = DEFAULT_PRECISION) {
        double factor = std::pow(10.0, precision);
        double rounded = std::round(value * factor) / factor;
        if (rounded == std::floor(rounded)) {
            return std::to_string(static_cast<long long>(rounded));
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << rounded;
        std::string result = oss.str();

        size_t end = result.find_last_not_of('0');
        if (end != std::string::npos && result[end] == '.') end--;
        return result.substr(0, end + 1);
    }
} // namespace printfleet::utils
