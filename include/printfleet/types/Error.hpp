#pragma once

#include <stdexcept>
#include <string>

namespace printfleet::types {

    class DriverException : public std::runtime_error {
    public:
        explicit DriverException(const std::string &msg)
            : std::runtime_error(msg) {}
    };

    class ConnectionException : public DriverException {
    public:
        explicit ConnectionException(const std::string &msg)
            : DriverException(msg) {}
    };

    class TimeoutException : public DriverException {
    public:
        TimeoutException() : DriverException("Timeout waiting for response") {}

        explicit TimeoutException(const std::string &msg)
            : DriverException(msg) {}
    };

    class ProtocolException : public DriverException {
    public:
        explicit ProtocolException(const std::string &msg)
            : DriverException(msg) {}
    };

}
