#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace printfleet::device {

    /**
     * @brief Interface for one command session with a printer.
     *
     * Every operation is bounded by its timeout. Failures are reported by throwing
     * types::ConnectionException or types::TimeoutException.
     */
    class PrinterSocket {
    public:
        virtual ~PrinterSocket() = default;

        virtual void connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Writes the whole buffer.
         * @param data Encoded command line, terminator included.
         */
        virtual void send(const std::string &data, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Reads one response: until the "ok" line, end of stream or the deadline.
         * @return Raw response text.
         */
        virtual std::string receiveResponse(std::chrono::milliseconds timeout) = 0;

        virtual void close() = 0;
    };

} // namespace printfleet::device
