#pragma once

#include "printfleet/device/PrinterSocket.hpp"
#include <boost/asio.hpp>
#include <functional>
#include <string>
#include <vector>

namespace printfleet::device {

    /**
     * @brief PrinterSocket over a Boost.Asio TCP stream.
     *
     * Blocking calls are built from async operations driven by io_context::run_for, so every
     * operation honours its own deadline.
     */
    class TcpPrinterSocket : public PrinterSocket {
    public:
        static constexpr size_t READ_CHUNK_SIZE = 1024;

        /**
         * @brief Name lookup for non-literal hosts. Throws boost::system::system_error on failure.
         */
        using HostLookup = std::function<std::vector<boost::asio::ip::tcp::endpoint>(const std::string &host,
                                                                                     uint16_t port)>;

        TcpPrinterSocket();

        explicit TcpPrinterSocket(HostLookup lookup);

        /**
         * @brief Blocking lookup through the system resolver.
         */
        static std::vector<boost::asio::ip::tcp::endpoint> systemLookup(const std::string &host, uint16_t port);

        ~TcpPrinterSocket() override;

        void connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout) override;

        void send(const std::string &data, std::chrono::milliseconds timeout) override;

        std::string receiveResponse(std::chrono::milliseconds timeout) override;

        void close() override;

    private:
        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::socket socket_;
        std::string peer_;
        HostLookup lookup_;

        /**
         * @brief Endpoints for `host`. Literal addresses skip the lookup, names are looked up on a
         * detached thread so a stalled resolver cannot hold the caller past `timeout`.
         */
        std::vector<boost::asio::ip::tcp::endpoint> resolve(const std::string &host, uint16_t port,
                                                            std::chrono::milliseconds timeout);

        /**
         * @brief Runs pending handlers until they finish or the timeout elapses.
         * @return false if the deadline hit first (pending operations are cancelled)
         */
        bool runFor(std::chrono::milliseconds timeout);
    };

} // namespace printfleet::device
