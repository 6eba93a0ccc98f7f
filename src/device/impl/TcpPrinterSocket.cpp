#include "printfleet/device/impl/TcpPrinterSocket.hpp"
#include "printfleet/protocol/ResponseParser.hpp"
#include "printfleet/types/Error.hpp"
#include "printfleet/logger/Logger.hpp"
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace printfleet::device {

    using boost::asio::ip::tcp;

    namespace {
        // Shared with the lookup thread, which may outlive the socket
        struct PendingLookup {
            std::mutex mutex;
            std::condition_variable done;
            bool finished = false;
            std::vector<tcp::endpoint> endpoints;
            std::string error;
        };
    }

    TcpPrinterSocket::TcpPrinterSocket()
            : TcpPrinterSocket(&TcpPrinterSocket::systemLookup) {
    }

    TcpPrinterSocket::TcpPrinterSocket(HostLookup lookup)
            : io_context_(), socket_(io_context_), lookup_(std::move(lookup)) {
    }

    std::vector<tcp::endpoint> TcpPrinterSocket::systemLookup(const std::string &host, uint16_t port) {
        boost::asio::io_context context;
        tcp::resolver resolver(context);
        std::vector<tcp::endpoint> endpoints;
        for (const auto &entry: resolver.resolve(host, std::to_string(port))) {
            endpoints.push_back(entry.endpoint());
        }
        return endpoints;
    }

    std::vector<tcp::endpoint> TcpPrinterSocket::resolve(const std::string &host, uint16_t port,
                                                         std::chrono::milliseconds timeout) {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(host, ec);
        if (!ec) {
            return {tcp::endpoint(address, port)};
        }

        auto pending = std::make_shared<PendingLookup>();
        std::thread([pending, lookup = lookup_, host, port]() {
            std::vector<tcp::endpoint> endpoints;
            std::string error;
            try {
                endpoints = lookup(host, port);
            } catch (const std::exception &e) {
                error = e.what();
            }

            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->endpoints = std::move(endpoints);
            pending->error = std::move(error);
            pending->finished = true;
            pending->done.notify_all();
        }).detach();

        std::unique_lock<std::mutex> lock(pending->mutex);
        if (!pending->done.wait_for(lock, timeout, [&pending] { return pending->finished; })) {
            throw types::TimeoutException("Resolving " + peer_ + " timed out");
        }
        if (!pending->error.empty()) {
            throw types::ConnectionException("Cannot resolve " + peer_ + ": " + pending->error);
        }
        if (pending->endpoints.empty()) {
            throw types::ConnectionException("Cannot resolve " + peer_ + ": no addresses");
        }
        return pending->endpoints;
    }

    TcpPrinterSocket::~TcpPrinterSocket() {
        close();
    }

    bool TcpPrinterSocket::runFor(std::chrono::milliseconds timeout) {
        io_context_.restart();
        io_context_.run_for(timeout);

        if (!io_context_.stopped()) {
            // Deadline hit: closing the socket aborts the pending operation
            boost::system::error_code ignored;
            socket_.close(ignored);
            io_context_.run();
            return false;
        }
        return true;
    }

    void TcpPrinterSocket::connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout) {
        peer_ = host + ":" + std::to_string(port);

        auto started = std::chrono::steady_clock::now();
        auto endpoints = resolve(host, port, timeout);
        auto remaining = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
        if (remaining.count() <= 0) {
            throw types::TimeoutException("Connect to " + peer_ + " timed out");
        }

        boost::system::error_code result = boost::asio::error::would_block;
        boost::asio::async_connect(socket_, endpoints,
                                   [&result](const boost::system::error_code &error, const tcp::endpoint &) {
                                       result = error;
                                   });

        if (!runFor(remaining)) {
            throw types::TimeoutException("Connect to " + peer_ + " timed out");
        }
        if (result) {
            throw types::ConnectionException("Connect to " + peer_ + " failed: " + result.message());
        }

        Logger::logDebug("[TcpPrinterSocket] Connected to " + peer_);
    }

    void TcpPrinterSocket::send(const std::string &data, std::chrono::milliseconds timeout) {
        if (!socket_.is_open()) {
            throw types::ConnectionException("Socket to " + peer_ + " is not open");
        }

        boost::system::error_code result = boost::asio::error::would_block;
        boost::asio::async_write(socket_, boost::asio::buffer(data),
                                 [&result](const boost::system::error_code &error, size_t) {
                                     result = error;
                                 });

        if (!runFor(timeout)) {
            throw types::TimeoutException("Write to " + peer_ + " timed out");
        }
        if (result) {
            throw types::ConnectionException("Write to " + peer_ + " failed: " + result.message());
        }

        Logger::logDebug("[TX] " + peer_ + " " + data.substr(0, data.find('\r')));
    }

    std::string TcpPrinterSocket::receiveResponse(std::chrono::milliseconds timeout) {
        if (!socket_.is_open()) {
            throw types::ConnectionException("Socket to " + peer_ + " is not open");
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::string response;
        char chunk[READ_CHUNK_SIZE];

        while (!protocol::ResponseParser::hasTerminator(response)) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                throw types::TimeoutException("Read from " + peer_ + " timed out");
            }

            boost::system::error_code result = boost::asio::error::would_block;
            size_t received = 0;
            socket_.async_read_some(boost::asio::buffer(chunk, sizeof(chunk)),
                                    [&result, &received](const boost::system::error_code &error, size_t n) {
                                        result = error;
                                        received = n;
                                    });

            if (!runFor(remaining)) {
                throw types::TimeoutException("Read from " + peer_ + " timed out");
            }

            response.append(chunk, received);

            if (result == boost::asio::error::eof) {
                break;
            }
            if (result) {
                throw types::ConnectionException("Read from " + peer_ + " failed: " + result.message());
            }
        }

        Logger::logDebug("[RX] " + peer_ + " " + std::to_string(response.size()) + " bytes");
        return response;
    }

    void TcpPrinterSocket::close() {
        if (socket_.is_open()) {
            boost::system::error_code ec;
            socket_.shutdown(tcp::socket::shutdown_both, ec);
            socket_.close(ec);
            if (ec) {
                Logger::logWarning("[TcpPrinterSocket] Error closing " + peer_ + ": " + ec.message());
            }
        }
    }

} // namespace printfleet::device
