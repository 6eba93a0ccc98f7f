#include <catch2/catch.hpp>

#include "printfleet/device/DeviceClient.hpp"
#include "printfleet/device/impl/TcpPrinterSocket.hpp"
#include "printfleet/types/Error.hpp"
#include "fakes/ScriptedPrinterSocket.hpp"

#include <boost/asio.hpp>
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace printfleet;
using boost::asio::ip::tcp;
using namespace std::chrono_literals;

namespace {
    /**
     * @brief Loopback printer answering one command per connection, or staying silent.
     */
    class LoopbackPrinter {
    public:
        explicit LoopbackPrinter(bool silent = false)
                : acceptor_(io_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)), silent_(silent) {
            thread_ = std::thread([this]() { serve(); });
        }

        ~LoopbackPrinter() {
            stopping_ = true;

            // A blocking accept is only woken by a connection
            boost::asio::io_context io;
            tcp::socket wake(io);
            boost::system::error_code ignored;
            wake.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port()), ignored);

            if (thread_.joinable()) thread_.join();
        }

        uint16_t port() const { return acceptor_.local_endpoint().port(); }

    private:
        boost::asio::io_context io_;
        tcp::acceptor acceptor_;
        bool silent_;
        std::atomic<bool> stopping_{false};
        std::thread thread_;

        void serve() {
            while (!stopping_) {
                boost::system::error_code ec;
                tcp::socket socket(io_);
                acceptor_.accept(socket, ec);
                if (ec || stopping_) return;

                for (int exchange = 0; exchange < 2; ++exchange) {
                    std::string line;
                    char c;
                    while (boost::asio::read(socket, boost::asio::buffer(&c, 1), ec) == 1 && c != '\n') {
                        line += c;
                    }
                    if (ec) break;
                    if (silent_) {
                        std::this_thread::sleep_for(300ms);
                        break;
                    }

                    std::string reply = line.rfind("~M601", 0) == 0
                                        ? testing::HANDSHAKE_REPLY
                                        : "CMD M105 Received.\r\nT0:25/0 B:24/0\r\n";
                    // Split the answer to exercise reads across chunks
                    boost::asio::write(socket, boost::asio::buffer(reply), ec);
                    if (reply != testing::HANDSHAKE_REPLY) {
                        std::this_thread::sleep_for(20ms);
                        boost::asio::write(socket, boost::asio::buffer(std::string("ok\r\n")), ec);
                    }
                }
            }
        }
    };
}

TEST_CASE("tcp socket reads until the ok line", "[tcp]") {
    LoopbackPrinter printer;

    device::TcpPrinterSocket socket;
    socket.connect("127.0.0.1", printer.port(), 1s);
    socket.send("~M601 S1\r\n", 1s);
    CHECK(socket.receiveResponse(1s) == testing::HANDSHAKE_REPLY);

    socket.send("~M105\r\n", 1s);
    auto response = socket.receiveResponse(1s);
    CHECK(response == "CMD M105 Received.\r\nT0:25/0 B:24/0\r\nok\r\n");
    socket.close();
}

TEST_CASE("tcp socket read is bounded by its timeout", "[tcp]") {
    LoopbackPrinter printer(true);

    device::TcpPrinterSocket socket;
    socket.connect("127.0.0.1", printer.port(), 1s);
    socket.send("~M601 S1\r\n", 1s);

    auto started = std::chrono::steady_clock::now();
    CHECK_THROWS_AS(socket.receiveResponse(100ms), types::TimeoutException);
    CHECK(std::chrono::steady_clock::now() - started < 1s);
}

TEST_CASE("tcp connect to a closed port is a connection error", "[tcp]") {
    uint16_t port;
    {
        boost::asio::io_context io;
        tcp::acceptor probe(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        port = probe.local_endpoint().port();
    }

    device::TcpPrinterSocket socket;
    CHECK_THROWS_AS(socket.connect("127.0.0.1", port, 1s), types::ConnectionException);
}

TEST_CASE("tcp connect resolves host names", "[tcp]") {
    LoopbackPrinter printer;

    std::vector<std::string> looked;
    device::TcpPrinterSocket socket([&looked](const std::string &host, uint16_t port) {
        looked.push_back(host);
        return std::vector<tcp::endpoint>{tcp::endpoint(boost::asio::ip::address_v4::loopback(), port)};
    });
    socket.connect("printer.lan", printer.port(), 1s);
    socket.send("~M601 S1\r\n", 1s);
    CHECK(socket.receiveResponse(1s) == testing::HANDSHAKE_REPLY);
    REQUIRE(looked.size() == 1);
    CHECK(looked[0] == "printer.lan");
}

TEST_CASE("a stalled name lookup is bounded by the connect timeout", "[tcp]") {
    device::TcpPrinterSocket socket([](const std::string &, uint16_t) {
        std::this_thread::sleep_for(2s);
        return std::vector<tcp::endpoint>{};
    });

    auto started = std::chrono::steady_clock::now();
    CHECK_THROWS_AS(socket.connect("stalled.lan", 8899, 100ms), types::TimeoutException);
    CHECK(std::chrono::steady_clock::now() - started < 1s);
}

TEST_CASE("a failed name lookup is a connection error", "[tcp]") {
    device::TcpPrinterSocket socket([](const std::string &host, uint16_t) -> std::vector<tcp::endpoint> {
        throw std::runtime_error("Host not found: " + host);
    });

    CHECK_THROWS_AS(socket.connect("missing.lan", 8899, 1s), types::ConnectionException);
}

TEST_CASE("device client talks to a tcp printer end to end", "[tcp]") {
    LoopbackPrinter printer;

    device::ConnectionSettings settings;
    settings.port = printer.port();
    device::DeviceClient client("loop", "127.0.0.1", settings,
                                []() { return std::make_unique<device::TcpPrinterSocket>(); });

    auto temperatures = client.getTemperatures();
    REQUIRE(temperatures.isSuccess());
    CHECK(temperatures.get().sensors.at("T0").current == Approx(25.0));
}
