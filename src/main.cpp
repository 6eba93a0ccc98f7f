#include "printfleet/application/controllers/ApplicationController.hpp"
#include "printfleet/logger/Logger.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>

using printfleet::Logger;

namespace {
    /**
     * @brief Blocks until SIGINT or SIGTERM arrives.
     */
    void waitForShutdownSignal() {
        boost::asio::io_context io;
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code &ec, int signal) {
            if (!ec) {
                Logger::logInfo("Received shutdown signal: " + std::to_string(signal));
            }
        });
        io.run();
    }
}

int main(int argc, char *argv[]) {
    int exitCode = 0;
    Logger::init();

    try {
        printfleet::ApplicationController app(argc > 1 ? argv[1] : "config.json");

        if (app.initialize()) {
            waitForShutdownSignal();
            app.shutdown();
        } else {
            Logger::logError("Application initialization failed");
            exitCode = 1;
        }
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}
