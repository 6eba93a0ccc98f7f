#pragma once

#include <chrono>
#include <thread>

namespace printfleet::testing {

    /**
     * @brief Polls `condition` until it holds or `timeout` passes.
     */
    template<typename Condition>
    bool waitUntil(Condition condition, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return condition();
    }

} // namespace printfleet::testing
