#pragma once

#include <string>

namespace printfleet::notification {

    enum class EventKind {
        PrintComplete
    };

    /**
     * @brief Configuration key holding the destinations of an event kind.
     */
    inline std::string eventKindKey(EventKind kind) {
        switch (kind) {
            case EventKind::PrintComplete: return "on_done";
        }
        return "unknown";
    }

    inline std::string eventKindToString(EventKind kind) {
        switch (kind) {
            case EventKind::PrintComplete: return "PrintComplete";
        }
        return "Unknown";
    }

} // namespace printfleet::notification
