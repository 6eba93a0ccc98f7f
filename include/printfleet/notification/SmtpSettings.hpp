#pragma once

#include <cstdint>
#include <string>

namespace printfleet::notification {

    enum class SmtpEncryption {
        None,
        StartTls,
        Tls
    };

    struct SmtpSettings {
        std::string host;
        uint16_t port = 0;
        SmtpEncryption encryption = SmtpEncryption::StartTls;
        std::string user;
        std::string password;
    };

} // namespace printfleet::notification
