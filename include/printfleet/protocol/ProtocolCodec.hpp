#pragma once

#include "printfleet/protocol/PrinterRequest.hpp"
#include "printfleet/types/Result.hpp"
#include <string>

namespace printfleet::protocol {

    /**
     * @brief Turns requests into command lines and raw responses into typed results.
     *
     * Pure transformation, no I/O. Decoding never throws: a response that does not follow the
     * grammar comes back as ResultCode::ProtocolError.
     */
    class ProtocolCodec {
    public:
        static constexpr const char *LINE_TERMINATOR = "\r\n";

        static std::string gcode(const ControlMessage &request);

        static std::string gcode(const GetInfo &request);

        static std::string gcode(const GetHeadPosition &request);

        static std::string gcode(const GetTemperature &request);

        static std::string gcode(const GetProgress &request);

        static std::string gcode(const GetStatus &request);

        static std::string gcode(const SetTemperature &request);

        /**
         * @brief Command line as written to the socket, CRLF terminated.
         */
        template<typename Request>
        static std::string encode(const Request &request) {
            return gcode(request) + LINE_TERMINATOR;
        }

        static types::Result<ControlSuccess> decode(const ControlMessage &request, const std::string &raw);

        static types::Result<PrinterInfo> decode(const GetInfo &request, const std::string &raw);

        static types::Result<PrinterHeadPosition> decode(const GetHeadPosition &request, const std::string &raw);

        static types::Result<PrinterTemperature> decode(const GetTemperature &request, const std::string &raw);

        static types::Result<PrinterProgress> decode(const GetProgress &request, const std::string &raw);

        static types::Result<PrinterStatus> decode(const GetStatus &request, const std::string &raw);

        static types::Result<ControlSuccess> decode(const SetTemperature &request, const std::string &raw);

    private:
        static types::Result<ControlSuccess> decodeAcknowledge(const char *requestName, const std::string &raw);
    };

} // namespace printfleet::protocol
