#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace printfleet::protocol {

    using KeyValueMap = std::map<std::string, std::string>;

    /**
     * @brief Low level grammar of printer responses.
     *
     * A response is an echo line ("CMD M119 Received.") followed by "key: value" lines and a
     * final "ok" line. Helpers throw types::ProtocolException on grammar violations.
     */
    class ResponseParser {
    public:
        static std::vector<std::string> splitLines(const std::string &raw);

        /**
         * @brief True once the raw text contains a line that is exactly "ok".
         */
        static bool hasTerminator(const std::string &raw);

        /**
         * @brief Parses the key/value body of a response.
         *
         * Lines keyed "X" and "T0" are split into their space separated "key: value" tokens,
         * the value of an "Endstop" line is split the same way.
         * @throws types::ProtocolException if the "ok" terminator is missing
         */
        static KeyValueMap parseKeyValues(const std::string &raw);

        /**
         * @brief Splits "X: 1 Y: 2" or "X-max:0 Y-max:0" into separate pairs.
         */
        static KeyValueMap parseInlinePairs(const std::string &text);

        /**
         * @brief Extracts every "current/total" pair after the echo line, in order of appearance.
         */
        static std::vector<std::pair<uint64_t, uint64_t>> parseRatios(const std::string &raw);

        static const std::string &require(const KeyValueMap &kv, const std::string &key);

        static int requireInt(const KeyValueMap &kv, const std::string &key);

        static double requireDouble(const KeyValueMap &kv, const std::string &key);

        static int toInt(const std::string &value, const std::string &what);

        static double toDouble(const std::string &value, const std::string &what);

        static uint64_t toUnsigned(const std::string &value, const std::string &what);
    };

} // namespace printfleet::protocol
