#include "printfleet/protocol/ResponseParser.hpp"
#include "printfleet/types/Error.hpp"
#include "printfleet/logger/Logger.hpp"

#include <regex>
#include <sstream>

namespace printfleet::protocol {

    namespace {
        const std::regex &inlinePairRegex() {
            static const std::regex regex(R"(([A-Za-z0-9\-\s]+):\s*([^:\s]+))");
            return regex;
        }

        const std::regex &ratioRegex() {
            static const std::regex regex(R"((\d+)/(\d+))");
            return regex;
        }

        std::string trimStart(const std::string &value) {
            size_t start = value.find_first_not_of(" \t");
            return start == std::string::npos ? std::string() : value.substr(start);
        }
    }

    std::vector<std::string> ResponseParser::splitLines(const std::string &raw) {
        std::vector<std::string> lines;
        std::istringstream stream(raw);
        std::string line;

        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(line);
        }

        return lines;
    }

    bool ResponseParser::hasTerminator(const std::string &raw) {
        for (const auto &line: splitLines(raw)) {
            if (line == "ok") return true;
        }
        return false;
    }

    KeyValueMap ResponseParser::parseKeyValues(const std::string &raw) {
        KeyValueMap kv;
        auto lines = splitLines(raw);

        // First line is the command echo ("CMD M119 Received.")
        for (size_t i = 1; i < lines.size(); ++i) {
            const std::string &line = lines[i];
            if (line == "ok") {
                return kv;
            }
            if (line.empty()) continue;

            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                Logger::logWarning("[ResponseParser] Invalid line: " + line);
                continue;
            }

            std::string key = line.substr(0, colon);
            std::string value = line.substr(colon + 1);

            if (key == "X" || key == "T0") {
                auto pairs = parseInlinePairs(line);
                kv.insert(pairs.begin(), pairs.end());
            } else if (key == "Endstop") {
                auto pairs = parseInlinePairs(value);
                kv.insert(pairs.begin(), pairs.end());
            } else {
                kv[key] = trimStart(value);
            }
        }

        throw types::ProtocolException("end of data, but did not see \"ok\"");
    }

    KeyValueMap ResponseParser::parseInlinePairs(const std::string &text) {
        KeyValueMap kv;
        auto begin = std::sregex_iterator(text.begin(), text.end(), inlinePairRegex());
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            kv[trimStart((*it)[1].str())] = (*it)[2].str();
        }
        return kv;
    }

    std::vector<std::pair<uint64_t, uint64_t>> ResponseParser::parseRatios(const std::string &raw) {
        std::vector<std::pair<uint64_t, uint64_t>> ratios;
        auto lines = splitLines(raw);

        for (size_t i = 1; i < lines.size(); ++i) {
            const std::string &line = lines[i];
            auto begin = std::sregex_iterator(line.begin(), line.end(), ratioRegex());
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                ratios.emplace_back(toUnsigned((*it)[1].str(), "progress"),
                                    toUnsigned((*it)[2].str(), "progress"));
            }
        }

        return ratios;
    }

    const std::string &ResponseParser::require(const KeyValueMap &kv, const std::string &key) {
        auto it = kv.find(key);
        if (it == kv.end()) {
            throw types::ProtocolException("missing key \"" + key + "\"");
        }
        return it->second;
    }

    int ResponseParser::requireInt(const KeyValueMap &kv, const std::string &key) {
        return toInt(require(kv, key), key);
    }

    double ResponseParser::requireDouble(const KeyValueMap &kv, const std::string &key) {
        return toDouble(require(kv, key), key);
    }

    int ResponseParser::toInt(const std::string &value, const std::string &what) {
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed == value.size()) return parsed;
        } catch (const std::exception &) {
        }
        throw types::ProtocolException("invalid integer \"" + value + "\" for " + what);
    }

    double ResponseParser::toDouble(const std::string &value, const std::string &what) {
        try {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            if (consumed == value.size()) return parsed;
        } catch (const std::exception &) {
        }
        throw types::ProtocolException("invalid number \"" + value + "\" for " + what);
    }

    uint64_t ResponseParser::toUnsigned(const std::string &value, const std::string &what) {
        try {
            size_t consumed = 0;
            unsigned long long parsed = std::stoull(value, &consumed);
            if (consumed == value.size()) return parsed;
        } catch (const std::exception &) {
        }
        throw types::ProtocolException("invalid unsigned \"" + value + "\" for " + what);
    }

} // namespace printfleet::protocol
