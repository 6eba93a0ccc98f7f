#include "printfleet/camera/MjpegParser.hpp"
#include "printfleet/logger/Logger.hpp"

#include <algorithm>
#include <cctype>

namespace printfleet::camera {

    namespace {
        const std::string HEADER_END = "\r\n\r\n";

        std::string trim(const std::string &value) {
            size_t start = value.find_first_not_of(" \t");
            if (start == std::string::npos) return "";
            size_t end = value.find_last_not_of(" \t\r");
            return value.substr(start, end - start + 1);
        }

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }
    }

    MjpegParser::MjpegParser(const std::string &boundary, FrameHandler onFrame)
            : marker_("--" + boundary), onFrame_(std::move(onFrame)) {
    }

    void MjpegParser::feed(const char *data, size_t size) {
        buffer_.append(data, size);

        bool progressed = true;
        while (progressed) {
            switch (state_) {
                case State::SeekBoundary:
                    progressed = seekBoundary();
                    break;
                case State::Headers:
                    progressed = readHeaders();
                    break;
                case State::Body:
                    progressed = readBody();
                    break;
            }
        }
    }

    bool MjpegParser::seekBoundary() {
        size_t pos = buffer_.find(marker_);
        if (pos == std::string::npos) {
            // Keep a tail long enough to hold a boundary split across chunks
            if (buffer_.size() >= marker_.size()) {
                buffer_.erase(0, buffer_.size() - marker_.size() + 1);
            }
            return false;
        }

        buffer_.erase(0, pos + marker_.size());
        current_ = CameraFrame{};
        contentLength_.reset();
        state_ = State::Headers;
        return true;
    }

    bool MjpegParser::readHeaders() {
        size_t end = buffer_.find(HEADER_END);
        if (end == std::string::npos) {
            if (buffer_.size() > MAX_HEADER_SIZE) {
                Logger::logWarning("[MjpegParser] Part headers too large, resynchronizing");
                state_ = State::SeekBoundary;
                return true;
            }
            return false;
        }

        std::string block = buffer_.substr(0, end);
        buffer_.erase(0, end + HEADER_END.size());

        size_t start = 0;
        while (start <= block.size()) {
            size_t lineEnd = block.find("\r\n", start);
            if (lineEnd == std::string::npos) lineEnd = block.size();
            std::string line = block.substr(start, lineEnd - start);
            start = lineEnd + 2;

            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            current_.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }

        auto length = current_.headers.find("content-length");
        if (length != current_.headers.end()) {
            try {
                size_t consumed = 0;
                unsigned long parsed = std::stoul(length->second, &consumed);
                if (consumed == length->second.size() && parsed <= MAX_FRAME_SIZE) {
                    contentLength_ = parsed;
                }
            } catch (const std::exception &) {
                Logger::logWarning("[MjpegParser] Invalid Content-Length: " + length->second);
            }
        }

        state_ = State::Body;
        return true;
    }

    bool MjpegParser::readBody() {
        if (contentLength_) {
            if (buffer_.size() < *contentLength_) {
                return false;
            }
            std::string body = buffer_.substr(0, *contentLength_);
            buffer_.erase(0, *contentLength_);
            emitFrame(std::move(body));
            return true;
        }

        size_t next = buffer_.find("\r\n" + marker_);
        if (next == std::string::npos) {
            if (buffer_.size() > MAX_FRAME_SIZE) {
                Logger::logWarning("[MjpegParser] Frame without boundary exceeds limit, dropping");
                buffer_.clear();
                state_ = State::SeekBoundary;
            }
            return false;
        }

        std::string body = buffer_.substr(0, next);
        buffer_.erase(0, next + 2);
        emitFrame(std::move(body));
        return true;
    }

    void MjpegParser::emitFrame(std::string body) {
        current_.body = std::move(body);
        state_ = State::SeekBoundary;
        ++framesParsed_;

        CameraFrame frame = std::move(current_);
        current_ = CameraFrame{};
        if (onFrame_) {
            onFrame_(std::move(frame));
        }
    }

} // namespace printfleet::camera
