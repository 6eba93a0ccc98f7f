#pragma once

#include <map>
#include <memory>
#include <string>

namespace printfleet::camera {

    /**
     * @brief One JPEG image cut out of the MJPEG stream. Header names are lower case.
     */
    struct CameraFrame {
        std::map<std::string, std::string> headers;
        std::string body;

        std::string contentType() const {
            auto it = headers.find("content-type");
            return it != headers.end() ? it->second : "image/jpeg";
        }
    };

    using FramePtr = std::shared_ptr<const CameraFrame>;

} // namespace printfleet::camera
