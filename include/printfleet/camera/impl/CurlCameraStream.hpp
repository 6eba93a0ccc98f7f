#pragma once

#include "printfleet/camera/CameraStreamSource.hpp"
#include <curl/curl.h>
#include <chrono>

namespace printfleet::camera {

    /**
     * @brief CameraStreamSource backed by a libcurl streaming GET.
     */
    class CurlCameraStream : public CameraStreamSource {
    public:
        explicit CurlCameraStream(std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(5000),
                                  std::chrono::seconds stallTimeout = std::chrono::seconds(10));

        types::Result<> open(const std::string &url, const ChunkHandler &onChunk,
                             const CancelCheck &cancelled) override;

    private:
        std::chrono::milliseconds connectTimeout_;
        std::chrono::seconds stallTimeout_;

        struct TransferContext {
            const ChunkHandler *onChunk = nullptr;
            const CancelCheck *cancelled = nullptr;
            bool declined = false;
        };

        static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp);

        static int progressCallback(void *clientp, curl_off_t dltotal, curl_off_t dlnow,
                                    curl_off_t ultotal, curl_off_t ulnow);
    };

} // namespace printfleet::camera
