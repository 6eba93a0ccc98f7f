#include "printfleet/camera/impl/CurlCameraStream.hpp"
#include "printfleet/logger/Logger.hpp"
#include <curl/curl.h>

namespace printfleet::camera {

    using types::ResultCode;

    CurlCameraStream::CurlCameraStream(std::chrono::milliseconds connectTimeout, std::chrono::seconds stallTimeout)
            : connectTimeout_(connectTimeout), stallTimeout_(stallTimeout) {
    }

    types::Result<> CurlCameraStream::open(const std::string &url, const ChunkHandler &onChunk,
                                           const CancelCheck &cancelled) {
        CURL *curl = curl_easy_init();
        if (!curl) {
            Logger::logError("[CurlCameraStream] Failed to initialize CURL");
            return types::Result<>::error(ResultCode::CameraUnavailable, "Failed to initialize CURL");
        }

        TransferContext context;
        context.onChunk = &onChunk;
        context.cancelled = &cancelled;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

        // No overall timeout: the stream is endless. A stalled camera is detected by the speed limit.
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeout_.count()));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(stallTimeout_.count()));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);

        Logger::logInfo("[CurlCameraStream] Connecting to " + url);
        CURLcode res = curl_easy_perform(curl);
        curl_easy_cleanup(curl);

        if (context.declined) {
            Logger::logInfo("[CurlCameraStream] Stream from " + url + " closed, no more consumers");
            return types::Result<>::success();
        }
        if (res == CURLE_ABORTED_BY_CALLBACK) {
            return types::Result<>::error(ResultCode::CameraUnavailable, "Stream cancelled");
        }
        if (res != CURLE_OK) {
            std::string error = "Camera stream failed: " + std::string(curl_easy_strerror(res));
            Logger::logWarning("[CurlCameraStream] " + url + ": " + error);
            return types::Result<>::error(ResultCode::CameraUnavailable, error);
        }

        Logger::logInfo("[CurlCameraStream] Stream from " + url + " ended by server");
        return types::Result<>::success();
    }

    size_t CurlCameraStream::writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
        auto *context = static_cast<TransferContext *>(userp);
        size_t totalSize = size * nmemb;

        if (!(*context->onChunk)(static_cast<const char *>(contents), totalSize)) {
            context->declined = true;
            return 0; // Abort transfer
        }
        return totalSize;
    }

    int CurlCameraStream::progressCallback(void *clientp, curl_off_t dltotal, curl_off_t dlnow,
                                           curl_off_t ultotal, curl_off_t ulnow) {
        (void) dltotal;
        (void) dlnow;
        (void) ultotal;
        (void) ulnow;

        auto *context = static_cast<TransferContext *>(clientp);
        if (*context->cancelled && (*context->cancelled)()) {
            return 1; // Abort transfer
        }
        return 0;
    }

} // namespace printfleet::camera
