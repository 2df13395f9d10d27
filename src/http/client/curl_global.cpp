#include "curl_global.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace http::client {

    // curl_url_strerror and curl_multi_poll are required.
    static constexpr unsigned int MIN_CURL_VERSION = 0x075000;

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (info->version_num < MIN_CURL_VERSION) {
            curl_global_cleanup();
            throw std::runtime_error(std::string("libcurl too old: ") + info->version);
        }

        version_ = info->version;
        has_ssl_ = (info->features & CURL_VERSION_SSL) != 0;

        if (!has_ssl_) {
            spdlog::warn("libcurl {} was built without TLS support; https transfers will fail", version_);
        }
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace http::client
