#include "url.hpp"

#include <curl/curl.h>

#include <string>

#include "../error/http_error.hpp"
#include "../../utils/string_utils.hpp"

namespace http::url {

    Url::Url(CurluPtr handle) : handle_(std::move(handle)) {
        text_ = part(handle_.get(), CURLUPART_URL);
        scheme_ = string_utils::to_lower(part(handle_.get(), CURLUPART_SCHEME));
        host_ = string_utils::to_lower(part(handle_.get(), CURLUPART_HOST));
        path_ = part(handle_.get(), CURLUPART_PATH);
        query_ = part(handle_.get(), CURLUPART_QUERY);

        const std::string port = part(handle_.get(), CURLUPART_PORT);
        if (!port.empty()) {
            host_ += ":" + port;
        }
    }

    Url Url::parse(const std::string& s) {
        CurluPtr h(curl_url());
        if (h == nullptr) {
            throw std::runtime_error("Failed to create CURLU handle");
        }

        const CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, s.c_str(), 0);
        if (rc != CURLUE_OK) {
            throw http::http_error::HttpError(s, std::string("invalid URL: ") + curl_url_strerror(rc));
        }

        return Url(std::move(h));
    }

    Url Url::resolve(const std::string& reference) const {
        CurluPtr h(curl_url_dup(handle_.get()));
        if (h == nullptr) {
            throw std::runtime_error("Failed to duplicate CURLU handle");
        }

        const CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, reference.c_str(), 0);
        if (rc != CURLUE_OK) {
            throw http::http_error::HttpError(reference, std::string("invalid redirect location: ") + curl_url_strerror(rc));
        }

        return Url(std::move(h));
    }

    std::string Url::request_uri() const {
        std::string uri = path_.empty() ? "/" : path_;
        if (!query_.empty()) {
            uri += "?" + query_;
        }
        return uri;
    }

    std::string Url::part(CURLU* h, CURLUPart what, unsigned int flags) {
        char* value = nullptr;
        const CURLUcode rc = curl_url_get(h, what, &value, flags);
        if (rc != CURLUE_OK || value == nullptr) {
            // Missing optional parts (port, query) come back as errors.
            return {};
        }

        std::string out(value);
        curl_free(value);
        return out;
    }
}  // namespace http::url
