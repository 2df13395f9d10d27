#ifndef TRANSFER_METER_URL_HPP
#define TRANSFER_METER_URL_HPP

#include <curl/curl.h>

#include <memory>
#include <string>

namespace http::url {
    // Absolute URL backed by libcurl's URL API.
    class Url {
       public:
        // Throws http_error::HttpError when the string is not an absolute URL.
        static Url parse(const std::string& s);

        // Resolves a (possibly relative) reference such as a Location header against this URL.
        [[nodiscard]] Url resolve(const std::string& reference) const;

        [[nodiscard]] const std::string& str() const { return text_; }
        [[nodiscard]] const std::string& scheme() const { return scheme_; }
        // Host name, with ":port" appended only when the URL spells a port out.
        [[nodiscard]] const std::string& host() const { return host_; }
        // Path and query, as written on the request line.
        [[nodiscard]] std::string request_uri() const;

        [[nodiscard]] bool same_origin(const Url& other) const { return scheme_ == other.scheme_ && host_ == other.host_; }

       private:
        struct CurluDeleter {
            void operator()(CURLU* h) const { curl_url_cleanup(h); }
        };
        using CurluPtr = std::unique_ptr<CURLU, CurluDeleter>;

        explicit Url(CurluPtr handle);

        static std::string part(CURLU* h, CURLUPart what, unsigned int flags = 0);

        CurluPtr handle_;
        std::string text_;
        std::string scheme_;
        std::string host_;
        std::string path_;
        std::string query_;
    };
}  // namespace http::url

#endif
