#ifndef TRANSFER_METER_CURL_GLOBAL_HPP
#define TRANSFER_METER_CURL_GLOBAL_HPP

#include <string>

namespace http::client {

    // Process-wide libcurl setup. Create one before any transfer and keep it alive until
    // every transport is gone.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] const std::string& version() const { return version_; }
        [[nodiscard]] bool has_ssl() const { return has_ssl_; }

       private:
        std::string version_;
        bool has_ssl_ = false;
    };

}  // namespace http::client

#endif
