#ifndef TRANSFER_METER_CURL_ROUND_TRIPPER_HPP
#define TRANSFER_METER_CURL_ROUND_TRIPPER_HPP

#include <curl/curl.h>

#include <array>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "../stream/body_stream.hpp"
#include "interface.hpp"
#include "transfer_state.hpp"
#include "transport_options.hpp"

struct curl_slist;

namespace http::client {
    inline constexpr int POLL_TIMEOUT_MS = 1000;

    // Connection, DNS and TLS session cache shared by every transfer to one host.
    class CurlShare {
       public:
        CurlShare();

        ~CurlShare();
        CurlShare(const CurlShare&) = delete;
        CurlShare& operator=(const CurlShare&) = delete;
        CurlShare(CurlShare&&) = delete;
        CurlShare& operator=(CurlShare&&) = delete;

        [[nodiscard]] CURLSH* handle() const { return share_; }

       private:
        static void lock_cb(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
        static void unlock_cb(CURL* handle, curl_lock_data data, void* userptr);

        CURLSH* share_{};
        std::array<std::mutex, CURL_LOCK_DATA_LAST> locks_;
    };

    // One in-flight exchange. An easy handle driven by a private multi handle so the
    // caller regains control once headers are in and then pulls the body on demand.
    class CurlTransfer : public http::stream::IBodyStream {
       public:
        CurlTransfer(std::shared_ptr<CurlShare> share, const TransportOptions& options, const http::model::Request& req);

        ~CurlTransfer() override;
        CurlTransfer(const CurlTransfer&) = delete;
        CurlTransfer& operator=(const CurlTransfer&) = delete;
        CurlTransfer(CurlTransfer&&) = delete;
        CurlTransfer& operator=(CurlTransfer&&) = delete;

        // Blocks until the final (non 1xx) response head arrived. Throws TransportError.
        void await_headers();

        http::stream::ReadResult read(char* buf, size_t n) override;
        void close() override;

        [[nodiscard]] long status() const { return head_.status(); }
        [[nodiscard]] const std::string& status_line() const { return head_.status_line(); }
        [[nodiscard]] const std::vector<std::string>& headers() const { return head_.headers(); }

       private:
        template <typename T>
        void setopt(CURLoption option, T value);

        void configure(const TransportOptions& options, const http::model::Request& req);
        void drive();
        void wait() const;
        void throw_if_failed() const;

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static size_t write_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static size_t read_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        std::shared_ptr<CurlShare> share_;
        std::shared_ptr<http::stream::IBodyStream> upload_;
        std::string url_;

        CURL* easy_{};
        CURLM* multi_{};
        curl_slist* header_list_{};
        std::array<char, CURL_ERROR_SIZE> error_buf_{};

        ResponseHeadParser head_;
        BodyBuffer body_;

        bool attached_ = false;
        bool done_ = false;
        bool paused_ = false;
        bool closed_ = false;
        CURLcode result_ = CURLE_OK;
        std::exception_ptr upload_error_;
    };

    class CurlRoundTripper : public IRoundTripper {
       public:
        explicit CurlRoundTripper(TransportOptions options);

        http::model::Response round_trip(const http::model::Request& req) override;

        [[nodiscard]] const TransportOptions& options() const { return options_; }

       private:
        TransportOptions options_;
        std::shared_ptr<CurlShare> share_;
    };
}  // namespace http::client

#endif
