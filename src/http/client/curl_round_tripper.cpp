#include "curl_round_tripper.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 0L;
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long SUPPRESS_CONNECT_HEADERS = 1L;
        static constexpr long MS_PER_S = 1000L;
    };

    //
    // CurlShare
    //

    CurlShare::CurlShare() : share_(curl_share_init()) {
        if (share_ == nullptr) {
            throw std::runtime_error("Failed to create CURL share handle");
        }

        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlShare::lock_cb);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlShare::unlock_cb);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);

        for (const auto data : {CURL_LOCK_DATA_CONNECT, CURL_LOCK_DATA_DNS, CURL_LOCK_DATA_SSL_SESSION}) {
            const auto rc = curl_share_setopt(share_, CURLSHOPT_SHARE, data);
            if (rc != CURLSHE_OK) {
                curl_share_cleanup(share_);
                throw std::runtime_error(std::string("curl_share_setopt failed: ") + curl_share_strerror(rc));
            }
        }
    }

    CurlShare::~CurlShare() {
        if (share_ != nullptr) {
            curl_share_cleanup(share_);
        }
    }

    void CurlShare::lock_cb(CURL* /*handle*/, curl_lock_data data, curl_lock_access /*access*/, void* userptr) {
        static_cast<CurlShare*>(userptr)->locks_.at(static_cast<size_t>(data)).lock();
    }

    void CurlShare::unlock_cb(CURL* /*handle*/, curl_lock_data data, void* userptr) {
        static_cast<CurlShare*>(userptr)->locks_.at(static_cast<size_t>(data)).unlock();
    }

    //
    // CurlTransfer
    //

    CurlTransfer::CurlTransfer(std::shared_ptr<CurlShare> share, const TransportOptions& options, const http::model::Request& req)
        : share_(std::move(share)), upload_(req.body_), url_(req.url_), easy_(curl_easy_init()), multi_(curl_multi_init()) {
        if (easy_ == nullptr || multi_ == nullptr) {
            if (easy_ != nullptr) {
                curl_easy_cleanup(easy_);
            }
            if (multi_ != nullptr) {
                curl_multi_cleanup(multi_);
            }
            throw std::runtime_error("Failed to create CURL handles");
        }

        try {
            configure(options, req);
        } catch (...) {
            if (header_list_ != nullptr) {
                curl_slist_free_all(header_list_);
            }
            curl_easy_cleanup(easy_);
            curl_multi_cleanup(multi_);
            throw;
        }

        const auto mc = curl_multi_add_handle(multi_, easy_);
        if (mc != CURLM_OK) {
            curl_slist_free_all(header_list_);
            curl_easy_cleanup(easy_);
            curl_multi_cleanup(multi_);
            throw std::runtime_error(std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc));
        }
        attached_ = true;
    }

    CurlTransfer::~CurlTransfer() {
        if (attached_) {
            curl_multi_remove_handle(multi_, easy_);
        }

        curl_easy_cleanup(easy_);
        curl_multi_cleanup(multi_);

        if (header_list_ != nullptr) {
            curl_slist_free_all(header_list_);
        }
    }

    template <typename T>
    void CurlTransfer::setopt(CURLoption option, T value) {
        const auto rc = curl_easy_setopt(easy_, option, value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlTransfer::configure(const TransportOptions& options, const http::model::Request& req) {
        error_buf_[0] = '\0';

        setopt(CURLOPT_URL, req.url_.c_str());
        setopt(CURLOPT_SHARE, share_->handle());
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_SUPPRESS_CONNECT_HEADERS, CurlDefaults::SUPPRESS_CONNECT_HEADERS);
        setopt(CURLOPT_USERAGENT, options.user_agent_.c_str());

        // libcurl has no separate handshake deadline; the connect phase covers dial and TLS.
        setopt(CURLOPT_CONNECTTIMEOUT_MS, (options.dial_timeout_s_ + options.tls_timeout_s_) * CurlDefaults::MS_PER_S);
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, options.keepalive_s_);
        setopt(CURLOPT_TCP_KEEPINTVL, options.keepalive_s_);
        setopt(CURLOPT_MAXCONNECTS, options.max_idle_per_host_);

        if (options.tls_.skip_verify_) {
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
        } else {
            if (!options.tls_.ca_info_.empty()) {
                setopt(CURLOPT_CAINFO, options.tls_.ca_info_.c_str());
            }
            if (!options.tls_.ca_path_.empty()) {
                setopt(CURLOPT_CAPATH, options.tls_.ca_path_.c_str());
            }
        }

        if (req.method_ == "HEAD") {
            setopt(CURLOPT_NOBODY, 1L);
        } else if (req.method_ == "GET" && req.body_ == nullptr) {
            setopt(CURLOPT_HTTPGET, 1L);
        } else {
            setopt(CURLOPT_CUSTOMREQUEST, req.method_.c_str());
        }

        long long content_length = req.content_length_;
        for (const auto& h : req.headers_) {
            const auto parts = string_utils::split_header_line(h);
            if (parts && string_utils::ieq(parts->first, constants::CONTENT_LENGTH)) {
                // libcurl writes Content-Length itself from the upload size.
                if (req.body_ != nullptr && content_length < 0) {
                    content_length = std::strtoll(parts->second.c_str(), nullptr, constants::BASE_10);
                }
                continue;
            }
            if (req.body_ == nullptr && parts && string_utils::ieq(parts->first, constants::TRANSFER_ENCODING)) {
                continue;
            }
            curl_slist* appended = curl_slist_append(header_list_, h.c_str());
            if (appended == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            header_list_ = appended;
        }
        if (header_list_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, header_list_);
        }

        if (req.body_ != nullptr) {
            setopt(CURLOPT_UPLOAD, 1L);
            setopt(CURLOPT_READFUNCTION, &CurlTransfer::read_cb);
            setopt(CURLOPT_READDATA, this);
            if (content_length >= 0) {
                setopt(CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(content_length));
            }
        }

        setopt(CURLOPT_HEADERFUNCTION, &CurlTransfer::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
        setopt(CURLOPT_WRITEFUNCTION, &CurlTransfer::write_cb);
        setopt(CURLOPT_WRITEDATA, this);
    }

    size_t CurlTransfer::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlTransfer*>(userdata);
        const size_t bytes = size * n_items;
        self->head_.feed(std::string_view(buffer, bytes));
        return bytes;
    }

    size_t CurlTransfer::write_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlTransfer*>(userdata);
        const size_t bytes = size * n_items;

        if (!self->body_.append(buffer, bytes)) {
            // The reader is behind; libcurl hands the same bytes back after CURLPAUSE_CONT.
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        return bytes;
    }

    size_t CurlTransfer::read_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlTransfer*>(userdata);
        const size_t capacity = size * n_items;

        try {
            while (true) {
                const auto r = self->upload_->read(buffer, capacity);
                if (r.bytes_ > 0 || r.end_of_stream_) {
                    return r.bytes_;
                }
            }
        } catch (...) {
            // Rethrown from await_headers() or read() once libcurl has unwound.
            self->upload_error_ = std::current_exception();
            return CURL_READFUNC_ABORT;
        }
    }

    void CurlTransfer::drive() {
        int running = 0;
        const auto mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            throw http::http_error::TransportError(url_, static_cast<long>(mc), std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc));
        }

        if (running != 0) {
            return;
        }

        int left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &left)) {
            if (msg->msg == CURLMSG_DONE) {
                result_ = msg->data.result;
            }
        }
        done_ = true;
    }

    void CurlTransfer::wait() const {
        const auto mc = curl_multi_poll(multi_, nullptr, 0, POLL_TIMEOUT_MS, nullptr);
        if (mc != CURLM_OK) {
            throw http::http_error::TransportError(url_, static_cast<long>(mc), std::string("curl_multi_poll failed: ") + curl_multi_strerror(mc));
        }
    }

    void CurlTransfer::throw_if_failed() const {
        if (upload_error_) {
            std::rethrow_exception(upload_error_);
        }

        if (result_ == CURLE_OK) {
            return;
        }

        std::string err = "curl transfer failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(result_);
        }

        throw http::http_error::TransportError(url_, static_cast<long>(result_), err);
    }

    void CurlTransfer::await_headers() {
        while (!head_.complete() && !done_) {
            drive();
            if (!head_.complete() && !done_) {
                wait();
            }
        }

        throw_if_failed();

        if (!head_.complete()) {
            throw http::http_error::TransportError(url_, static_cast<long>(CURLE_GOT_NOTHING), "transfer finished without a response head");
        }
    }

    http::stream::ReadResult CurlTransfer::read(char* buf, size_t n) {
        if (closed_) {
            throw http::http_error::StreamError(url_, "read on closed body");
        }

        while (body_.empty() && !done_) {
            if (paused_) {
                paused_ = false;
                const auto rc = curl_easy_pause(easy_, CURLPAUSE_CONT);
                if (rc != CURLE_OK) {
                    throw http::http_error::StreamError(url_, std::string("curl_easy_pause failed: ") + curl_easy_strerror(rc));
                }
            }
            drive();
            if (body_.empty() && !done_) {
                wait();
            }
        }

        if (!body_.empty()) {
            const size_t count = body_.take(buf, n);
            return {.bytes_ = count, .end_of_stream_ = body_.empty() && done_ && result_ == CURLE_OK && !upload_error_};
        }

        try {
            throw_if_failed();
        } catch (const http::http_error::TransportError& e) {
            throw http::http_error::StreamError(url_, e.what());
        }

        return {.bytes_ = 0, .end_of_stream_ = true};
    }

    void CurlTransfer::close() {
        if (closed_) {
            return;
        }
        closed_ = true;

        // Detaching mid-body drops the connection instead of returning it to the pool.
        if (attached_) {
            curl_multi_remove_handle(multi_, easy_);
            attached_ = false;
        }
    }

    //
    // CurlRoundTripper
    //

    CurlRoundTripper::CurlRoundTripper(TransportOptions options) : options_(std::move(options)), share_(std::make_shared<CurlShare>()) {
        spdlog::debug("transport for {}: dial={}s keepalive={}s tls={}s max_idle={} skip_verify={}", options_.host_, options_.dial_timeout_s_,
                      options_.keepalive_s_, options_.tls_timeout_s_, options_.max_idle_per_host_, options_.tls_.skip_verify_);
    }

    http::model::Response CurlRoundTripper::round_trip(const http::model::Request& req) {
        auto transfer = std::make_unique<CurlTransfer>(share_, options_, req);
        transfer->await_headers();

        http::model::Response r;
        r.transfer_id_ = req.transfer_id_;
        r.status_ = transfer->status();
        r.status_line_ = transfer->status_line();
        r.headers_ = transfer->headers();
        r.content_type_ = http::model::header_value(r.headers_, constants::CONTENT_TYPE).value_or("");
        r.effective_url_ = req.url_;
        r.request_method_ = req.method_;
        r.body_ = std::move(transfer);
        return r;
    }
}  // namespace http::client
