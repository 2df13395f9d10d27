#ifndef TRANSFER_METER_HTTP_ERROR_HPP
#define TRANSFER_METER_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    struct HttpError : public std::runtime_error {
        std::string url_;
        explicit HttpError(std::string u, const std::string &msg);
    };

    // Connection, TLS, timeout or any other failure reported by the transport.
    struct TransportError : public HttpError {
        long curl_code_;
        explicit TransportError(std::string u, long code, const std::string &msg);
    };

    // A redirect hop rejected by the redirect policy. Aborts the whole operation.
    struct RedirectError : public HttpError {
        size_t hops_;
        explicit RedirectError(std::string u, size_t hops, const std::string &msg);
    };

    // Failure while pulling body bytes after the headers were received.
    struct StreamError : public HttpError {
        explicit StreamError(std::string u, const std::string &msg);
    };

    // Request or response could not be rendered as a header dump.
    struct DumpError : public HttpError {
        explicit DumpError(std::string u, const std::string &msg);
    };
}  // namespace http::http_error

#endif
