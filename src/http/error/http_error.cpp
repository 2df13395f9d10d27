#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::http_error {
    HttpError::HttpError(std::string u, const std::string &msg) : std::runtime_error(msg), url_(std::move(u)) {}

    TransportError::TransportError(std::string u, long code, const std::string &msg) : HttpError(std::move(u), msg), curl_code_(code) {}

    RedirectError::RedirectError(std::string u, size_t hops, const std::string &msg) : HttpError(std::move(u), msg), hops_(hops) {}

    StreamError::StreamError(std::string u, const std::string &msg) : HttpError(std::move(u), msg) {}

    DumpError::DumpError(std::string u, const std::string &msg) : HttpError(std::move(u), msg) {}
}  // namespace http::http_error
