#ifndef TRANSFER_METER_MODEL_HPP
#define TRANSFER_METER_MODEL_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../stream/body_stream.hpp"

namespace http::model {
    // Opaque id threaded through request, response and body stream of one transfer.
    using TransferId = std::uint64_t;
    inline constexpr TransferId NO_TRANSFER = 0;

    struct Request {
        std::string url_;
        std::string method_ = "GET";

        // "Name: value" lines, in the order they go on the wire.
        std::vector<std::string> headers_;

        std::shared_ptr<http::stream::IBodyStream> body_;
        long long content_length_ = -1;

        TransferId transfer_id_ = NO_TRANSFER;
    };

    struct Response {
        TransferId transfer_id_ = NO_TRANSFER;
        long status_ = 0;

        std::string status_line_;
        std::vector<std::string> headers_;
        std::string content_type_;

        // Method and URL of the request that produced this response, after redirects.
        std::string effective_url_;
        std::string request_method_;

        std::unique_ptr<http::stream::IBodyStream> body_;
    };

    [[nodiscard]] std::optional<std::string> header_value(const std::vector<std::string>& headers, std::string_view name);
    [[nodiscard]] std::vector<std::string> header_names(const std::vector<std::string>& headers);
    void set_header(std::vector<std::string>& headers, std::string_view name, std::string_view value);
    void remove_header(std::vector<std::string>& headers, std::string_view name);
}  // namespace http::model

#endif
