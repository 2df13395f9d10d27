#ifndef TRANSFER_METER_DUMP_HPP
#define TRANSFER_METER_DUMP_HPP

#include <string>

#include "model.hpp"

namespace http::model {
    // Header-only wire renderings ("GET /a HTTP/1.1\r\nHost: h\r\n...\r\n\r\n").
    // Both throw http_error::DumpError on malformed URLs or header lines.
    [[nodiscard]] std::string dump_request(const Request& req);
    [[nodiscard]] std::string dump_response(const Response& resp);
}  // namespace http::model

#endif
