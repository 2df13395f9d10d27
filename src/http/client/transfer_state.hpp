#ifndef TRANSFER_METER_TRANSFER_STATE_HPP
#define TRANSFER_METER_TRANSFER_STATE_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "../../utils/constants.hpp"

namespace http::client {
    // Builds the final response head from raw header lines as libcurl reports them.
    // Interim 1xx heads are discarded; lines after the final head (trailers) are ignored.
    class ResponseHeadParser {
       public:
        void feed(std::string_view raw_line);

        [[nodiscard]] bool complete() const { return complete_; }
        [[nodiscard]] long status() const { return status_; }
        [[nodiscard]] const std::string& status_line() const { return status_line_; }
        [[nodiscard]] const std::vector<std::string>& headers() const { return headers_; }

       private:
        bool complete_ = false;
        long status_ = 0;
        std::string status_line_;
        std::vector<std::string> headers_;
    };

    // Body bytes received but not yet read. Refuses data once limit bytes are waiting.
    class BodyBuffer {
       public:
        explicit BodyBuffer(size_t limit = constants::MAX_BUFFERED_BODY_BYTES) : limit_(limit) {}

        // False when the reader is behind; the transfer must be paused and the bytes offered again.
        bool append(const char* data, size_t n);
        size_t take(char* buf, size_t n);

        [[nodiscard]] size_t available() const { return data_.size() - offset_; }
        [[nodiscard]] bool empty() const { return available() == 0; }

       private:
        size_t limit_;
        std::string data_;
        size_t offset_ = 0;
    };
}  // namespace http::client

#endif
