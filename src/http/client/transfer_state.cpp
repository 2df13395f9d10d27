#include "transfer_state.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <string>

#include "../../utils/string_utils.hpp"

namespace http::client {

    //
    // ResponseHeadParser
    //

    void ResponseHeadParser::feed(std::string_view raw_line) {
        if (complete_) {
            return;
        }

        std::string line(raw_line);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }

        if (line.rfind("HTTP/", 0) == 0) {
            // A new head: the first one, or the one following a 1xx.
            status_line_ = line;
            headers_.clear();
            const auto space = line.find(' ');
            status_ = space == std::string::npos ? 0 : std::strtol(line.c_str() + space + 1, nullptr, constants::BASE_10);
        } else if (line.empty()) {
            complete_ = status_ >= 200;
        } else if ((line.front() == ' ' || line.front() == '\t') && !headers_.empty()) {
            headers_.back() += " " + string_utils::trim(line);
        } else {
            headers_.push_back(std::move(line));
        }
    }

    //
    // BodyBuffer
    //

    bool BodyBuffer::append(const char* data, size_t n) {
        if (empty()) {
            data_.clear();
            offset_ = 0;
        }

        if (available() >= limit_) {
            return false;
        }

        data_.append(data, n);
        return true;
    }

    size_t BodyBuffer::take(char* buf, size_t n) {
        const size_t count = std::min(n, available());
        std::memcpy(buf, data_.data() + offset_, count);
        offset_ += count;
        return count;
    }
}  // namespace http::client
