#include "body_stream.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <string>

#include "../../utils/constants.hpp"

namespace http::stream {
    StringBodyStream::StringBodyStream(std::string data) : data_(std::move(data)) {}

    ReadResult StringBodyStream::read(char* buf, size_t n) {
        if (closed_ || offset_ >= data_.size()) {
            return {.bytes_ = 0, .end_of_stream_ = true};
        }

        const size_t count = std::min(n, data_.size() - offset_);
        std::memcpy(buf, data_.data() + offset_, count);
        offset_ += count;

        return {.bytes_ = count, .end_of_stream_ = offset_ >= data_.size()};
    }

    void StringBodyStream::close() { closed_ = true; }

    std::string read_all(IBodyStream& stream) {
        std::string out;
        std::array<char, constants::READ_CHUNK_SIZE> chunk{};

        while (true) {
            const ReadResult r = stream.read(chunk.data(), chunk.size());
            out.append(chunk.data(), r.bytes_);
            if (r.end_of_stream_) {
                return out;
            }
        }
    }
}  // namespace http::stream
