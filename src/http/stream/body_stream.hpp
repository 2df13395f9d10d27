#ifndef TRANSFER_METER_BODY_STREAM_HPP
#define TRANSFER_METER_BODY_STREAM_HPP

#include <cstddef>
#include <string>

namespace http::stream {
    // Outcome of one read. A read may return bytes and signal end of stream at once.
    struct ReadResult {
        size_t bytes_ = 0;
        bool end_of_stream_ = false;
    };

    // Pull-style body. read() blocks until data, end of stream or an error (thrown).
    class IBodyStream {
       public:
        IBodyStream() = default;
        virtual ~IBodyStream() = default;
        IBodyStream(const IBodyStream&) = delete;
        IBodyStream& operator=(const IBodyStream&) = delete;
        IBodyStream(IBodyStream&&) = delete;
        IBodyStream& operator=(IBodyStream&&) = delete;

        virtual ReadResult read(char* buf, size_t n) = 0;
        virtual void close() = 0;
    };

    class StringBodyStream : public IBodyStream {
       public:
        explicit StringBodyStream(std::string data);

        ReadResult read(char* buf, size_t n) override;
        void close() override;

       private:
        std::string data_;
        size_t offset_ = 0;
        bool closed_ = false;
    };

    // Reads until end of stream and returns the concatenated bytes.
    std::string read_all(IBodyStream& stream);
}  // namespace http::stream

#endif
