#include "byte_counting_stream.hpp"

#include <string>

#include "../error/http_error.hpp"

namespace http::stream {
    ByteCountingStream::ByteCountingStream(std::shared_ptr<IBodyStream> inner, CountingMode mode, bool traceable, http::model::TransferId id,
                                           std::shared_ptr<http::trace::TraceSink> sink, http::trace::TraceOptions trace_options,
                                           std::shared_ptr<stats::TransferRegistry> registry)
        : inner_(std::move(inner)),
          mode_(mode),
          traceable_(traceable),
          id_(id),
          sink_(std::move(sink)),
          trace_options_(trace_options),
          registry_(std::move(registry)) {
        if (inner_ == nullptr) {
            throw std::invalid_argument("ByteCountingStream requires an underlying stream");
        }
    }

    ReadResult ByteCountingStream::read(char* buf, size_t n) {
        if (closed_) {
            throw http::http_error::StreamError("", "read on closed body");
        }

        // Errors from the underlying stream propagate and leave the record untouched.
        const ReadResult r = inner_->read(buf, n);

        count_ += static_cast<long long>(r.bytes_);

        if (traceable_ && r.bytes_ > 0) {
            mirror(buf, r.bytes_);
        }

        if (r.end_of_stream_) {
            finish();
        }

        return r;
    }

    void ByteCountingStream::close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        inner_->close();
    }

    void ByteCountingStream::mirror(const char* buf, size_t n) const {
        if (sink_ == nullptr) {
            return;
        }

        const std::string chunk(buf, n);
        if (mode_ == CountingMode::RESPONSE) {
            sink_->summary("HTTP: " + chunk);
        }
        if (trace_options_.verbose_) {
            sink_->write(chunk);
        }
    }

    void ByteCountingStream::finish() {
        if (end_seen_.exchange(true)) {
            return;
        }

        if (mode_ != CountingMode::RESPONSE || registry_ == nullptr) {
            return;
        }

        registry_->finalize(id_, count_, stats::Clock::now());
    }
}  // namespace http::stream
