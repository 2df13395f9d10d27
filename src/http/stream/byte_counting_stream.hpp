#ifndef TRANSFER_METER_BYTE_COUNTING_STREAM_HPP
#define TRANSFER_METER_BYTE_COUNTING_STREAM_HPP

#include <atomic>
#include <memory>

#include "../../stats/transfer_registry.hpp"
#include "../model/model.hpp"
#include "../trace/trace_emitter.hpp"
#include "../trace/trace_sink.hpp"
#include "body_stream.hpp"

namespace http::stream {
    enum class CountingMode {
        REQUEST,
        RESPONSE,
    };

    // Decorator counting the bytes pulled through a body. In response mode the first
    // end of stream finalizes the transfer's record; later reads never touch it again.
    class ByteCountingStream : public IBodyStream {
       public:
        // registry may be null, meaning statistics collection is off.
        ByteCountingStream(std::shared_ptr<IBodyStream> inner, CountingMode mode, bool traceable, http::model::TransferId id,
                           std::shared_ptr<http::trace::TraceSink> sink, http::trace::TraceOptions trace_options,
                           std::shared_ptr<stats::TransferRegistry> registry);

        ReadResult read(char* buf, size_t n) override;
        void close() override;

        [[nodiscard]] long long count() const { return count_; }
        [[nodiscard]] bool finalized() const { return end_seen_; }
        [[nodiscard]] CountingMode mode() const { return mode_; }

       private:
        void mirror(const char* buf, size_t n) const;
        void finish();

        std::shared_ptr<IBodyStream> inner_;
        CountingMode mode_;
        bool traceable_;
        http::model::TransferId id_;
        std::shared_ptr<http::trace::TraceSink> sink_;
        http::trace::TraceOptions trace_options_;
        std::shared_ptr<stats::TransferRegistry> registry_;

        std::atomic<long long> count_ = 0;
        std::atomic<bool> end_seen_ = false;
        bool closed_ = false;
    };
}  // namespace http::stream

#endif
