#ifndef TRANSFER_METER_INSTRUMENTED_CLIENT_HPP
#define TRANSFER_METER_INSTRUMENTED_CLIENT_HPP

#include <memory>
#include <string>

#include "../../stats/transfer_registry.hpp"
#include "../model/model.hpp"
#include "../trace/trace_emitter.hpp"
#include "interface.hpp"

namespace http::client {
    // Traces, counts and records every exchange made through the wrapped client.
    //
    // The returned response body is a response-mode ByteCountingStream: reading it to
    // the end finalizes the transfer's record. Bodies that are dropped early leave a
    // partial record behind.
    class InstrumentedClient : public IHttpClient {
       public:
        InstrumentedClient(std::shared_ptr<IHttpClient> inner, std::shared_ptr<http::trace::TraceEmitter> tracer,
                           std::shared_ptr<stats::TransferRegistry> registry, bool collect_stats);

        // Errors from the wrapped client propagate unchanged and record nothing.
        http::model::Response execute(http::model::Request req) override;

        // Groups a transfer under key for the stats report. No-op when stats are off.
        void log_transfer(const std::string& key, const http::model::Response& resp) const;

        [[nodiscard]] bool collects_stats() const { return collect_stats_; }

       private:
        // Size of the header dump, or zero when the message cannot be dumped.
        template <typename Message, typename DumpFn>
        long long header_size(const Message& message, DumpFn dump) const;

        std::shared_ptr<IHttpClient> inner_;
        std::shared_ptr<http::trace::TraceEmitter> tracer_;
        std::shared_ptr<stats::TransferRegistry> registry_;
        bool collect_stats_;
    };
}  // namespace http::client

#endif
