#include "instrumented_client.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

#include "../error/http_error.hpp"
#include "../model/dump.hpp"
#include "../stream/byte_counting_stream.hpp"

namespace http::client {
    using http::stream::ByteCountingStream;
    using http::stream::CountingMode;

    InstrumentedClient::InstrumentedClient(std::shared_ptr<IHttpClient> inner, std::shared_ptr<http::trace::TraceEmitter> tracer,
                                           std::shared_ptr<stats::TransferRegistry> registry, bool collect_stats)
        : inner_(std::move(inner)), tracer_(std::move(tracer)), registry_(std::move(registry)), collect_stats_(collect_stats) {
        if (inner_ == nullptr || tracer_ == nullptr || registry_ == nullptr) {
            throw std::invalid_argument("InstrumentedClient requires a client, a tracer and a registry");
        }
    }

    template <typename Message, typename DumpFn>
    long long InstrumentedClient::header_size(const Message& message, DumpFn dump) const {
        try {
            return static_cast<long long>(dump(message).size());
        } catch (const http::http_error::DumpError& e) {
            spdlog::debug("header dump failed, recording zero size: {}", e.what());
            return 0;
        }
    }

    http::model::Response InstrumentedClient::execute(http::model::Request req) {
        if (req.transfer_id_ == http::model::NO_TRANSFER) {
            req.transfer_id_ = registry_->next_transfer_id();
        }
        const http::model::TransferId id = req.transfer_id_;
        const auto& trace_options = tracer_->options();

        tracer_->trace_request(req);

        std::shared_ptr<ByteCountingStream> request_body;
        if (req.body_ != nullptr) {
            request_body = std::make_shared<ByteCountingStream>(req.body_, CountingMode::REQUEST, http::trace::is_traceable_content(req.headers_), id,
                                                                tracer_->sink(), trace_options, nullptr);
            req.body_ = request_body;
        }

        const long long request_header_size = collect_stats_ ? header_size(req, http::model::dump_request) : 0;
        const auto start = stats::Clock::now();

        http::model::Response resp = inner_->execute(std::move(req));
        resp.transfer_id_ = id;

        tracer_->trace_response(resp);

        std::shared_ptr<http::stream::IBodyStream> raw_body = std::move(resp.body_);
        if (raw_body == nullptr) {
            raw_body = std::make_shared<http::stream::StringBodyStream>("");
        }
        resp.body_ = std::make_unique<ByteCountingStream>(std::move(raw_body), CountingMode::RESPONSE, http::trace::is_traceable_content(resp.headers_),
                                                          id, tracer_->sink(), trace_options, collect_stats_ ? registry_ : nullptr);

        if (collect_stats_) {
            stats::TransferRecord record;
            record.request_.header_size_ = request_header_size;
            record.request_.body_size_ = request_body != nullptr ? request_body->count() : 0;
            // Response body size is only known once it has been read; Content-Length may be absent or wrong.
            record.response_.header_size_ = header_size(resp, http::model::dump_response);
            record.response_.start_ = start;
            record.status_ = resp.status_;
            record.url_ = resp.effective_url_;
            registry_->open(id, std::move(record));
        }

        return resp;
    }

    void InstrumentedClient::log_transfer(const std::string& key, const http::model::Response& resp) const {
        if (!collect_stats_) {
            return;
        }
        registry_->add_to_bucket(key, resp.transfer_id_);
    }
}  // namespace http::client
