#ifndef TRANSFER_METER_TEST_SUPPORT_HPP
#define TRANSFER_METER_TEST_SUPPORT_HPP

#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "http/client/interface.hpp"
#include "http/error/http_error.hpp"
#include "http/model/model.hpp"
#include "http/stream/body_stream.hpp"
#include "http/trace/trace_sink.hpp"
#include "utils/constants.hpp"

namespace test_support {
    // Captures summaries (message text only, one per line) and the verbose dump stream.
    struct CapturedTrace {
        std::ostringstream summaries_;
        std::ostringstream dumps_;
        std::shared_ptr<http::trace::TraceSink> sink_;

        CapturedTrace() {
            auto ostream_sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(summaries_);
            auto logger = std::make_shared<spdlog::logger>("trace-capture", ostream_sink);
            logger->set_pattern("%v");
            logger->set_level(spdlog::level::info);
            sink_ = std::make_shared<http::trace::TraceSink>(std::move(logger), dumps_);
        }

        std::string summaries() const { return summaries_.str(); }
        std::string dumps() const { return dumps_.str(); }
    };

    // Body that counts close() calls on a counter shared with the test.
    class TrackedBodyStream : public http::stream::StringBodyStream {
       public:
        TrackedBodyStream(std::string data, std::shared_ptr<std::atomic<int>> closes)
            : http::stream::StringBodyStream(std::move(data)), closes_(std::move(closes)) {}

        void close() override {
            ++*closes_;
            http::stream::StringBodyStream::close();
        }

       private:
        std::shared_ptr<std::atomic<int>> closes_;
    };

    // Hands out its bytes once, then fails the next read.
    class FailingBodyStream : public http::stream::IBodyStream {
       public:
        explicit FailingBodyStream(std::string first_chunk) : first_chunk_(std::move(first_chunk)) {}

        http::stream::ReadResult read(char* buf, size_t n) override {
            if (delivered_) {
                throw http::http_error::StreamError("", "connection reset");
            }
            delivered_ = true;
            const size_t count = std::min(n, first_chunk_.size());
            first_chunk_.copy(buf, count);
            return {.bytes_ = count, .end_of_stream_ = false};
        }

        void close() override {}

       private:
        std::string first_chunk_;
        bool delivered_ = false;
    };

    struct ScriptedResponse {
        long status_ = 200;
        std::vector<std::string> headers_;
        std::string body_;
        std::optional<std::string> transport_error_;
    };

    inline ScriptedResponse redirect_to(long status, const std::string& location) {
        return ScriptedResponse{.status_ = status, .headers_ = {std::string(constants::LOCATION) + ": " + location}, .body_ = "moved"};
    }

    // Network-free transport. Replays scripted responses in order, then a default one,
    // and keeps a copy of every request it was asked to send.
    class FakeRoundTripper : public http::client::IRoundTripper {
       public:
        FakeRoundTripper() = default;
        explicit FakeRoundTripper(ScriptedResponse fallback) : fallback_(std::move(fallback)) {}

        void push(ScriptedResponse response) {
            std::lock_guard<std::mutex> lock(mutex_);
            script_.push_back(std::move(response));
        }

        http::model::Response round_trip(const http::model::Request& req) override {
            ScriptedResponse next;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sent_.push_back(http::model::Request{
                    .url_ = req.url_, .method_ = req.method_, .headers_ = req.headers_, .body_ = nullptr, .transfer_id_ = req.transfer_id_});
                if (script_.empty()) {
                    next = fallback_;
                } else {
                    next = std::move(script_.front());
                    script_.pop_front();
                }
            }

            // The transport consumes the upload before the response arrives.
            if (req.body_ != nullptr) {
                std::lock_guard<std::mutex> lock(mutex_);
                uploaded_.push_back(http::stream::read_all(*req.body_));
            }

            if (next.transport_error_) {
                throw http::http_error::TransportError(req.url_, 7, *next.transport_error_);
            }

            http::model::Response resp;
            resp.status_ = next.status_;
            resp.status_line_ = "HTTP/1.1 " + std::to_string(next.status_) + " Scripted";
            resp.headers_ = next.headers_;
            resp.content_type_ = http::model::header_value(next.headers_, constants::CONTENT_TYPE).value_or("");
            resp.effective_url_ = req.url_;
            resp.request_method_ = req.method_;
            resp.body_ = std::make_unique<TrackedBodyStream>(next.body_, closes_);
            return resp;
        }

        size_t calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_.size();
        }

        std::vector<http::model::Request> sent() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_;
        }

        std::vector<std::string> uploaded() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return uploaded_;
        }

        int closed_bodies() const { return *closes_; }

       private:
        mutable std::mutex mutex_;
        std::deque<ScriptedResponse> script_;
        ScriptedResponse fallback_{.status_ = 200, .headers_ = {"Content-Type: application/octet-stream"}, .body_ = "ok"};
        std::vector<http::model::Request> sent_;
        std::vector<std::string> uploaded_;
        std::shared_ptr<std::atomic<int>> closes_ = std::make_shared<std::atomic<int>>(0);
    };
}  // namespace test_support

#endif
