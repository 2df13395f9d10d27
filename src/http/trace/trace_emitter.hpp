#ifndef TRANSFER_METER_TRACE_EMITTER_HPP
#define TRANSFER_METER_TRACE_EMITTER_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../model/model.hpp"
#include "trace_sink.hpp"

namespace http::trace {
    struct TraceOptions {
        bool verbose_ = false;
        bool unsafe_debug_ = false;
    };

    inline constexpr const char* OUTBOUND = ">";
    inline constexpr const char* INBOUND = "<";
    inline constexpr const char* REDACTED_BASIC_AUTH = "Authorization: Basic * * * * *";

    class TraceEmitter {
       public:
        TraceEmitter(std::shared_ptr<TraceSink> sink, TraceOptions options);

        void trace_request(const http::model::Request& req) const;
        void trace_response(const http::model::Response& resp) const;

        // Prefixes every line of a header dump with the direction marker, redacting Basic credentials.
        [[nodiscard]] std::string format_dump(std::string_view direction, const std::string& dump) const;

        [[nodiscard]] const TraceOptions& options() const { return options_; }
        [[nodiscard]] const std::shared_ptr<TraceSink>& sink() const { return sink_; }

       private:
        std::shared_ptr<TraceSink> sink_;
        TraceOptions options_;
    };

    // True when the primary Content-Type token names a text-like format safe to echo.
    // "Authorization: Basic ..." in any letter case and spacing.
    [[nodiscard]] bool is_basic_authorization(std::string_view header_line);

    [[nodiscard]] bool is_traceable_content(const std::vector<std::string>& headers);
}  // namespace http::trace

#endif
