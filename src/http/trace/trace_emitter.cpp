#include "trace_emitter.hpp"

#include <string>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/dump.hpp"

namespace http::trace {
    TraceEmitter::TraceEmitter(std::shared_ptr<TraceSink> sink, TraceOptions options) : sink_(std::move(sink)), options_(options) {}

    void TraceEmitter::trace_request(const http::model::Request& req) const {
        sink_->summary("HTTP: " + req.method_ + " " + req.url_);

        if (!options_.verbose_) {
            return;
        }

        std::string dump;
        try {
            dump = http::model::dump_request(req);
        } catch (const http::http_error::DumpError& e) {
            sink_->logger()->debug("skipping request dump: {}", e.what());
            return;
        }

        sink_->write(format_dump(OUTBOUND, dump));
    }

    void TraceEmitter::trace_response(const http::model::Response& resp) const {
        sink_->summary("HTTP: " + std::to_string(resp.status_));

        if (!options_.verbose_) {
            return;
        }

        std::string dump;
        try {
            dump = http::model::dump_response(resp);
        } catch (const http::http_error::DumpError& e) {
            sink_->logger()->debug("skipping response dump: {}", e.what());
            return;
        }

        std::string block = is_traceable_content(resp.headers_) ? "\n\n" : "\n";
        block += format_dump(INBOUND, dump);
        sink_->write(block);
    }

    std::string TraceEmitter::format_dump(std::string_view direction, const std::string& dump) const {
        std::string out;

        for (const auto& line : string_utils::split_lines(dump)) {
            out += direction;
            out += ' ';
            if (!options_.unsafe_debug_ && is_basic_authorization(line)) {
                out += REDACTED_BASIC_AUTH;
            } else {
                out += line;
            }
            out += '\n';
        }

        return out;
    }

    bool is_basic_authorization(std::string_view header_line) {
        const auto parts = string_utils::split_header_line(header_line);
        if (!parts || !string_utils::ieq(parts->first, constants::AUTHORIZATION)) {
            return false;
        }

        const std::string& value = parts->second;
        constexpr std::string_view scheme = "basic";
        if (value.size() < scheme.size() || !string_utils::ieq(std::string_view(value).substr(0, scheme.size()), scheme)) {
            return false;
        }
        return value.size() == scheme.size() || value[scheme.size()] == ' ' || value[scheme.size()] == '\t';
    }

    bool is_traceable_content(const std::vector<std::string>& headers) {
        const auto content_type = http::model::header_value(headers, constants::CONTENT_TYPE);
        if (!content_type) {
            return false;
        }

        const std::string primary = string_utils::to_lower(content_type->substr(0, content_type->find(';')));
        for (const char* traced : constants::TRACED_CONTENT_TYPES) {
            if (primary.find(traced) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
}  // namespace http::trace
