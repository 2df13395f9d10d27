#include "dump.hpp"

#include <string>

#include "../error/http_error.hpp"
#include "../url/url.hpp"

namespace http::model {
    namespace {
        constexpr const char* CRLF = "\r\n";

        void append_headers(std::string& out, const std::vector<std::string>& headers, const std::string& url) {
            for (const auto& line : headers) {
                if (line.find(':') == std::string::npos || line.find_first_of("\r\n") != std::string::npos) {
                    throw http::http_error::DumpError(url, "malformed header line: " + line);
                }
                out += line;
                out += CRLF;
            }
        }
    }  // namespace

    std::string dump_request(const Request& req) {
        std::string out;
        try {
            const auto u = http::url::Url::parse(req.url_);
            out = req.method_ + " " + u.request_uri() + " HTTP/1.1" + CRLF;
            if (!header_value(req.headers_, "Host")) {
                out += "Host: " + u.host() + CRLF;
            }
        } catch (const http::http_error::HttpError& e) {
            throw http::http_error::DumpError(req.url_, e.what());
        }

        append_headers(out, req.headers_, req.url_);
        out += CRLF;
        return out;
    }

    std::string dump_response(const Response& resp) {
        if (resp.status_line_.empty()) {
            throw http::http_error::DumpError(resp.effective_url_, "response has no status line");
        }

        std::string out = resp.status_line_ + CRLF;
        append_headers(out, resp.headers_, resp.effective_url_);
        out += CRLF;
        return out;
    }
}  // namespace http::model
