#include "redirect_policy.hpp"

#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../url/url.hpp"

namespace http::redirect {
    RedirectPolicy::RedirectPolicy(std::shared_ptr<http::trace::TraceSink> sink, size_t max_redirects)
        : sink_(std::move(sink)), max_redirects_(max_redirects) {}

    void RedirectPolicy::check(http::model::Request& req, const std::vector<http::model::Request>& via) const {
        if (via.empty()) {
            return;
        }

        if (via.size() >= max_redirects_) {
            throw http::http_error::RedirectError(req.url_, via.size(), "stopped after " + std::to_string(max_redirects_) + " redirects");
        }

        const http::model::Request& oldest = via.front();
        const bool same_origin = http::url::Url::parse(req.url_).same_origin(http::url::Url::parse(oldest.url_));

        for (const auto& name : http::model::header_names(oldest.headers_)) {
            if (string_utils::ieq(name, constants::AUTHORIZATION) && !same_origin) {
                continue;
            }
            // Framing headers describe the first request's body, not this hop's.
            if (req.body_ == nullptr && (string_utils::ieq(name, constants::CONTENT_LENGTH) || string_utils::ieq(name, constants::TRANSFER_ENCODING))) {
                continue;
            }
            http::model::set_header(req.headers_, name, *http::model::header_value(oldest.headers_, name));
        }

        if (sink_ != nullptr) {
            sink_->summary("api: redirect " + oldest.method_ + " " + string_utils::strip_query(oldest.url_) + " to " +
                           string_utils::strip_query(req.url_));
        }
    }
}  // namespace http::redirect
