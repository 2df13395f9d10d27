#include "redirecting_client.hpp"

#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../url/url.hpp"

namespace http::client {

    enum class RedirectStatus : long {
        MOVED_PERMANENTLY = 301,
        FOUND = 302,
        SEE_OTHER = 303,
        TEMPORARY_REDIRECT = 307,
        PERMANENT_REDIRECT = 308,
    };

    RedirectingClient::RedirectingClient(std::shared_ptr<IRoundTripper> transport, RedirectCheck check)
        : transport_(std::move(transport)), check_(std::move(check)) {}

    std::optional<http::model::Request> RedirectingClient::redirect_request(const http::model::Request& current, const http::model::Response& resp) {
        const auto status = static_cast<RedirectStatus>(resp.status_);
        const bool rewrites_method =
            status == RedirectStatus::MOVED_PERMANENTLY || status == RedirectStatus::FOUND || status == RedirectStatus::SEE_OTHER;
        const bool keeps_method = status == RedirectStatus::TEMPORARY_REDIRECT || status == RedirectStatus::PERMANENT_REDIRECT;

        if (!rewrites_method && !keeps_method) {
            return std::nullopt;
        }

        const auto location = http::model::header_value(resp.headers_, constants::LOCATION);
        if (!location || location->empty()) {
            return std::nullopt;
        }

        // A streamed body cannot be replayed on the next hop.
        if (keeps_method && current.body_ != nullptr) {
            return std::nullopt;
        }

        http::model::Request next;
        next.url_ = http::url::Url::parse(current.url_).resolve(*location).str();
        next.transfer_id_ = current.transfer_id_;

        if (keeps_method) {
            next.method_ = current.method_;
        } else {
            next.method_ = current.method_ == "HEAD" ? "HEAD" : "GET";
        }

        return next;
    }

    http::model::Response RedirectingClient::execute(http::model::Request req) {
        std::vector<http::model::Request> via;
        http::model::Request current = std::move(req);

        while (true) {
            http::model::Response resp = transport_->round_trip(current);

            std::optional<http::model::Request> next;
            try {
                next = redirect_request(current, resp);
            } catch (...) {
                if (resp.body_ != nullptr) {
                    resp.body_->close();
                }
                throw;
            }

            if (!next) {
                return resp;
            }

            if (resp.body_ != nullptr) {
                resp.body_->close();
            }

            via.push_back(std::move(current));
            if (check_) {
                check_(*next, via);
            }
            current = std::move(*next);
        }
    }
}  // namespace http::client
