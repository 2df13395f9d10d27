#ifndef TRANSFER_METER_REDIRECT_POLICY_HPP
#define TRANSFER_METER_REDIRECT_POLICY_HPP

#include <memory>
#include <vector>

#include "../../utils/constants.hpp"
#include "../model/model.hpp"
#include "../trace/trace_sink.hpp"

namespace http::redirect {
    // Consulted before every redirect hop with the pending request and all requests
    // already sent for the operation, oldest first.
    class RedirectPolicy {
       public:
        explicit RedirectPolicy(std::shared_ptr<http::trace::TraceSink> sink, size_t max_redirects = constants::MAX_REDIRECTS);

        // Copies the original request's headers onto req. Authorization only survives a
        // same-origin hop. Throws http_error::RedirectError once the hop limit is reached.
        void check(http::model::Request& req, const std::vector<http::model::Request>& via) const;

        [[nodiscard]] size_t max_redirects() const { return max_redirects_; }

       private:
        std::shared_ptr<http::trace::TraceSink> sink_;
        size_t max_redirects_;
    };
}  // namespace http::redirect

#endif
