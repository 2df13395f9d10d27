#ifndef TRANSFER_METER_REDIRECTING_CLIENT_HPP
#define TRANSFER_METER_REDIRECTING_CLIENT_HPP

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

namespace http::client {
    // Called before each hop with the pending request and every request sent so far.
    // Throwing aborts the operation.
    using RedirectCheck = std::function<void(http::model::Request& next, const std::vector<http::model::Request>& via)>;

    // Follows 3xx responses hop by hop over a round tripper.
    class RedirectingClient : public IHttpClient {
       public:
        RedirectingClient(std::shared_ptr<IRoundTripper> transport, RedirectCheck check);

        http::model::Response execute(http::model::Request req) override;

        // The request to send next, or nullopt when the response is not a followable redirect.
        [[nodiscard]] static std::optional<http::model::Request> redirect_request(const http::model::Request& current,
                                                                                  const http::model::Response& resp);

       private:
        std::shared_ptr<IRoundTripper> transport_;
        RedirectCheck check_;
    };
}  // namespace http::client

#endif
