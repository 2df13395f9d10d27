#ifndef TRANSFER_METER_CLIENT_INTERFACE_HPP
#define TRANSFER_METER_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace http::client {
    // Performs exactly one HTTP exchange; redirects are returned, not followed.
    // Returns once the response headers are in; the body is pulled from Response::body_.
    class IRoundTripper {
       public:
        IRoundTripper() = default;
        virtual ~IRoundTripper() = default;
        IRoundTripper(const IRoundTripper&) = delete;
        IRoundTripper& operator=(const IRoundTripper&) = delete;
        IRoundTripper(IRoundTripper&&) = delete;
        IRoundTripper& operator=(IRoundTripper&&) = delete;

        virtual http::model::Response round_trip(const http::model::Request& req) = 0;
    };

    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response execute(http::model::Request req) = 0;
    };
}  // namespace http::client

#endif
