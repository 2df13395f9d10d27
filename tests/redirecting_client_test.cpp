#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "http/client/redirecting_client.hpp"
#include "http/error/http_error.hpp"
#include "http/model/model.hpp"
#include "http/stream/body_stream.hpp"
#include "test_support.hpp"

using http::client::RedirectingClient;
using http::model::Request;
using http::model::Response;
using test_support::FakeRoundTripper;
using test_support::redirect_to;

namespace {
    Response response(long status, std::vector<std::string> headers) {
        Response resp;
        resp.status_ = status;
        resp.headers_ = std::move(headers);
        return resp;
    }
}  // namespace

TEST(RedirectRequestTest, SeeOtherSwitchesToGetWithoutBody) {
    const Request post{.url_ = "https://host/upload",
                       .method_ = "POST",
                       .body_ = std::make_shared<http::stream::StringBodyStream>("data"),
                       .transfer_id_ = 9};

    const auto next = RedirectingClient::redirect_request(post, response(303, {"Location: /status"}));

    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->method_, "GET");
    EXPECT_EQ(next->url_, "https://host/status");
    EXPECT_EQ(next->body_, nullptr);
    EXPECT_TRUE(next->headers_.empty());
    EXPECT_EQ(next->transfer_id_, 9U);
}

TEST(RedirectRequestTest, HeadStaysHead) {
    const Request head{.url_ = "https://host/a", .method_ = "HEAD"};

    const auto next = RedirectingClient::redirect_request(head, response(302, {"Location: https://cdn/a"}));

    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->method_, "HEAD");
}

TEST(RedirectRequestTest, TemporaryRedirectKeepsMethod) {
    const Request put{.url_ = "https://host/a", .method_ = "PUT"};

    const auto next = RedirectingClient::redirect_request(put, response(308, {"Location: https://host/b"}));

    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->method_, "PUT");
}

TEST(RedirectRequestTest, TemporaryRedirectWithBodyIsNotFollowed) {
    const Request put{.url_ = "https://host/a", .method_ = "PUT", .body_ = std::make_shared<http::stream::StringBodyStream>("x")};

    EXPECT_FALSE(RedirectingClient::redirect_request(put, response(307, {"Location: https://host/b"})).has_value());
}

TEST(RedirectRequestTest, NonRedirectsAndMissingLocationAreFinal) {
    const Request get{.url_ = "https://host/a"};

    EXPECT_FALSE(RedirectingClient::redirect_request(get, response(200, {"Location: /b"})).has_value());
    EXPECT_FALSE(RedirectingClient::redirect_request(get, response(304, {"Location: /b"})).has_value());
    EXPECT_FALSE(RedirectingClient::redirect_request(get, response(302, {})).has_value());
}

TEST(RedirectingClientTest, ClosesIntermediateBodies) {
    auto transport = std::make_shared<FakeRoundTripper>();
    transport->push(redirect_to(302, "/b"));
    transport->push(redirect_to(301, "/c"));
    RedirectingClient client(transport, nullptr);

    auto resp = client.execute(Request{.url_ = "https://host/a"});

    EXPECT_EQ(transport->calls(), 3U);
    EXPECT_EQ(transport->closed_bodies(), 2);
    EXPECT_EQ(http::stream::read_all(*resp.body_), "ok");
}

TEST(RedirectingClientTest, PassesEverySentRequestToTheCheck) {
    auto transport = std::make_shared<FakeRoundTripper>();
    transport->push(redirect_to(302, "/b"));
    transport->push(redirect_to(302, "/c"));
    std::vector<size_t> via_sizes;
    RedirectingClient client(transport, [&via_sizes](Request&, const std::vector<Request>& via) { via_sizes.push_back(via.size()); });

    (void)client.execute(Request{.url_ = "https://host/a"});

    EXPECT_EQ(via_sizes, (std::vector<size_t>{1, 2}));
}

TEST(RedirectingClientTest, TransportErrorsPropagate) {
    auto transport = std::make_shared<FakeRoundTripper>();
    transport->push(test_support::ScriptedResponse{.transport_error_ = "could not resolve host"});
    RedirectingClient client(transport, nullptr);

    EXPECT_THROW((void)client.execute(Request{.url_ = "https://nowhere/a"}), http::http_error::TransportError);
}

