#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "http/client/instrumented_client.hpp"
#include "http/client/redirecting_client.hpp"
#include "http/error/http_error.hpp"
#include "http/model/dump.hpp"
#include "http/redirect/redirect_policy.hpp"
#include "http/stream/body_stream.hpp"
#include "http/trace/trace_emitter.hpp"
#include "stats/stats_reporter.hpp"
#include "stats/transfer_registry.hpp"
#include "test_support.hpp"
#include "utils/string_utils.hpp"

using http::client::InstrumentedClient;
using http::model::Request;
using test_support::FakeRoundTripper;
using test_support::ScriptedResponse;

class InstrumentedClientTest : public ::testing::Test {
   protected:
    std::shared_ptr<InstrumentedClient> make_client(bool collect_stats, http::trace::TraceOptions options = {}) {
        auto policy = std::make_shared<http::redirect::RedirectPolicy>(trace_.sink_);
        auto redirecting = std::make_shared<http::client::RedirectingClient>(
            transport_, [policy](Request& next, const std::vector<Request>& via) { policy->check(next, via); });
        auto tracer = std::make_shared<http::trace::TraceEmitter>(trace_.sink_, options);
        return std::make_shared<InstrumentedClient>(redirecting, tracer, registry_, collect_stats);
    }

    test_support::CapturedTrace trace_;
    std::shared_ptr<FakeRoundTripper> transport_ = std::make_shared<FakeRoundTripper>();
    std::shared_ptr<stats::TransferRegistry> registry_ = std::make_shared<stats::TransferRegistry>();
};

TEST_F(InstrumentedClientTest, OpensRecordAndFinalizesWhenBodyIsDrained) {
    transport_->push(ScriptedResponse{.status_ = 200, .headers_ = {"Content-Type: application/json"}, .body_ = "{}"});
    auto client = make_client(true);
    const std::vector<std::string> headers = {"Content-Type: text/plain", "Accept: application/json"};

    auto resp = client->execute(
        Request{.url_ = "https://example.com/upload", .method_ = "POST", .headers_ = headers, .body_ = std::make_shared<http::stream::StringBodyStream>("hello")});

    auto record = registry_->find(resp.transfer_id_);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->finalized_);
    EXPECT_EQ(record->status_, 200);
    EXPECT_EQ(record->url_, "https://example.com/upload");
    EXPECT_EQ(record->request_.body_size_, 5);
    EXPECT_EQ(record->request_.header_size_,
              static_cast<long long>(http::model::dump_request(Request{.url_ = "https://example.com/upload", .method_ = "POST", .headers_ = headers}).size()));
    EXPECT_EQ(record->response_.header_size_,
              static_cast<long long>(std::string("HTTP/1.1 200 Scripted\r\nContent-Type: application/json\r\n\r\n").size()));
    EXPECT_EQ(transport_->uploaded(), std::vector<std::string>{"hello"});

    EXPECT_EQ(http::stream::read_all(*resp.body_), "{}");

    record = registry_->find(resp.transfer_id_);
    EXPECT_TRUE(record->finalized_);
    EXPECT_EQ(record->response_.body_size_, 2);
    EXPECT_GE(record->response_.stop_, record->response_.start_);
}

TEST_F(InstrumentedClientTest, TransportErrorRecordsNothing) {
    transport_->push(ScriptedResponse{.transport_error_ = "connection refused"});
    auto client = make_client(true);

    EXPECT_THROW((void)client->execute(Request{.url_ = "https://example.com/a"}), http::http_error::TransportError);
    EXPECT_EQ(registry_->record_count(), 0U);
}

TEST_F(InstrumentedClientTest, RedirectLimitRecordsNothing) {
    for (int i = 0; i < 3; ++i) {
        transport_->push(test_support::redirect_to(302, "/next" + std::to_string(i)));
    }
    auto client = make_client(true);

    EXPECT_THROW((void)client->execute(Request{.url_ = "https://example.com/a"}), http::http_error::RedirectError);
    EXPECT_EQ(registry_->record_count(), 0U);
}

TEST_F(InstrumentedClientTest, StatsDisabledLeavesRegistryUntouched) {
    auto client = make_client(false);

    auto resp = client->execute(Request{.url_ = "https://example.com/a"});
    (void)http::stream::read_all(*resp.body_);
    client->log_transfer("download", resp);

    EXPECT_FALSE(client->collects_stats());
    EXPECT_EQ(registry_->record_count(), 0U);
    EXPECT_TRUE(registry_->buckets().empty());
}

TEST_F(InstrumentedClientTest, KeepsCallerTransferId) {
    auto client = make_client(true);

    auto resp = client->execute(Request{.url_ = "https://example.com/a", .transfer_id_ = 500});

    EXPECT_EQ(resp.transfer_id_, 500U);
    EXPECT_TRUE(registry_->find(500).has_value());
}

TEST_F(InstrumentedClientTest, AssignsDistinctIds) {
    auto client = make_client(true);

    const auto first = client->execute(Request{.url_ = "https://example.com/a"});
    const auto second = client->execute(Request{.url_ = "https://example.com/a"});

    EXPECT_NE(first.transfer_id_, http::model::NO_TRANSFER);
    EXPECT_NE(first.transfer_id_, second.transfer_id_);
}

TEST_F(InstrumentedClientTest, RecordsFinalUrlAfterRedirect) {
    transport_->push(test_support::redirect_to(302, "https://cdn.example.com/blob"));
    auto client = make_client(true);

    auto resp = client->execute(Request{.url_ = "https://example.com/a"});

    EXPECT_EQ(registry_->find(resp.transfer_id_)->url_, "https://cdn.example.com/blob");
}

TEST_F(InstrumentedClientTest, TracesRequestAndResponse) {
    auto client = make_client(false, http::trace::TraceOptions{.verbose_ = true});

    auto resp = client->execute(Request{.url_ = "https://example.com/a", .headers_ = {"Authorization: Basic c2VjcmV0"}});

    EXPECT_NE(trace_.summaries().find("HTTP: GET https://example.com/a\n"), std::string::npos);
    EXPECT_NE(trace_.summaries().find("HTTP: 200\n"), std::string::npos);
    EXPECT_NE(trace_.dumps().find("> Authorization: Basic * * * * *\n"), std::string::npos);
    EXPECT_NE(trace_.dumps().find("< HTTP/1.1 200 Scripted\n"), std::string::npos);
    EXPECT_EQ(trace_.dumps().find("c2VjcmV0"), std::string::npos);
}

TEST_F(InstrumentedClientTest, ConcurrentTransfersEachGetOneReportLine) {
    constexpr int TRANSFERS = 24;
    auto client = make_client(true);

    std::vector<std::thread> threads;
    for (int i = 0; i < TRANSFERS; ++i) {
        threads.emplace_back([&client, i]() {
            auto resp = client->execute(Request{.url_ = "https://example.com/objects/" + std::to_string(i)});
            (void)http::stream::read_all(*resp.body_);
            client->log_transfer(i % 2 == 0 ? "download" : "upload", resp);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry_->record_count(), static_cast<size_t>(TRANSFERS));
    EXPECT_EQ(registry_->finalized_count(), static_cast<size_t>(TRANSFERS));

    std::ostringstream out;
    stats::StatsReporter(registry_).write_lines(out, stats::ReportSettings{.concurrent_transfers_ = 3, .version_ = "test"}, 1);
    const auto lines = string_utils::split_lines(out.str());
    ASSERT_EQ(lines.size(), static_cast<size_t>(TRANSFERS + 1));
    for (size_t i = 1; i < lines.size(); ++i) {
        EXPECT_NE(lines[i].find(" resbody=2 "), std::string::npos) << lines[i];
        EXPECT_NE(lines[i].find(" status=200 "), std::string::npos) << lines[i];
    }
}

TEST(InstrumentedClientConstructionTest, RequiresCollaborators) {
    test_support::CapturedTrace trace;
    auto tracer = std::make_shared<http::trace::TraceEmitter>(trace.sink_, http::trace::TraceOptions{});
    auto registry = std::make_shared<stats::TransferRegistry>();

    EXPECT_THROW(InstrumentedClient(nullptr, tracer, registry, true), std::invalid_argument);
}
