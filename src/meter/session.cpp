#include "session.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "../http/client/curl_round_tripper.hpp"
#include "../http/client/redirecting_client.hpp"
#include "../http/url/url.hpp"
#include "../stats/stats_reporter.hpp"
#include "../utils/constants.hpp"

namespace meter {

    //
    // MeterSession implementation
    //

    MeterSession::MeterSession(config::Config config, std::shared_ptr<http::trace::TraceSink> sink, RoundTripperFactory round_tripper_factory)
        : config_(std::move(config)),
          sink_(std::move(sink)),
          registry_(std::make_shared<stats::TransferRegistry>()),
          tracer_(std::make_shared<http::trace::TraceEmitter>(
              sink_, http::trace::TraceOptions{.verbose_ = config_.trace_http_, .unsafe_debug_ = config_.debug_http_})),
          redirect_policy_(std::make_shared<http::redirect::RedirectPolicy>(sink_)) {
        const http::cache::TransportCachePolicy policy{
            .dial_timeout_s_ = config_.dial_timeout_s_,
            .keepalive_s_ = config_.keepalive_s_,
            .tls_timeout_s_ = config_.tls_timeout_s_,
            .max_idle_per_host_ = config_.max_idle_per_host(),
        };

        auto tls_policy = [this](const std::string& host) { return config_.tls_for_host(host); };

        auto factory = [this, round_tripper_factory = std::move(round_tripper_factory)](const http::client::TransportOptions& options) {
            auto redirect_policy = redirect_policy_;
            auto redirecting = std::make_shared<http::client::RedirectingClient>(
                round_tripper_factory(options),
                [redirect_policy](http::model::Request& next, const std::vector<http::model::Request>& via) { redirect_policy->check(next, via); });
            return std::make_shared<http::client::InstrumentedClient>(std::move(redirecting), tracer_, registry_, config_.log_stats_);
        };

        transport_cache_ = std::make_unique<http::cache::TransportCache>(policy, std::move(tls_policy), std::move(factory));
    }

    std::shared_ptr<http::client::InstrumentedClient> MeterSession::client_for(const std::string& host) { return transport_cache_->client_for(host); }

    std::shared_ptr<http::client::InstrumentedClient> MeterSession::client_for_url(const std::string& url) {
        return client_for(http::url::Url::parse(url).host());
    }

    void MeterSession::log_transfer(const std::string& key, const http::model::Response& resp) {
        if (!config_.log_stats_) {
            return;
        }
        registry_->add_to_bucket(key, resp.transfer_id_);
    }

    std::optional<std::filesystem::path> MeterSession::shutdown() {
        if (!config_.log_stats_ || reported_.exchange(true)) {
            return std::nullopt;
        }

        const stats::StatsReporter reporter(registry_);
        return reporter.write_report(stats::ReportSettings{
            .concurrent_transfers_ = config_.concurrent_transfers_,
            .batch_ = config_.batch_,
            .version_ = constants::CLIENT_VERSION,
            .log_dir_ = config_.log_dir_,
        });
    }

    //
    // MeterSessionBuilder implementation
    //

    MeterSessionBuilder& MeterSessionBuilder::with_config(config::Config config) {
        config_ = std::move(config);
        return *this;
    }

    MeterSessionBuilder& MeterSessionBuilder::with_trace_sink(std::shared_ptr<http::trace::TraceSink> sink) {
        sink_ = std::move(sink);
        return *this;
    }

    MeterSessionBuilder& MeterSessionBuilder::with_round_tripper_factory(RoundTripperFactory factory) {
        round_tripper_factory_ = std::move(factory);
        return *this;
    }

    MeterSessionBuilder& MeterSessionBuilder::validate() {
        if (sink_ == nullptr) {
            throw std::runtime_error("Trace sink is required");
        }
        if (!round_tripper_factory_) {
            throw std::runtime_error("Round tripper factory is required");
        }
        if (config_.concurrent_transfers_ <= 0) {
            throw std::runtime_error("Concurrent transfers must be positive");
        }
        return *this;
    }

    std::unique_ptr<MeterSession> MeterSessionBuilder::build() {
        return std::make_unique<MeterSession>(std::move(config_), std::move(sink_), std::move(round_tripper_factory_));
    }

    RoundTripperFactory curl_round_tripper_factory() {
        return [](const http::client::TransportOptions& options) { return std::make_shared<http::client::CurlRoundTripper>(options); };
    }
}  // namespace meter
