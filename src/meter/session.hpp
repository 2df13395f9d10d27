#ifndef TRANSFER_METER_SESSION_HPP
#define TRANSFER_METER_SESSION_HPP

#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../config/config.hpp"
#include "../http/cache/transport_cache.hpp"
#include "../http/client/instrumented_client.hpp"
#include "../http/client/interface.hpp"
#include "../http/redirect/redirect_policy.hpp"
#include "../http/trace/trace_emitter.hpp"
#include "../http/trace/trace_sink.hpp"
#include "../stats/transfer_registry.hpp"

namespace meter {
    using RoundTripperFactory = std::function<std::shared_ptr<http::client::IRoundTripper>(const http::client::TransportOptions&)>;

    // Everything one process run shares: configuration, trace output, the statistics
    // registry and the per-host clients.
    class MeterSession {
       public:
        MeterSession(config::Config config, std::shared_ptr<http::trace::TraceSink> sink, RoundTripperFactory round_tripper_factory);

        ~MeterSession() = default;
        MeterSession(const MeterSession&) = delete;
        MeterSession& operator=(const MeterSession&) = delete;
        MeterSession(MeterSession&&) = delete;
        MeterSession& operator=(MeterSession&&) = delete;

        std::shared_ptr<http::client::InstrumentedClient> client_for(const std::string& host);
        std::shared_ptr<http::client::InstrumentedClient> client_for_url(const std::string& url);

        void log_transfer(const std::string& key, const http::model::Response& resp);

        // Writes the stats report the first time it is called with stats enabled.
        std::optional<std::filesystem::path> shutdown();

        [[nodiscard]] const config::Config& get_config() const { return config_; }
        [[nodiscard]] const std::shared_ptr<stats::TransferRegistry>& get_registry() const { return registry_; }
        [[nodiscard]] const http::cache::TransportCache& get_transport_cache() const { return *transport_cache_; }

       private:
        config::Config config_;
        std::shared_ptr<http::trace::TraceSink> sink_;
        std::shared_ptr<stats::TransferRegistry> registry_;
        std::shared_ptr<http::trace::TraceEmitter> tracer_;
        std::shared_ptr<http::redirect::RedirectPolicy> redirect_policy_;
        std::unique_ptr<http::cache::TransportCache> transport_cache_;
        std::atomic<bool> reported_ = false;
    };

    class MeterSessionBuilder {
       public:
        MeterSessionBuilder& with_config(config::Config config);
        MeterSessionBuilder& with_trace_sink(std::shared_ptr<http::trace::TraceSink> sink);
        MeterSessionBuilder& with_round_tripper_factory(RoundTripperFactory factory);
        MeterSessionBuilder& validate();
        std::unique_ptr<MeterSession> build();

       private:
        config::Config config_;
        std::shared_ptr<http::trace::TraceSink> sink_;
        RoundTripperFactory round_tripper_factory_;
    };

    // libcurl-backed transports; requires a live http::client::CurlGlobal.
    [[nodiscard]] RoundTripperFactory curl_round_tripper_factory();
}  // namespace meter

#endif
