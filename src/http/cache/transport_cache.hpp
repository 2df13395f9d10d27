#ifndef TRANSFER_METER_TRANSPORT_CACHE_HPP
#define TRANSFER_METER_TRANSPORT_CACHE_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../../utils/constants.hpp"
#include "../client/instrumented_client.hpp"
#include "../client/transport_options.hpp"

namespace http::cache {
    struct TransportCachePolicy {
        long dial_timeout_s_ = constants::DEFAULT_DIAL_TIMEOUT_S;
        long keepalive_s_ = constants::DEFAULT_KEEPALIVE_S;
        long tls_timeout_s_ = constants::DEFAULT_TLS_TIMEOUT_S;
        long max_idle_per_host_ = constants::DEFAULT_CONCURRENT_TRANSFERS;
    };

    // Builds the full client stack (transport, redirects, instrumentation) for one host.
    using ClientFactory = std::function<std::shared_ptr<http::client::InstrumentedClient>(const http::client::TransportOptions&)>;

    // Lazily creates one configured client per host and hands the same instance back afterwards.
    class TransportCache {
       public:
        TransportCache(TransportCachePolicy policy, http::client::TlsPolicy tls_policy, ClientFactory factory);

        ~TransportCache() = default;
        TransportCache(const TransportCache &) = delete;
        TransportCache &operator=(const TransportCache &) = delete;
        TransportCache(TransportCache &&) = delete;
        TransportCache &operator=(TransportCache &&) = delete;

        // host may carry a port ("example.com:8443").
        std::shared_ptr<http::client::InstrumentedClient> client_for(const std::string &host);

        [[nodiscard]] http::client::TransportOptions options_for(const std::string &host) const;
        [[nodiscard]] size_t size() const;

       private:
        TransportCachePolicy policy_;
        http::client::TlsPolicy tls_policy_;
        ClientFactory factory_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<http::client::InstrumentedClient>> clients_;
    };
}  // namespace http::cache

#endif
