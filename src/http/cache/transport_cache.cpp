#include "transport_cache.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>
#include <string>

namespace http::cache {

    TransportCache::TransportCache(TransportCachePolicy policy, http::client::TlsPolicy tls_policy, ClientFactory factory)
        : policy_(policy), tls_policy_(std::move(tls_policy)), factory_(std::move(factory)) {
        if (!factory_) {
            throw std::invalid_argument("TransportCache requires a client factory");
        }
    }

    http::client::TransportOptions TransportCache::options_for(const std::string &host) const {
        http::client::TransportOptions options;
        options.host_ = host;
        options.dial_timeout_s_ = policy_.dial_timeout_s_;
        options.keepalive_s_ = policy_.keepalive_s_;
        options.tls_timeout_s_ = policy_.tls_timeout_s_;
        options.max_idle_per_host_ = policy_.max_idle_per_host_;
        if (tls_policy_) {
            options.tls_ = tls_policy_(host);
        }
        return options;
    }

    std::shared_ptr<http::client::InstrumentedClient> TransportCache::client_for(const std::string &host) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (auto it = clients_.find(host); it != clients_.end()) {
            return it->second;
        }

        // Built under the lock: creating a transport does no network I/O.
        auto client = factory_(options_for(host));
        if (client == nullptr) {
            throw std::runtime_error("client factory returned no client for " + host);
        }

        spdlog::debug("created transport for {}", host);
        clients_.emplace(host, client);
        return client;
    }

    size_t TransportCache::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return clients_.size();
    }
}  // namespace http::cache
