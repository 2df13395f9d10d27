#ifndef TRANSFER_METER_TRANSPORT_OPTIONS_HPP
#define TRANSFER_METER_TRANSPORT_OPTIONS_HPP

#include <functional>
#include <string>

#include "../../utils/constants.hpp"

namespace http::client {
    struct TlsSettings {
        bool skip_verify_ = false;
        std::string ca_info_;
        std::string ca_path_;
    };

    // Trust settings for a host ("host" or "host:port").
    using TlsPolicy = std::function<TlsSettings(const std::string& host)>;

    struct TransportOptions {
        std::string host_;
        long dial_timeout_s_ = constants::DEFAULT_DIAL_TIMEOUT_S;
        long keepalive_s_ = constants::DEFAULT_KEEPALIVE_S;
        long tls_timeout_s_ = constants::DEFAULT_TLS_TIMEOUT_S;
        long max_idle_per_host_ = constants::DEFAULT_CONCURRENT_TRANSFERS;
        TlsSettings tls_;
        std::string user_agent_ = constants::USER_AGENT;
    };
}  // namespace http::client

#endif
