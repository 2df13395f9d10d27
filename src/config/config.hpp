#ifndef TRANSFER_METER_CONFIG_HPP
#define TRANSFER_METER_CONFIG_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

#include "../http/client/transport_options.hpp"
#include "../utils/constants.hpp"

namespace config {
    struct ConfigError : public std::runtime_error {
        std::string key_;
        ConfigError(std::string key, const std::string& msg);
    };

    // Returns the variable's value, or nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

    struct HostTls {
        std::optional<bool> ssl_verify_;
        std::string ca_info_;
        std::string ca_path_;
    };

    struct Config {
        long dial_timeout_s_ = constants::DEFAULT_DIAL_TIMEOUT_S;
        long keepalive_s_ = constants::DEFAULT_KEEPALIVE_S;
        long tls_timeout_s_ = constants::DEFAULT_TLS_TIMEOUT_S;
        std::optional<long> max_idle_per_host_;
        int concurrent_transfers_ = constants::DEFAULT_CONCURRENT_TRANSFERS;
        bool batch_ = false;

        bool log_stats_ = false;
        bool trace_http_ = false;
        bool debug_http_ = false;
        std::filesystem::path log_dir_ = ".transfer_meter/logs";

        bool ssl_verify_ = true;
        std::string ca_info_;
        std::string ca_path_;
        std::unordered_map<std::string, HostTls> hosts_;

        // Idle connections kept per host; follows the concurrency limit unless set.
        [[nodiscard]] long max_idle_per_host() const { return max_idle_per_host_.value_or(concurrent_transfers_); }

        // Host entry first, then global settings. Disabling verification wins over trust roots.
        [[nodiscard]] http::client::TlsSettings tls_for_host(const std::string& host) const;

        // Throws ConfigError on malformed JSON, wrong value types or out-of-range values.
        static Config parse_json(std::string_view json);
        static Config load_from_file(const std::filesystem::path& path);

        // GIT_CURL_VERBOSE, GIT_LOG_STATS, LFS_DEBUG_HTTP, GIT_SSL_NO_VERIFY, GIT_SSL_CAINFO, GIT_SSL_CAPATH.
        void apply_environment(const EnvLookup& env);
    };

    [[nodiscard]] EnvLookup process_environment();
}  // namespace config

#endif
