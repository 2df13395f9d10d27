#include "config.hpp"

#include <simdjson.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>

#include "../utils/string_utils.hpp"

namespace config {
    namespace parser {
        template <typename T>
        struct ParserOptions {
            T min_value_;
            const char* error_message_;
        };

        const ParserOptions<int64_t> TIMEOUT_PARSER_OPTIONS = {.min_value_ = 1, .error_message_ = "must be a positive number of seconds"};
        const ParserOptions<int64_t> COUNT_PARSER_OPTIONS = {.min_value_ = 1, .error_message_ = "must be a positive integer"};

        int64_t parse_int(simdjson::ondemand::value value, const std::string& key, const ParserOptions<int64_t>& options) {
            int64_t out = 0;
            if (value.get_int64().get(out) != simdjson::SUCCESS) {
                throw ConfigError(key, key + ": expected an integer");
            }
            if (out < options.min_value_) {
                throw ConfigError(key, key + ": " + options.error_message_);
            }
            return out;
        }

        bool parse_bool(simdjson::ondemand::value value, const std::string& key) {
            bool out = false;
            if (value.get_bool().get(out) != simdjson::SUCCESS) {
                throw ConfigError(key, key + ": expected true or false");
            }
            return out;
        }

        std::string parse_string(simdjson::ondemand::value value, const std::string& key) {
            std::string_view out;
            if (value.get_string().get(out) != simdjson::SUCCESS) {
                throw ConfigError(key, key + ": expected a string");
            }
            return std::string(out);
        }

        simdjson::ondemand::object parse_object(simdjson::ondemand::value value, const std::string& key) {
            simdjson::ondemand::object out;
            if (value.get_object().get(out) != simdjson::SUCCESS) {
                throw ConfigError(key, key + ": expected an object");
            }
            return out;
        }

        simdjson::ondemand::field unwrap_field(simdjson::simdjson_result<simdjson::ondemand::field> result) {
            simdjson::ondemand::field field;
            if (std::move(result).get(field) != simdjson::SUCCESS) {
                throw ConfigError("", "malformed object member");
            }
            return field;
        }

        std::string field_key(simdjson::ondemand::field& field) {
            std::string_view key;
            if (field.unescaped_key().get(key) != simdjson::SUCCESS) {
                throw ConfigError("", "invalid object key");
            }
            return std::string(key);
        }

        HostTls parse_host(simdjson::ondemand::object obj, const std::string& host) {
            HostTls out;
            for (auto result : obj) {
                auto field = unwrap_field(result);
                const std::string name = field_key(field);
                const std::string key = "hosts." + host + "." + name;

                if (name == "ssl_verify") {
                    out.ssl_verify_ = parse_bool(field.value(), key);
                } else if (name == "ca_info") {
                    out.ca_info_ = parse_string(field.value(), key);
                } else if (name == "ca_path") {
                    out.ca_path_ = parse_string(field.value(), key);
                }
            }
            return out;
        }

        bool env_flag(const std::optional<std::string>& value) {
            if (!value || value->empty()) {
                return false;
            }
            const std::string lowered = string_utils::to_lower(*value);
            return lowered != "0" && lowered != "false";
        }
    }  // namespace parser

    ConfigError::ConfigError(std::string key, const std::string& msg) : std::runtime_error(msg), key_(std::move(key)) {}

    http::client::TlsSettings Config::tls_for_host(const std::string& host) const {
        http::client::TlsSettings out{.skip_verify_ = !ssl_verify_, .ca_info_ = ca_info_, .ca_path_ = ca_path_};

        if (auto it = hosts_.find(host); it != hosts_.end()) {
            if (it->second.ssl_verify_) {
                out.skip_verify_ = !*it->second.ssl_verify_;
            }
            if (!it->second.ca_info_.empty()) {
                out.ca_info_ = it->second.ca_info_;
            }
            if (!it->second.ca_path_.empty()) {
                out.ca_path_ = it->second.ca_path_;
            }
        }

        if (out.skip_verify_) {
            out.ca_info_.clear();
            out.ca_path_.clear();
        }
        return out;
    }

    Config Config::parse_json(std::string_view json) {
        Config out;

        try {
            simdjson::ondemand::parser json_parser;
            simdjson::padded_string padded(json);
            simdjson::ondemand::document doc = json_parser.iterate(padded);

            simdjson::ondemand::object root;
            if (doc.get_object().get(root) != simdjson::SUCCESS) {
                throw ConfigError("", "configuration must be a JSON object");
            }

            for (auto result : root) {
                auto field = parser::unwrap_field(result);
                const std::string key = parser::field_key(field);

                if (key == "dial_timeout") {
                    out.dial_timeout_s_ = static_cast<long>(parser::parse_int(field.value(), key, parser::TIMEOUT_PARSER_OPTIONS));
                } else if (key == "keepalive") {
                    out.keepalive_s_ = static_cast<long>(parser::parse_int(field.value(), key, parser::TIMEOUT_PARSER_OPTIONS));
                } else if (key == "tls_timeout") {
                    out.tls_timeout_s_ = static_cast<long>(parser::parse_int(field.value(), key, parser::TIMEOUT_PARSER_OPTIONS));
                } else if (key == "max_idle_per_host") {
                    out.max_idle_per_host_ = static_cast<long>(parser::parse_int(field.value(), key, parser::COUNT_PARSER_OPTIONS));
                } else if (key == "concurrent_transfers") {
                    out.concurrent_transfers_ = static_cast<int>(parser::parse_int(field.value(), key, parser::COUNT_PARSER_OPTIONS));
                } else if (key == "batch") {
                    out.batch_ = parser::parse_bool(field.value(), key);
                } else if (key == "log_stats") {
                    out.log_stats_ = parser::parse_bool(field.value(), key);
                } else if (key == "trace_http") {
                    out.trace_http_ = parser::parse_bool(field.value(), key);
                } else if (key == "debug_http") {
                    out.debug_http_ = parser::parse_bool(field.value(), key);
                } else if (key == "log_dir") {
                    out.log_dir_ = parser::parse_string(field.value(), key);
                } else if (key == "ssl_verify") {
                    out.ssl_verify_ = parser::parse_bool(field.value(), key);
                } else if (key == "ca_info") {
                    out.ca_info_ = parser::parse_string(field.value(), key);
                } else if (key == "ca_path") {
                    out.ca_path_ = parser::parse_string(field.value(), key);
                } else if (key == "hosts") {
                    for (auto host_result : parser::parse_object(field.value(), key)) {
                        auto host_field = parser::unwrap_field(host_result);
                        const std::string host = string_utils::to_lower(parser::field_key(host_field));
                        out.hosts_[host] = parser::parse_host(parser::parse_object(host_field.value(), key + "." + host), host);
                    }
                }
                // Unknown keys are ignored so newer files still load.
            }
        } catch (const simdjson::simdjson_error& e) {
            throw ConfigError("", std::string("malformed configuration: ") + e.what());
        }

        return out;
    }

    Config Config::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw ConfigError("", "configuration file not found: " + path.string());
        }

        simdjson::padded_string json;
        if (simdjson::padded_string::load(path.string()).get(json) != simdjson::SUCCESS) {
            throw ConfigError("", "cannot read configuration file: " + path.string());
        }

        return parse_json(std::string_view(json.data(), json.size()));
    }

    void Config::apply_environment(const EnvLookup& env) {
        if (parser::env_flag(env("GIT_CURL_VERBOSE"))) {
            trace_http_ = true;
        }
        if (parser::env_flag(env("GIT_LOG_STATS"))) {
            log_stats_ = true;
        }
        if (parser::env_flag(env("LFS_DEBUG_HTTP"))) {
            debug_http_ = true;
        }
        if (parser::env_flag(env("GIT_SSL_NO_VERIFY"))) {
            ssl_verify_ = false;
            for (auto& [host, tls] : hosts_) {
                tls.ssl_verify_ = false;
            }
        }
        if (auto ca_info = env("GIT_SSL_CAINFO"); ca_info && !ca_info->empty()) {
            ca_info_ = *ca_info;
        }
        if (auto ca_path = env("GIT_SSL_CAPATH"); ca_path && !ca_path->empty()) {
            ca_path_ = *ca_path;
        }
    }

    EnvLookup process_environment() {
        return [](const std::string& name) -> std::optional<std::string> {
            const char* value = std::getenv(name.c_str());
            if (value == nullptr) {
                return std::nullopt;
            }
            return std::string(value);
        };
    }
}  // namespace config
