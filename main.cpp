#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "src/config/config.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/model/model.hpp"
#include "src/http/trace/trace_sink.hpp"
#include "src/meter/session.hpp"
#include "src/utils/thread_pool.hpp"

namespace {
    struct CliOptions {
        std::string config_path_;
        std::string bucket_ = "fetch";
        std::vector<std::string> urls_;
    };

    void print_usage() { std::cerr << "usage: transfer_meter [-c config.json] [-b bucket] URL...\n"; }

    CliOptions parse_args(int argc, char** argv) {
        CliOptions options;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-c" || arg == "-b") && i + 1 < argc) {
                (arg == "-c" ? options.config_path_ : options.bucket_) = argv[++i];
            } else if (arg == "-c" || arg == "-b") {
                throw std::invalid_argument("missing value for " + arg);
            } else {
                options.urls_.push_back(arg);
            }
        }
        return options;
    }
}  // namespace

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        const CliOptions cli = parse_args(argc, argv);
        if (cli.urls_.empty()) {
            print_usage();
            return 1;
        }

        auto config = cli.config_path_.empty() ? config::Config{} : config::Config::load_from_file(cli.config_path_);
        config.apply_environment(config::process_environment());

        http::client::CurlGlobal curl_global;
        spdlog::debug("libcurl {}", curl_global.version());

        auto session = meter::MeterSessionBuilder()
                           .with_config(config)
                           .with_trace_sink(http::trace::TraceSink::make_stderr())
                           .with_round_tripper_factory(meter::curl_round_tripper_factory())
                           .validate()
                           .build();

        //
        // Transfer
        //

        std::mutex output_mutex;
        const auto workers = static_cast<size_t>(std::max(1, config.concurrent_transfers_));
        {
            concurrency::ThreadPool pool(std::min(workers, cli.urls_.size()));
            for (const auto& url : cli.urls_) {
                pool.enqueue([&session, &output_mutex, &cli, url]() {
                    try {
                        auto client = session->client_for_url(url);
                        auto resp = client->execute(http::model::Request{.url_ = url});
                        const auto body = http::stream::read_all(*resp.body_);
                        resp.body_->close();
                        session->log_transfer(cli.bucket_, resp);

                        const std::lock_guard<std::mutex> lock(output_mutex);
                        std::cout << resp.status_ << " " << body.size() << " " << resp.effective_url_ << "\n";
                    } catch (const http::http_error::HttpError& e) {
                        const std::lock_guard<std::mutex> lock(output_mutex);
                        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
                        throw;
                    }
                });
            }

            try {
                pool.wait_all();
            } catch (const std::exception&) {
                spdlog::warn("{} of {} transfers failed", pool.failed_tasks(), cli.urls_.size());
                session->shutdown();
                return 2;
            }
        }

        //
        // Report
        //

        session->shutdown();
    } catch (const http::http_error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
};
