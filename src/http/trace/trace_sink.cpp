#include "trace_sink.hpp"

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace http::trace {
    TraceSink::TraceSink(std::shared_ptr<spdlog::logger> summary_logger, std::ostream& dump_stream)
        : summary_logger_(std::move(summary_logger)), dump_stream_(&dump_stream) {
        if (summary_logger_ == nullptr) {
            throw std::invalid_argument("TraceSink requires a summary logger");
        }
    }

    std::shared_ptr<TraceSink> TraceSink::make_stderr() {
        auto logger = spdlog::get(TRACE_LOGGER_NAME);
        if (logger == nullptr) {
            logger = spdlog::stderr_logger_mt(TRACE_LOGGER_NAME);
            logger->set_pattern("%H:%M:%S.%f %n: %v");

            const char* git_trace = std::getenv("GIT_TRACE");
            const bool enabled = git_trace != nullptr && std::string(git_trace) != "" && std::string(git_trace) != "0";
            logger->set_level(enabled ? spdlog::level::info : spdlog::level::off);
        }

        return std::make_shared<TraceSink>(std::move(logger), std::cerr);
    }

    void TraceSink::summary(std::string_view line) const { summary_logger_->info("{}", line); }

    void TraceSink::write(std::string_view text) {
        std::lock_guard<std::mutex> lock(dump_mutex_);
        dump_stream_->write(text.data(), static_cast<std::streamsize>(text.size()));
        dump_stream_->flush();
    }
}  // namespace http::trace
