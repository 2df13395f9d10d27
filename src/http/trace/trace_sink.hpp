#ifndef TRANSFER_METER_TRACE_SINK_HPP
#define TRANSFER_METER_TRACE_SINK_HPP

#include <spdlog/logger.h>

#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace http::trace {
    inline constexpr const char* TRACE_LOGGER_NAME = "trace";

    // Diagnostic output shared by every transfer. One-line summaries go to a spdlog
    // logger; verbose dumps and mirrored body bytes go verbatim to a text stream.
    class TraceSink {
       public:
        TraceSink(std::shared_ptr<spdlog::logger> summary_logger, std::ostream& dump_stream);

        ~TraceSink() = default;
        TraceSink(const TraceSink&) = delete;
        TraceSink& operator=(const TraceSink&) = delete;
        TraceSink(TraceSink&&) = delete;
        TraceSink& operator=(TraceSink&&) = delete;

        // Logger named "trace" on stderr. Enabled when GIT_TRACE is set, off otherwise.
        static std::shared_ptr<TraceSink> make_stderr();

        void summary(std::string_view line) const;
        void write(std::string_view text);

        [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const { return summary_logger_; }

       private:
        std::shared_ptr<spdlog::logger> summary_logger_;
        std::ostream* dump_stream_;
        std::mutex dump_mutex_;
    };
}  // namespace http::trace

#endif
