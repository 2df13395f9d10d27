#include "stats_reporter.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace stats {
    StatsReporter::StatsReporter(std::shared_ptr<const TransferRegistry> registry) : registry_(std::move(registry)) {}

    std::filesystem::path StatsReporter::log_file_path(const std::filesystem::path& log_dir, long long unix_ts_s) {
        return log_dir / "http" / ("http-" + std::to_string(unix_ts_s) + ".log");
    }

    std::optional<std::filesystem::path> StatsReporter::write_report(const ReportSettings& settings) const {
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
        const auto path = log_file_path(settings.log_dir_, now);

        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("Error logging http stats: {}: {}", path.parent_path().string(), ec.message());
            return std::nullopt;
        }

        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            spdlog::error("Error logging http stats: cannot create {}", path.string());
            return std::nullopt;
        }

        write_lines(out, settings, now);
        out.flush();
        if (!out) {
            spdlog::error("Error logging http stats: write failed: {}", path.string());
            return std::nullopt;
        }

        spdlog::info("HTTP Stats logged to file {}", path.string());
        return path;
    }

    void StatsReporter::write_lines(std::ostream& out, const ReportSettings& settings, long long unix_ts_s) const {
        out << "concurrent=" << settings.concurrent_transfers_ << " batch=" << (settings.batch_ ? "true" : "false") << " time=" << unix_ts_s
            << " version=" << settings.version_ << "\n";

        for (const auto& bucket : registry_->buckets()) {
            for (const auto id : bucket.transfers_) {
                // An id without a record still gets a line, with zeroed values.
                const TransferRecord record = registry_->find(id).value_or(TransferRecord{});

                out << "key=" << bucket.key_ << " reqheader=" << record.request_.header_size_ << " reqbody=" << record.request_.body_size_
                    << " resheader=" << record.response_.header_size_ << " resbody=" << record.response_.body_size_
                    << " restime=" << record.response_time().count() << " status=" << record.status_ << " url=" << record.url_ << "\n";
            }
        }
    }
}  // namespace stats
