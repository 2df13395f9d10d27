#ifndef TRANSFER_METER_STATS_REPORTER_HPP
#define TRANSFER_METER_STATS_REPORTER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "transfer_registry.hpp"

namespace stats {
    struct ReportSettings {
        int concurrent_transfers_ = 0;
        bool batch_ = false;
        std::string version_;
        std::filesystem::path log_dir_;
    };

    class StatsReporter {
       public:
        explicit StatsReporter(std::shared_ptr<const TransferRegistry> registry);

        // Writes <log_dir>/http/http-<unix>.log. I/O failures are logged and yield nullopt.
        [[nodiscard]] std::optional<std::filesystem::path> write_report(const ReportSettings& settings) const;

        // One settings line, then one line per bucketed transfer.
        void write_lines(std::ostream& out, const ReportSettings& settings, long long unix_ts_s) const;

        [[nodiscard]] static std::filesystem::path log_file_path(const std::filesystem::path& log_dir, long long unix_ts_s);

       private:
        std::shared_ptr<const TransferRegistry> registry_;
    };
}  // namespace stats

#endif
