#include "transfer_registry.hpp"

#include <algorithm>
#include <mutex>
#include <string>

namespace stats {
    std::chrono::nanoseconds TransferRecord::response_time() const {
        if (!finalized_ || response_.stop_ < response_.start_) {
            return std::chrono::nanoseconds{0};
        }
        return std::chrono::duration_cast<std::chrono::nanoseconds>(response_.stop_ - response_.start_);
    }

    http::model::TransferId TransferRegistry::next_transfer_id() { return ++last_id_; }

    void TransferRegistry::open(http::model::TransferId id, TransferRecord record) {
        std::lock_guard<std::mutex> lock(records_mutex_);
        records_.insert_or_assign(id, std::move(record));
    }

    bool TransferRegistry::finalize(http::model::TransferId id, long long body_size, Clock::time_point stop) {
        std::lock_guard<std::mutex> lock(records_mutex_);

        auto it = records_.find(id);
        if (it == records_.end() || it->second.finalized_) {
            return false;
        }

        it->second.response_.body_size_ = body_size;
        it->second.response_.stop_ = stop;
        it->second.finalized_ = true;
        return true;
    }

    void TransferRegistry::add_to_bucket(const std::string& key, http::model::TransferId id) {
        std::lock_guard<std::mutex> lock(buckets_mutex_);

        auto [it, inserted] = bucket_index_.try_emplace(key, buckets_.size());
        if (inserted) {
            buckets_.push_back(Bucket{.key_ = key, .transfers_ = {}});
        }
        buckets_[it->second].transfers_.push_back(id);
    }

    std::optional<TransferRecord> TransferRegistry::find(http::model::TransferId id) const {
        std::lock_guard<std::mutex> lock(records_mutex_);

        auto it = records_.find(id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<Bucket> TransferRegistry::buckets() const {
        std::lock_guard<std::mutex> lock(buckets_mutex_);
        return buckets_;
    }

    size_t TransferRegistry::record_count() const {
        std::lock_guard<std::mutex> lock(records_mutex_);
        return records_.size();
    }

    size_t TransferRegistry::finalized_count() const {
        std::lock_guard<std::mutex> lock(records_mutex_);
        return static_cast<size_t>(std::count_if(records_.begin(), records_.end(), [](const auto& entry) { return entry.second.finalized_; }));
    }
}  // namespace stats
