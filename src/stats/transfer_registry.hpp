#ifndef TRANSFER_METER_TRANSFER_REGISTRY_HPP
#define TRANSFER_METER_TRANSFER_REGISTRY_HPP

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../http/model/model.hpp"

namespace stats {
    using Clock = std::chrono::steady_clock;

    struct TransferStats {
        long long header_size_ = 0;
        long long body_size_ = 0;
        Clock::time_point start_{};
        Clock::time_point stop_{};
    };

    struct TransferRecord {
        TransferStats request_;
        TransferStats response_;
        long status_ = 0;
        std::string url_;
        bool finalized_ = false;

        // Response duration, or zero while the body has not been read to the end.
        [[nodiscard]] std::chrono::nanoseconds response_time() const;
    };

    struct Bucket {
        std::string key_;
        std::vector<http::model::TransferId> transfers_;
    };

    // Per-session statistics store. Records and buckets are locked independently;
    // no lock is held longer than one map operation.
    class TransferRegistry {
       public:
        TransferRegistry() = default;
        ~TransferRegistry() = default;
        TransferRegistry(const TransferRegistry&) = delete;
        TransferRegistry& operator=(const TransferRegistry&) = delete;
        TransferRegistry(TransferRegistry&&) = delete;
        TransferRegistry& operator=(TransferRegistry&&) = delete;

        [[nodiscard]] http::model::TransferId next_transfer_id();

        void open(http::model::TransferId id, TransferRecord record);
        // Returns false when the record is unknown or was already finalized.
        bool finalize(http::model::TransferId id, long long body_size, Clock::time_point stop);
        void add_to_bucket(const std::string& key, http::model::TransferId id);

        [[nodiscard]] std::optional<TransferRecord> find(http::model::TransferId id) const;
        // Buckets in first-use order, each listing ids in append order.
        [[nodiscard]] std::vector<Bucket> buckets() const;
        [[nodiscard]] size_t record_count() const;
        [[nodiscard]] size_t finalized_count() const;

       private:
        std::atomic<http::model::TransferId> last_id_ = http::model::NO_TRANSFER;

        mutable std::mutex records_mutex_;
        std::unordered_map<http::model::TransferId, TransferRecord> records_;

        mutable std::mutex buckets_mutex_;
        std::vector<Bucket> buckets_;
        std::unordered_map<std::string, size_t> bucket_index_;
    };
}  // namespace stats

#endif
