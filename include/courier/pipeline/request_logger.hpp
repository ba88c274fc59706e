#pragma once

#include <courier/http/http_message.hpp>
#include <courier/log/macros.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace courier::pipeline {

/// One completed typed request
struct request_log {
    http::request request;
    std::optional<std::string> response_data;
    bool is_success = false;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/// Process-wide sink for request_log records
///
/// Keeps the most recent records in memory (oldest evicted first) and echoes
/// each one through the logger: info for successes, warning for failures.
class request_logger {
public:
    static constexpr size_t default_capacity = 256;

    static request_logger& instance() {
        static request_logger inst;
        return inst;
    }

    void log(request_log record) {
        if (record.is_success) {
            COURIER_LOG_INFO("{} {} ok ({} bytes)",
                             http::method_to_string(record.request.get_method()),
                             record.request.target(),
                             record.response_data ? record.response_data->size() : 0);
        } else {
            COURIER_LOG_WARNING("{} {} failed{}",
                                http::method_to_string(record.request.get_method()),
                                record.request.target(),
                                record.response_data ? " to decode" : "");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0) {
            return;
        }
        while (history_.size() >= capacity_) {
            history_.pop_front();
        }
        history_.push_back(std::move(record));
    }

    /// Snapshot of the retained records, oldest first
    [[nodiscard]] std::vector<request_log> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {history_.begin(), history_.end()};
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.clear();
    }

    /// Bound the retained history; 0 keeps nothing
    void set_capacity(size_t capacity) {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_ = capacity;
        while (history_.size() > capacity_) {
            history_.pop_front();
        }
    }

    [[nodiscard]] size_t capacity() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return capacity_;
    }

private:
    request_logger() = default;

    request_logger(const request_logger&) = delete;
    request_logger& operator=(const request_logger&) = delete;

    mutable std::mutex mutex_;
    std::deque<request_log> history_;
    size_t capacity_ = default_capacity;
};

} // namespace courier::pipeline
