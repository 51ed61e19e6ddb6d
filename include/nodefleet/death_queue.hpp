#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "nodefleet/types.hpp"

namespace nodefleet {
    // Bounded multi-producer / single-consumer channel carrying death notices
    // from monitors to the replacement loop.
    class DeathQueue {
    public:
        explicit DeathQueue(size_t capacity = 64) : capacity_(capacity == 0 ? 1 : capacity) {}

        // Blocks while the queue is full. Returns false once the queue is closed.
        bool push(DeathNotice notice) {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return closed_ || notices_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            notices_.push_back(std::move(notice));
            not_empty_.notify_one();
            return true;
        }

        std::optional<DeathNotice> pop_for(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !notices_.empty(); })) {
                return std::nullopt;
            }
            if (notices_.empty()) {
                return std::nullopt;
            }
            DeathNotice notice = std::move(notices_.front());
            notices_.pop_front();
            not_full_.notify_one();
            return notice;
        }

        // Wakes every blocked producer and consumer; later pushes are dropped.
        void close() {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            not_full_.notify_all();
            not_empty_.notify_all();
        }

        bool closed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return notices_.size();
        }

    private:
        const size_t capacity_;
        std::deque<DeathNotice> notices_;
        bool closed_{false};
        mutable std::mutex mutex_;
        std::condition_variable not_full_;
        std::condition_variable not_empty_;
    };
} // namespace nodefleet
