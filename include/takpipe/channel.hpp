#pragma once

#include <takpipe/common.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace takpipe {

    /// FIFO handoff between threads
    /// capacity == 0 means unbounded. pop() blocks on an empty channel until an item
    /// arrives or the channel is closed; push_nowait() never blocks.
    template <typename T> class Channel {
      private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<T> items_;
        dp::usize capacity_;
        bool closed_;

      public:
        explicit Channel(dp::usize capacity = 0) : capacity_(capacity), closed_(false) {}

        Channel(const Channel &) = delete;
        Channel &operator=(const Channel &) = delete;

        /// Admit an item, failing if the channel is full or closed
        dp::Res<void> push_nowait(T item) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return dp::result::err(dp::Error::not_found("channel closed"));
                }
                if (capacity_ > 0 && items_.size() >= capacity_) {
                    return dp::result::err(dp::Error::io_error("channel full"));
                }
                items_.push_back(std::move(item));
            }
            cv_.notify_one();
            return dp::result::ok();
        }

        /// Admit an item, evicting the oldest one first if the channel is full
        /// Returns true if an item was evicted
        bool push_evicting(T item) {
            bool evicted = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return false;
                }
                if (capacity_ > 0 && items_.size() >= capacity_) {
                    items_.pop_front();
                    evicted = true;
                }
                items_.push_back(std::move(item));
            }
            cv_.notify_one();
            return evicted;
        }

        /// Block until an item is available
        /// Fails with not_found once the channel is closed and drained
        dp::Res<T> pop() {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !items_.empty() || closed_; });
            if (items_.empty()) {
                return dp::result::err(dp::Error::not_found("channel closed"));
            }
            T item = std::move(items_.front());
            items_.pop_front();
            return dp::result::ok(std::move(item));
        }

        /// Block for at most timeout_ms
        dp::Res<T> pop_for(dp::u32 timeout_ms) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                              [this] { return !items_.empty() || closed_; })) {
                return dp::result::err(dp::Error::timeout("channel pop timeout"));
            }
            if (items_.empty()) {
                return dp::result::err(dp::Error::not_found("channel closed"));
            }
            T item = std::move(items_.front());
            items_.pop_front();
            return dp::result::ok(std::move(item));
        }

        /// Take an item if one is ready, timeout error otherwise
        dp::Res<T> try_pop() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) {
                return dp::result::err(dp::Error::timeout("channel empty"));
            }
            T item = std::move(items_.front());
            items_.pop_front();
            return dp::result::ok(std::move(item));
        }

        /// Wake every waiter; pending items can still be popped
        void close() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool closed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        dp::usize size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return items_.size();
        }

        bool empty() const { return size() == 0; }

        bool full() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return capacity_ > 0 && items_.size() >= capacity_;
        }

        dp::usize capacity() const { return capacity_; }
    };

    /// Bounded queue of payloads between the application and one transport direction
    using Queue = Channel<Message>;

    /// Boolean condition that threads can wait on
    class Event {
      private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool set_;

      public:
        explicit Event(bool initially_set = false) : set_(initially_set) {}

        void set() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                set_ = true;
            }
            cv_.notify_all();
        }

        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            set_ = false;
        }

        bool is_set() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return set_;
        }

        void wait() {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return set_; });
        }

        bool wait_for(dp::u32 timeout_ms) {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return set_; });
        }
    };

} // namespace takpipe
