#pragma once

#include <atomic>
#include <chrono>
#include <datapod/datapod.hpp>

namespace takpipe {

    /// Counters for one endpoint's TX/RX pipeline
    /// Shared by the endpoint's workers; all fields are safe to read from any thread
    struct PipelineMetrics {
        // Transmit path
        std::atomic<dp::u64> tx_messages{0};
        std::atomic<dp::u64> tx_bytes{0};
        std::atomic<dp::u64> tx_empty_dropped{0};
        std::atomic<dp::u64> encode_fallbacks{0};

        // Receive path
        std::atomic<dp::u64> rx_messages{0};
        std::atomic<dp::u64> rx_bytes{0};
        std::atomic<dp::u64> rx_incomplete{0};

        // Backpressure
        std::atomic<dp::u64> evicted{0};

        // Send latency (microseconds), write call through drain
        std::atomic<dp::u64> total_send_us{0};
        std::atomic<dp::u64> max_send_us{0};

        /// Reset all metrics to zero
        inline void reset() {
            tx_messages = 0;
            tx_bytes = 0;
            tx_empty_dropped = 0;
            encode_fallbacks = 0;
            rx_messages = 0;
            rx_bytes = 0;
            rx_incomplete = 0;
            evicted = 0;
            total_send_us = 0;
            max_send_us = 0;
        }

        /// Get average send latency in microseconds
        inline dp::u64 avg_send_us() const {
            dp::u64 total = tx_messages.load();
            if (total == 0)
                return 0;
            return total_send_us.load() / total;
        }

        /// Get fraction of admitted messages that were later evicted (0.0 to 1.0)
        inline double eviction_rate() const {
            dp::u64 total = tx_messages.load() + rx_messages.load() + evicted.load();
            if (total == 0)
                return 0.0;
            return static_cast<double>(evicted.load()) / static_cast<double>(total);
        }
    };

    /// RAII helper for timing one transmit
    class SendTracker {
      private:
        PipelineMetrics &metrics_;
        std::chrono::steady_clock::time_point start_time_;
        dp::usize size_;
        bool completed_;

      public:
        explicit SendTracker(PipelineMetrics &metrics, dp::usize size)
            : metrics_(metrics), start_time_(std::chrono::steady_clock::now()), size_(size), completed_(false) {}

        /// Mark the transmit as handed to the transport
        inline void success() {
            if (completed_)
                return;

            auto end_time = std::chrono::steady_clock::now();
            auto latency_us = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_).count();

            metrics_.tx_messages.fetch_add(1);
            metrics_.tx_bytes.fetch_add(size_);
            metrics_.total_send_us.fetch_add(latency_us);

            dp::u64 max = metrics_.max_send_us.load();
            while (static_cast<dp::u64>(latency_us) > max &&
                   !metrics_.max_send_us.compare_exchange_weak(max, latency_us)) {
                // Retry if another thread updated max
            }

            completed_ = true;
        }
    };

} // namespace takpipe
