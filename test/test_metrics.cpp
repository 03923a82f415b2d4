#include <doctest/doctest.h>
#include <takpipe/metrics.hpp>

#include <thread>
#include <vector>

TEST_CASE("PipelineMetrics") {
    takpipe::PipelineMetrics metrics;

    SUBCASE("Starts empty") {
        CHECK(metrics.tx_messages == 0);
        CHECK(metrics.avg_send_us() == 0);
        CHECK(metrics.eviction_rate() == doctest::Approx(0.0));
    }

    SUBCASE("Eviction rate") {
        metrics.tx_messages = 3;
        metrics.evicted = 1;
        CHECK(metrics.eviction_rate() == doctest::Approx(0.25));
    }

    SUBCASE("Reset") {
        metrics.tx_messages = 5;
        metrics.rx_incomplete = 2;
        metrics.max_send_us = 99;
        metrics.reset();
        CHECK(metrics.tx_messages == 0);
        CHECK(metrics.rx_incomplete == 0);
        CHECK(metrics.max_send_us == 0);
    }
}

TEST_CASE("SendTracker") {
    takpipe::PipelineMetrics metrics;

    SUBCASE("Success counts once") {
        takpipe::SendTracker tracker(metrics, 120);
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        tracker.success();
        tracker.success();

        CHECK(metrics.tx_messages == 1);
        CHECK(metrics.tx_bytes == 120);
        CHECK(metrics.max_send_us >= 1000);
        CHECK(metrics.avg_send_us() == metrics.total_send_us.load());
    }

    SUBCASE("Unfinished send is not counted") {
        { takpipe::SendTracker tracker(metrics, 64); }
        CHECK(metrics.tx_messages == 0);
        CHECK(metrics.tx_bytes == 0);
    }

    SUBCASE("Concurrent senders") {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&metrics] {
                for (int i = 0; i < 100; ++i) {
                    takpipe::SendTracker tracker(metrics, 10);
                    tracker.success();
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }
        CHECK(metrics.tx_messages == 400);
        CHECK(metrics.tx_bytes == 4000);
    }
}
