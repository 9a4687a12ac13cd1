/**
 * @file test_fan_out.cc
 * @brief Unit tests for the fan-out/wait-all batch helper
 */

#include <doctest/doctest.h>
#include <stemdeck/error.hh>
#include <stemdeck/fan_out.hh>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace stemdeck;

TEST_SUITE("FanOut::Unit") {

    TEST_CASE("should_run_every_item_and_report_in_order") {
        std::vector<int> items = {1, 2, 3, 4, 5};
        std::atomic<int> sum{0};

        auto results = fan_out(items, [&sum](int v) { sum += v; });

        REQUIRE(results.size() == items.size());
        CHECK(sum == 15);
        for (std::size_t i = 0; i < results.size(); ++i) {
            CHECK(results[i].index == i);
            CHECK(results[i].ok);
            CHECK(results[i].error.empty());
        }
        CHECK(count_failures(results) == 0);
    }

    TEST_CASE("should_isolate_failures") {
        std::vector<int> items = {0, 1, 2, 3};
        std::atomic<int> completed{0};

        auto results = fan_out(items, [&completed](int v) {
            if (v % 2 == 1) {
                throw channel_error("odd item " + std::to_string(v));
            }
            // Slow successful tasks still complete after siblings failed
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++completed;
        });

        CHECK(completed == 2);
        CHECK(count_failures(results) == 2);
        CHECK(results[0].ok);
        CHECK_FALSE(results[1].ok);
        CHECK(results[1].error == "odd item 1");
        CHECK(results[2].ok);
        CHECK_FALSE(results[3].ok);
    }

    TEST_CASE("should_handle_empty_batch") {
        std::vector<int> items;
        auto results = fan_out(items, [](int) { FAIL("must not run"); });
        CHECK(results.empty());
    }

    TEST_CASE("should_run_items_concurrently") {
        std::vector<int> items(4, 0);
        std::atomic<int> inside{0};
        std::atomic<int> peak{0};

        fan_out(items, [&](int) {
            const int now = ++inside;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --inside;
        });

        CHECK(peak > 1);
    }
}
