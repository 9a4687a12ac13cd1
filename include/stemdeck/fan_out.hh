#pragma once

#include <cstddef>
#include <exception>
#include <future>
#include <string>
#include <system_error>
#include <vector>

namespace stemdeck {

    /**
     * @brief Outcome of one task of a fan-out batch
     */
    struct fan_out_result {
        std::size_t index = 0;
        bool ok = true;
        std::string error;
    };

    /**
     * @brief Issue @p op to every item concurrently and wait for all to settle
     *
     * Each item gets its own task. The call returns only after every task
     * finished, successfully or not, and reports one result per item in
     * item order. A failing task never blocks or aborts the others.
     *
     * @param items Items to operate on (typically channel slots)
     * @param op    Callable invoked as op(item); failures are reported by throwing
     */
    template<typename Item, typename Op>
    std::vector<fan_out_result> fan_out(const std::vector<Item>& items, Op op) {
        std::vector<std::future<void>> tasks;
        tasks.reserve(items.size());
        for (const auto& item : items) {
            auto task = [&op, &item]() { op(item); };
            try {
                tasks.push_back(std::async(std::launch::async, task));
            } catch (const std::system_error&) {
                // No thread available: run the task lazily on this thread at get()
                tasks.push_back(std::async(std::launch::deferred, task));
            }
        }

        std::vector<fan_out_result> results(items.size());
        for (std::size_t i = 0; i < tasks.size(); ++i) {
            results[i].index = i;
            try {
                tasks[i].get();
            } catch (const std::exception& e) {
                results[i].ok = false;
                results[i].error = e.what();
            }
        }
        return results;
    }

    /**
     * @brief Number of failed tasks in a batch
     */
    inline std::size_t count_failures(const std::vector<fan_out_result>& results) {
        std::size_t failures = 0;
        for (const auto& r : results) {
            if (!r.ok) {
                ++failures;
            }
        }
        return failures;
    }

} // namespace stemdeck
