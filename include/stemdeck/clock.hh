#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    /**
     * @class scheduler
     * @brief Clock and one-shot timers for the control thread
     *
     * Timers never fire on their own: the control loop calls run_due()
     * and every due task runs on the calling thread. This keeps the click
     * classifier, the progress tick and the follower debounce on the single
     * control thread and makes them deterministic under a manual_scheduler.
     *
     * Objects that schedule tasks must cancel them before they are destroyed.
     */
    class STEMDECK_EXPORT scheduler {
        public:
            using clock_type = std::chrono::steady_clock;
            using time_point = clock_type::time_point;
            using timer_id = std::uint64_t;
            using task_t = std::function<void()>;

            static constexpr timer_id invalid_timer = 0;

            virtual ~scheduler();

            scheduler(const scheduler&) = delete;
            scheduler& operator=(const scheduler&) = delete;

            [[nodiscard]] virtual time_point now() const = 0;

            /**
             * @brief Run @p task once, @p delay after now()
             * @return id usable with cancel()
             */
            timer_id schedule(std::chrono::milliseconds delay, task_t task);

            /**
             * @brief Cancel a pending timer
             * @return false if the timer already fired or never existed
             */
            bool cancel(timer_id id);

            /**
             * @brief Run every timer whose deadline is not after now()
             * @return number of tasks run
             *
             * Tasks scheduled by a running task with zero delay run in the same call.
             */
            std::size_t run_due();

            [[nodiscard]] std::size_t pending() const;

        protected:
            scheduler();

            [[nodiscard]] std::optional<time_point> next_deadline() const;
            /// Pop and run the earliest timer if its deadline is <= limit
            bool run_next(time_point limit);

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

    /**
     * @brief Scheduler on std::chrono::steady_clock
     */
    class STEMDECK_EXPORT steady_scheduler final : public scheduler {
        public:
            steady_scheduler() = default;
            [[nodiscard]] time_point now() const override;
    };

    /**
     * @brief Scheduler with virtual time for tests and offline runs
     */
    class STEMDECK_EXPORT manual_scheduler final : public scheduler {
        public:
            manual_scheduler();

            [[nodiscard]] time_point now() const override;

            /**
             * @brief Move virtual time forward by @p dt
             *
             * Timers fire in deadline order with now() set to each deadline,
             * so periodic tasks see the same timestamps as in real time.
             */
            std::size_t advance(std::chrono::milliseconds dt);

        private:
            time_point m_now;
    };

} // namespace stemdeck
