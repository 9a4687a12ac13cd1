//
// Control thread queue for asynchronous push notifications.
//

#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <functional>
#include <utility>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    /**
     * callback_dispatcher queues notifications arriving from document store
     * subscriptions (on any thread) and dispatches them on the control thread,
     * so every state mutation happens on one thread.
     *
     * Each callback is tagged with the token of the subscription that produced
     * it; cleanup(token) drops whatever a cancelled subscription left queued.
     */
    class STEMDECK_EXPORT callback_dispatcher {
        public:
            using callback_t = std::pair<int, std::function <void()>>;

            callback_dispatcher();
            ~callback_dispatcher();

            callback_dispatcher(const callback_dispatcher&) = delete;
            callback_dispatcher& operator=(const callback_dispatcher&) = delete;

            /**
             * Allocate a token for a new subscription.
             */
            int next_token();

            /**
             * Enqueue a callback event from any thread.
             */
            void enqueue(const callback_t& cbk);

            /**
             * Run queued callbacks on the calling (control) thread.
             * Callbacks enqueued while dispatching wait for the next call.
             * @return number of callbacks run
             */
            std::size_t dispatch();

            void cleanup(int token);

            [[nodiscard]] std::size_t pending() const;
        private:
            std::deque<callback_t> m_queue;
            mutable std::mutex     m_mutex;
            std::atomic<int>       m_next_token{1};
    };

} // namespace stemdeck
